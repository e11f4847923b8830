#include "engine/report/compliance_report.hpp"

#include <chrono>
#include <ctime>
#include <utility>

#include "engine/core/logging.hpp"

namespace rascheck::report {
namespace {

std::size_t sev_index(rules::Severity s) noexcept {
  const int i = static_cast<int>(s);
  return (i >= 0 && i < 3) ? static_cast<std::size_t>(i) : 2;
}

std::size_t status_index(rules::FindingStatus st) noexcept {
  const int i = static_cast<int>(st);
  return (i >= 0 && i < 4) ? static_cast<std::size_t>(i) : 3;
}

} // namespace

void SummaryCounts::add(rules::Severity s, rules::FindingStatus st) noexcept {
  ++cells_[sev_index(s)][status_index(st)];
  ++total_;
}

int SummaryCounts::count(rules::Severity s, rules::FindingStatus st) const noexcept {
  return cells_[sev_index(s)][status_index(st)];
}

int SummaryCounts::by_status(rules::FindingStatus st) const noexcept {
  int n = 0;
  for (const auto& row : cells_) n += row[status_index(st)];
  return n;
}

int SummaryCounts::by_severity(rules::Severity s) const noexcept {
  int n = 0;
  for (int c : cells_[sev_index(s)]) n += c;
  return n;
}

bool ComplianceReport::has_violation_failures() const noexcept {
  return summary.count(rules::Severity::kViolation, rules::FindingStatus::kFail) > 0;
}

int ComplianceReport::exit_code() const noexcept {
  return has_violation_failures() ? kExitViolations : kExitCompliant;
}

ComplianceReport aggregate(RunMetadata meta,
                           std::vector<rules::Finding> findings,
                           std::vector<std::string> warnings,
                           const rules::RuleSet& rule_set) {
  ComplianceReport r;
  r.meta = std::move(meta);
  r.meta.ruleset_name = rule_set.name();
  r.meta.ruleset_version = rule_set.version();
  r.meta.ruleset_hash = rule_set.hash;
  r.meta.superseded_rules = rule_set.superseded;

  for (const auto& f : findings) r.summary.add(f.severity, f.status);
  r.findings = std::move(findings);
  r.warnings = std::move(warnings);
  for (const auto& e : rule_set.load_errors) r.rule_load_errors.push_back({e.rule_id(), e.reason()});

  log_debug("report: " + std::to_string(r.summary.total()) + " finding(s), " +
            std::to_string(r.summary.by_status(rules::FindingStatus::kFail)) + " fail");
  return r;
}

std::string utc_timestamp() {
  const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &now);
#else
  gmtime_r(&now, &tm);
#endif
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

std::string finding_location(const rules::Finding& f) {
  return f.entity ? f.entity->to_string() : std::string("model");
}

} // namespace rascheck::report
