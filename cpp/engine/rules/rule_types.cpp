#include "engine/rules/rule_types.hpp"

#include "engine/core/strings.hpp"

namespace rascheck::rules {

const char* severity_name(Severity s) noexcept {
  switch (s) {
    case Severity::kInfo:      return "info";
    case Severity::kWarning:   return "warning";
    case Severity::kViolation: return "violation";
    default:                   return "unknown";
  }
}

std::optional<Severity> parse_severity(std::string_view s) noexcept {
  if (s == "info") return Severity::kInfo;
  if (s == "warning") return Severity::kWarning;
  if (s == "violation" || s == "error") return Severity::kViolation;
  return std::nullopt;
}

const char* status_name(FindingStatus s) noexcept {
  switch (s) {
    case FindingStatus::kPass:          return "pass";
    case FindingStatus::kFail:          return "fail";
    case FindingStatus::kNotApplicable: return "not_applicable";
    case FindingStatus::kError:         return "error";
    default:                            return "unknown";
  }
}

std::string RuleSet::name() const {
  std::vector<std::string> parts;
  for (const auto& d : documents) {
    if (!d.ruleset.empty()) parts.push_back(d.ruleset);
  }
  return join(parts, " + ");
}

std::string RuleSet::version() const {
  std::vector<std::string> parts;
  for (const auto& d : documents) {
    if (!d.version.empty()) parts.push_back(d.version);
  }
  return join(parts, " + ");
}

const Rule* RuleSet::find(std::string_view id) const noexcept {
  for (const auto& r : rules) {
    if (r.id == id) return &r;
  }
  return nullptr;
}

} // namespace rascheck::rules
