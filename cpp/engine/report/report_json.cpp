#include "engine/report/report_json.hpp"

#include <ostream>
#include <sstream>

#include "engine/report/json_writer.hpp"

namespace rascheck::report {
namespace {

constexpr rules::FindingStatus kStatuses[] = {
    rules::FindingStatus::kPass,
    rules::FindingStatus::kFail,
    rules::FindingStatus::kNotApplicable,
    rules::FindingStatus::kError,
};

constexpr rules::Severity kSeverities[] = {
    rules::Severity::kInfo,
    rules::Severity::kWarning,
    rules::Severity::kViolation,
};

void write_meta(JsonWriter& w, const RunMetadata& m) {
  w.key("tool");
  w.begin_object();
  w.key_string("name", kToolName);
  w.key_string("version", m.tool_version);
  w.end_object();

  w.key_string("timestamp", m.timestamp);

  w.key("ruleset");
  w.begin_object();
  w.key_string("name", m.ruleset_name);
  w.key_string("version", m.ruleset_version);
  w.key_string("hash", hash_to_hex(m.ruleset_hash));
  w.key("superseded");
  w.begin_array();
  for (const auto& id : m.superseded_rules) w.string(id);
  w.end_array();
  w.end_object();

  w.key("inputs");
  w.begin_array();
  for (const auto& in : m.inputs) {
    w.begin_object();
    w.key_string("path", in.source.path);
    w.key_string("kind", file_kind_name(in.source.kind));
    w.key_string("id", in.source.id);
    w.key_string("hash", hash_to_hex(in.content_hash));
    w.end_object();
  }
  w.end_array();

  w.key("active_plan");
  if (m.active_plan.empty()) w.null_value();
  else w.string(m.active_plan);
  w.key_string("precedence", m.precedence);
}

void write_summary(JsonWriter& w, const SummaryCounts& s) {
  w.begin_object();
  w.key("total");
  w.integer(s.total());

  w.key("by_status");
  w.begin_object();
  for (auto st : kStatuses) {
    w.key(rules::status_name(st));
    w.integer(s.by_status(st));
  }
  w.end_object();

  w.key("by_severity");
  w.begin_object();
  for (auto sev : kSeverities) {
    w.key(rules::severity_name(sev));
    w.begin_object();
    for (auto st : kStatuses) {
      w.key(rules::status_name(st));
      w.integer(s.count(sev, st));
    }
    w.end_object();
  }
  w.end_object();
  w.end_object();
}

void write_findings(JsonWriter& w, const std::vector<rules::Finding>& findings) {
  w.begin_array();
  for (const auto& f : findings) {
    w.begin_object();
    w.key_string("rule_id", f.rule_id);
    w.key_string("rule_name", f.rule_name);
    w.key_string("severity", rules::severity_name(f.severity));
    w.key_string("status", rules::status_name(f.status));
    w.key("entity");
    if (f.entity) {
      w.begin_object();
      w.key_string("type", f.entity->type);
      w.key_string("id", f.entity->id);
      w.end_object();
    } else {
      w.null_value();
    }
    w.key_string("message", f.message);
    w.key_string("citation", f.citation);
    if (!f.citation_url.empty()) w.key_string("citation_url", f.citation_url);
    w.end_object();
  }
  w.end_array();
}

} // namespace

void write_report_json(std::ostream& os, const ComplianceReport& report, const ReportSettings& opt) {
  JsonWriteOptions jo;
  jo.pretty = opt.pretty_json;
  jo.indent_spaces = opt.indent_spaces;
  JsonWriter w(os, jo);

  // Stable key order for deterministic diffs.
  w.begin_object();
  write_meta(w, report.meta);

  w.key("summary");
  write_summary(w, report.summary);
  w.key("exit_code");
  w.integer(report.exit_code());

  w.key("findings");
  write_findings(w, report.findings);

  w.key("warnings");
  w.begin_array();
  for (const auto& s : report.warnings) w.string(s);
  w.end_array();

  w.key("rule_load_errors");
  w.begin_array();
  for (const auto& e : report.rule_load_errors) {
    w.begin_object();
    w.key_string("rule_id", e.rule_id);
    w.key_string("reason", e.reason);
    w.end_object();
  }
  w.end_array();

  w.end_object();
  os << "\n";
}

std::string report_to_json(const ComplianceReport& report, const ReportSettings& opt) {
  std::ostringstream ss;
  write_report_json(ss, report, opt);
  return ss.str();
}

} // namespace rascheck::report
