#include "engine/report/report_text.hpp"

#include <ostream>
#include <sstream>
#include <utility>
#include <vector>

#include "engine/core/strings.hpp"

namespace rascheck::report {
namespace {

using rules::FindingStatus;
using rules::Severity;

const std::pair<const char*, const char*> kCategories[] = {
    {"MANN", "Manning's n"},
    {"COEF", "Expansion / Contraction Coefficients"},
    {"FW", "Floodway / Surcharge"},
    {"EVENT", "Required Flood Events"},
    {"BRG", "Bridge / Culvert"},
    {"BC", "Boundary Conditions"},
    {"FB", "Freeboard"},
};

constexpr const char* kOtherCategory = "Other";

std::string tsv_cell(std::string_view s) {
  std::string out(s);
  for (char& c : out) {
    if (c == '\t' || c == '\n' || c == '\r') c = ' ';
  }
  return out;
}

std::string md_cell(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    if (c == '|') out += "\\|";
    else if (c == '\n' || c == '\r') out += ' ';
    else out += c;
  }
  return out.empty() ? std::string("-") : out;
}

const char* status_tag(FindingStatus st) {
  switch (st) {
    case FindingStatus::kPass: return "PASS";
    case FindingStatus::kFail: return "FAIL";
    case FindingStatus::kNotApplicable: return "N/A";
    case FindingStatus::kError: return "ERROR";
  }
  return "?";
}

bool shown(const rules::Finding& f, const ReportSettings& opt) {
  return opt.include_not_applicable || f.status != FindingStatus::kNotApplicable;
}

bool is_critical(const rules::Finding& f) {
  return f.status == FindingStatus::kFail && f.severity == Severity::kViolation;
}

std::string entity_text(const rules::Finding& f) {
  return f.entity ? f.entity->type + " " + f.entity->id : std::string("model");
}

} // namespace

std::string rule_category(const std::string& rule_id) {
  for (const auto& part : split(rule_id, '-')) {
    const std::string p = trim(part);
    for (const auto& [prefix, name] : kCategories) {
      if (p == prefix) return name;
    }
  }
  return kOtherCategory;
}

std::string report_to_tsv(const ComplianceReport& report, const ReportSettings& opt) {
  std::ostringstream os;
  os << "rule_id\tseverity\tstatus\tentity_type\tentity_id\tmessage\tcitation\n";
  for (const auto& f : report.findings) {
    if (!shown(f, opt)) continue;
    os << tsv_cell(f.rule_id) << "\t"
       << rules::severity_name(f.severity) << "\t"
       << rules::status_name(f.status) << "\t"
       << (f.entity ? tsv_cell(f.entity->type) : std::string()) << "\t"
       << (f.entity ? tsv_cell(f.entity->id) : std::string()) << "\t"
       << tsv_cell(f.message) << "\t"
       << tsv_cell(f.citation) << "\n";
  }
  return os.str();
}

std::string report_to_markdown(const ComplianceReport& report, const ReportSettings& opt) {
  const RunMetadata& m = report.meta;
  const SummaryCounts& s = report.summary;
  std::ostringstream os;

  os << "# HEC-RAS Compliance Report\n\n";
  os << "| Field | Value |\n|:------|:------|\n";
  for (const auto& in : m.inputs) {
    os << "| **Input** | `" << md_cell(in.source.path) << "` (" << file_kind_name(in.source.kind)
       << ", " << hash_to_hex(in.content_hash) << ") |\n";
  }
  os << "| **Active plan** | " << md_cell(m.active_plan) << " |\n";
  os << "| **Rule set** | " << md_cell(m.ruleset_name) << " " << md_cell(m.ruleset_version) << " ("
     << hash_to_hex(m.ruleset_hash) << ") |\n";
  os << "| **Tool** | " << kToolName << " " << m.tool_version << " |\n";
  os << "| **Generated** | " << md_cell(m.timestamp) << " |\n\n";

  const int n_pass = s.by_status(FindingStatus::kPass);
  const int n_fail = s.by_status(FindingStatus::kFail);
  const int n_na = s.by_status(FindingStatus::kNotApplicable);
  const int n_err = s.by_status(FindingStatus::kError);
  const int n_critical = s.count(Severity::kViolation, FindingStatus::kFail);

  os << "## Executive Summary\n\n";
  os << "| Status | Count |\n|:-------|------:|\n";
  os << "| PASS | " << n_pass << " |\n";
  os << "| FAIL | " << n_fail << " |\n";
  os << "| ERROR | " << n_err << " |\n";
  os << "| N/A | " << n_na << " |\n";
  os << "| **Total** | **" << s.total() << "** |\n\n";

  if (n_fail == 0 && n_err == 0) {
    os << "> All checks passed. No compliance issues detected.\n\n";
  } else if (n_critical == 0) {
    os << "> No critical failures. " << (n_fail + n_err) << " finding(s) require review.\n\n";
  } else {
    os << "> **" << n_critical << " critical failure(s)** must be resolved before submission.\n\n";
  }

  if (n_critical > 0) {
    os << "## Critical Failures\n\n";
    for (const auto& f : report.findings) {
      if (!is_critical(f)) continue;
      os << "- **" << f.rule_id << "** " << md_cell(f.rule_name) << " at " << md_cell(entity_text(f)) << "\n";
      os << "  - " << md_cell(f.message) << "\n";
      os << "  - Citation: " << md_cell(f.citation) << "\n";
    }
    os << "\n";
  }

  os << "## Detailed Results\n\n";
  std::vector<const char*> order;
  for (const auto& c : kCategories) order.push_back(c.second);
  order.push_back(kOtherCategory);
  for (const char* category : order) {
    std::vector<const rules::Finding*> rows;
    for (const auto& f : report.findings) {
      if (shown(f, opt) && rule_category(f.rule_id) == category) rows.push_back(&f);
    }
    if (rows.empty()) continue;

    os << "### " << category << "\n\n";
    os << "| Status | Severity | Rule | Location | Message | Citation |\n";
    os << "|:-------|:---------|:-----|:---------|:--------|:---------|\n";
    for (const rules::Finding* f : rows) {
      os << "| " << status_tag(f->status) << " | " << rules::severity_name(f->severity) << " | "
         << md_cell(f->rule_id) << " | " << md_cell(entity_text(*f)) << " | " << md_cell(f->message)
         << " | " << md_cell(f->citation) << " |\n";
    }
    os << "\n";
  }

  if (!report.warnings.empty()) {
    os << "## Input Warnings\n\n";
    for (const auto& w : report.warnings) os << "- " << md_cell(w) << "\n";
    os << "\n";
  }

  if (!report.rule_load_errors.empty()) {
    os << "## Rule Load Errors\n\n";
    for (const auto& e : report.rule_load_errors) {
      os << "- `" << (e.rule_id.empty() ? std::string("<no id>") : e.rule_id) << "`: " << md_cell(e.reason) << "\n";
    }
    os << "\n";
  }
  return os.str();
}

void print_terminal_summary(std::ostream& os, const ComplianceReport& report) {
  const SummaryCounts& s = report.summary;
  const std::string rule = std::string(40, '-');

  os << "\nHEC-RAS Compliance Checker\n" << std::string(40, '=') << "\n";
  os << "  Rules:  " << report.meta.ruleset_name << " " << report.meta.ruleset_version << "\n";
  os << "  Plan:   " << (report.meta.active_plan.empty() ? std::string("(none)") : report.meta.active_plan) << "\n";
  os << "  Inputs: " << report.meta.inputs.size() << " file(s)\n\n";

  os << "Results\n" << rule << "\n";
  for (const auto& f : report.findings) {
    if (f.status == FindingStatus::kNotApplicable) continue;
    os << "  " << status_tag(f.status) << "  " << f.rule_id << "  " << entity_text(f) << "\n";
  }

  os << "\nSummary\n" << rule << "\n";
  os << "  " << s.by_status(FindingStatus::kPass) << " passed   "
     << s.by_status(FindingStatus::kFail) << " failed   "
     << s.by_status(FindingStatus::kError) << " errors   "
     << s.by_status(FindingStatus::kNotApplicable) << " not applicable\n";

  const int critical = s.count(Severity::kViolation, FindingStatus::kFail);
  if (critical > 0) {
    os << "\n  " << critical << " critical failure(s) must be resolved before submission.\n\n";
    for (const auto& f : report.findings) {
      if (!is_critical(f)) continue;
      os << "  x " << f.rule_id << " " << f.rule_name << " at " << entity_text(f) << "\n";
      os << "    " << f.message << "\n";
      os << "    " << f.citation << "\n\n";
    }
  }
  if (!report.warnings.empty()) os << "\n  " << report.warnings.size() << " input warning(s); see the report.\n";
  if (!report.rule_load_errors.empty()) {
    os << "  " << report.rule_load_errors.size() << " rule(s) failed to load:\n";
    for (const auto& e : report.rule_load_errors) os << "    " << e.rule_id << ": " << e.reason << "\n";
  }
  os << "\n";
}

} // namespace rascheck::report
