/*
  Compliance report / renderer selftest

  Covers:
    1) Summary counts per severity x status; exit code 2 only for failed
       violations.
    2) Rendering is byte-identical on repeat; reports differing only in the
       timestamp differ only in that line.
    3) JSON escaping, NaN -> null, empty containers.
    4) TSV filtering of not_applicable rows; Markdown grouping by category.

  Framework-free; non-zero exit on failure.
*/

#include <cmath>
#include <exception>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "engine/core/settings.hpp"
#include "engine/core/source.hpp"
#include "engine/report/compliance_report.hpp"
#include "engine/report/json_writer.hpp"
#include "engine/report/report_json.hpp"
#include "engine/report/report_text.hpp"
#include "engine/rules/rule_loader.hpp"

namespace rascheck {
namespace {

static int g_fail_count = 0;

void fail(std::string_view msg) {
  ++g_fail_count;
  std::cerr << "[FAIL] " << msg << "\n";
}

void pass(std::string_view msg) {
  std::cerr << "[ OK ] " << msg << "\n";
}

void expect_true(bool v, std::string_view msg) {
  if (!v) fail(msg);
  else pass(msg);
}

void expect_eq_str(const std::string& a, const std::string& b, std::string_view msg) {
  if (a != b) {
    fail(msg);
    std::cerr << "  a: " << a << "\n";
    std::cerr << "  b: " << b << "\n";
  } else {
    pass(msg);
  }
}

bool contains(const std::string& hay, std::string_view needle) {
  return hay.find(needle) != std::string::npos;
}

rules::Finding finding(const char* rule_id, rules::Severity sev, rules::FindingStatus st,
                       const char* entity_id, const char* message) {
  rules::Finding f;
  f.rule_id = rule_id;
  f.rule_name = std::string(rule_id) + " name";
  f.citation = "44 CFR 60.3(d)";
  f.severity = sev;
  f.status = st;
  f.message = message;
  if (entity_id) f.entity = model::EntityKey{model::kCrossSection, entity_id};
  return f;
}

rules::RuleSet rule_set() {
  rules::RuleLoader loader;
  loader.add_text(
      "ruleset: fema_baseline\n"
      "version: '2024.1'\n"
      "rules:\n"
      "  - id: FEMA-MANN-001\n"
      "    citation: c\n"
      "    severity: violation\n"
      "    selector: cross_section\n"
      "    condition: \"true\"\n"
      "  - id: BROKEN\n"
      "    severity: violation\n"
      "    selector: cross_section\n"
      "    condition: \"true\"\n",
      "fema.yaml");
  return loader.finish();
}

report::ComplianceReport make_report(const std::string& timestamp, bool with_violation) {
  using rules::FindingStatus;
  using rules::Severity;
  std::vector<rules::Finding> fs;
  fs.push_back(finding("FEMA-MANN-001", Severity::kViolation, FindingStatus::kPass, "Creek/Upper/4000", "ok"));
  fs.push_back(finding("FEMA-MANN-001", Severity::kViolation,
                       with_violation ? FindingStatus::kFail : FindingStatus::kPass, "Creek/Upper/5000",
                       "channel n 0.012 outside [0.02, 0.15]"));
  fs.push_back(finding("FEMA-COEF-001", Severity::kWarning, FindingStatus::kFail, "Creek/Upper/5000",
                       "tab\there \"quoted\""));
  fs.push_back(finding("FEMA-BRG-001", Severity::kInfo, FindingStatus::kNotApplicable, nullptr,
                       "no bridge entity matched"));
  fs.push_back(finding("CUSTOM-001", Severity::kWarning, FindingStatus::kError, "Creek/Upper/3000",
                       "condition: missing attribute 'expansion_coef'"));

  report::RunMetadata meta;
  meta.timestamp = timestamp;
  meta.active_plan = "p01";
  meta.precedence = "result_overrides_design";
  report::InputFile in;
  in.source = make_source("/data/study.g01");
  in.content_hash = hash_bytes("geometry");
  meta.inputs.push_back(in);

  return report::aggregate(std::move(meta), std::move(fs), {"/data/study.g01:12: bad number 'x'"}, rule_set());
}

void test_counts() {
  const auto r = make_report("2024-01-01T00:00:00Z", true);
  const auto& s = r.summary;
  expect_true(s.total() == 5, "counts: total");
  expect_true(s.by_status(rules::FindingStatus::kFail) == 2, "counts: fail");
  expect_true(s.count(rules::Severity::kViolation, rules::FindingStatus::kFail) == 1, "counts: violation x fail");
  expect_true(s.by_severity(rules::Severity::kWarning) == 2, "counts: warning severity");
  expect_true(r.exit_code() == report::kExitViolations, "exit code 2 with failed violation");
  expect_true(make_report("t", false).exit_code() == report::kExitCompliant,
              "exit code 0 when only warnings fail");
  expect_true(r.rule_load_errors.size() == 1 && r.rule_load_errors[0].rule_id == "BROKEN",
              "rule load errors carried into the report");
  expect_eq_str(r.meta.ruleset_name, "fema_baseline", "ruleset name stamped");
}

void test_determinism() {
  const auto a = make_report("2024-01-01T00:00:00Z", true);
  const auto b = make_report("2024-06-30T12:00:00Z", true);
  const ReportSettings rs;

  expect_eq_str(report::report_to_json(a, rs), report::report_to_json(a, rs), "json: repeat render identical");
  expect_eq_str(report::report_to_markdown(a, rs), report::report_to_markdown(a, rs), "markdown: repeat identical");

  std::istringstream ja(report::report_to_json(a, rs));
  std::istringstream jb(report::report_to_json(b, rs));
  std::string la;
  std::string lb;
  int differing = 0;
  while (std::getline(ja, la) && std::getline(jb, lb)) {
    if (la != lb) {
      ++differing;
      expect_true(contains(la, "\"timestamp\""), "json: only the timestamp line differs");
    }
  }
  expect_true(differing == 1, "json: exactly one line differs across runs");
}

void test_json() {
  const auto r = make_report("2024-01-01T00:00:00Z", true);
  const std::string j = report::report_to_json(r, {});
  expect_true(contains(j, "\"exit_code\": 2"), "json: exit code");
  expect_true(contains(j, "tab\\there \\\"quoted\\\""), "json: escaping");
  expect_true(contains(j, "\"entity\": null"), "json: model-wide finding has null entity");
  expect_true(contains(j, "\"superseded\": []"), "json: empty array");

  std::ostringstream os;
  report::JsonWriteOptions opt;
  opt.pretty = false;
  report::JsonWriter w(os, opt);
  w.begin_object();
  w.key("a");
  w.number(std::nan(""));
  w.key("b");
  w.begin_array();
  w.number(0.1);
  w.number(3);
  w.end_array();
  w.key("c");
  w.begin_object();
  w.end_object();
  w.end_object();
  expect_eq_str(os.str(), "{\"a\":null,\"b\":[0.1,3],\"c\":{}}", "json writer: compact form");
}

void test_text_renderings() {
  const auto r = make_report("2024-01-01T00:00:00Z", true);

  ReportSettings rs;
  rs.include_not_applicable = false;
  const std::string tsv = report::report_to_tsv(r, rs);
  int lines = 0;
  for (char c : tsv) lines += c == '\n' ? 1 : 0;
  expect_true(lines == 5, "tsv: header + four applicable rows");
  expect_true(contains(tsv, "tab here \"quoted\""), "tsv: tab in message replaced");

  const std::string md = report::report_to_markdown(r, {});
  expect_true(contains(md, "## Critical Failures"), "markdown: critical section");
  expect_true(contains(md, "### Manning's n"), "markdown: category by rule id");
  expect_true(contains(md, "### Other"), "markdown: uncategorized rules");
  expect_true(contains(md, "## Rule Load Errors"), "markdown: rule load errors");

  expect_eq_str(report::rule_category("TX-FW-001"), "Floodway / Surcharge", "category: state prefix");

  std::ostringstream term;
  report::print_terminal_summary(term, r);
  expect_true(contains(term.str(), "1 critical failure(s)"), "terminal: critical count");
}

} // namespace
} // namespace rascheck

int main() {
  using namespace rascheck;
  try {
    test_counts();
    test_determinism();
    test_json();
    test_text_renderings();
  } catch (const std::exception& e) {
    std::cerr << "Unhandled exception: " << e.what() << "\n";
    return 1;
  }

  if (g_fail_count != 0) {
    std::cerr << "Selftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "All selftests passed.\n";
  return 0;
}
