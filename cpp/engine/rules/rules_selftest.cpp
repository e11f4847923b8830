/*
  Rule loader / expression / engine selftest

  Covers:
    1) A rule without a citation is rejected; its siblings still load.
    2) Aggregate misuse, undefined parameters, duplicate ids and unknown
       keys are per-rule load errors; "error" severity maps to violation.
    3) Overlay documents supersede baseline rules by id.
    4) Empty selector match -> one not_applicable finding.
    5) Missing attribute -> error finding for that entity only.
    6) Aggregate rules produce one finding.
    7) Message placeholders.
    8) Parallel evaluation output equals sequential output.
    9) Expressions nested past the depth limit are syntax errors.
   10) Generated state overlays load cleanly, supersede baseline rules and
       are not overwritten without the overwrite flag.

  Framework-free; non-zero exit on failure.
*/

#include <chrono>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "engine/core/errors.hpp"
#include "engine/core/settings.hpp"
#include "engine/core/source.hpp"
#include "engine/model/model_builder.hpp"
#include "engine/rules/expr_eval.hpp"
#include "engine/rules/expr_parser.hpp"
#include "engine/rules/overlay_writer.hpp"
#include "engine/rules/rule_engine.hpp"
#include "engine/rules/rule_loader.hpp"
#include "engine/text/section_parser.hpp"

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

const char* kGeometry =
    "Geom Title=Rules Test\n"
    "Program Version=6.30\n"
    "River Reach=Creek           ,Upper           \n"
    "Type RM Length L Ch R = 1 ,5000,100,100,100\n"
    "Node Name=Section\n"
    "#Sta/Elev= 3 \n"
    "       0     100      50      90     100     100\n"
    "#Mann= 3 , 0 , 0 \n"
    "     .04       0       0    .035      30       0     .05      70       0\n"
    "Bank Sta=30,70\n"
    "Exp/Cntr=0.3,0.1\n"
    "Type RM Length L Ch R = 1 ,4000,100,100,100\n"
    "Node Name=Section\n"
    "#Sta/Elev= 3 \n"
    "       0     100      50      88     100     100\n"
    "#Mann= 3 , 0 , 0 \n"
    "     .04       0       0    .012      30       0     .05      70       0\n"
    "Bank Sta=30,70\n"
    "Exp/Cntr=0.3,0.1\n"
    "Type RM Length L Ch R = 1 ,3000,100,100,100\n"
    "Node Name=Section\n"
    "#Sta/Elev= 3 \n"
    "       0     100      50      86     100     100\n";

model::HydraulicModel build_model() {
  MergeSettings ms;
  const auto policy = model::make_merge_policy(ms.precedence);
  const model::ModelBuilder builder(ms, *policy);
  std::vector<text::ParsedTextFile> files;
  files.push_back(text::parse_text(kGeometry, make_source("/tmp/rules.g01")));
  return builder.build(std::move(files), {});
}

const char* kBaseline =
    "ruleset: fema_baseline\n"
    "version: '1'\n"
    "rules:\n"
    "  - id: MANN-001\n"
    "    name: Channel n range\n"
    "    citation: Test citation 1\n"
    "    severity: violation\n"
    "    selector: {type: cross_section, where: \"exists(mann_table)\"}\n"
    "    condition: \"manning_n_channel >= params.min and manning_n_channel <= params.max\"\n"
    "    parameters: {min: 0.02, max: 0.15}\n"
    "    message: \"{id}: channel n {manning_n_channel} outside [{params.min}, {params.max}]\"\n"
    "  - id: NOCITE-001\n"
    "    severity: warning\n"
    "    selector: cross_section\n"
    "    condition: \"true\"\n"
    "  - id: FW-001\n"
    "    citation: Test citation 2\n"
    "    severity: error\n"
    "    selector: bridge\n"
    "    condition: \"min_low_chord > 0\"\n"
    "  - id: MISS-001\n"
    "    citation: Test citation 3\n"
    "    severity: info\n"
    "    selector: cross_section\n"
    "    condition: \"expansion_coef <= 0.5\"\n"
    "  - id: AGG-001\n"
    "    citation: Test citation 4\n"
    "    severity: warning\n"
    "    selector: cross_section\n"
    "    aggregate: true\n"
    "    condition: \"count() >= params.min_sections\"\n"
    "    parameters: {min_sections: 3}\n"
    "    pass_message: \"{params.min_sections} or more sections\"\n"
    "  - id: AGG-BAD\n"
    "    citation: Test citation 5\n"
    "    severity: warning\n"
    "    selector: cross_section\n"
    "    condition: \"count() > 1\"\n"
    "  - id: PARAM-BAD\n"
    "    citation: Test citation 6\n"
    "    severity: warning\n"
    "    selector: cross_section\n"
    "    condition: \"thalweg > params.nope\"\n"
    "  - id: KEY-BAD\n"
    "    citation: Test citation 7\n"
    "    severity: warning\n"
    "    selector: cross_section\n"
    "    condition: \"true\"\n"
    "    threshold: 3\n"
    "  - id: MANN-001\n"
    "    citation: Test citation 8\n"
    "    severity: info\n"
    "    selector: cross_section\n"
    "    condition: \"true\"\n";

const char* kOverlay =
    "ruleset: state\n"
    "version: '2'\n"
    "supersedes: [FW-001, NOT-THERE]\n"
    "rules:\n"
    "  - id: ST-FW-001\n"
    "    citation: State citation\n"
    "    severity: violation\n"
    "    selector: {types: [bridge, cross_section], where: \"thalweg < 89\"}\n"
    "    condition: \"thalweg < params.limit\"\n"
    "    parameters: {limit: 87}\n";

bool has_load_error(const rules::RuleSet& set, const std::string& id, std::string_view needle) {
  for (const auto& e : set.load_errors) {
    if (e.rule_id() == id && e.reason().find(needle) != std::string::npos) return true;
  }
  return false;
}

std::vector<rules::Finding> findings_for(const std::vector<rules::Finding>& all, const std::string& id) {
  std::vector<rules::Finding> out;
  for (const auto& f : all) {
    if (f.rule_id == id) out.push_back(f);
  }
  return out;
}

rules::RuleSet load_both() {
  rules::RuleLoader loader;
  loader.add_text(kBaseline, "baseline.yaml");
  loader.add_text(kOverlay, "state.yaml");
  return loader.finish();
}

void test_loading() {
  const auto set = load_both();

  expect_true(set.find("NOCITE-001") == nullptr, "load: rule without citation rejected");
  expect_true(has_load_error(set, "NOCITE-001", "citation"), "load: missing citation reported");
  expect_true(has_load_error(set, "AGG-BAD", "aggregate"), "load: aggregate function outside aggregate rule");
  expect_true(has_load_error(set, "PARAM-BAD", "params.nope"), "load: undefined parameter");
  expect_true(has_load_error(set, "KEY-BAD", "threshold"), "load: unknown rule key");
  expect_true(has_load_error(set, "MANN-001", "duplicate"), "load: duplicate id");
  expect_true(set.load_errors.size() == 5, "load: five rule errors");

  const rules::Rule* mann = set.find("MANN-001");
  expect_true(mann && mann->citation == "Test citation 1", "load: first MANN-001 definition kept");
  expect_true(set.find("FW-001") == nullptr, "overlay: FW-001 superseded");
  expect_true(set.superseded.size() == 1 && set.superseded[0] == "FW-001", "overlay: superseded list");
  expect_true(set.find("ST-FW-001") != nullptr, "overlay: state rule added");
  expect_eq_str(set.name(), "fema_baseline + state", "ruleset display name");
  expect_true(set.rules.size() == 4, "load: four rules active");

  rules::RuleLoader alias;
  alias.add_text(kBaseline, "baseline.yaml");
  const auto base = alias.finish();
  const rules::Rule* fw = base.find("FW-001");
  expect_true(fw && fw->severity == rules::Severity::kViolation, "severity alias: error -> violation");
  expect_true(base.hash.value != set.hash.value, "hash differs with overlay");

  bool threw = false;
  try {
    rules::RuleLoader bad;
    bad.add_text("rules: [unclosed", "broken.yaml");
  } catch (const RuleLoadError&) {
    threw = true;
  }
  expect_true(threw, "load: invalid YAML is fatal for the document");
}

void test_evaluation() {
  const auto m = build_model();
  const auto set = load_both();
  const rules::RuleEngine engine(EvalSettings{false, 0});
  const auto all = engine.evaluate(set, m);

  const auto mann = findings_for(all, "MANN-001");
  expect_true(mann.size() == 2, "mann: where filter drops section without table");
  if (mann.size() == 2) {
    // Canonical station order: 4000 before 5000.
    expect_true(mann[0].status == rules::FindingStatus::kFail, "mann: 4000 fails (n = 0.012)");
    expect_eq_str(mann[0].message, "Creek/Upper/4000: channel n 0.012 outside [0.02, 0.15]",
                  "mann: message placeholders");
    expect_true(mann[1].status == rules::FindingStatus::kPass, "mann: 5000 passes");
    expect_eq_str(mann[1].message, "condition met", "mann: default pass message");
  }

  const auto miss = findings_for(all, "MISS-001");
  expect_true(miss.size() == 3, "missing: one finding per section");
  int errors = 0;
  for (const auto& f : miss) {
    if (f.status == rules::FindingStatus::kError) {
      ++errors;
      expect_true(f.message.find("expansion_coef") != std::string::npos, "missing: names the attribute");
      expect_true(f.entity && f.entity->id == "Creek/Upper/3000", "missing: error bound to entity");
    }
  }
  expect_true(errors == 1, "missing: only the section without Exp/Cntr errors");

  const auto agg = findings_for(all, "AGG-001");
  expect_true(agg.size() == 1 && agg[0].status == rules::FindingStatus::kPass && !agg[0].entity,
              "aggregate: single finding");
  if (!agg.empty()) expect_eq_str(agg[0].message, "3 or more sections", "aggregate: pass message");

  const auto st = findings_for(all, "ST-FW-001");
  expect_true(st.size() == 2, "overlay: multi-type selector with where");
  if (st.size() == 2) {
    expect_true(st[0].status == rules::FindingStatus::kPass, "overlay: 86 < 87");
    expect_true(st[1].status == rules::FindingStatus::kFail, "overlay: 88 >= 87");
  }

  rules::RuleLoader only_bridges;
  only_bridges.add_text(
      "rules:\n"
      "  - id: BR-001\n"
      "    citation: c\n"
      "    severity: warning\n"
      "    selector: bridge\n"
      "    condition: \"min_low_chord > 0\"\n",
      "bridges.yaml");
  const auto na = engine.evaluate(only_bridges.finish(), m);
  expect_true(na.size() == 1 && na[0].status == rules::FindingStatus::kNotApplicable && !na[0].entity,
              "empty match: one not_applicable finding");
}

void test_parallel_matches_sequential() {
  const auto m = build_model();
  const auto set = load_both();
  const auto seq = rules::RuleEngine(EvalSettings{false, 0}).evaluate(set, m);
  const auto par = rules::RuleEngine(EvalSettings{true, 2}).evaluate(set, m);

  bool same = seq.size() == par.size();
  for (std::size_t i = 0; same && i < seq.size(); ++i) {
    same = seq[i].rule_id == par[i].rule_id && seq[i].status == par[i].status &&
           seq[i].message == par[i].message && seq[i].entity == par[i].entity;
  }
  expect_true(same, "parallel evaluation matches sequential");
}

void test_expressions() {
  const auto m = build_model();
  const model::Entity* xs = m.find(model::kCrossSection, "Creek/Upper/5000");
  if (!xs) {
    fail("expr: fixture section present");
    return;
  }
  rules::ParamMap params;
  params["zones"] = model::Value::strings({"left", "right"});
  rules::EvalContext ctx;
  ctx.entity = xs;
  ctx.params = &params;

  const auto eval = [&ctx](const char* text) { return rules::evaluate(*rules::parse_expression(text), ctx); };

  expect_true(eval("channel_width == 40").as_bool(), "expr: derived attribute");
  expect_true(eval("max(manning_n_left, manning_n_right) == 0.05").as_bool(), "expr: max()");
  expect_true(eval("\"left\" in params.zones and \"center\" not in params.zones").as_bool(), "expr: in / not in");
  expect_true(eval("1 / 0 > 0").is_error(), "expr: division by zero is an error");
  expect_true(eval("station_id == 5000").is_error(), "expr: string vs number comparison is an error");
  expect_true(eval("not exists(pier_count)").as_bool(), "expr: exists() on missing attribute");

  bool threw = false;
  try {
    (void)rules::parse_expression("thalweg >");
  } catch (const rules::ExprSyntaxError&) {
    threw = true;
  }
  expect_true(threw, "expr: syntax error reported");
}

void test_nesting_limit() {
  const auto rejected = [](const std::string& text) {
    try {
      (void)rules::parse_expression(text);
    } catch (const rules::ExprSyntaxError& e) {
      return std::string(e.what()).find("nested deeper") != std::string::npos;
    }
    return false;
  };

  expect_true(rejected(std::string(1000, '(') + "1" + std::string(1000, ')')), "nesting: 1000 parentheses rejected");
  expect_true(rejected(std::string(1000, '-') + "1"), "nesting: 1000 unary minus rejected");

  std::string nots;
  for (int i = 0; i < 1000; ++i) nots += "not ";
  expect_true(rejected(nots + "true"), "nesting: 1000 'not' rejected");

  const std::string shallow = std::string(100, '(') + "1" + std::string(100, ')') + " == 1";
  const auto e = rules::parse_expression(shallow);
  expect_true(e != nullptr, "nesting: 100 parentheses accepted");

  const std::string doc =
      "ruleset: deep\n"
      "version: '1'\n"
      "rules:\n"
      "  - id: DEEP-001\n"
      "    citation: Test citation\n"
      "    severity: warning\n"
      "    selector: cross_section\n"
      "    condition: \"" + std::string(1000, '(') + "true" + std::string(1000, ')') + "\"\n"
      "  - id: SHALLOW-001\n"
      "    citation: Test citation\n"
      "    severity: warning\n"
      "    selector: cross_section\n"
      "    condition: \"true\"\n";
  rules::RuleLoader loader;
  loader.add_text(doc, "deep.yaml");
  const auto set = loader.finish();
  expect_true(set.find("DEEP-001") == nullptr && has_load_error(set, "DEEP-001", "nested deeper"),
              "nesting: deep condition is a per-rule load error");
  expect_true(set.find("SHALLOW-001") != nullptr, "nesting: sibling rule still loads");
}

void test_state_overlay() {
  rules::StateOverlayOptions o;
  o.state_name = "New Mexico";
  o.abbreviation = "nm";
  o.supersedes = {"FW-001"};
  o.zero_rise = true;
  o.events = {"100yr", "10yr"};
  o.freeboard_review = true;

  const std::string text = rules::emit_state_overlay(o);
  rules::RuleLoader loader;
  loader.add_text(kBaseline, "baseline.yaml");
  loader.add_text(text, "new_mexico.yaml");
  const auto set = loader.finish();

  bool clean = true;
  for (const auto& e : set.load_errors) {
    if (e.rule_id().rfind("NM-", 0) == 0) clean = false;
  }
  expect_true(clean, "overlay: generated rules load without errors");
  expect_true(set.find("FW-001") == nullptr, "overlay: supersedes removes the baseline rule");
  expect_true(set.find("NM-FW-001") != nullptr, "overlay: zero-rise rule");
  expect_true(set.find("NM-EVENT-001") != nullptr && set.find("NM-EVENT-003") != nullptr,
              "overlay: event ids follow the event table");
  expect_true(set.find("NM-EVENT-002") == nullptr, "overlay: unrequested event omitted");
  const rules::Rule* fb = set.find("NM-FB-001");
  expect_true(fb && fb->severity == rules::Severity::kInfo, "overlay: freeboard review is info");
  expect_eq_str(set.name(), "fema_baseline + new_mexico", "overlay: ruleset named after the state");
  expect_true(text.find("FEMA-FW-001") != std::string::npos, "overlay: zero-rise supersedes FEMA-FW-001");

  const auto rejects = [](const rules::StateOverlayOptions& bad) {
    try {
      (void)rules::emit_state_overlay(bad);
    } catch (const ValidationError&) {
      return true;
    }
    return false;
  };
  rules::StateOverlayOptions bad_event = o;
  bad_event.events = {"25yr"};
  expect_true(rejects(bad_event), "overlay: unknown event rejected");
  rules::StateOverlayOptions bad_name = o;
  bad_name.state_name = "../texas";
  expect_true(rejects(bad_name), "overlay: path in state name rejected");

  namespace fs = std::filesystem;
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  const fs::path dir = fs::temp_directory_path() / ("rascheck_rules_selftest_" + std::to_string(stamp));

  rules::StateOverlayOptions plain;
  plain.state_name = "Florida";
  plain.abbreviation = "FL";
  const std::string path = rules::write_state_overlay(dir.string(), plain, false);
  expect_true(path == (dir / "rules" / "states" / "florida.yaml").string(), "overlay: written under rules/states");

  rules::RuleLoader empty;
  empty.add_text(rules::emit_state_overlay(plain), "florida.yaml");
  const auto empty_set = empty.finish();
  expect_true(empty_set.rules.empty() && empty_set.load_errors.empty(), "overlay: empty starter loads");

  bool refused = false;
  try {
    (void)rules::write_state_overlay(dir.string(), plain, false);
  } catch (const IoError& e) {
    refused = std::string(e.what()).find("already exists") != std::string::npos;
  }
  expect_true(refused, "overlay: existing file not overwritten");

  bool forced = true;
  try {
    (void)rules::write_state_overlay(dir.string(), plain, true);
  } catch (const IoError&) {
    forced = false;
  }
  expect_true(forced, "overlay: overwrite flag replaces the file");

  std::error_code ec;
  fs::remove_all(dir, ec);
}

} // namespace
} // namespace rascheck

int main() {
  using namespace rascheck;
  try {
    test_loading();
    test_evaluation();
    test_parallel_matches_sequential();
    test_expressions();
    test_nesting_limit();
    test_state_overlay();
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
