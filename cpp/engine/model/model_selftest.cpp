/*
  Model builder selftest

  Covers:
    1) Derived attributes: Manning's n per zone, channel width, thalweg,
       bridge low chord / opening / pier width.
    2) A non-numeric Manning's n leaves that zone unset with a warning.
    3) Conflicting design values: ModelConsistencyError without a plan; the
       file linked by the active plan wins otherwise.
    4) Result precedence under both merge policies; result-only sections.
    5) Steady flow profiles / boundaries and unsteady boundary locations.

  Framework-free; non-zero exit on failure.
*/

#include <cmath>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "engine/core/errors.hpp"
#include "engine/core/settings.hpp"
#include "engine/core/source.hpp"
#include "engine/model/model_builder.hpp"
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

void expect_near(double a, double b, double tol, std::string_view msg) {
  if (!(std::fabs(a - b) <= tol)) {
    fail(msg);
    std::cerr << "  a: " << a << "\n";
    std::cerr << "  b: " << b << "\n";
  } else {
    pass(msg);
  }
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

text::ParsedTextFile parse(const std::string& path, const std::string& content) {
  return text::parse_text(content, make_source(path));
}

model::HydraulicModel build(std::vector<text::ParsedTextFile> text_files,
                            std::vector<results::ParsedResultFile> result_files = {},
                            MergePrecedence precedence = MergePrecedence::kResultOverridesDesign) {
  MergeSettings ms;
  ms.precedence = precedence;
  const auto policy = model::make_merge_policy(precedence);
  const model::ModelBuilder builder(ms, *policy);
  return builder.build(std::move(text_files), std::move(result_files));
}

bool has_warning_containing(const model::HydraulicModel& m, std::string_view needle) {
  for (const auto& w : m.warnings()) {
    if (w.find(needle) != std::string::npos) return true;
  }
  return false;
}

double number_of(const model::HydraulicModel& m, const char* type, const std::string& id,
                 const char* attr) {
  const model::Entity* e = m.find(type, id);
  return e ? e->get(attr).as_number() : std::nan("");
}

std::string cross_section(const std::string& rs, const std::string& bank_sta,
                          const std::string& channel_n) {
  return "Type RM Length L Ch R = 1 ," + rs + ",100,100,100\n"
         "Node Name=Section\n"
         "#Sta/Elev= 3 \n"
         "       0     100      50      90     100     100\n"
         "#Mann= 3 , 0 , 0 \n"
         "     .04       0       0" + channel_n + "      30       0     .05      70       0\n"
         "Bank Sta=" + bank_sta + "\n"
         "Exp/Cntr=0.3,0.1\n";
}

std::string geometry(const std::string& body) {
  return "Geom Title=Test Geometry\n"
         "Program Version=6.30\n"
         "River Reach=Creek           ,Upper           \n" +
         body;
}

const char* kBridge =
    "Type RM Length L Ch R = 6 ,4500    ,50,50,50\n"
    "Node Name=Main St\n"
    "#Deck/Roadway= 2 ,30 \n"
    "       0     110     105     100     110     104\n"
    "US Boundary Condition Sta=20,80\n"
    "#Pier= 1 \n"
    "Pier Skew=0\n"
    "Center Sta Upstream=50\n"
    "#Pier Elev= 2 \n"
    "      90       2     110       4\n";

void test_derived_attributes() {
  const auto m = build({parse("/tmp/study.g01",
                              geometry(cross_section("5000", "30,70", "    .035") + kBridge +
                                       cross_section("4000", "30,70", "     abc")))});

  const std::string xs = "Creek/Upper/5000";
  expect_near(number_of(m, model::kCrossSection, xs, "manning_n_left"), 0.04, 1e-12, "derived: left n");
  expect_near(number_of(m, model::kCrossSection, xs, "manning_n_channel"), 0.035, 1e-12, "derived: channel n");
  expect_near(number_of(m, model::kCrossSection, xs, "manning_n_right"), 0.05, 1e-12, "derived: right n");
  expect_near(number_of(m, model::kCrossSection, xs, "channel_width"), 40.0, 1e-12, "derived: channel width");
  expect_near(number_of(m, model::kCrossSection, xs, "thalweg"), 90.0, 1e-12, "derived: thalweg");
  expect_near(number_of(m, model::kCrossSection, xs, "expansion_coef"), 0.3, 1e-12, "Exp/Cntr: expansion first");

  const std::string br = "Creek/Upper/4500";
  expect_near(number_of(m, model::kBridge, br, "min_low_chord"), 104.0, 1e-12, "bridge: min low chord");
  expect_near(number_of(m, model::kBridge, br, "opening_width"), 60.0, 1e-12, "bridge: opening width");
  expect_near(number_of(m, model::kBridge, br, "total_pier_width"), 3.4, 1e-9, "bridge: pier width at low chord");
  expect_near(number_of(m, model::kBridge, br, "pier_count"), 1.0, 0.0, "bridge: pier count");

  expect_near(number_of(m, model::kReach, "Creek/Upper", "cross_section_count"), 2.0, 0.0, "reach: cross section count");
  expect_near(number_of(m, model::kReach, "Creek/Upper", "bridge_count"), 1.0, 0.0, "reach: bridge count");

  const model::Entity* bad = m.find(model::kCrossSection, "Creek/Upper/4000");
  expect_true(bad != nullptr, "bad n: entity still built");
  if (bad) {
    expect_true(bad->get("manning_n_channel").is_missing(), "bad n: channel n missing");
    expect_true(bad->get("manning_n_left").is_number(), "bad n: other zones still set");
  }
  expect_true(has_warning_containing(m, "manning_n_channel"), "bad n: model warning names the attribute");

  const model::Entity* rel = m.find(model::kCrossSection, xs);
  expect_true(rel && rel->related("reach") && rel->related("reach")->id == "Creek/Upper",
              "relations: cross section -> reach");
}

void test_manning_entry_order() {
  const auto m = build({parse("/tmp/study.g01",
                              geometry("Type RM Length L Ch R = 1 ,300   ,0   ,0   ,0\n"
                                       "#Mann= 2 , 0\n"
                                       "     .05       0       0    .035      50       0\n"))});
  const std::string xs = "Creek/Upper/300";
  expect_near(number_of(m, model::kCrossSection, xs, "manning_n_left"), 0.05, 1e-12, "mann order: n leads each entry");
  expect_near(number_of(m, model::kCrossSection, xs, "manning_n_right"), 0.035, 1e-12, "mann order: last region is right n");
  expect_near(number_of(m, model::kCrossSection, xs, "manning_region_count"), 2.0, 0.0, "mann order: two regions");
  const model::Entity* e = m.find(model::kCrossSection, xs);
  expect_true(e && e->get("manning_n_channel").is_missing(), "mann order: no bank stations -> no channel n");
}

void test_conflicts() {
  const std::string g1 = geometry(cross_section("5000", "30,70", "    .035"));
  const std::string g2 = geometry(cross_section("5000.0", "25,70", "    .035"));

  bool threw = false;
  try {
    (void)build({parse("/tmp/study.g01", g1), parse("/tmp/study.g02", g2)});
  } catch (const ModelConsistencyError& e) {
    threw = true;
    expect_true(e.first_source().find("study.g01") != std::string::npos, "conflict: first source named");
    expect_true(e.second_source().find("study.g02") != std::string::npos, "conflict: second source named");
    const std::string what = e.what();
    expect_true(what.find("30") != std::string::npos && what.find("25") != std::string::npos,
                "conflict: both values in the message");
  }
  expect_true(threw, "conflict: no plan -> ModelConsistencyError");

  const std::string plan =
      "Plan Title=Existing\n"
      "Program Version=6.30\n"
      "Short Identifier=Existing\n"
      "Geom File=g02\n"
      "Flow File=f01\n"
      "Plan Type= 1 \n";
  const auto m = build({parse("/tmp/study.g01", g1), parse("/tmp/study.g02", g2),
                        parse("/tmp/study.p01", plan)});
  expect_near(number_of(m, model::kCrossSection, "Creek/Upper/5000", "left_bank_station"), 25.0, 0.0,
              "conflict: linked geometry wins");
  expect_near(number_of(m, model::kCrossSection, "Creek/Upper/5000", "channel_width"), 45.0, 0.0,
              "conflict: derived width follows the winner");
  expect_true(has_warning_containing(m, "overrides"), "conflict: override recorded as warning");

  const model::Entity* p = m.find(model::kPlan, "p01");
  expect_true(p && p->get("active").as_bool(), "plan: only plan is active");
  expect_true(p && p->related("flow") && p->related("flow")->id == "f01", "plan: flow link");

  // Equal values (and "5000" vs "5000.0") are the same station, not a conflict.
  const auto same = build({parse("/tmp/study.g01", g1),
                           parse("/tmp/study.g02", geometry(cross_section("5000.0", "30,70", "    .035")))});
  expect_true(same.of_type(model::kCrossSection).size() == 1, "stations canonicalized numerically");
}

results::ParsedResultFile result_fixture() {
  results::ParsedResultFile r;
  r.source = make_source("/tmp/study.p01.hdf");
  r.file_type = "HEC-RAS Results";
  r.file_version = "HEC-RAS 6.3.1 September 2022";
  r.layout_name = "results_v6";

  const std::string attrs = "Geometry/Cross Sections/Attributes/";
  results::RawDataset river;
  river.path = attrs + "River";
  river.strings = {"Creek", "Creek"};
  river.shape = {2};
  results::RawDataset reach = river;
  reach.path = attrs + "Reach";
  reach.strings = {"Upper", "Upper"};
  results::RawDataset rs = river;
  rs.path = attrs + "RS";
  rs.strings = {"5000", "4750"};
  results::RawDataset contr;
  contr.path = attrs + "Contr";
  contr.numbers = {0.2, 0.15};
  contr.shape = {2};

  results::RawDataset ws;
  ws.path = "Results/Steady/Output/Output Blocks/Base Output/Steady Profiles/Cross Sections/Water Surface";
  ws.shape = {2, 2};
  ws.numbers = {101.0, 102.0, 103.0, 104.0};

  r.datasets = {contr, rs, reach, river, ws};
  return r;
}

void test_result_precedence() {
  const std::string g1 = geometry(cross_section("5000", "30,70", "    .035"));

  const auto m = build({parse("/tmp/study.g01", g1)}, {result_fixture()});
  const model::Entity* xs = m.find(model::kCrossSection, "Creek/Upper/5000");
  const model::Attribute* c = xs ? xs->attribute("contraction_coef") : nullptr;
  expect_true(c != nullptr, "precedence: attribute present");
  if (c) {
    expect_near(c->value.as_number(), 0.2, 1e-12, "precedence: result value effective");
    expect_true(c->design_value && std::fabs(c->design_value->as_number() - 0.1) < 1e-12,
                "precedence: text value kept as design_value");
    expect_true(c->origin == model::Origin::kResult, "precedence: origin result");
  }
  const model::Value wsv = xs ? xs->get("water_surface") : model::Value::missing();
  expect_true(wsv.as_numbers().size() == 2 && wsv.as_numbers()[0] == 101.0 && wsv.as_numbers()[1] == 103.0,
              "results: per-profile values follow the cross-section column");

  const model::Entity* only = m.find(model::kCrossSection, "Creek/Upper/4750");
  expect_true(only != nullptr, "results: result-only cross section created");
  if (only) {
    const model::Attribute* a = only->attribute("contraction_coef");
    expect_true(a && a->origin == model::Origin::kResult && !a->design_value,
                "results: result-only attribute has origin result");
  }
  const model::Entity* plan = m.find(model::kPlan, "p01");
  expect_true(plan && plan->get("has_results").as_bool(), "results: plan marked has_results");

  const auto d = build({parse("/tmp/study.g01", g1)}, {result_fixture()},
                       MergePrecedence::kDesignOverridesResult);
  const model::Entity* dxs = d.find(model::kCrossSection, "Creek/Upper/5000");
  expect_near(dxs ? dxs->get("contraction_coef").as_number() : std::nan(""), 0.1, 1e-12,
              "precedence: design policy keeps text value");
}

void test_flows() {
  const std::string steady =
      "Flow Title=Base\n"
      "Program Version=6.30\n"
      "Number of Profiles= 2 \n"
      "Profile Names=10yr,100yr\n"
      "River Rch & RM=Creek,Upper,5000\n"
      "     500    1200\n"
      "Boundary for River Rch & Prof#=Creek,Upper, 1 \n"
      "Up Type= 0 \n"
      "Dn Type= 3 \n"
      "Dn Slope=0.001\n"
      "Boundary for River Rch & Prof#=Creek,Upper, 2 \n"
      "Up Type= 0 \n"
      "Dn Type= 3 \n"
      "Dn Slope=0.001\n";
  const std::string unsteady =
      "Flow Title=Event\n"
      "Program Version=6.30\n"
      "Use Restart= 0 \n"
      "Boundary Location=Creek           ,Upper           ,5000    ,        ,                \n"
      "Interval=1HOUR\n"
      "Flow Hydrograph= 3 \n"
      "     100     500     200\n"
      "Boundary Location=Creek           ,Upper           ,1000    ,        ,                \n"
      "Friction Slope=0.002,0\n";

  const auto m = build({parse("/tmp/study.f01", steady), parse("/tmp/study.u01", unsteady)});

  expect_near(number_of(m, model::kProfile, "100yr", "index"), 2.0, 0.0, "steady: profile index");
  const model::Entity* b = m.find(model::kBoundary, "f01/Creek/Upper/P2");
  expect_true(b != nullptr, "steady: boundary per profile");
  if (b) {
    expect_eq_str(b->get("downstream_type_name").as_string(), "normal_depth", "steady: boundary type name");
    expect_eq_str(b->get("profile_name").as_string(), "100yr", "steady: boundary profile name");
  }
  expect_near(number_of(m, model::kFlowChange, "f01/Creek/Upper/5000", "max_flow"), 1200.0, 0.0,
              "steady: flow change peak");
  expect_near(number_of(m, model::kFlow, "f01", "boundary_count"), 2.0, 0.0, "steady: boundary count");

  const model::Entity* h = m.find(model::kBoundary, "u01/Creek/Upper/5000");
  expect_true(h && h->get("boundary_type").as_string() == "flow_hydrograph", "unsteady: hydrograph boundary");
  expect_near(number_of(m, model::kBoundary, "u01/Creek/Upper/5000", "hydrograph_peak"), 500.0, 0.0,
              "unsteady: hydrograph peak");
  const model::Entity* nd = m.find(model::kBoundary, "u01/Creek/Upper/1000");
  expect_true(nd && nd->get("boundary_type").as_string() == "normal_depth", "unsteady: friction slope boundary");
  expect_near(number_of(m, model::kBoundary, "u01/Creek/Upper/1000", "friction_slope"), 0.002, 1e-12,
              "unsteady: friction slope");
  expect_near(number_of(m, model::kFlow, "u01", "boundary_count"), 2.0, 0.0, "unsteady: boundary count");

  const model::Entity* top = m.find(model::kModel, "model");
  expect_true(top && top->get("profile_names").as_strings().size() == 2, "model: profile names aggregated");
  const model::Value names = top ? top->get("profile_names") : model::Value::missing();
  expect_true(names.as_strings() == std::vector<std::string>{"10yr", "100yr"}, "model: profile names in flow order");
  expect_near(number_of(m, model::kProfile, "10yr", "index"), 1.0, 0.0, "steady: first profile index");
  const model::Entity* p1 = m.find(model::kProfile, "10yr");
  expect_true(p1 && p1->related("flow") && p1->related("flow")->id == "f01", "steady: profile -> flow relation");

  // Canonical key order, unique keys.
  const model::EntityKey* prev = nullptr;
  bool ordered = true;
  for (const auto& [key, e] : m.entities()) {
    if (prev && !(*prev < key)) ordered = false;
    prev = &key;
  }
  expect_true(ordered, "entities iterate in strictly increasing key order");
}

} // namespace
} // namespace rascheck

int main() {
  using namespace rascheck;

  try {
    test_derived_attributes();
    test_manning_entry_order();
    test_conflicts();
    test_result_precedence();
    test_flows();
  } catch (const std::exception& e) {
    fail(std::string("unexpected exception: ") + e.what());
  }

  if (g_fail_count != 0) {
    std::cerr << "Selftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "All selftests passed.\n";
  return 0;
}
