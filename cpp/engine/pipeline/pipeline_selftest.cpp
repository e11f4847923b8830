/*
  Pipeline selftest

  Covers:
    1) A project with a Current Plan pulls in that plan and the files it
       links, not every listed file.
    2) Unreadable / unrecognized inputs are dropped with a report warning;
       the run continues.
    3) Conflicting unlinked geometry files abort the run with
       ModelConsistencyError.
    4) Parallel and sequential runs render identical reports (timestamp
       aside); exit code follows failed violations.

  Framework-free; non-zero exit on failure. Writes into a scratch directory
  under the system temp path.
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
#include "engine/core/file_io.hpp"
#include "engine/core/progress.hpp"
#include "engine/core/settings.hpp"
#include "engine/pipeline/input_resolver.hpp"
#include "engine/pipeline/pipeline.hpp"
#include "engine/report/report_json.hpp"
#include "engine/rules/rule_loader.hpp"

namespace rascheck {
namespace {

namespace fs = std::filesystem;

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
    std::cerr << "  a: " << a.substr(0, 400) << "\n";
    std::cerr << "  b: " << b.substr(0, 400) << "\n";
  } else {
    pass(msg);
  }
}

bool has_warning_containing(const std::vector<std::string>& ws, std::string_view needle) {
  for (const auto& w : ws) {
    if (w.find(needle) != std::string::npos) return true;
  }
  return false;
}

// Counts events by kind; used to check the sink sees every stage.
class CountingSink final : public IProgressSink {
 public:
  void on_event(const ProgressEvent& ev) noexcept override {
    if (ev.kind == ProgressKind::kStageStarted) ++started;
    if (ev.kind == ProgressKind::kStageCompleted && ev.stage == "report") ++reports;
    if (ev.kind == ProgressKind::kWarning) ++warnings;
  }
  int started = 0;
  int reports = 0;
  int warnings = 0;
};

std::string geometry(const std::string& bank_sta, const std::string& channel_n) {
  return "Geom Title=Pipeline Test\n"
         "Program Version=6.30\n"
         "River Reach=Creek           ,Upper           \n"
         "Type RM Length L Ch R = 1 ,5000,100,100,100\n"
         "Node Name=Section\n"
         "#Sta/Elev= 3 \n"
         "       0     100      50      90     100     100\n"
         "#Mann= 3 , 0 , 0 \n"
         "     .04       0       0" + channel_n + "      30       0     .05      70       0\n"
         "Bank Sta=" + bank_sta + "\n"
         "Exp/Cntr=0.3,0.1\n";
}

const char* kPlan =
    "Plan Title=Existing\n"
    "Program Version=6.30\n"
    "Short Identifier=Existing\n"
    "Geom File=g01\n"
    "Flow File=f01\n"
    "Plan Type= 1 \n";

const char* kSteady =
    "Flow Title=Base\n"
    "Program Version=6.30\n"
    "Number of Profiles= 2 \n"
    "Profile Names=10yr,100yr\n"
    "River Rch & RM=Creek,Upper,5000\n"
    "     500    1200\n";

const char* kRules =
    "ruleset: pipeline_test\n"
    "version: '1'\n"
    "rules:\n"
    "  - id: T-MANN-001\n"
    "    citation: Test citation\n"
    "    severity: violation\n"
    "    selector: cross_section\n"
    "    condition: \"manning_n_channel >= 0.02\"\n"
    "  - id: T-EVENT-001\n"
    "    citation: Test citation\n"
    "    severity: warning\n"
    "    selector: model\n"
    "    condition: \"\\\"100yr\\\" in profile_names\"\n";

class Scratch {
 public:
  Scratch() {
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    dir_ = fs::temp_directory_path() / ("rascheck_pipeline_selftest_" + std::to_string(stamp));
    fs::create_directories(dir_);
  }
  ~Scratch() {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  std::string write(const std::string& name, const std::string& content) const {
    const std::string p = (dir_ / name).string();
    write_text_file(p, content);
    return p;
  }

  std::string path(const std::string& name) const { return (dir_ / name).string(); }

 private:
  fs::path dir_;
};

Settings settings(bool parallel) {
  Settings s = Settings::defaults();
  s.parse.parallel = parallel;
  s.eval.parallel = parallel;
  s.log_level = LogLevel::ERROR;
  return s;
}

rules::RuleSet rule_set() {
  rules::RuleLoader loader;
  loader.add_text(kRules, "pipeline_rules.yaml");
  return loader.finish();
}

void test_current_plan_resolution(const Scratch& dir) {
  const std::string prj = dir.path("study.prj");
  const auto in = pipeline::resolve_inputs({prj}, settings(false));

  expect_true(in.parsed.size() == 2, "resolve: project and current plan parsed up front");
  expect_true(in.text_paths.size() == 2, "resolve: linked geometry and flow");
  bool has_g02 = false;
  for (const auto& p : in.text_paths) has_g02 = has_g02 || p.find("study.g02") != std::string::npos;
  expect_true(!has_g02, "resolve: unlinked geometry left out");
  expect_true(in.result_paths.empty(), "resolve: no result container present");
}

void test_run(const Scratch& dir) {
  CountingSink sink;
  const pipeline::Pipeline p(settings(true), &sink);
  const auto rs = rule_set();
  const auto r = p.run({dir.path("study.prj"), dir.path("missing.g05"), dir.path("notes.txt")}, rs);

  expect_true(r.meta.inputs.size() == 4, "run: four inputs read");
  expect_true(r.meta.active_plan == "p01", "run: active plan recorded");
  expect_true(has_warning_containing(r.warnings, "missing.g05"), "run: missing file reported");
  expect_true(has_warning_containing(r.warnings, "notes.txt"), "run: unrecognized file reported");
  expect_true(r.exit_code() == 2, "run: channel n 0.012 is a failed violation");
  expect_true(r.summary.by_status(rules::FindingStatus::kPass) == 1, "run: 100yr profile present");
  expect_true(sink.started == 5 && sink.reports == 1, "run: every stage reported to the sink");
  expect_true(sink.warnings >= 2, "run: dropped files reported to the sink");

  const pipeline::Pipeline seq(settings(false));
  auto a = p.run({dir.path("study.prj")}, rs);
  auto b = seq.run({dir.path("study.prj")}, rs);
  a.meta.timestamp = b.meta.timestamp;
  expect_eq_str(report::report_to_json(a), report::report_to_json(b), "run: parallel equals sequential");
}

void test_conflict(const Scratch& dir) {
  const pipeline::Pipeline p(settings(true));
  bool threw = false;
  try {
    (void)p.run({dir.path("other.prj")}, rule_set());
  } catch (const ModelConsistencyError& e) {
    threw = true;
    expect_true(e.first_source().find("other.g0") != std::string::npos &&
                    e.second_source().find("other.g0") != std::string::npos,
                "conflict: both sources named");
  }
  expect_true(threw, "conflict: unlinked geometries abort the run");

  bool io = false;
  try {
    (void)p.run({dir.path("nothing.g01")}, rule_set());
  } catch (const IoError&) {
    io = true;
  }
  expect_true(io, "no readable input is an IoError");
}

} // namespace
} // namespace rascheck

int main() {
  using namespace rascheck;
  try {
    set_log_level(LogLevel::ERROR);
    const Scratch dir;
    dir.write("study.prj",
              "Proj Title=Study\n"
              "Current Plan=p01\n"
              "Default Exp/Contr=0.3,0.1\n"
              "English Units\n"
              "Geom File=g01\n"
              "Geom File=g02\n"
              "Steady File=f01\n"
              "Plan File=p01\n");
    dir.write("study.g01", geometry("30,70", "    .012"));
    dir.write("study.g02", geometry("25,70", "    .035"));
    dir.write("study.p01", kPlan);
    dir.write("study.f01", kSteady);
    dir.write("notes.txt", "not a model file\n");

    dir.write("other.prj",
              "Proj Title=Other\n"
              "Geom File=g01\n"
              "Geom File=g02\n"
              "Plan File=p05\n");
    dir.write("other.g01", geometry("30,70", "    .035"));
    dir.write("other.g02", geometry("25,70", "    .035"));

    test_current_plan_resolution(dir);
    test_run(dir);
    test_conflict(dir);
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
