/*
================================================================================
Fragment 8.0 — CLI: Main Entry Point (rascheck)
FILE: cpp/cli/main.cpp

Purpose:
  - Command-line front end of the compliance checker. Owns argument parsing,
    rule-set resolution (FEMA baseline + optional state overlay + extra
    documents), invoking the pipeline, rendering and the exit code.

Usage:
  rascheck <command> [options] [inputs...]

Commands:
  run         - Check a model and write reports
  list-rules  - Show the resolved rule set
  summary     - Model overview without a compliance check
  add-state   - Generate a starter state rule overlay
  help        - Show help message

Exit Codes:
  0 - No failed violation
  1 - Tool error (bad arguments, unreadable rules, fatal model error)
  2 - At least one failed violation
================================================================================
*/

#include "engine/core/errors.hpp"
#include "engine/core/file_io.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/progress.hpp"
#include "engine/core/settings.hpp"
#include "engine/core/settings_yaml.hpp"
#include "engine/core/strings.hpp"
#include "engine/model/entity.hpp"
#include "engine/pipeline/pipeline.hpp"
#include "engine/report/report_json.hpp"
#include "engine/report/report_text.hpp"
#include "engine/rules/overlay_writer.hpp"
#include "engine/rules/rule_loader.hpp"

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

#ifndef RASCHECK_CONFIG_DIR
#define RASCHECK_CONFIG_DIR "config"
#endif
#ifndef RASCHECK_SOURCE_CONFIG_DIR
#define RASCHECK_SOURCE_CONFIG_DIR "config"
#endif

using namespace rascheck;

// Installed config when present, else the source tree's (uninstalled build).
static std::string default_config_dir() {
  std::error_code ec;
  if (std::filesystem::is_directory(std::filesystem::path(RASCHECK_CONFIG_DIR) / "rules", ec)) {
    return RASCHECK_CONFIG_DIR;
  }
  return RASCHECK_SOURCE_CONFIG_DIR;
}

// Exit codes for CI integration
enum ExitCode {
  SUCCESS = 0,
  TOOL_ERROR = 1,
  VIOLATIONS = 2
};

struct Args {
  std::string command = "help";
  std::vector<std::string> inputs;

  std::string config_dir = default_config_dir();
  std::string state;
  std::vector<std::string> extra_rules;
  bool default_rules = true;

  std::string settings_path;
  std::string json_out;
  std::string tsv_out;
  std::string md_out;

  bool strict = false;
  bool sequential = false;
  bool quiet = false;
  std::string precedence;  // "result" | "design"
  std::string log_level;

  // add-state
  std::string abbrev;
  std::string overlay_version;
  std::vector<std::string> supersedes;
  std::vector<std::string> events;
  bool zero_rise = false;
  bool freeboard_review = false;
  bool force = false;
};

static void print_help() {
  std::cout << R"(
rascheck - HEC-RAS model compliance checker

Usage:
  rascheck run <project.prj | files...> [options]
  rascheck list-rules [options]
  rascheck summary <project.prj | files...> [options]
  rascheck add-state <state name> --abbrev <AB> [add-state options]
  rascheck help

Options:
  --state <TX|ME|name>     Apply a state rule overlay (config/rules/states/<name>.yaml)
  --rules <file.yaml>      Additional rule document (repeatable, applied in order)
  --no-default-rules       Do not load the FEMA baseline
  --config-dir <dir>       Directory holding rules/ (default: built-in config)
  --settings <file.yaml>   Settings overrides (io, parse, merge, eval, report, log)
  --json <path>            Write the JSON report
  --tsv <path>             Write the TSV findings table
  --md <path>              Write the Markdown report
  --strict                 Malformed text input is fatal for the file
  --precedence result|design
                           Which side wins when a result value overlaps a design value
  --sequential             Disable parallel parsing and evaluation
  --log-level <debug|info|warn|error>
  --quiet                  No terminal summary

add-state options (writes <config-dir>/rules/states/<state_name>.yaml):
  --abbrev <AB>            Rule id prefix, e.g. FL -> FL-FW-001
  --supersedes <ID[,ID]>   Baseline rules the overlay replaces (repeatable)
  --zero-rise              Add a zero-rise floodway rule (supersedes FEMA-FW-001)
  --events <list>          Required profiles: 10yr,50yr,100yr,500yr
  --freeboard-review       Add a freeboard manual review flag
  --version <text>         Overlay version (default: draft)
  --force                  Overwrite an existing overlay

Exit Codes:
  0 - No failed violation
  1 - Tool error
  2 - At least one failed violation
)";
}

static bool get_next(int& i, int argc, char** argv, std::string* out) {
  if (i + 1 >= argc) return false;
  *out = argv[++i];
  return true;
}

static bool parse_args(int argc, char** argv, Args* a, std::string* err) {
  if (argc >= 2) a->command = argv[1];

  for (int i = 2; i < argc; ++i) {
    const char* k = argv[i];
    std::string v;

    const auto value = [&](const char* name, std::string* dst) {
      if (!get_next(i, argc, argv, dst)) {
        *err = std::string(name) + " requires a value";
        return false;
      }
      return true;
    };

    if (std::strcmp(k, "--state") == 0) {
      if (!value("--state", &a->state)) return false;
    } else if (std::strcmp(k, "--rules") == 0) {
      if (!value("--rules", &v)) return false;
      a->extra_rules.push_back(v);
    } else if (std::strcmp(k, "--no-default-rules") == 0) {
      a->default_rules = false;
    } else if (std::strcmp(k, "--config-dir") == 0) {
      if (!value("--config-dir", &a->config_dir)) return false;
    } else if (std::strcmp(k, "--settings") == 0) {
      if (!value("--settings", &a->settings_path)) return false;
    } else if (std::strcmp(k, "--json") == 0) {
      if (!value("--json", &a->json_out)) return false;
    } else if (std::strcmp(k, "--tsv") == 0) {
      if (!value("--tsv", &a->tsv_out)) return false;
    } else if (std::strcmp(k, "--md") == 0) {
      if (!value("--md", &a->md_out)) return false;
    } else if (std::strcmp(k, "--strict") == 0) {
      a->strict = true;
    } else if (std::strcmp(k, "--sequential") == 0) {
      a->sequential = true;
    } else if (std::strcmp(k, "--quiet") == 0) {
      a->quiet = true;
    } else if (std::strcmp(k, "--precedence") == 0) {
      if (!value("--precedence", &a->precedence)) return false;
      if (a->precedence != "result" && a->precedence != "design") {
        *err = "--precedence must be 'result' or 'design'";
        return false;
      }
    } else if (std::strcmp(k, "--log-level") == 0) {
      if (!value("--log-level", &a->log_level)) return false;
    } else if (std::strcmp(k, "--abbrev") == 0) {
      if (!value("--abbrev", &a->abbrev)) return false;
    } else if (std::strcmp(k, "--supersedes") == 0) {
      if (!value("--supersedes", &v)) return false;
      for (const auto& id : split(v, ',')) a->supersedes.push_back(id);
    } else if (std::strcmp(k, "--events") == 0) {
      if (!value("--events", &v)) return false;
      for (const auto& e : split(v, ',')) a->events.push_back(e);
    } else if (std::strcmp(k, "--zero-rise") == 0) {
      a->zero_rise = true;
    } else if (std::strcmp(k, "--freeboard-review") == 0) {
      a->freeboard_review = true;
    } else if (std::strcmp(k, "--version") == 0) {
      if (!value("--version", &a->overlay_version)) return false;
    } else if (std::strcmp(k, "--force") == 0) {
      a->force = true;
    } else if (k[0] == '-' && k[1] == '-') {
      *err = std::string("unknown option: ") + k;
      return false;
    } else {
      a->inputs.emplace_back(k);
    }
  }
  return true;
}

// CLI flags override the settings file, which overrides the defaults.
static Settings resolve_settings(const Args& a) {
  Settings s = a.settings_path.empty() ? Settings::defaults() : load_settings_yaml(a.settings_path);
  if (a.strict) s.parse.strict = true;
  if (a.sequential) {
    s.parse.parallel = false;
    s.eval.parallel = false;
  }
  if (a.precedence == "result") s.merge.precedence = MergePrecedence::kResultOverridesDesign;
  if (a.precedence == "design") s.merge.precedence = MergePrecedence::kDesignOverridesResult;
  if (!a.log_level.empty() && !parse_log_level(a.log_level, &s.log_level)) {
    throw ValidationError("unknown log level: " + a.log_level);
  }
  s.validate_or_throw();
  return s;
}

// "TX" / "texas" -> "texas"; "New Mexico" -> "new_mexico".
static std::string state_key(const std::string& state) {
  const std::string l = to_lower(trim(state));
  if (l == "tx") return "texas";
  if (l == "me") return "maine";
  return rules::state_file_stem(l);
}

static std::vector<std::string> rule_documents(const Args& a) {
  namespace fs = std::filesystem;
  const fs::path rules_dir = fs::path(a.config_dir) / "rules";
  std::vector<std::string> docs;
  if (a.default_rules) docs.push_back((rules_dir / "fema_rules.yaml").string());
  if (!a.state.empty()) {
    const std::string p = (rules_dir / "states" / (state_key(a.state) + ".yaml")).string();
    if (!file_exists(p)) throw ValidationError("no rule overlay for state '" + a.state + "' (" + p + ")");
    docs.push_back(p);
  }
  for (const auto& r : a.extra_rules) docs.push_back(r);
  if (docs.empty()) throw ValidationError("no rule documents selected");
  return docs;
}

static void write_output(const std::string& path, const std::string& content, const char* what) {
  write_text_file(path, content);
  std::cout << "  " << what << ": " << path << "\n";
}

static int cmd_run(const Args& a, const Settings& s) {
  if (a.inputs.empty()) {
    std::cerr << "run: no input files given\n";
    return ExitCode::TOOL_ERROR;
  }
  const rules::RuleSet rule_set = rules::load_rule_files(rule_documents(a), s.io);

  LogProgressSink sink;
  const pipeline::Pipeline p(s, &sink);
  const report::ComplianceReport r = p.run(a.inputs, rule_set);

  if (!a.quiet) report::print_terminal_summary(std::cout, r);
  if (!a.json_out.empty()) write_output(a.json_out, report::report_to_json(r, s.report), "JSON");
  if (!a.tsv_out.empty()) write_output(a.tsv_out, report::report_to_tsv(r, s.report), "TSV");
  if (!a.md_out.empty()) write_output(a.md_out, report::report_to_markdown(r, s.report), "Markdown");

  return r.exit_code() == report::kExitViolations ? ExitCode::VIOLATIONS : ExitCode::SUCCESS;
}

static int cmd_list_rules(const Args& a, const Settings& s) {
  const rules::RuleSet set = rules::load_rule_files(rule_documents(a), s.io);

  std::size_t id_w = 12;
  for (const auto& r : set.rules) id_w = std::max(id_w, r.id.size());

  std::cout << "\nApplicable Compliance Rules\n  " << set.name() << " (" << set.version() << ")\n"
            << std::string(60, '=') << "\n\n";
  for (const auto& r : set.rules) {
    std::cout << "  " << r.id << std::string(id_w - r.id.size(), ' ') << "  " << r.name << "  ["
              << rules::severity_name(r.severity) << "]\n";
  }
  std::cout << "\n  " << set.rules.size() << " rules total";
  if (!set.superseded.empty()) std::cout << " (" << join(set.superseded, ", ") << " superseded)";
  std::cout << "\n";
  for (const auto& e : set.load_errors) std::cerr << "  rejected: " << e.what() << "\n";
  std::cout << "\n";
  return set.load_errors.empty() ? ExitCode::SUCCESS : ExitCode::TOOL_ERROR;
}

static void print_attr(const model::Entity& e, const char* label, const char* attr) {
  const model::Value v = e.get(attr);
  if (v.is_missing()) return;
  std::cout << "    " << label << v.to_display() << "\n";
}

static int cmd_summary(const Args& a, const Settings& s) {
  if (a.inputs.empty()) {
    std::cerr << "summary: no input files given\n";
    return ExitCode::TOOL_ERROR;
  }
  const pipeline::Pipeline p(s);
  const pipeline::ModelRun run = p.build_model(a.inputs);
  const model::HydraulicModel& m = run.model;

  std::cout << "\nModel Summary\n" << std::string(50, '=') << "\n";
  for (const auto& src : m.sources()) std::cout << "  " << file_kind_name(src.kind) << ": " << src.path << "\n";

  for (const model::Entity* prj : m.of_type(model::kProject)) {
    std::cout << "\n  Project " << prj->id() << "\n  " << std::string(30, '-') << "\n";
    print_attr(*prj, "Title:        ", "title");
    print_attr(*prj, "Units:        ", "units");
    print_attr(*prj, "Current plan: ", "current_plan");
  }

  if (const model::Entity* me = m.find(model::kModel, "model")) {
    std::cout << "\n  Geometry\n  " << std::string(30, '-') << "\n";
    print_attr(*me, "Reaches:          ", "reach_count");
    print_attr(*me, "Cross sections:   ", "cross_section_count");
    print_attr(*me, "Bridges:          ", "bridge_count");
    print_attr(*me, "Min Manning's n:  ", "min_manning_n");
    print_attr(*me, "Max Manning's n:  ", "max_manning_n");

    std::cout << "\n  Flow\n  " << std::string(30, '-') << "\n";
    print_attr(*me, "Profiles:         ", "profile_names");
    print_attr(*me, "Boundaries:       ", "boundary_count");
    print_attr(*me, "Has results:      ", "has_results");
  }

  for (const model::Entity* plan : m.of_type(model::kPlan)) {
    std::cout << "\n  Plan " << plan->id() << "\n  " << std::string(30, '-') << "\n";
    print_attr(*plan, "Title:            ", "title");
    print_attr(*plan, "Active:           ", "active");
    print_attr(*plan, "Flow regime:      ", "flow_regime");
    print_attr(*plan, "Encroachment:     ", "encroachment_enabled");
    print_attr(*plan, "Target surcharge: ", "target_surcharge");
  }

  if (!run.warnings.empty()) std::cout << "\n  " << run.warnings.size() << " warning(s)\n";
  for (const auto& w : run.warnings) std::cout << "    " << w << "\n";
  std::cout << "\n";
  return ExitCode::SUCCESS;
}

static int cmd_add_state(const Args& a) {
  if (a.inputs.size() != 1) {
    std::cerr << "add-state: expected one state name (quote names with spaces)\n";
    return ExitCode::TOOL_ERROR;
  }
  rules::StateOverlayOptions o;
  o.state_name = a.inputs.front();
  o.abbreviation = a.abbrev;
  if (!a.overlay_version.empty()) o.version = a.overlay_version;
  o.supersedes = a.supersedes;
  o.zero_rise = a.zero_rise;
  o.events = a.events;
  o.freeboard_review = a.freeboard_review;

  const std::string path = rules::write_state_overlay(a.config_dir, o, a.force);
  std::cout << "\n  Created: " << path << "\n\n  Next steps:\n"
            << "    1. Replace the placeholder citations in " << path << "\n"
            << "    2. rascheck list-rules --state \"" << a.inputs.front() << "\"\n"
            << "    3. rascheck run model.prj --state \"" << a.inputs.front() << "\"\n\n";
  return ExitCode::SUCCESS;
}

int main(int argc, char** argv) {
  Args args;
  std::string err;
  if (!parse_args(argc, argv, &args, &err)) {
    std::cerr << "Error: " << err << "\n";
    std::cerr << "Run 'rascheck help' for usage information.\n";
    return ExitCode::TOOL_ERROR;
  }

  const std::string& cmd = args.command;
  if (cmd == "help" || cmd == "-h" || cmd == "--help") {
    print_help();
    return ExitCode::SUCCESS;
  }
  if (cmd != "run" && cmd != "list-rules" && cmd != "summary" && cmd != "add-state") {
    std::cerr << "Unknown command: " << cmd << "\n";
    std::cerr << "Run 'rascheck help' for usage information.\n";
    return ExitCode::TOOL_ERROR;
  }

  try {
    const Settings settings = resolve_settings(args);
    set_log_level(settings.log_level);

    if (cmd == "run") return cmd_run(args, settings);
    if (cmd == "list-rules") return cmd_list_rules(args, settings);
    if (cmd == "add-state") return cmd_add_state(args);
    return cmd_summary(args, settings);

  } catch (const ModelConsistencyError& e) {
    std::cerr << "Model error: " << e.what() << "\n";
    std::cerr << "  first:  " << e.first_source() << "\n";
    std::cerr << "  second: " << e.second_source() << "\n";
    return ExitCode::TOOL_ERROR;
  } catch (const RascheckError& e) {
    std::cerr << "Error [" << to_string(e.code()) << "]: " << e.what() << "\n";
    return ExitCode::TOOL_ERROR;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return ExitCode::TOOL_ERROR;
  }
}
