#include "engine/rules/overlay_writer.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

#include <yaml-cpp/yaml.h>

#include "engine/core/errors.hpp"
#include "engine/core/file_io.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/strings.hpp"

namespace rascheck::rules {
namespace {

struct EventSpec {
  const char* key;
  const char* description;
  std::vector<std::string> accepted_names;
};

// EVENT-00N numbering follows this table, not the order requested.
const std::vector<EventSpec>& event_table() {
  static const std::vector<EventSpec> kEvents = {
      {"10yr", "10% annual chance", {"10yr", "10-yr", "10 yr", "10-year", "10%", "q10"}},
      {"50yr", "2% annual chance", {"50yr", "50-yr", "50 yr", "50-year", "2%", "q50"}},
      {"100yr", "1% annual chance", {"100yr", "100-yr", "100 yr", "100-year", "1%", "base flood", "q100"}},
      {"500yr", "0.2% annual chance", {"500yr", "500-yr", "500 yr", "500-year", "0.2%", "q500"}},
  };
  return kEvents;
}

std::string upper(std::string s) {
  for (char& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return s;
}

std::string placeholder_citation(const std::string& state) {
  return state + " state regulations (replace with the specific citation)";
}

void emit_flow_list(YAML::Emitter& out, const std::vector<std::string>& items) {
  out << YAML::Flow << YAML::BeginSeq;
  for (const auto& s : items) out << s;
  out << YAML::EndSeq;
}

void emit_zero_rise(YAML::Emitter& out, const std::string& ab, const std::string& state) {
  out << YAML::BeginMap;
  out << YAML::Key << "id" << YAML::Value << ab + "-FW-001";
  out << YAML::Key << "name" << YAML::Value << "Zero-rise floodway";
  out << YAML::Key << "description" << YAML::Value << state + " requires zero rise in the regulatory floodway.";
  out << YAML::Key << "citation" << YAML::Value << placeholder_citation(state);
  out << YAML::Key << "severity" << YAML::Value << "violation";
  out << YAML::Key << "selector" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "type" << YAML::Value << "plan";
  out << YAML::Key << "where" << YAML::Value << YAML::DoubleQuoted << "is_floodway";
  out << YAML::EndMap;
  out << YAML::Key << "condition" << YAML::Value << YAML::DoubleQuoted
      << "target_surcharge >= params.min and target_surcharge <= params.max";
  out << YAML::Key << "parameters" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "min" << YAML::Value << 0.0;
  out << YAML::Key << "max" << YAML::Value << 0.0;
  out << YAML::EndMap;
  out << YAML::Key << "message" << YAML::Value << YAML::DoubleQuoted
      << "plan {id}: target surcharge {target_surcharge} ft; " + state + " requires zero rise";
  out << YAML::EndMap;
}

void emit_event(YAML::Emitter& out, const std::string& ab, const std::string& state, std::size_t index,
                const EventSpec& ev) {
  const std::string n = std::to_string(index + 1);
  out << YAML::BeginMap;
  out << YAML::Key << "id" << YAML::Value << ab + "-EVENT-" + std::string(3 - n.size(), '0') + n;
  out << YAML::Key << "name" << YAML::Value << std::string(ev.description) + " profile present";
  out << YAML::Key << "description" << YAML::Value
      << state + " requires analysis of the " + ev.description + " flood event.";
  out << YAML::Key << "citation" << YAML::Value << placeholder_citation(state);
  out << YAML::Key << "severity" << YAML::Value << "violation";
  out << YAML::Key << "selector" << YAML::Value << "profile";
  out << YAML::Key << "aggregate" << YAML::Value << true;
  out << YAML::Key << "condition" << YAML::Value << YAML::DoubleQuoted
      << "any(lower(name) in params.accepted_names)";
  out << YAML::Key << "parameters" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "accepted_names" << YAML::Value;
  emit_flow_list(out, ev.accepted_names);
  out << YAML::EndMap;
  out << YAML::Key << "message" << YAML::Value << YAML::DoubleQuoted
      << std::string("no ") + ev.description + " profile";
  out << YAML::EndMap;
}

void emit_freeboard(YAML::Emitter& out, const std::string& ab, const std::string& state) {
  out << YAML::BeginMap;
  out << YAML::Key << "id" << YAML::Value << ab + "-FB-001";
  out << YAML::Key << "name" << YAML::Value << "Freeboard review";
  out << YAML::Key << "citation" << YAML::Value << state + " state and local regulations (replace with the specific citation)";
  out << YAML::Key << "severity" << YAML::Value << "info";
  out << YAML::Key << "selector" << YAML::Value << "model";
  out << YAML::Key << "condition" << YAML::Value << YAML::DoubleQuoted << "true";
  out << YAML::Key << "parameters" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "review_note" << YAML::Value
      << "Verify the applicable " + state + " local freeboard ordinance.";
  out << YAML::EndMap;
  out << YAML::Key << "pass_message" << YAML::Value << YAML::DoubleQuoted << "manual review: {params.review_note}";
  out << YAML::EndMap;
}

} // namespace

std::string state_file_stem(const std::string& state_name) {
  std::string stem = to_lower(trim(state_name));
  if (stem.empty()) throw ValidationError("state name is empty");
  for (char& c : stem) {
    if (c == ' ') {
      c = '_';
    } else if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-') {
      throw ValidationError("state name '" + state_name + "' contains '" + std::string(1, c) + "'");
    }
  }
  return stem;
}

std::string emit_state_overlay(const StateOverlayOptions& o) {
  const std::string state = trim(o.state_name);
  const std::string ab = upper(trim(o.abbreviation));
  const std::string stem = state_file_stem(state);
  if (ab.empty()) throw ValidationError("state abbreviation is empty");

  std::vector<std::size_t> event_rows;
  for (const auto& e : o.events) {
    const std::string key = to_lower(trim(e));
    const auto& table = event_table();
    const auto it = std::find_if(table.begin(), table.end(), [&](const EventSpec& ev) { return key == ev.key; });
    if (it == table.end()) throw ValidationError("unknown flood event '" + e + "' (10yr, 50yr, 100yr, 500yr)");
    const auto row = static_cast<std::size_t>(it - table.begin());
    if (std::find(event_rows.begin(), event_rows.end(), row) == event_rows.end()) event_rows.push_back(row);
  }
  std::sort(event_rows.begin(), event_rows.end());

  std::vector<std::string> supersedes;
  for (const auto& s : o.supersedes) {
    const std::string id = trim(s);
    if (!id.empty() && std::find(supersedes.begin(), supersedes.end(), id) == supersedes.end()) {
      supersedes.push_back(id);
    }
  }
  if (o.zero_rise && std::find(supersedes.begin(), supersedes.end(), "FEMA-FW-001") == supersedes.end()) {
    supersedes.push_back("FEMA-FW-001");
  }

  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "ruleset" << YAML::Value << stem;
  out << YAML::Key << "version" << YAML::Value << YAML::DoubleQuoted << o.version;
  out << YAML::Key << "supersedes" << YAML::Value << YAML::BeginSeq;
  for (const auto& id : supersedes) out << id;
  out << YAML::EndSeq;
  out << YAML::Key << "rules" << YAML::Value << YAML::BeginSeq;
  if (o.zero_rise) emit_zero_rise(out, ab, state);
  for (const std::size_t row : event_rows) emit_event(out, ab, state, row, event_table()[row]);
  if (o.freeboard_review) emit_freeboard(out, ab, state);
  out << YAML::EndSeq;
  out << YAML::EndMap;

  if (!out.good()) throw ValidationError("cannot emit overlay for '" + state + "': " + out.GetLastError());

  return "# " + state + " (" + ab + ") overlay. Applied on top of the FEMA baseline.\n"
         "# Generated by rascheck add-state; replace the placeholder citations.\n" +
         std::string(out.c_str()) + "\n";
}

std::string write_state_overlay(const std::string& config_dir, const StateOverlayOptions& o, bool overwrite) {
  namespace fs = std::filesystem;
  const std::string text = emit_state_overlay(o);
  const fs::path dir = fs::path(config_dir) / "rules" / "states";
  const fs::path target = dir / (state_file_stem(o.state_name) + ".yaml");

  std::error_code ec;
  if (fs::exists(target, ec) && !overwrite) {
    throw IoError("overlay already exists: " + target.string() + " (use --force to overwrite)");
  }
  fs::create_directories(dir, ec);
  if (ec) throw IoError("cannot create " + dir.string() + ": " + ec.message());

  write_text_file(target.string(), text);
  log_info("rules: wrote state overlay " + target.string());
  return target.string();
}

} // namespace rascheck::rules
