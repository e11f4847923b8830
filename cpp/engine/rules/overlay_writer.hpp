#pragma once
/*
================================================================================
Fragment 5.6 — Rules: State Overlay Writer
FILE: cpp/engine/rules/overlay_writer.hpp

Purpose:
  - Generate a starter state overlay document (the add-state command) in the
    shape RuleLoader reads: ruleset, version, supersedes, rules.
  - Optional starter rules, ids prefixed with the state abbreviation:
      <AB>-FW-001        zero-rise floodway (adds FEMA-FW-001 to supersedes)
      <AB>-EVENT-00N     required annual chance profile, one per event
      <AB>-FB-001        freeboard manual review flag
  - Citations are placeholders the author is expected to replace.

File naming:
  "New Mexico" -> <config>/rules/states/new_mexico.yaml
================================================================================
*/

#include <string>
#include <vector>

namespace rascheck::rules {

struct StateOverlayOptions {
  std::string state_name;    // "Florida"
  std::string abbreviation;  // "FL"; rule id prefix
  std::string version = "draft";
  std::vector<std::string> supersedes;

  bool zero_rise = false;
  std::vector<std::string> events;  // subset of 10yr, 50yr, 100yr, 500yr
  bool freeboard_review = false;
};

// Lower-cased, spaces to underscores. Throws ValidationError when empty or
// when the name would leave the states directory.
std::string state_file_stem(const std::string& state_name);

// Throws ValidationError for a missing name/abbreviation or an unknown event.
std::string emit_state_overlay(const StateOverlayOptions& o);

// Writes <config_dir>/rules/states/<stem>.yaml and returns its path. An
// existing file is an IoError unless overwrite is set.
std::string write_state_overlay(const std::string& config_dir, const StateOverlayOptions& o, bool overwrite);

} // namespace rascheck::rules
