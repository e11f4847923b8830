#pragma once

#include <string>

#include "engine/core/settings.hpp"

namespace rascheck {

// Overlay a YAML settings document onto `base`. Unknown keys are rejected so
// typos do not silently fall back to defaults.
//
//   io:     { read_timeout_ms: 5000, max_text_bytes: 1048576 }
//   parse:  { strict: false, parallel: true }
//   merge:  { precedence: result_overrides_design, numeric_rel_tol: 1e-9 }
//   eval:   { parallel: true, max_workers: 0 }
//   report: { pretty_json: true, indent_spaces: 2, include_not_applicable: true }
//   log:    { level: info }
//
// Throws ValidationError (bad keys / values) or IoError (unreadable file).
Settings load_settings_yaml(const std::string& path, const Settings& base = Settings::defaults());

// Same, from an in-memory document.
Settings parse_settings_yaml(const std::string& text, const Settings& base = Settings::defaults());

const char* precedence_name(MergePrecedence p) noexcept;

} // namespace rascheck
