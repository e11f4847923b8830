#pragma once
/*
================================================================================
Fragment 1.4 — Core: Run Settings
FILE: cpp/engine/core/settings.hpp

Purpose:
  - Centralize every knob that changes what a run reads or reports into a
    single validated object (I/O bounds, parser strictness, merge precedence,
    rule evaluation, report rendering).
  - Settings are plain structs with conservative defaults. They can be
    overridden from a YAML file (settings_yaml.hpp) and then by CLI flags.

Hardening:
  - validate_or_throw() catches nonsensical values early (ValidationError).
================================================================================
*/

#include <cstdint>
#include <string>

#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"

namespace rascheck {

// ----------------------------- I/O -------------------------------------------
struct IoSettings {
  // Upper bound for a single file read. A read that takes longer fails with
  // IoError(kTimeout) instead of hanging the run.
  int read_timeout_ms = 30000;

  // Refuse text inputs larger than this (bytes). 0 = no limit.
  std::uint64_t max_text_bytes = 256ull * 1024ull * 1024ull;

  void validate_or_throw() const {
    if (read_timeout_ms < 1 || read_timeout_ms > 3600000) {
      throw ValidationError("IoSettings: read_timeout_ms must be in [1, 3600000]");
    }
  }
};

// ----------------------------- Parsing ---------------------------------------
struct ParseSettings {
  // Strict: unknown keywords and malformed numeric fields raise ParseError
  // instead of being recorded as warnings.
  bool strict = false;

  // Parse independent input files concurrently.
  bool parallel = true;

  void validate_or_throw() const {}
};

// ----------------------------- Merge -----------------------------------------
enum class MergePrecedence : int {
  kResultOverridesDesign = 0,
  kDesignOverridesResult = 1,
};

struct MergeSettings {
  MergePrecedence precedence = MergePrecedence::kResultOverridesDesign;

  // Relative tolerance when deciding whether two design numbers disagree.
  double numeric_rel_tol = 1e-9;

  void validate_or_throw() const {
    if (!(numeric_rel_tol >= 0.0) || numeric_rel_tol > 1e-2) {
      throw ValidationError("MergeSettings: numeric_rel_tol must be in [0, 1e-2]");
    }
  }
};

// ----------------------------- Evaluation ------------------------------------
struct EvalSettings {
  // Evaluate independent rules concurrently (findings are reassembled in
  // rule-load order either way).
  bool parallel = true;

  // 0 = one task per rule.
  int max_workers = 0;

  void validate_or_throw() const {
    if (max_workers < 0 || max_workers > 1024) {
      throw ValidationError("EvalSettings: max_workers must be in [0, 1024]");
    }
  }
};

// ----------------------------- Report ----------------------------------------
struct ReportSettings {
  bool pretty_json = true;
  int indent_spaces = 2;

  // Include not_applicable findings in TSV/Markdown tables.
  bool include_not_applicable = true;

  void validate_or_throw() const {
    if (indent_spaces < 0 || indent_spaces > 8) {
      throw ValidationError("ReportSettings: indent_spaces must be in [0, 8]");
    }
  }
};

// ----------------------------- Settings --------------------------------------
struct Settings {
  IoSettings io;
  ParseSettings parse;
  MergeSettings merge;
  EvalSettings eval;
  ReportSettings report;

  LogLevel log_level = LogLevel::INFO;

  void validate_or_throw() const {
    io.validate_or_throw();
    parse.validate_or_throw();
    merge.validate_or_throw();
    eval.validate_or_throw();
    report.validate_or_throw();
  }

  static Settings defaults() {
    Settings s;
    return s;
  }
};

} // namespace rascheck
