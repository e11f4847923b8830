#pragma once
/*
================================================================================
Fragment 6.1 — Report: Compliance Report (Aggregation)
FILE: cpp/engine/report/compliance_report.hpp

Purpose:
  - Collect Findings (already in rule-load order) into one immutable report
    with summary counts per severity x status and run metadata.
  - No business logic beyond aggregation and counting.

Exit code:
  - 0 when no `fail` Finding with severity `violation` exists, 2 otherwise.
    Tool errors (1) are decided by the caller.
================================================================================
*/

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "engine/core/hashing.hpp"
#include "engine/core/source.hpp"
#include "engine/rules/rule_types.hpp"

namespace rascheck::report {

inline constexpr const char* kToolName = "rascheck";
inline constexpr const char* kToolVersion = "0.1.0";

inline constexpr int kExitCompliant = 0;
inline constexpr int kExitViolations = 2;

struct InputFile {
  SourceRef source;
  Hash64 content_hash;
};

struct RunMetadata {
  std::string tool_version = kToolVersion;
  std::string timestamp;  // ISO 8601 UTC; the only run-dependent field

  std::vector<InputFile> inputs;  // canonical source order

  std::string ruleset_name;
  std::string ruleset_version;
  Hash64 ruleset_hash;
  std::vector<std::string> superseded_rules;

  std::string active_plan;  // empty when no plan was selected
  std::string precedence;   // merge policy name
};

struct RuleLoadIssue {
  std::string rule_id;
  std::string reason;
};

class SummaryCounts {
 public:
  void add(rules::Severity s, rules::FindingStatus st) noexcept;

  int count(rules::Severity s, rules::FindingStatus st) const noexcept;
  int by_status(rules::FindingStatus st) const noexcept;
  int by_severity(rules::Severity s) const noexcept;
  int total() const noexcept { return total_; }

 private:
  std::array<std::array<int, 4>, 3> cells_{};
  int total_ = 0;
};

struct ComplianceReport {
  RunMetadata meta;
  std::vector<rules::Finding> findings;
  SummaryCounts summary;
  std::vector<std::string> warnings;  // parse / read / merge
  std::vector<RuleLoadIssue> rule_load_errors;

  bool has_violation_failures() const noexcept;
  int exit_code() const noexcept;
};

// Findings keep their order. Rule-set identity and load errors are copied
// from `rule_set`.
ComplianceReport aggregate(RunMetadata meta,
                           std::vector<rules::Finding> findings,
                           std::vector<std::string> warnings,
                           const rules::RuleSet& rule_set);

// Current UTC time, "YYYY-MM-DDTHH:MM:SSZ".
std::string utc_timestamp();

// "cross_section:Creek/Upper/5000", or "model" for model-wide findings.
std::string finding_location(const rules::Finding& f);

} // namespace rascheck::report
