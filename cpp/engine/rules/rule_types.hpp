#pragma once
/*
================================================================================
Fragment 5.4 — Rules: Rule / RuleSet / Finding
FILE: cpp/engine/rules/rule_types.hpp

Contract:
  - Rules are immutable after load; parsed expressions are shared read-only.
  - RuleSet keeps load order; superseded rules are already removed.
  - A Finding is produced once per (rule, matched entity), or once per rule
    for aggregate rules and empty matches (entity unset).
================================================================================
*/

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "engine/core/errors.hpp"
#include "engine/core/hashing.hpp"
#include "engine/model/entity.hpp"
#include "engine/rules/expr_ast.hpp"
#include "engine/rules/expr_eval.hpp"

namespace rascheck::rules {

enum class Severity : int {
  kInfo = 0,
  kWarning = 1,
  kViolation = 2,
};

const char* severity_name(Severity s) noexcept;

// "info" | "warning" | "violation" ("error" is accepted as violation).
std::optional<Severity> parse_severity(std::string_view s) noexcept;

enum class FindingStatus : int {
  kPass = 0,
  kFail = 1,
  kNotApplicable = 2,
  kError = 3,
};

const char* status_name(FindingStatus s) noexcept;

struct Selector {
  std::vector<std::string> types;  // entity types, matched in canonical order
  std::string where_text;
  ExprHandle where;  // null = no filter
};

struct Rule {
  std::string id;
  std::string name;
  std::string description;
  std::string citation;
  std::string citation_url;
  Severity severity = Severity::kViolation;

  Selector selector;
  bool aggregate = false;

  std::string condition_text;
  ExprHandle condition;

  // Templates with {attribute} / {params.name} / {id} placeholders.
  std::string message;       // fail
  std::string pass_message;

  ParamMap params;
  std::string source;  // rule document path
};

struct RuleDocument {
  std::string ruleset;
  std::string version;
  std::string source;
  std::vector<std::string> supersedes;
};

struct RuleSet {
  std::vector<RuleDocument> documents;
  std::vector<Rule> rules;
  std::vector<RuleLoadError> load_errors;
  std::vector<std::string> superseded;  // ids removed by overlays
  Hash64 hash;

  // "fema_baseline + texas" style display name.
  std::string name() const;
  std::string version() const;

  const Rule* find(std::string_view id) const noexcept;
};

struct Finding {
  std::string rule_id;
  std::string rule_name;
  std::string citation;
  std::string citation_url;
  Severity severity = Severity::kViolation;
  FindingStatus status = FindingStatus::kNotApplicable;
  std::string message;
  std::optional<model::EntityKey> entity;
};

} // namespace rascheck::rules
