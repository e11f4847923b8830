#pragma once
/*
================================================================================
Fragment 5.6 — Rules: Rule Engine
FILE: cpp/engine/rules/rule_engine.hpp

Contract:
  - evaluate() returns the findings of every rule in rule-load order; within
    a rule, matched entities follow canonical key order.
  - Nothing thrown by a rule escapes: evaluation problems become `error`
    findings for that rule / entity only.
  - Rule evaluation is a pure function of (Rule, HydraulicModel); rules may
    run concurrently (std::async) and are reassembled by index.
================================================================================
*/

#include <string>
#include <vector>

#include "engine/core/settings.hpp"
#include "engine/model/hydraulic_model.hpp"
#include "engine/rules/rule_types.hpp"

namespace rascheck::rules {

class RuleEngine {
 public:
  explicit RuleEngine(EvalSettings settings = {}) : settings_(settings) {}

  std::vector<Finding> evaluate(const RuleSet& rules, const model::HydraulicModel& m) const;

 private:
  EvalSettings settings_;
};

std::vector<Finding> evaluate_rule(const Rule& rule, const model::HydraulicModel& m);

// Expands {attribute}, {params.name}, {id} and {rule_id}; unknown attributes
// render as "<missing name>".
std::string render_message(const std::string& tmpl, const Rule& rule, const model::Entity* entity);

} // namespace rascheck::rules
