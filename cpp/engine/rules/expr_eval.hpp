#pragma once
/*
================================================================================
Fragment 5.3 — Rules: Expression Evaluator
FILE: cpp/engine/rules/expr_eval.hpp

Contract:
  - Total: every expression yields a Value for every context. Failures are
    Value::error(message); nothing is thrown.
  - Touching a missing attribute anywhere except exists() yields
    error "missing attribute '<name>'".
  - and / or short-circuit left to right.
  - Aggregate functions evaluate their argument once per matched entity, in
    canonical order; the first error wins.
================================================================================
*/

#include <functional>
#include <map>
#include <string>
#include <vector>

#include "engine/model/entity.hpp"
#include "engine/model/value.hpp"
#include "engine/rules/expr_ast.hpp"

namespace rascheck::rules {

using ParamMap = std::map<std::string, model::Value, std::less<>>;

struct EvalContext {
  const model::Entity* entity = nullptr;                         // per-entity rules
  const std::vector<const model::Entity*>* matched = nullptr;    // aggregate rules
  const ParamMap* params = nullptr;
};

model::Value evaluate(const Expr& e, const EvalContext& ctx) noexcept;

} // namespace rascheck::rules
