#pragma once
/*
================================================================================
Fragment 5.1 — Rules: Expression AST
FILE: cpp/engine/rules/expr_ast.hpp

Purpose:
  - Parsed form of rule conditions and selector filters. Built once at rule
    load, shared read-only by every evaluation (including parallel ones).
================================================================================
*/

#include <memory>
#include <string>
#include <vector>

#include "engine/model/value.hpp"

namespace rascheck::rules {

enum class ExprKind : int {
  kLiteral = 0,    // number / string / bool
  kList = 1,       // [a, b, ...]
  kAttribute = 2,  // attribute of the current entity
  kParam = 3,      // params.<name>
  kUnary = 4,      // "not" | "-"
  kBinary = 5,     // or and == != < <= > >= in "not in" + - * /
  kCall = 6,       // function call
};

struct Expr {
  ExprKind kind = ExprKind::kLiteral;
  model::Value literal;  // kLiteral
  std::string name;      // attribute / param / operator / function name
  std::vector<std::unique_ptr<Expr>> args;
  int pos = 0;           // column in the source text (0-based)
};

using ExprPtr = std::unique_ptr<Expr>;

// Shared, immutable expression.
using ExprHandle = std::shared_ptr<const Expr>;

} // namespace rascheck::rules
