#pragma once
/*
================================================================================
Fragment 5.2 — Rules: Expression Parser
FILE: cpp/engine/rules/expr_parser.hpp

Grammar (lowest precedence first):
  or      := and ("or" and)*
  and     := not ("and" not)*
  not     := "not" not | cmp
  cmp     := sum [("=="|"!="|"<"|"<="|">"|">="|"in"|"not in") sum]
  sum     := product (("+"|"-") product)*
  product := unary (("*"|"/") unary)*
  unary   := "-" unary | primary
  primary := number | string | "true" | "false" | "[" [or ("," or)*] "]"
           | "(" or ")" | name "(" [or ("," or)*] ")" | "params" "." name | name

Load-time checks (ExprSyntaxError):
  - unknown function names and wrong argument counts
  - exists()/design() take a bare attribute name
  - aggregate functions nested inside aggregate functions
================================================================================
*/

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "engine/rules/expr_ast.hpp"

namespace rascheck::rules {

class ExprSyntaxError : public std::runtime_error {
 public:
  ExprSyntaxError(int pos, const std::string& reason)
      : std::runtime_error("at column " + std::to_string(pos + 1) + ": " + reason), pos_(pos) {}

  int pos() const noexcept { return pos_; }

 private:
  int pos_;
};

ExprHandle parse_expression(std::string_view text);

// count / any / all / sum / mean / min_of / max_of.
bool is_aggregate_function(std::string_view name) noexcept;

// True when the expression calls any aggregate function.
bool uses_aggregates(const Expr& e) noexcept;

// Names referenced as params.<name>, in first-use order, without repeats.
std::vector<std::string> referenced_params(const Expr& e);

} // namespace rascheck::rules
