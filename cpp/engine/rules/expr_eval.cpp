#include "engine/rules/expr_eval.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <optional>
#include <utility>

#include "engine/core/strings.hpp"

namespace rascheck::rules {
namespace {

using model::Value;
using model::ValueKind;

std::string kind_of(const Value& v) { return model::value_kind_name(v.kind()); }

// Error / missing operands turn into the error the whole expression yields.
std::optional<Value> failed(const Value& v) {
  if (v.is_error()) return v;
  if (v.is_missing()) return Value::error("missing attribute '" + v.missing_name() + "'");
  return std::nullopt;
}

template <class T>
bool contains_value(const std::vector<T>& seq, const T& x) {
  return std::find(seq.begin(), seq.end(), x) != seq.end();
}

// x in seq / substring. nullopt when the kinds do not combine.
std::optional<bool> membership(const Value& x, const Value& seq) {
  if (seq.kind() == ValueKind::kNumberList && x.is_number()) return contains_value(seq.as_numbers(), x.as_number());
  if (seq.kind() == ValueKind::kStringList && x.is_string()) return contains_value(seq.as_strings(), x.as_string());
  if (seq.is_string() && x.is_string()) return seq.as_string().find(x.as_string()) != std::string::npos;
  return std::nullopt;
}

class Evaluator {
 public:
  explicit Evaluator(const EvalContext& ctx) : ctx_(ctx) {}

  Value eval(const Expr& e) const {
    switch (e.kind) {
      case ExprKind::kLiteral: return e.literal;
      case ExprKind::kList: return list(e);
      case ExprKind::kAttribute: return attribute(e.name);
      case ExprKind::kParam: return param(e.name);
      case ExprKind::kUnary: return unary(e);
      case ExprKind::kBinary: return binary(e);
      case ExprKind::kCall: return call(e);
      default: return Value::error("unknown expression node");
    }
  }

 private:
  Value attribute(const std::string& name) const {
    if (!ctx_.entity) return Value::error("attribute '" + name + "' used outside an aggregate function");
    return ctx_.entity->get(name);
  }

  Value param(const std::string& name) const {
    if (ctx_.params) {
      const auto it = ctx_.params->find(name);
      if (it != ctx_.params->end()) return it->second;
    }
    return Value::error("unknown parameter '" + name + "'");
  }

  Value list(const Expr& e) const {
    std::vector<double> nums;
    std::vector<std::string> strs;
    for (const auto& a : e.args) {
      const Value v = eval(*a);
      if (auto f = failed(v)) return *f;
      if (v.is_number() && strs.empty()) nums.push_back(v.as_number());
      else if (v.is_string() && nums.empty()) strs.push_back(v.as_string());
      else return Value::error("list elements must be all numbers or all strings");
    }
    if (!strs.empty()) return Value::strings(std::move(strs));
    return Value::numbers(std::move(nums));
  }

  Value unary(const Expr& e) const {
    const Value v = eval(*e.args.front());
    if (auto f = failed(v)) return *f;
    if (e.name == "not") {
      if (!v.is_bool()) return Value::error("'not' needs a bool, got " + kind_of(v));
      return Value::boolean(!v.as_bool());
    }
    if (!v.is_number()) return Value::error("unary '-' needs a number, got " + kind_of(v));
    return Value::number(-v.as_number());
  }

  Value logical(const Expr& e) const {
    const bool is_and = e.name == "and";
    for (const auto& side : e.args) {
      const Value v = eval(*side);
      if (auto f = failed(v)) return *f;
      if (!v.is_bool()) return Value::error("'" + e.name + "' needs bools, got " + kind_of(v));
      if (is_and && !v.as_bool()) return Value::boolean(false);
      if (!is_and && v.as_bool()) return Value::boolean(true);
    }
    return Value::boolean(is_and);
  }

  Value binary(const Expr& e) const {
    if (e.name == "and" || e.name == "or") return logical(e);

    const Value a = eval(*e.args[0]);
    if (auto f = failed(a)) return *f;
    const Value b = eval(*e.args[1]);
    if (auto f = failed(b)) return *f;
    const std::string& op = e.name;

    if (op == "==" || op == "!=") {
      if (a.kind() != b.kind()) {
        return Value::error("cannot compare " + kind_of(a) + " with " + kind_of(b));
      }
      return Value::boolean((a == b) == (op == "=="));
    }
    if (op == "<" || op == "<=" || op == ">" || op == ">=") {
      int c = 0;
      if (a.is_number() && b.is_number()) {
        const double x = a.as_number();
        const double y = b.as_number();
        if (std::isnan(x) || std::isnan(y)) return Value::boolean(false);
        c = x < y ? -1 : (x > y ? 1 : 0);
      } else if (a.is_string() && b.is_string()) {
        c = a.as_string().compare(b.as_string());
        c = c < 0 ? -1 : (c > 0 ? 1 : 0);
      } else {
        return Value::error("cannot order " + kind_of(a) + " and " + kind_of(b));
      }
      if (op == "<") return Value::boolean(c < 0);
      if (op == "<=") return Value::boolean(c <= 0);
      if (op == ">") return Value::boolean(c > 0);
      return Value::boolean(c >= 0);
    }
    if (op == "in" || op == "not in") {
      const auto m = membership(a, b);
      if (!m) return Value::error("'" + op + "' not defined for " + kind_of(a) + " and " + kind_of(b));
      return Value::boolean(*m == (op == "in"));
    }
    if (op == "+" && a.is_string() && b.is_string()) return Value::string(a.as_string() + b.as_string());
    if (!a.is_number() || !b.is_number()) {
      return Value::error("'" + op + "' needs numbers, got " + kind_of(a) + " and " + kind_of(b));
    }
    const double x = a.as_number();
    const double y = b.as_number();
    if (op == "+") return Value::number(x + y);
    if (op == "-") return Value::number(x - y);
    if (op == "*") return Value::number(x * y);
    if (y == 0.0) return Value::error("division by zero");
    return Value::number(x / y);
  }

  Value call(const Expr& e) const {
    const std::string& fn = e.name;

    if (fn == "exists") {
      if (!ctx_.entity) return Value::error("'exists' used outside an aggregate function");
      return Value::boolean(ctx_.entity->attribute(e.args.front()->name) != nullptr);
    }
    if (fn == "design") {
      const std::string& name = e.args.front()->name;
      if (!ctx_.entity) return Value::error("'design' used outside an aggregate function");
      const model::Attribute* a = ctx_.entity->attribute(name);
      if (!a) return Value::missing(name);
      if (a->design_value) return *a->design_value;
      if (a->origin == model::Origin::kDesign) return a->value;
      return Value::missing(name);
    }
    if (fn == "count" || fn == "any" || fn == "all" || fn == "sum" || fn == "mean" ||
        fn == "min_of" || fn == "max_of") {
      return aggregate(e);
    }

    std::vector<Value> args;
    for (const auto& a : e.args) {
      Value v = eval(*a);
      if (auto f = failed(v)) return *f;
      args.push_back(std::move(v));
    }
    const Value& x = args.front();

    if (fn == "abs") {
      if (!x.is_number()) return Value::error("'abs' needs a number, got " + kind_of(x));
      return Value::number(std::fabs(x.as_number()));
    }
    if (fn == "len") {
      if (x.is_string()) return Value::number(static_cast<double>(x.as_string().size()));
      if (x.kind() == ValueKind::kNumberList) return Value::number(static_cast<double>(x.as_numbers().size()));
      if (x.kind() == ValueKind::kStringList) return Value::number(static_cast<double>(x.as_strings().size()));
      return Value::error("'len' needs a string or sequence, got " + kind_of(x));
    }
    if (fn == "lower") {
      if (x.is_string()) return Value::string(to_lower(x.as_string()));
      if (x.kind() == ValueKind::kStringList) {
        std::vector<std::string> out;
        for (const auto& s : x.as_strings()) out.push_back(to_lower(s));
        return Value::strings(std::move(out));
      }
      return Value::error("'lower' needs a string, got " + kind_of(x));
    }
    if (fn == "min" || fn == "max") {
      std::vector<double> nums;
      if (args.size() == 1 && x.kind() == ValueKind::kNumberList) {
        nums = x.as_numbers();
      } else {
        for (const auto& v : args) {
          if (!v.is_number()) return Value::error("'" + fn + "' needs numbers, got " + kind_of(v));
          nums.push_back(v.as_number());
        }
      }
      if (nums.empty()) return Value::error("'" + fn + "' of an empty sequence");
      return Value::number(fn == "min" ? *std::min_element(nums.begin(), nums.end())
                                       : *std::max_element(nums.begin(), nums.end()));
    }
    if (fn == "contains") {
      const auto m = membership(args[1], x);
      if (!m) return Value::error("'contains' not defined for " + kind_of(x) + " and " + kind_of(args[1]));
      return Value::boolean(*m);
    }
    return Value::error("unknown function '" + fn + "'");
  }

  Value aggregate(const Expr& e) const {
    const std::string& fn = e.name;
    if (!ctx_.matched) return Value::error("aggregate '" + fn + "' used outside an aggregate rule");
    const auto& matched = *ctx_.matched;
    if (fn == "count" && e.args.empty()) return Value::number(static_cast<double>(matched.size()));

    const bool boolean = fn == "count" || fn == "any" || fn == "all";
    std::vector<double> nums;
    std::size_t trues = 0;
    for (const model::Entity* ent : matched) {
      EvalContext sub = ctx_;
      sub.entity = ent;
      sub.matched = nullptr;
      const Value v = Evaluator(sub).eval(*e.args.front());
      if (auto f = failed(v)) {
        return Value::error(ent->key().to_string() + ": " + f->error_message());
      }
      if (boolean) {
        if (!v.is_bool()) return Value::error("'" + fn + "' needs a bool per entity, got " + kind_of(v));
        if (v.as_bool()) ++trues;
      } else {
        if (!v.is_number()) return Value::error("'" + fn + "' needs a number per entity, got " + kind_of(v));
        nums.push_back(v.as_number());
      }
    }

    if (fn == "count") return Value::number(static_cast<double>(trues));
    if (fn == "any") return Value::boolean(trues > 0);
    if (fn == "all") return Value::boolean(trues == matched.size());
    if (fn == "sum") {
      double s = 0.0;
      for (const double v : nums) s += v;
      return Value::number(s);
    }
    if (nums.empty()) return Value::error("'" + fn + "' over no entities");
    if (fn == "mean") {
      double s = 0.0;
      for (const double v : nums) s += v;
      return Value::number(s / static_cast<double>(nums.size()));
    }
    return Value::number(fn == "min_of" ? *std::min_element(nums.begin(), nums.end())
                                        : *std::max_element(nums.begin(), nums.end()));
  }

  const EvalContext& ctx_;
};

} // namespace

model::Value evaluate(const Expr& e, const EvalContext& ctx) noexcept {
  try {
    return Evaluator(ctx).eval(e);
  } catch (const std::exception& ex) {
    return model::Value::error(std::string("evaluation failed: ") + ex.what());
  }
}

} // namespace rascheck::rules
