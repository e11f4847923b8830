#include "engine/model/value.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include "engine/core/strings.hpp"

namespace rascheck::model {
namespace {

const std::string kEmpty;
const std::vector<double> kNoNumbers;
const std::vector<std::string> kNoStrings;

bool same_number(double a, double b) noexcept {
  if (std::isnan(a) || std::isnan(b)) return std::isnan(a) && std::isnan(b);
  return a == b;
}

bool close_number(double a, double b, double rel_tol) noexcept {
  if (std::isnan(a) || std::isnan(b)) return std::isnan(a) && std::isnan(b);
  const double scale = std::max({std::fabs(a), std::fabs(b), 1.0});
  return std::fabs(a - b) <= rel_tol * scale;
}

} // namespace

const char* value_kind_name(ValueKind k) noexcept {
  switch (k) {
    case ValueKind::kMissing:    return "missing";
    case ValueKind::kBool:       return "bool";
    case ValueKind::kNumber:     return "number";
    case ValueKind::kString:     return "string";
    case ValueKind::kNumberList: return "number list";
    case ValueKind::kStringList: return "string list";
    case ValueKind::kError:      return "error";
    default:                     return "unknown";
  }
}

Value Value::missing(std::string attribute) {
  return Value(Storage{std::in_place_index<0>, Missing{std::move(attribute)}});
}
Value Value::boolean(bool v) { return Value(Storage{std::in_place_index<1>, v}); }
Value Value::number(double v) { return Value(Storage{std::in_place_index<2>, v}); }
Value Value::string(std::string v) { return Value(Storage{std::in_place_index<3>, std::move(v)}); }
Value Value::numbers(std::vector<double> v) { return Value(Storage{std::in_place_index<4>, std::move(v)}); }
Value Value::strings(std::vector<std::string> v) {
  return Value(Storage{std::in_place_index<5>, std::move(v)});
}
Value Value::error(std::string message) {
  return Value(Storage{std::in_place_index<6>, Error{std::move(message)}});
}

bool Value::as_bool() const noexcept {
  const auto* b = std::get_if<bool>(&v_);
  return b && *b;
}

double Value::as_number() const noexcept {
  if (const auto* d = std::get_if<double>(&v_)) return *d;
  return std::numeric_limits<double>::quiet_NaN();
}

const std::string& Value::as_string() const noexcept {
  if (const auto* s = std::get_if<std::string>(&v_)) return *s;
  return kEmpty;
}

const std::vector<double>& Value::as_numbers() const noexcept {
  if (const auto* v = std::get_if<std::vector<double>>(&v_)) return *v;
  return kNoNumbers;
}

const std::vector<std::string>& Value::as_strings() const noexcept {
  if (const auto* v = std::get_if<std::vector<std::string>>(&v_)) return *v;
  return kNoStrings;
}

const std::string& Value::missing_name() const noexcept {
  if (const auto* m = std::get_if<Missing>(&v_)) return m->attribute;
  return kEmpty;
}

const std::string& Value::error_message() const noexcept {
  if (const auto* e = std::get_if<Error>(&v_)) return e->message;
  return kEmpty;
}

std::string Value::to_display() const {
  switch (kind()) {
    case ValueKind::kMissing:
      return missing_name().empty() ? "<missing>" : "<missing " + missing_name() + ">";
    case ValueKind::kBool:
      return as_bool() ? "true" : "false";
    case ValueKind::kNumber:
      return format_number(as_number());
    case ValueKind::kString:
      return as_string();
    case ValueKind::kNumberList: {
      std::vector<std::string> parts;
      for (double d : as_numbers()) parts.push_back(format_number(d));
      return "[" + join(parts, ", ") + "]";
    }
    case ValueKind::kStringList:
      return "[" + join(as_strings(), ", ") + "]";
    case ValueKind::kError:
      return "<error: " + error_message() + ">";
  }
  return {};
}

bool Value::operator==(const Value& o) const noexcept {
  if (kind() != o.kind()) return false;
  switch (kind()) {
    case ValueKind::kMissing:
      return true;
    case ValueKind::kBool:
      return as_bool() == o.as_bool();
    case ValueKind::kNumber:
      return same_number(as_number(), o.as_number());
    case ValueKind::kString:
      return as_string() == o.as_string();
    case ValueKind::kNumberList: {
      const auto& a = as_numbers();
      const auto& b = o.as_numbers();
      if (a.size() != b.size()) return false;
      for (std::size_t i = 0; i < a.size(); ++i) {
        if (!same_number(a[i], b[i])) return false;
      }
      return true;
    }
    case ValueKind::kStringList:
      return as_strings() == o.as_strings();
    case ValueKind::kError:
      return error_message() == o.error_message();
  }
  return false;
}

bool values_equivalent(const Value& a, const Value& b, double rel_tol) noexcept {
  if (a.kind() != b.kind()) return false;
  if (a.is_number()) return close_number(a.as_number(), b.as_number(), rel_tol);
  if (a.kind() == ValueKind::kNumberList) {
    const auto& x = a.as_numbers();
    const auto& y = b.as_numbers();
    if (x.size() != y.size()) return false;
    for (std::size_t i = 0; i < x.size(); ++i) {
      if (!close_number(x[i], y[i], rel_tol)) return false;
    }
    return true;
  }
  return a == b;
}

} // namespace rascheck::model
