#pragma once
/*
================================================================================
Fragment 4.1 — Model: Value
FILE: cpp/engine/model/value.hpp

Purpose:
  - The dynamically typed value held by model attributes and produced by the
    rule expression evaluator.
  - Tagged variant: missing | bool | number | string | number sequence |
    string sequence | error.

Contract:
  - missing carries the name of the attribute that was looked up (so errors
    can name it); error carries a message.
  - Equality treats NaN == NaN and ignores the missing name.
================================================================================
*/

#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace rascheck::model {

enum class ValueKind : int {
  kMissing = 0,
  kBool = 1,
  kNumber = 2,
  kString = 3,
  kNumberList = 4,
  kStringList = 5,
  kError = 6,
};

const char* value_kind_name(ValueKind k) noexcept;

class Value {
 public:
  Value() = default;

  static Value missing(std::string attribute = {});
  static Value boolean(bool v);
  static Value number(double v);
  static Value string(std::string v);
  static Value numbers(std::vector<double> v);
  static Value strings(std::vector<std::string> v);
  static Value error(std::string message);

  ValueKind kind() const noexcept { return static_cast<ValueKind>(v_.index()); }
  bool is_missing() const noexcept { return kind() == ValueKind::kMissing; }
  bool is_error() const noexcept { return kind() == ValueKind::kError; }
  bool is_bool() const noexcept { return kind() == ValueKind::kBool; }
  bool is_number() const noexcept { return kind() == ValueKind::kNumber; }
  bool is_string() const noexcept { return kind() == ValueKind::kString; }
  bool is_sequence() const noexcept {
    return kind() == ValueKind::kNumberList || kind() == ValueKind::kStringList;
  }

  // Accessors return a neutral default when the kind does not match.
  bool as_bool() const noexcept;
  double as_number() const noexcept;
  const std::string& as_string() const noexcept;
  const std::vector<double>& as_numbers() const noexcept;
  const std::vector<std::string>& as_strings() const noexcept;

  const std::string& missing_name() const noexcept;
  const std::string& error_message() const noexcept;

  // Rendering for messages: "0.035", "[1, 2]", strings unquoted,
  // "<missing x>", "<error: ...>".
  std::string to_display() const;

  bool operator==(const Value& o) const noexcept;
  bool operator!=(const Value& o) const noexcept { return !(*this == o); }

 private:
  struct Missing {
    std::string attribute;
  };
  struct Error {
    std::string message;
  };
  using Storage = std::variant<Missing, bool, double, std::string, std::vector<double>,
                               std::vector<std::string>, Error>;

  explicit Value(Storage v) : v_(std::move(v)) {}

  Storage v_;
};

// Same kind and equal within a relative tolerance for numbers / number
// sequences (|a-b| <= rel_tol * max(|a|,|b|,1)); exact otherwise.
bool values_equivalent(const Value& a, const Value& b, double rel_tol) noexcept;

} // namespace rascheck::model
