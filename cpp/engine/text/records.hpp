#pragma once
/*
================================================================================
Fragment 2.1 — Text: Raw Records
FILE: cpp/engine/text/records.hpp

Purpose:
  - The output vocabulary of the section parser. A text input file becomes an
    ordered sequence of RawRecords; each record is a section (or the file's
    root) holding an ordered list of Fields.

Contract:
  - Records are immutable once the parser returns them.
  - Record identity is (section, ordinal, opaque, fields); source line numbers
    and warnings are provenance only and do not take part in equality.
  - FieldValue "missing" is always accompanied by a warning when the input
    held a token that failed to parse.
================================================================================
*/

#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "engine/core/source.hpp"

namespace rascheck::text {

enum class FieldValueKind : int {
  kMissing = 0,
  kNumber = 1,
  kString = 2,
  kNumberList = 3,
  kStringList = 4,
};

class FieldValue {
 public:
  FieldValue() = default;

  static FieldValue number(double v) { return FieldValue(Storage{std::in_place_index<1>, v}); }
  static FieldValue string(std::string v) { return FieldValue(Storage{std::in_place_index<2>, std::move(v)}); }
  static FieldValue numbers(std::vector<double> v) { return FieldValue(Storage{std::in_place_index<3>, std::move(v)}); }
  static FieldValue strings(std::vector<std::string> v) { return FieldValue(Storage{std::in_place_index<4>, std::move(v)}); }

  FieldValueKind kind() const noexcept { return static_cast<FieldValueKind>(v_.index()); }
  bool is_missing() const noexcept { return v_.index() == 0; }

  // Accessors return the stored value, or an empty / NaN default when the
  // kind does not match.
  double as_number() const noexcept;
  const std::string& as_string() const noexcept;
  const std::vector<double>& as_numbers() const noexcept;
  const std::vector<std::string>& as_strings() const noexcept;

  // NaN elements compare equal to NaN.
  bool operator==(const FieldValue& o) const noexcept;
  bool operator!=(const FieldValue& o) const noexcept { return !(*this == o); }

 private:
  using Storage = std::variant<std::monostate, double, std::string, std::vector<double>,
                               std::vector<std::string>>;
  explicit FieldValue(Storage v) : v_(std::move(v)) {}

  Storage v_;
};

struct Field {
  std::string name;    // keyword as written before '=' (empty for raw lines)
  FieldValue value;
  std::string header;  // counted tables: the text after '=' ("3 , 0 , 0")
  bool raw = false;    // unrecognized line kept verbatim in value
  int line = 0;

  bool operator==(const Field& o) const noexcept {
    return name == o.name && value == o.value && header == o.header && raw == o.raw;
  }
  bool operator!=(const Field& o) const noexcept { return !(*this == o); }
};

struct Diagnostic {
  int line = 0;  // 0 = whole file
  std::string message;

  std::string to_string() const {
    return line > 0 ? "line " + std::to_string(line) + ": " + message : message;
  }
};

struct RawRecord {
  std::string section;  // "" for the file root
  int ordinal = 0;      // position in the file's record sequence (root = 0)
  std::vector<Field> fields;
  bool opaque = false;     // unknown BEGIN/END section kept as raw lines
  bool truncated = false;  // EOF reached before the section terminator
  int line = 0;            // opener line

  std::vector<Diagnostic> warnings;

  // First field with this name, or nullptr.
  const Field* find(std::string_view name) const noexcept;

  bool operator==(const RawRecord& o) const noexcept {
    return section == o.section && ordinal == o.ordinal && opaque == o.opaque &&
           fields == o.fields;
  }
  bool operator!=(const RawRecord& o) const noexcept { return !(*this == o); }
};

struct ParsedTextFile {
  SourceRef source;
  std::string version;      // "Program Version=" value, empty if absent
  std::string layout_name;  // descriptor that drove the parse
  std::vector<RawRecord> records;  // records[0] is always the root record
  std::vector<Diagnostic> warnings;  // file-level
  bool truncated = false;

  const RawRecord& root() const { return records.front(); }

  // File-level and record-level warnings, prefixed with the source label.
  std::vector<std::string> all_warnings() const;
};

} // namespace rascheck::text
