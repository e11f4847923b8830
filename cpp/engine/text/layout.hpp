#pragma once
/*
================================================================================
Fragment 2.2 — Text: Layout Descriptors
FILE: cpp/engine/text/layout.hpp

Purpose:
  - Describe, as data, how each text file kind is laid out: which lines open
    sections, which keywords a section understands, how values are split and
    typed, and how counted tables are read.
  - Format drift between program versions is handled by registering another
    descriptor with a higher min_version. The parser picks the newest
    descriptor whose min_version does not exceed the file's version marker.
================================================================================
*/

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "engine/core/source.hpp"

namespace rascheck::text {

enum class FieldType : int {
  kNumber = 0,      // "Key=1.5"
  kFlag = 1,        // "Key=-1" | "Key=True"; stored as a number, non-zero = on
  kString = 2,      // "Key=free text"
  kNumberList = 3,  // "Key=1,2,3"
  kStringList = 4,  // "Key=a,b,c"
  kTable = 5,       // "#Key= N [,extra]" + N*values_per_entry numbers on following lines
  kTextBlock = 6,   // "BEGIN KEY:" ... "END KEY:"
  kBare = 7,        // a whole line equal to one of `alternatives`
};

// How the numeric rows of counted tables are split.
enum class Delimiter : int {
  kWhitespace = 0,
  kFixedWidth = 1,  // columns of `column_width`; touching values allowed
};

struct FieldLayout {
  std::string keyword;
  FieldType type = FieldType::kString;
  int values_per_entry = 1;               // kTable
  std::vector<std::string> alternatives;  // kBare
};

struct SectionLayout {
  std::string name;

  // Either a keyword opener ("Type RM Length L Ch R" matches
  // "Type RM Length L Ch R = 1 ,5000 ,...") whose comma-split value is kept as
  // a string-list field named after the opener, or a BEGIN/END pair.
  std::string opener;
  bool begin_end = false;

  // Numbers that directly follow the opener line, stored as field
  // `trailing_field`; their count is the numeric root field
  // `trailing_count_field` (read until the next keyword line when absent).
  std::string trailing_field;
  std::string trailing_count_field;

  std::vector<FieldLayout> fields;

  const FieldLayout* field(std::string_view keyword) const noexcept;
  const FieldLayout* bare_field(std::string_view line) const noexcept;
};

struct Version {
  int major = 0;
  int minor = 0;

  // "6.30" -> {6,30}; "5.0.7" -> {5,0}; "4" -> {4,0}.
  static std::optional<Version> parse(std::string_view s);

  bool operator<(const Version& o) const noexcept {
    return major != o.major ? major < o.major : minor < o.minor;
  }
  bool operator<=(const Version& o) const noexcept { return !(o < *this); }
  std::string to_string() const;
};

struct FileLayout {
  std::string name;
  FileKind kind = FileKind::kUnknown;
  Version min_version;

  Delimiter table_delimiter = Delimiter::kWhitespace;
  int column_width = 8;
  int values_per_line = 10;  // writer only

  std::vector<FieldLayout> root_fields;
  std::vector<SectionLayout> sections;

  const FieldLayout* root_field(std::string_view keyword) const noexcept;
  const FieldLayout* root_bare(std::string_view line) const noexcept;
  const SectionLayout* section_by_opener(std::string_view keyword) const noexcept;
  const SectionLayout* section_by_name(std::string_view name) const noexcept;
};

class LayoutRegistry {
 public:
  void add(FileLayout layout);

  // Newest layout for `kind` with min_version <= version. Without a version
  // the newest registered layout is returned. nullptr if the kind has none.
  const FileLayout* select(FileKind kind, const std::optional<Version>& version) const noexcept;

  // Number of layouts registered for a kind.
  std::size_t count(FileKind kind) const noexcept;

  const FileLayout* by_name(std::string_view name) const noexcept;

  // Geometry (legacy + current), plan, steady / unsteady / quasi flow, project.
  static const LayoutRegistry& builtin();

 private:
  std::vector<FileLayout> layouts_;
};

} // namespace rascheck::text
