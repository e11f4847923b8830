#pragma once
/*
================================================================================
Fragment 3.1 — Results: Raw Datasets
FILE: cpp/engine/results/result_types.hpp

Purpose:
  - The output vocabulary of the binary result reader.
  - A RawDataset is one named array (or, for a matched group, just its
    attributes). Compound tables are split into one RawDataset per member,
    named "<table path>/<member>".

Contract:
  - Numeric values are always double (integer and float32 data widened).
  - Strings are decoded per the stored character set (ASCII bytes above 0x7F
    become '?').
  - Exactly one of numbers / strings is populated for array datasets; both are
    empty for group entries.
================================================================================
*/

#include <cstddef>
#include <map>
#include <string>
#include <variant>
#include <vector>

#include "engine/core/source.hpp"

namespace rascheck::results {

using AttrValue = std::variant<double, std::string>;

struct RawDataset {
  std::string path;                 // "Geometry/Cross Sections/Attributes/RS"
  std::vector<std::size_t> shape;   // empty for groups and scalars read as groups
  std::vector<double> numbers;
  std::vector<std::string> strings;
  std::map<std::string, AttrValue> attributes;
  bool is_group = false;

  std::size_t size() const noexcept { return numbers.empty() ? strings.size() : numbers.size(); }
  bool is_string() const noexcept { return !strings.empty(); }

  // Row-major element (r, c) of a 2-D numeric dataset; NaN when out of range.
  double at(std::size_t r, std::size_t c) const noexcept;
};

struct ParsedResultFile {
  SourceRef source;
  std::string file_type;     // root attribute "File Type"
  std::string file_version;  // root attribute "File Version"
  std::string layout_name;
  std::vector<RawDataset> datasets;  // sorted by object path; compound members in member order
  std::vector<std::string> warnings;

  // nullptr when no dataset has exactly this path.
  const RawDataset* find(const std::string& path) const noexcept;
};

} // namespace rascheck::results
