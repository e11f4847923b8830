#pragma once
/*
================================================================================
Fragment 3.3 — Results: Result Layout Descriptors
FILE: cpp/engine/results/result_layout.hpp

Purpose:
  - Declare, per container generation ("File Version" major), which paths the
    reader extracts and how they map onto model attributes.
  - Cross-section geometry comes from the compound "Attributes" table; per
    profile output from 2-D datasets shaped [profile, cross section].
================================================================================
*/

#include <string>
#include <vector>

namespace rascheck::results {

// Dataset (or compound member) name -> model attribute name.
struct ResultVariable {
  std::string dataset;
  std::string attribute;
};

struct ResultLayout {
  std::string name;
  int min_major = 0;

  std::string plan_information;  // group; attributes only
  std::string xs_attributes;     // compound table
  std::string profile_names;     // string dataset
  std::string xs_output;         // group of [profile, xs] datasets

  std::vector<ResultVariable> xs_members;  // from xs_attributes
  std::vector<ResultVariable> xs_outputs;  // from xs_output/<dataset>

  // Globs handed to the reader.
  std::vector<std::string> globs() const;
};

class ResultLayoutRegistry {
 public:
  void add(ResultLayout layout);

  // Newest layout with min_major <= major; the oldest one when major predates
  // all of them. nullptr only when empty.
  const ResultLayout* select(int major) const noexcept;

  const ResultLayout* by_name(const std::string& name) const noexcept;

  static const ResultLayoutRegistry& builtin();

 private:
  std::vector<ResultLayout> layouts_;
};

// First integer in a "File Version" marker ("HEC-RAS 6.3.1 September 2022"
// -> 6); -1 when there is none.
int version_major(const std::string& file_version) noexcept;

} // namespace rascheck::results
