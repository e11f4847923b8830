#pragma once
/*
================================================================================
Fragment 4.4 — Model: Builder
FILE: cpp/engine/model/model_builder.hpp

Purpose:
  - Fold parsed text files and parsed result containers into one
    HydraulicModel.

Order of work:
  1) canonicalize inputs (kind, id, path)
  2) pick the active plan (project "Current Plan", else the only plan)
  3) text records -> design attributes (conflicts resolved or thrown)
  4) result datasets -> result attributes (IMergePolicy on overlap)
  5) derived attributes from effective values

Errors:
  - ModelConsistencyError when two design sources disagree and the active
    plan does not link exactly one of them.
================================================================================
*/

#include <string>
#include <string_view>
#include <vector>

#include "engine/core/settings.hpp"
#include "engine/model/hydraulic_model.hpp"
#include "engine/model/merge_policy.hpp"
#include "engine/results/result_types.hpp"
#include "engine/text/records.hpp"

namespace rascheck::model {

class ModelBuilder {
 public:
  // `policy` must outlive the builder.
  ModelBuilder(MergeSettings settings, const IMergePolicy& policy);

  HydraulicModel build(std::vector<text::ParsedTextFile> text_files,
                       std::vector<results::ParsedResultFile> result_files) const;

 private:
  MergeSettings settings_;
  const IMergePolicy& policy_;
};

// "5000", "5000.0" and " 5000 " -> "5000"; non-numeric stations ("4500.*")
// are only trimmed.
std::string canonical_station(std::string_view rs);

// "River/Reach" with both parts trimmed.
std::string reach_id(std::string_view river, std::string_view reach);

} // namespace rascheck::model
