#pragma once
/*
================================================================================
Fragment 4.3 — Model: Design / Result Precedence
FILE: cpp/engine/model/merge_policy.hpp

Purpose:
  - Decide the effective attribute when a text (design) value and a result
    value exist for the same entity attribute.
  - The builder only ever calls merge(); which side wins is entirely the
    policy's business.
================================================================================
*/

#include <memory>

#include "engine/core/settings.hpp"
#include "engine/model/entity.hpp"

namespace rascheck::model {

struct IMergePolicy {
  virtual ~IMergePolicy() = default;
  virtual const char* name() const noexcept = 0;

  // `design` has origin kDesign, `result` has origin kResult.
  virtual Attribute merge(const Attribute& design, const Attribute& result) const = 0;
};

// Result value effective; text value kept as design_value.
class ResultOverridesDesign final : public IMergePolicy {
 public:
  const char* name() const noexcept override { return "result_overrides_design"; }
  Attribute merge(const Attribute& design, const Attribute& result) const override;
};

// Text value stays effective (and is also reported as design_value).
class DesignOverridesResult final : public IMergePolicy {
 public:
  const char* name() const noexcept override { return "design_overrides_result"; }
  Attribute merge(const Attribute& design, const Attribute& result) const override;
};

std::unique_ptr<IMergePolicy> make_merge_policy(MergePrecedence precedence);

} // namespace rascheck::model
