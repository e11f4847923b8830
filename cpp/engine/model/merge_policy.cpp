#include "engine/model/merge_policy.hpp"

namespace rascheck::model {

Attribute ResultOverridesDesign::merge(const Attribute& design, const Attribute& result) const {
  Attribute out = result;
  out.origin = Origin::kResult;
  out.design_value = design.value;
  return out;
}

Attribute DesignOverridesResult::merge(const Attribute& design, const Attribute&) const {
  Attribute out = design;
  out.origin = Origin::kDesign;
  out.design_value = design.value;
  return out;
}

std::unique_ptr<IMergePolicy> make_merge_policy(MergePrecedence precedence) {
  if (precedence == MergePrecedence::kDesignOverridesResult) {
    return std::make_unique<DesignOverridesResult>();
  }
  return std::make_unique<ResultOverridesDesign>();
}

} // namespace rascheck::model
