#include "engine/model/entity.hpp"

#include "engine/core/strings.hpp"

namespace rascheck::model {

bool is_entity_type(std::string_view type) noexcept {
  for (const char* t : {kModel, kProject, kPlan, kFlow, kProfile, kReach, kCrossSection, kBridge,
                        kBoundary, kFlowChange}) {
    if (type == t) return true;
  }
  return false;
}

const char* origin_name(Origin o) noexcept {
  return o == Origin::kResult ? "result" : "design";
}

bool EntityKey::operator<(const EntityKey& o) const noexcept {
  if (type != o.type) return type < o.type;
  return natural_less(id, o.id);
}

const Attribute* Entity::attribute(std::string_view name) const noexcept {
  const auto it = attrs_.find(name);
  return it == attrs_.end() ? nullptr : &it->second;
}

Value Entity::get(std::string_view name) const {
  const Attribute* a = attribute(name);
  return a ? a->value : Value::missing(std::string(name));
}

const EntityKey* Entity::related(std::string_view role) const noexcept {
  const auto it = relations_.find(role);
  return it == relations_.end() ? nullptr : &it->second;
}

void Entity::erase(std::string_view name) {
  const auto it = attrs_.find(name);
  if (it != attrs_.end()) attrs_.erase(it);
}

} // namespace rascheck::model
