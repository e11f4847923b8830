#include "engine/model/hydraulic_model.hpp"

namespace rascheck::model {

const Entity* HydraulicModel::find(std::string_view type, std::string_view id) const {
  const auto it = entities_.find(EntityKey{std::string(type), std::string(id)});
  return it == entities_.end() ? nullptr : &it->second;
}

std::vector<const Entity*> HydraulicModel::of_type(std::string_view type) const {
  std::vector<const Entity*> out;
  // Keys order by type first, so one type is a contiguous range.
  auto it = entities_.lower_bound(EntityKey{std::string(type), std::string()});
  for (; it != entities_.end() && it->first.type == type; ++it) out.push_back(&it->second);
  return out;
}

Entity& HydraulicModel::upsert(const std::string& type, const std::string& id) {
  EntityKey key{type, id};
  auto it = entities_.find(key);
  if (it == entities_.end()) it = entities_.emplace(key, Entity(type, id)).first;
  return it->second;
}

Entity* HydraulicModel::find_mutable(const std::string& type, const std::string& id) {
  const auto it = entities_.find(EntityKey{type, id});
  return it == entities_.end() ? nullptr : &it->second;
}

} // namespace rascheck::model
