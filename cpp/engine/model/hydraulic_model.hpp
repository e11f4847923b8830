#pragma once
/*
================================================================================
Fragment 4.2 — Model: Hydraulic Model
FILE: cpp/engine/model/hydraulic_model.hpp

Purpose:
  - The canonical object graph every rule is evaluated against: entities
    keyed by (type, identifier), iterated in canonical key order.

Contract:
  - Keys are unique (map-backed).
  - Only the builder mutates a model; everything else sees const access.
================================================================================
*/

#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "engine/core/source.hpp"
#include "engine/model/entity.hpp"

namespace rascheck::model {

namespace detail {
class ModelAssembly;
} // namespace detail

class HydraulicModel {
 public:
  const Entity* find(std::string_view type, std::string_view id) const;

  // Canonical order.
  std::vector<const Entity*> of_type(std::string_view type) const;
  const std::map<EntityKey, Entity>& entities() const noexcept { return entities_; }
  std::size_t size() const noexcept { return entities_.size(); }

  // Model-level warnings (overrides, discarded values, duplicate records).
  const std::vector<std::string>& warnings() const noexcept { return warnings_; }

  // Sources that contributed, canonical order.
  const std::vector<SourceRef>& sources() const noexcept { return sources_; }

 private:
  friend class detail::ModelAssembly;

  Entity& upsert(const std::string& type, const std::string& id);
  Entity* find_mutable(const std::string& type, const std::string& id);

  std::map<EntityKey, Entity> entities_;
  std::vector<std::string> warnings_;
  std::vector<SourceRef> sources_;
};

} // namespace rascheck::model
