#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "engine/model/value.hpp"

namespace rascheck::model {

// Entity type names.
inline constexpr const char* kModel = "model";
inline constexpr const char* kProject = "project";
inline constexpr const char* kPlan = "plan";
inline constexpr const char* kFlow = "flow";
inline constexpr const char* kProfile = "profile";
inline constexpr const char* kReach = "reach";
inline constexpr const char* kCrossSection = "cross_section";
inline constexpr const char* kBridge = "bridge";
inline constexpr const char* kBoundary = "boundary";
inline constexpr const char* kFlowChange = "flow_change";

bool is_entity_type(std::string_view type) noexcept;

enum class Origin : int {
  kDesign = 0,  // text model input
  kResult = 1,  // binary result container
};

const char* origin_name(Origin o) noexcept;

struct Attribute {
  Value value;
  std::optional<Value> design_value;  // text value kept when a result value is effective
  Origin origin = Origin::kDesign;
  std::string source;     // "path:line" or "path@dataset"
  std::string source_id;  // short id of the file ("g01", "p01")
};

// Canonical order: type, then natural order of the identifier.
struct EntityKey {
  std::string type;
  std::string id;

  bool operator<(const EntityKey& o) const noexcept;
  bool operator==(const EntityKey& o) const noexcept { return type == o.type && id == o.id; }
  std::string to_string() const { return type + ":" + id; }
};

class Entity {
 public:
  Entity(std::string type, std::string id) : key_{std::move(type), std::move(id)} {}

  const EntityKey& key() const noexcept { return key_; }
  const std::string& type() const noexcept { return key_.type; }
  const std::string& id() const noexcept { return key_.id; }

  // nullptr when absent.
  const Attribute* attribute(std::string_view name) const noexcept;

  // Effective value; Value::missing(name) when absent.
  Value get(std::string_view name) const;

  const std::map<std::string, Attribute, std::less<>>& attributes() const noexcept { return attrs_; }

  // Related entity by role ("reach" of a cross section, "geometry" of a plan).
  const EntityKey* related(std::string_view role) const noexcept;
  const std::map<std::string, EntityKey, std::less<>>& relations() const noexcept { return relations_; }

  void set(std::string name, Attribute a) { attrs_[std::move(name)] = std::move(a); }
  void erase(std::string_view name);
  void relate(std::string role, EntityKey target) { relations_[std::move(role)] = std::move(target); }

 private:
  EntityKey key_;
  std::map<std::string, Attribute, std::less<>> attrs_;
  std::map<std::string, EntityKey, std::less<>> relations_;
};

} // namespace rascheck::model
