#include "engine/core/settings_yaml.hpp"

#include <initializer_list>
#include <string_view>

#include <yaml-cpp/yaml.h>

#include "engine/core/errors.hpp"
#include "engine/core/file_io.hpp"

namespace rascheck {
namespace {

void reject_unknown_keys(const YAML::Node& node,
                         std::string_view section,
                         std::initializer_list<std::string_view> known) {
  for (const auto& kv : node) {
    const std::string key = kv.first.as<std::string>();
    bool ok = false;
    for (auto k : known) ok = ok || (k == key);
    if (!ok) {
      throw ValidationError("settings: unknown key '" + std::string(section) + "." + key + "'");
    }
  }
}

template <class T>
void read_opt(const YAML::Node& node, const char* key, T& out) {
  if (node[key]) out = node[key].as<T>();
}

MergePrecedence parse_precedence(const std::string& s) {
  if (s == "result_overrides_design") return MergePrecedence::kResultOverridesDesign;
  if (s == "design_overrides_result") return MergePrecedence::kDesignOverridesResult;
  throw ValidationError("settings: merge.precedence must be result_overrides_design or "
                        "design_overrides_result (got '" + s + "')");
}

Settings apply(const YAML::Node& root, Settings s) {
  if (!root || root.IsNull()) return s;
  if (!root.IsMap()) throw ValidationError("settings: document root must be a mapping");
  reject_unknown_keys(root, "", {"io", "parse", "merge", "eval", "report", "log"});

  if (const auto n = root["io"]) {
    reject_unknown_keys(n, "io", {"read_timeout_ms", "max_text_bytes"});
    read_opt(n, "read_timeout_ms", s.io.read_timeout_ms);
    read_opt(n, "max_text_bytes", s.io.max_text_bytes);
  }
  if (const auto n = root["parse"]) {
    reject_unknown_keys(n, "parse", {"strict", "parallel"});
    read_opt(n, "strict", s.parse.strict);
    read_opt(n, "parallel", s.parse.parallel);
  }
  if (const auto n = root["merge"]) {
    reject_unknown_keys(n, "merge", {"precedence", "numeric_rel_tol"});
    if (n["precedence"]) s.merge.precedence = parse_precedence(n["precedence"].as<std::string>());
    read_opt(n, "numeric_rel_tol", s.merge.numeric_rel_tol);
  }
  if (const auto n = root["eval"]) {
    reject_unknown_keys(n, "eval", {"parallel", "max_workers"});
    read_opt(n, "parallel", s.eval.parallel);
    read_opt(n, "max_workers", s.eval.max_workers);
  }
  if (const auto n = root["report"]) {
    reject_unknown_keys(n, "report", {"pretty_json", "indent_spaces", "include_not_applicable"});
    read_opt(n, "pretty_json", s.report.pretty_json);
    read_opt(n, "indent_spaces", s.report.indent_spaces);
    read_opt(n, "include_not_applicable", s.report.include_not_applicable);
  }
  if (const auto n = root["log"]) {
    reject_unknown_keys(n, "log", {"level"});
    if (n["level"]) {
      const std::string lvl = n["level"].as<std::string>();
      if (!parse_log_level(lvl, &s.log_level)) {
        throw ValidationError("settings: log.level must be debug|info|warn|error (got '" + lvl + "')");
      }
    }
  }

  s.validate_or_throw();
  return s;
}

} // namespace

Settings parse_settings_yaml(const std::string& text, const Settings& base) {
  try {
    return apply(YAML::Load(text), base);
  } catch (const YAML::Exception& e) {
    throw ValidationError(std::string("settings: invalid YAML: ") + e.what());
  }
}

Settings load_settings_yaml(const std::string& path, const Settings& base) {
  const std::string text = read_file_bounded(path, base.io);
  try {
    return apply(YAML::Load(text), base);
  } catch (const YAML::Exception& e) {
    throw ValidationError("settings: invalid YAML in " + path + ": " + e.what());
  }
}

const char* precedence_name(MergePrecedence p) noexcept {
  switch (p) {
    case MergePrecedence::kResultOverridesDesign: return "result_overrides_design";
    case MergePrecedence::kDesignOverridesResult: return "design_overrides_result";
    default:                                      return "unknown";
  }
}

} // namespace rascheck
