#include "engine/rules/rule_loader.hpp"

#include <algorithm>
#include <initializer_list>
#include <stdexcept>
#include <string_view>
#include <utility>

#include <yaml-cpp/yaml.h>

#include "engine/core/file_io.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/strings.hpp"
#include "engine/rules/expr_parser.hpp"

namespace rascheck::rules {
namespace {

const std::initializer_list<std::string_view> kRuleKeys = {
    "id", "name", "description", "citation", "citation_url", "severity", "selector",
    "aggregate", "condition", "parameters", "message", "pass_message",
};

std::string scalar(const YAML::Node& n, const char* key, const std::string& fallback = {}) {
  const YAML::Node v = n[key];
  if (!v || v.IsNull()) return fallback;
  if (!v.IsScalar()) throw std::runtime_error(std::string("'") + key + "' must be a scalar");
  return trim(v.Scalar());
}

model::Value param_scalar(const YAML::Node& v) {
  const std::string s = v.Scalar();
  if (const auto d = try_parse_double(s)) return model::Value::number(*d);
  const std::string l = to_lower(trim(s));
  if (l == "true") return model::Value::boolean(true);
  if (l == "false") return model::Value::boolean(false);
  return model::Value::string(s);
}

ParamMap parse_params(const YAML::Node& n) {
  ParamMap out;
  if (!n || n.IsNull()) return out;
  if (!n.IsMap()) throw std::runtime_error("'parameters' must be a mapping");
  for (const auto& kv : n) {
    const std::string key = kv.first.as<std::string>();
    const YAML::Node& v = kv.second;
    if (v.IsScalar()) {
      out[key] = param_scalar(v);
    } else if (v.IsSequence()) {
      std::vector<double> nums;
      std::vector<std::string> strs;
      bool all_numbers = true;
      for (const auto& item : v) {
        if (!item.IsScalar()) throw std::runtime_error("parameter '" + key + "' must hold scalars");
        strs.push_back(item.Scalar());
        const auto d = try_parse_double(item.Scalar());
        if (d) nums.push_back(*d);
        else all_numbers = false;
      }
      out[key] = (all_numbers && !strs.empty()) ? model::Value::numbers(std::move(nums))
                                                : model::Value::strings(std::move(strs));
    } else {
      throw std::runtime_error("parameter '" + key + "' must be a scalar or a list");
    }
  }
  return out;
}

Selector parse_selector(const YAML::Node& n) {
  Selector s;
  if (!n || n.IsNull()) throw std::runtime_error("missing 'selector'");
  if (n.IsScalar()) {
    s.types.push_back(trim(n.Scalar()));
  } else if (n.IsMap()) {
    for (const auto& kv : n) {
      const std::string k = kv.first.as<std::string>();
      if (k != "type" && k != "types" && k != "where") {
        throw std::runtime_error("unknown selector key '" + k + "'");
      }
    }
    if (const YAML::Node t = n["type"]) s.types.push_back(trim(t.as<std::string>()));
    if (const YAML::Node ts = n["types"]) {
      if (!ts.IsSequence()) throw std::runtime_error("'selector.types' must be a list");
      for (const auto& t : ts) s.types.push_back(trim(t.as<std::string>()));
    }
    s.where_text = scalar(n, "where");
  } else {
    throw std::runtime_error("'selector' must be a type name or a mapping");
  }
  if (s.types.empty()) throw std::runtime_error("selector names no entity type");
  for (const auto& t : s.types) {
    if (!model::is_entity_type(t)) throw std::runtime_error("unknown entity type '" + t + "'");
  }
  return s;
}

ExprHandle parse_checked(const std::string& text, const char* what) {
  try {
    return parse_expression(text);
  } catch (const ExprSyntaxError& e) {
    throw std::runtime_error(std::string(what) + " " + e.what());
  }
}

Rule parse_rule(const YAML::Node& n, const std::string& source) {
  if (!n.IsMap()) throw RuleLoadError("", "rule entry in " + source + " is not a mapping");
  std::string id;
  try {
    id = scalar(n, "id");
  } catch (const std::exception& e) {
    throw RuleLoadError("", e.what());
  }
  if (id.empty()) throw RuleLoadError("", "rule entry in " + source + " has no 'id'");

  try {
    for (const auto& kv : n) {
      const std::string k = kv.first.as<std::string>();
      if (std::find(kRuleKeys.begin(), kRuleKeys.end(), k) == kRuleKeys.end()) {
        throw std::runtime_error("unknown key '" + k + "'");
      }
    }

    Rule r;
    r.id = id;
    r.source = source;
    r.name = scalar(n, "name", id);
    r.description = scalar(n, "description");
    r.citation = scalar(n, "citation");
    if (r.citation.empty()) throw std::runtime_error("missing 'citation'");
    r.citation_url = scalar(n, "citation_url");

    const std::string sev = scalar(n, "severity");
    if (sev.empty()) throw std::runtime_error("missing 'severity'");
    const auto severity = parse_severity(to_lower(sev));
    if (!severity) throw std::runtime_error("unknown severity '" + sev + "'");
    r.severity = *severity;

    r.selector = parse_selector(n["selector"]);
    if (const YAML::Node a = n["aggregate"]) r.aggregate = a.as<bool>();

    r.condition_text = scalar(n, "condition");
    if (r.condition_text.empty()) throw std::runtime_error("missing 'condition'");
    r.condition = parse_checked(r.condition_text, "condition");
    if (!r.selector.where_text.empty()) {
      r.selector.where = parse_checked(r.selector.where_text, "where");
      if (uses_aggregates(*r.selector.where)) {
        throw std::runtime_error("aggregate function in 'where'");
      }
    }
    if (!r.aggregate && uses_aggregates(*r.condition)) {
      throw std::runtime_error("aggregate function in a non-aggregate rule");
    }

    r.params = parse_params(n["parameters"]);
    std::vector<std::string> used = referenced_params(*r.condition);
    if (r.selector.where) {
      for (auto& p : referenced_params(*r.selector.where)) used.push_back(std::move(p));
    }
    for (const auto& p : used) {
      if (r.params.find(p) == r.params.end()) throw std::runtime_error("undefined parameter 'params." + p + "'");
    }

    r.message = scalar(n, "message");
    r.pass_message = scalar(n, "pass_message");
    return r;
  } catch (const RuleLoadError&) {
    throw;
  } catch (const YAML::Exception& e) {
    throw RuleLoadError(id, e.what());
  } catch (const std::exception& e) {
    throw RuleLoadError(id, e.what());
  }
}

Hash64 hash_rules(const RuleSet& set) {
  Fnv1a64 h;
  for (const auto& d : set.documents) {
    h.update_string(d.ruleset);
    h.update_string(d.version);
  }
  for (const auto& r : set.rules) {
    h.update_string(r.id);
    h.update_string(r.citation);
    h.update_enum(r.severity);
    for (const auto& t : r.selector.types) h.update_string(t);
    h.update_string(r.selector.where_text);
    h.update_bool(r.aggregate);
    h.update_string(r.condition_text);
    for (const auto& [k, v] : r.params) {
      h.update_string(k);
      h.update_string(v.to_display());
    }
    h.update_string(r.message);
    h.update_string(r.pass_message);
  }
  return h.digest();
}

} // namespace

void RuleLoader::add_file(const std::string& path, const IoSettings& io) {
  std::string text;
  try {
    text = read_file_bounded(path, io);
  } catch (const IoError& e) {
    throw RuleLoadError("", std::string("cannot read rule document: ") + e.what());
  }
  add_text(text, path);
}

void RuleLoader::add_text(const std::string& yaml, const std::string& source) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml);
  } catch (const YAML::Exception& e) {
    throw RuleLoadError("", source + ": invalid YAML: " + e.what());
  }
  if (!root.IsMap() || !root["rules"] || !root["rules"].IsSequence()) {
    throw RuleLoadError("", source + ": document has no 'rules' list");
  }

  RuleDocument doc;
  doc.source = source;
  try {
    doc.ruleset = scalar(root, "ruleset");
    doc.version = scalar(root, "version");
    if (const YAML::Node s = root["supersedes"]) {
      if (!s.IsSequence()) throw std::runtime_error("'supersedes' must be a list");
      for (const auto& id : s) doc.supersedes.push_back(trim(id.as<std::string>()));
    }
  } catch (const std::exception& e) {
    throw RuleLoadError("", source + ": " + e.what());
  }

  for (const auto& id : doc.supersedes) {
    auto& rules = set_.rules;
    const auto before = rules.size();
    rules.erase(std::remove_if(rules.begin(), rules.end(), [&id](const Rule& r) { return r.id == id; }),
                rules.end());
    if (rules.size() == before) {
      log_warn("rules: " + source + " supersedes unknown rule '" + id + "'");
    } else {
      set_.superseded.push_back(id);
    }
  }

  std::size_t loaded = 0;
  for (const auto& node : root["rules"]) {
    try {
      Rule r = parse_rule(node, source);
      if (const Rule* prev = set_.find(r.id)) {
        throw RuleLoadError(r.id, "duplicate rule id (first defined in " + prev->source + ")");
      }
      set_.rules.push_back(std::move(r));
      ++loaded;
    } catch (const RuleLoadError& e) {
      log_warn(std::string("rules: ") + source + ": " + e.what());
      set_.load_errors.push_back(e);
    }
  }
  log_debug("rules: " + source + ": " + std::to_string(loaded) + " rule(s) loaded");
  set_.documents.push_back(std::move(doc));
}

RuleSet RuleLoader::finish() {
  set_.hash = hash_rules(set_);
  RuleSet out = std::move(set_);
  set_ = RuleSet{};
  return out;
}

RuleSet load_rule_files(const std::vector<std::string>& paths, const IoSettings& io) {
  RuleLoader loader;
  for (const auto& p : paths) loader.add_file(p, io);
  return loader.finish();
}

} // namespace rascheck::rules
