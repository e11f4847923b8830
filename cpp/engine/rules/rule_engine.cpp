#include "engine/rules/rule_engine.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <utility>

#include "engine/core/logging.hpp"
#include "engine/core/strings.hpp"

namespace rascheck::rules {
namespace {

Finding base_finding(const Rule& rule) {
  Finding f;
  f.rule_id = rule.id;
  f.rule_name = rule.name;
  f.citation = rule.citation;
  f.citation_url = rule.citation_url;
  f.severity = rule.severity;
  return f;
}

Finding error_finding(const Rule& rule, const model::Entity* e, std::string message) {
  Finding f = base_finding(rule);
  f.status = FindingStatus::kError;
  f.message = std::move(message);
  if (e) f.entity = e->key();
  return f;
}

std::string value_problem(const model::Value& v) {
  if (v.is_error()) return v.error_message();
  if (v.is_missing()) return "missing attribute '" + v.missing_name() + "'";
  return std::string("yielded ") + model::value_kind_name(v.kind()) + ", not a bool";
}

Finding condition_finding(const Rule& rule, const model::Entity* e, const model::Value& v) {
  if (!v.is_bool()) return error_finding(rule, e, "condition: " + value_problem(v));
  Finding f = base_finding(rule);
  if (e) f.entity = e->key();
  if (v.as_bool()) {
    f.status = FindingStatus::kPass;
    f.message = rule.pass_message.empty() ? "condition met"
                                          : render_message(rule.pass_message, rule, e);
  } else {
    f.status = FindingStatus::kFail;
    f.message = rule.message.empty() ? "condition not met: " + rule.condition_text
                                     : render_message(rule.message, rule, e);
  }
  return f;
}

} // namespace

std::string render_message(const std::string& tmpl, const Rule& rule, const model::Entity* entity) {
  std::string out;
  out.reserve(tmpl.size());
  std::size_t i = 0;
  while (i < tmpl.size()) {
    const std::size_t open = tmpl.find('{', i);
    if (open == std::string::npos) break;
    const std::size_t close = tmpl.find('}', open + 1);
    if (close == std::string::npos) break;
    out.append(tmpl, i, open - i);

    const std::string key = trim(std::string_view(tmpl).substr(open + 1, close - open - 1));
    if (key == "id") {
      out += entity ? entity->id() : std::string("-");
    } else if (key == "rule_id") {
      out += rule.id;
    } else if (key.rfind("params.", 0) == 0) {
      const auto it = rule.params.find(key.substr(7));
      out += it == rule.params.end() ? "<missing " + key + ">" : it->second.to_display();
    } else if (entity) {
      out += entity->get(key).to_display();
    } else {
      out += "<missing " + key + ">";
    }
    i = close + 1;
  }
  out.append(tmpl, i, std::string::npos);
  return out;
}

std::vector<Finding> evaluate_rule(const Rule& rule, const model::HydraulicModel& m) {
  std::vector<Finding> out;
  std::vector<const model::Entity*> matched;

  for (const auto& type : rule.selector.types) {
    for (const model::Entity* e : m.of_type(type)) {
      if (!rule.selector.where) {
        matched.push_back(e);
        continue;
      }
      EvalContext ctx;
      ctx.entity = e;
      ctx.params = &rule.params;
      const model::Value w = evaluate(*rule.selector.where, ctx);
      if (!w.is_bool()) {
        out.push_back(error_finding(rule, e, "where: " + value_problem(w)));
        continue;
      }
      if (w.as_bool()) matched.push_back(e);
    }
  }

  if (matched.empty()) {
    Finding f = base_finding(rule);
    f.status = FindingStatus::kNotApplicable;
    f.message = "no " + join(rule.selector.types, "/") + " entity matched";
    out.push_back(std::move(f));
    return out;
  }

  if (rule.aggregate) {
    EvalContext ctx;
    ctx.matched = &matched;
    ctx.params = &rule.params;
    out.push_back(condition_finding(rule, nullptr, evaluate(*rule.condition, ctx)));
    return out;
  }

  for (const model::Entity* e : matched) {
    EvalContext ctx;
    ctx.entity = e;
    ctx.params = &rule.params;
    out.push_back(condition_finding(rule, e, evaluate(*rule.condition, ctx)));
  }
  return out;
}

std::vector<Finding> RuleEngine::evaluate(const RuleSet& rules, const model::HydraulicModel& m) const {
  const std::size_t n = rules.rules.size();
  std::vector<std::vector<Finding>> per_rule(n);

  // A rule that throws (allocation failure) still yields its own error finding.
  const auto run = [&rules, &m](std::size_t i) {
    const Rule& r = rules.rules[i];
    try {
      return evaluate_rule(r, m);
    } catch (const std::exception& e) {
      log_error("rule " + r.id + ": " + e.what());
      return std::vector<Finding>{error_finding(r, nullptr, std::string("evaluation failed: ") + e.what())};
    }
  };

  if (!settings_.parallel || n < 2) {
    for (std::size_t i = 0; i < n; ++i) per_rule[i] = run(i);
  } else {
    const std::size_t wave = settings_.max_workers > 0 ? static_cast<std::size_t>(settings_.max_workers) : n;
    for (std::size_t start = 0; start < n; start += wave) {
      const std::size_t end = std::min(n, start + wave);
      std::vector<std::future<std::vector<Finding>>> futs;
      futs.reserve(end - start);
      for (std::size_t i = start; i < end; ++i) futs.push_back(std::async(std::launch::async, run, i));
      for (std::size_t i = start; i < end; ++i) per_rule[i] = futs[i - start].get();
    }
  }

  std::vector<Finding> out;
  for (auto& f : per_rule) {
    for (auto& x : f) out.push_back(std::move(x));
  }
  log_debug("rules: " + std::to_string(n) + " rule(s) -> " + std::to_string(out.size()) + " finding(s)");
  return out;
}

} // namespace rascheck::rules
