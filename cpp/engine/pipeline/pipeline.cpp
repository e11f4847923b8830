#include "engine/pipeline/pipeline.hpp"

#include <algorithm>
#include <functional>
#include <future>
#include <optional>
#include <utility>

#include "engine/core/errors.hpp"
#include "engine/core/file_io.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/settings_yaml.hpp"
#include "engine/model/merge_policy.hpp"
#include "engine/model/model_builder.hpp"
#include "engine/pipeline/input_resolver.hpp"
#include "engine/results/result_reader.hpp"
#include "engine/rules/rule_engine.hpp"
#include "engine/text/section_parser.hpp"

namespace rascheck::pipeline {
namespace {

// One input file after the parse stage. Exactly one of text / result is set
// unless `error` is non-empty.
struct ParseOutcome {
  std::string path;
  std::optional<text::ParsedTextFile> text;
  std::optional<results::ParsedResultFile> result;
  Hash64 hash;
  std::string error;
};

ParseOutcome parse_one(const std::string& path, bool is_result, const Settings& settings) {
  ParseOutcome out;
  out.path = path;
  try {
    if (is_result) out.result = results::read_result_file(path, settings);
    else out.text = text::parse_text_file(path, settings);
    out.hash = hash_file_bounded(path, settings.io);
  } catch (const RascheckError& e) {
    out.text.reset();
    out.result.reset();
    out.error = e.what();
  }
  return out;
}

ParseOutcome hash_parsed(text::ParsedTextFile f, const Settings& settings) {
  ParseOutcome out;
  out.path = f.source.path;
  try {
    out.hash = hash_file_bounded(out.path, settings.io);
    out.text = std::move(f);
  } catch (const IoError& e) {
    out.error = e.what();
  }
  return out;
}

} // namespace

Pipeline::Pipeline(Settings settings, IProgressSink* sink) : settings_(std::move(settings)), sink_(sink) {
  settings_.validate_or_throw();
}

void Pipeline::emit(ProgressKind kind, const std::string& stage, const std::string& detail) const noexcept {
  if (!sink_) return;
  try {
    sink_->on_event(ProgressEvent{kind, stage, detail});
  } catch (const std::exception& e) {
    // Building the event failed (allocation); the run goes on without it.
    log_debug(std::string("progress event dropped: ") + e.what());
  }
}

ModelRun Pipeline::build_model(const std::vector<std::string>& paths) const {
  ModelRun out;

  emit(ProgressKind::kStageStarted, "resolve");
  ResolvedInputs in = resolve_inputs(paths, settings_);
  for (const auto& w : in.warnings) {
    emit(ProgressKind::kWarning, "resolve", w);
    out.warnings.push_back(w);
  }
  emit(ProgressKind::kStageCompleted, "resolve");

  // Independent files, independent immutable results; order is restored by
  // the builder's canonical sort.
  emit(ProgressKind::kStageStarted, "parse");
  const auto policy = settings_.parse.parallel ? std::launch::async : std::launch::deferred;
  std::vector<std::future<ParseOutcome>> futs;
  for (auto& f : in.parsed) {
    futs.push_back(std::async(policy, hash_parsed, std::move(f), std::cref(settings_)));
  }
  for (const auto& p : in.text_paths) {
    futs.push_back(std::async(policy, parse_one, p, false, std::cref(settings_)));
  }
  for (const auto& p : in.result_paths) {
    futs.push_back(std::async(policy, parse_one, p, true, std::cref(settings_)));
  }

  std::vector<text::ParsedTextFile> text_files;
  std::vector<results::ParsedResultFile> result_files;
  for (auto& fut : futs) {
    ParseOutcome o = fut.get();
    if (!o.error.empty()) {
      const std::string w = o.error + "; file skipped";
      emit(ProgressKind::kWarning, "parse", w);
      out.warnings.push_back(w);
      continue;
    }
    if (o.text) {
      out.inputs.push_back({o.text->source, o.hash});
      text_files.push_back(std::move(*o.text));
    } else if (o.result) {
      out.inputs.push_back({o.result->source, o.hash});
      result_files.push_back(std::move(*o.result));
    }
    emit(ProgressKind::kStageCompleted, "parse", o.path);
  }

  if (text_files.empty() && result_files.empty()) {
    throw IoError("no readable input file among " + std::to_string(paths.size()) + " path(s)");
  }

  std::sort(out.inputs.begin(), out.inputs.end(),
            [](const report::InputFile& a, const report::InputFile& b) { return source_less(a.source, b.source); });
  std::sort(text_files.begin(), text_files.end(),
            [](const text::ParsedTextFile& a, const text::ParsedTextFile& b) { return source_less(a.source, b.source); });
  std::sort(result_files.begin(), result_files.end(),
            [](const results::ParsedResultFile& a, const results::ParsedResultFile& b) {
              return source_less(a.source, b.source);
            });
  for (const auto& f : text_files) {
    for (auto& w : f.all_warnings()) out.warnings.push_back(std::move(w));
  }
  for (const auto& f : result_files) {
    for (const auto& w : f.warnings) out.warnings.push_back(w);
  }

  emit(ProgressKind::kStageStarted, "merge");
  const auto merge_policy = model::make_merge_policy(settings_.merge.precedence);
  const model::ModelBuilder builder(settings_.merge, *merge_policy);
  out.model = builder.build(std::move(text_files), std::move(result_files));
  for (const auto& w : out.model.warnings()) out.warnings.push_back(w);
  emit(ProgressKind::kStageCompleted, "merge", std::to_string(out.model.size()) + " entities");

  return out;
}

report::ComplianceReport Pipeline::run(const std::vector<std::string>& paths, const rules::RuleSet& rule_set) const {
  ModelRun mr = build_model(paths);

  emit(ProgressKind::kStageStarted, "evaluate");
  const rules::RuleEngine engine(settings_.eval);
  std::vector<rules::Finding> findings = engine.evaluate(rule_set, mr.model);
  emit(ProgressKind::kStageCompleted, "evaluate", std::to_string(findings.size()) + " findings");

  emit(ProgressKind::kStageStarted, "report");
  report::RunMetadata meta;
  meta.timestamp = report::utc_timestamp();
  meta.inputs = std::move(mr.inputs);
  meta.precedence = precedence_name(settings_.merge.precedence);
  if (const model::Entity* m = mr.model.find(model::kModel, "model")) {
    const model::Value ap = m->get("active_plan");
    if (ap.is_string()) meta.active_plan = ap.as_string();
  }

  report::ComplianceReport r =
      report::aggregate(std::move(meta), std::move(findings), std::move(mr.warnings), rule_set);
  emit(ProgressKind::kStageCompleted, "report");

  log_info("run: " + std::to_string(r.summary.total()) + " finding(s), " +
           std::to_string(r.summary.count(rules::Severity::kViolation, rules::FindingStatus::kFail)) +
           " failed violation(s)");
  return r;
}

} // namespace rascheck::pipeline
