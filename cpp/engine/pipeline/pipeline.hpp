#pragma once
/*
================================================================================
Fragment 7.2 — Pipeline: Compliance Run
FILE: cpp/engine/pipeline/pipeline.hpp

Stages (progress events use these names):
  resolve  -> expand project files into inputs
  parse    -> text files and result containers, concurrently (std::async)
  merge    -> one HydraulicModel (canonical order, isolated precedence policy)
  evaluate -> RuleEngine
  report   -> aggregate into a ComplianceReport

Failure model:
  - A file that cannot be read or parsed is dropped with a report warning;
    the run continues with the remaining files.
  - No readable input at all -> IoError.
  - ModelConsistencyError aborts the run.
  - Sinks are notified through noexcept calls only.
================================================================================
*/

#include <string>
#include <vector>

#include "engine/core/progress.hpp"
#include "engine/core/settings.hpp"
#include "engine/model/hydraulic_model.hpp"
#include "engine/report/compliance_report.hpp"
#include "engine/rules/rule_types.hpp"

namespace rascheck::pipeline {

struct ModelRun {
  model::HydraulicModel model;
  std::vector<report::InputFile> inputs;  // files that parsed, canonical order
  std::vector<std::string> warnings;      // resolve / parse / read / merge
};

class Pipeline {
 public:
  // `sink` may be null; it must outlive the pipeline.
  explicit Pipeline(Settings settings, IProgressSink* sink = nullptr);

  // resolve + parse + merge.
  ModelRun build_model(const std::vector<std::string>& paths) const;

  // Full run.
  report::ComplianceReport run(const std::vector<std::string>& paths, const rules::RuleSet& rule_set) const;

  const Settings& settings() const noexcept { return settings_; }

 private:
  void emit(ProgressKind kind, const std::string& stage, const std::string& detail = {}) const noexcept;

  Settings settings_;
  IProgressSink* sink_;
};

} // namespace rascheck::pipeline
