#pragma once
/*
================================================================================
Fragment 7.1 — Pipeline: Input Resolution
FILE: cpp/engine/pipeline/input_resolver.hpp

Purpose:
  - Expand the paths named on the command line into the set of files a run
    reads. A project file (.prj) pulls in the files it lists, located next to
    it as `<stem>.<ext>`:
      * with a readable Current Plan: that plan, the geometry and flow files
        the plan links, and `<stem>.<plan>.hdf` when present;
      * otherwise every listed geometry / plan / flow file plus the result
        container of every listed plan that has one.
  - Other paths pass through by kind; each file is read at most once.

Failure model:
  - Unreadable project / plan files and listed-but-missing files become
    warnings; resolution itself never throws for a single bad file.
================================================================================
*/

#include <string>
#include <vector>

#include "engine/core/settings.hpp"
#include "engine/text/records.hpp"

namespace rascheck::pipeline {

struct ResolvedInputs {
  // Files already parsed while resolving (projects, the current plan).
  std::vector<text::ParsedTextFile> parsed;

  std::vector<std::string> text_paths;
  std::vector<std::string> result_paths;
  std::vector<std::string> warnings;
};

ResolvedInputs resolve_inputs(const std::vector<std::string>& paths, const Settings& settings);

} // namespace rascheck::pipeline
