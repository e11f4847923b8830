#pragma once
/*
================================================================================
Fragment 3.4 — Results: HDF5 Result Reader
FILE: cpp/engine/results/result_reader.hpp

Purpose:
  - Extract RawDatasets from an HDF5 result container for a set of path
    globs, after checking the file signature and the root schema markers.

Failure model:
  - Missing / unreadable / timed-out signature read  -> IoError
  - Wrong signature, cannot open, missing or foreign root markers, failing
    dataset read                                     -> ResultReadError
  - Glob with no match                               -> empty, not an error
  - Unsupported datatypes                            -> skipped with a warning

Thread-safety:
  - Safe to call from several threads; HDF5 work is serialized on
    hdf5_mutex().
================================================================================
*/

#include <string>
#include <vector>

#include "engine/core/settings.hpp"
#include "engine/results/result_layout.hpp"
#include "engine/results/result_types.hpp"

namespace rascheck::results {

inline constexpr const char* kResultFileTypePrefix = "HEC-RAS Results";

// Datasets matching any of `globs` (each object read once).
ParsedResultFile read_result_datasets(const std::string& path,
                                      const std::vector<std::string>& globs,
                                      const IoSettings& io);

// Globs chosen from the layout that matches the container's "File Version".
ParsedResultFile read_result_file(const std::string& path,
                                  const Settings& settings,
                                  const ResultLayoutRegistry& registry = ResultLayoutRegistry::builtin());

} // namespace rascheck::results
