#pragma once
/*
================================================================================
Fragment 1.6 — Core: Bounded File I/O
FILE: cpp/engine/core/file_io.hpp

Purpose:
  - Every input read in a run goes through here so that:
      * a read that exceeds IoSettings::read_timeout_ms fails with IoError
        (code kTimeout) instead of hanging the pipeline;
      * missing / unreadable / oversized files fail with IoError naming the path.

Notes:
  - A timed-out read leaves its worker thread to finish on its own; the
    stream is scope-owned by that worker and closed when it ends.
================================================================================
*/

#include <cstddef>
#include <string>

#include "engine/core/hashing.hpp"
#include "engine/core/settings.hpp"

namespace rascheck {

// Whole file as bytes. Throws IoError.
std::string read_file_bounded(const std::string& path, const IoSettings& io);

// First n bytes (fewer if the file is shorter). Throws IoError.
std::string read_file_prefix(const std::string& path, std::size_t n, const IoSettings& io);

// FNV-1a 64 of the whole file, streamed (no size limit). Throws IoError.
Hash64 hash_file_bounded(const std::string& path, const IoSettings& io);

// Write (truncate) a file. Throws IoError.
void write_text_file(const std::string& path, const std::string& content);

bool file_exists(const std::string& path) noexcept;

} // namespace rascheck
