#pragma once
/*
===========================================================
Fragment 1.1 — Core: Logging
FILE: cpp/engine/core/logging.hpp
===========================================================
Purpose:
  - Minimal, dependency-free logging used by ALL engine modules.
  - Centralizes stdout/stderr policy.

Hardening:
  - Logging MUST NOT throw (noexcept API).
  - Thread-safe (coarse mutex in implementation); parsers log from
    worker threads.
  - Everything goes to the stderr family (clog/cerr); stdout is reserved
    for rendered reports.
===========================================================
*/

#include <string>
#include <string_view>

namespace rascheck {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

// Set global logging verbosity (default INFO).
void set_log_level(LogLevel lvl) noexcept;

// Get global logging verbosity.
LogLevel get_log_level() noexcept;

// "debug" | "info" | "warn" | "error" (case-insensitive). Returns false on unknown names.
bool parse_log_level(std::string_view name, LogLevel* out) noexcept;

// Core logging call. Never throws.
void log(LogLevel lvl, const std::string& msg) noexcept;

inline void log_debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
inline void log_info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
inline void log_warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
inline void log_error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }

} // namespace rascheck
