#pragma once
/*
================================================================================
Fragment 1.2 — Core: Error Types (Engine-Wide)
FILE: cpp/engine/core/errors.hpp

Purpose:
  - Uniform exception types so input, model and rule failures are:
      * catchable by category
      * reportable with a stable ErrorCode
      * traceable to the file / line / rule that caused them

Propagation contract:
  - ParseError        : text input; fatal for one file (or one line in strict mode)
  - ResultReadError   : binary result container; fatal for that file
  - ModelConsistencyError : conflicting authoritative design data; fatal for the build
  - RuleLoadError     : one malformed rule; collected, never aborts the load
  - IoError           : missing file, read failure, timeout
  - ValidationError   : settings / CLI argument validation
================================================================================
*/

#include <stdexcept>
#include <string>
#include <utility>

#include "engine/core/error.hpp"

namespace rascheck {

// Base error for the engine.
class RascheckError : public std::runtime_error {
 public:
  RascheckError(ErrorCode code, std::string msg)
      : std::runtime_error(std::move(msg)), code_(code) {}

  ErrorCode code() const noexcept { return code_; }

 private:
  ErrorCode code_;
};

// Thrown when user/config input fails validation.
class ValidationError : public RascheckError {
 public:
  explicit ValidationError(std::string msg)
      : RascheckError(ErrorCode::kInvalidConfig, std::move(msg)) {}
};

// Thrown for I/O or filesystem related issues, including read timeouts.
class IoError : public RascheckError {
 public:
  explicit IoError(std::string msg, ErrorCode code = ErrorCode::kIoError)
      : RascheckError(code, std::move(msg)) {}
};

// Malformed or truncated text input. line == 0 means "whole file".
class ParseError : public RascheckError {
 public:
  ParseError(std::string path, int line, std::string reason)
      : RascheckError(ErrorCode::kParseError, build(path, line, reason)),
        path_(std::move(path)),
        line_(line),
        reason_(std::move(reason)) {}

  const std::string& path() const noexcept { return path_; }
  int line() const noexcept { return line_; }
  const std::string& reason() const noexcept { return reason_; }

 private:
  static std::string build(const std::string& path, int line, const std::string& reason) {
    std::string s = "parse error in " + (path.empty() ? std::string{"<text>"} : path);
    if (line > 0) s += ":" + std::to_string(line);
    return s + ": " + reason;
  }

  std::string path_;
  int line_;
  std::string reason_;
};

// Result container unreadable, wrong signature, or wrong schema markers.
class ResultReadError : public RascheckError {
 public:
  ResultReadError(std::string path, std::string reason)
      : RascheckError(ErrorCode::kResultRead,
                      "result read error in " + path + ": " + reason),
        path_(std::move(path)) {}

  const std::string& path() const noexcept { return path_; }

 private:
  std::string path_;
};

// Two design sources disagree on an authoritative value.
class ModelConsistencyError : public RascheckError {
 public:
  ModelConsistencyError(std::string msg, std::string first_source, std::string second_source)
      : RascheckError(ErrorCode::kModelConsistency, std::move(msg)),
        first_(std::move(first_source)),
        second_(std::move(second_source)) {}

  const std::string& first_source() const noexcept { return first_; }
  const std::string& second_source() const noexcept { return second_; }

 private:
  std::string first_;
  std::string second_;
};

// A single rule record could not be loaded.
class RuleLoadError : public RascheckError {
 public:
  RuleLoadError(std::string rule_id, std::string reason)
      : RascheckError(ErrorCode::kRuleLoad,
                      "rule '" + (rule_id.empty() ? std::string{"<no id>"} : rule_id) +
                          "': " + reason),
        rule_id_(std::move(rule_id)),
        reason_(std::move(reason)) {}

  const std::string& rule_id() const noexcept { return rule_id_; }
  const std::string& reason() const noexcept { return reason_; }

 private:
  std::string rule_id_;
  std::string reason_;
};

} // namespace rascheck
