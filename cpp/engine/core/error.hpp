#pragma once

#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace rascheck {

// Stable error codes for report output + downstream tooling.
// Keep these values stable once public.
enum class ErrorCode : std::uint16_t {
  kOk = 0,

  // Input / config
  kInvalidArgument = 10,
  kOutOfRange      = 11,
  kInvalidConfig   = 12,

  // Text / binary inputs
  kIoError         = 20,
  kTimeout         = 21,
  kParseError      = 22,
  kResultRead      = 23,

  // Model / rules
  kModelConsistency = 30,
  kRuleLoad         = 31,
  kRuleEvaluation   = 32,

  kInvariant = 90,
  kInternal  = 91,
};

inline const char* to_string(ErrorCode c) noexcept {
  switch (c) {
    case ErrorCode::kOk:               return "Ok";
    case ErrorCode::kInvalidArgument:  return "InvalidArgument";
    case ErrorCode::kOutOfRange:       return "OutOfRange";
    case ErrorCode::kInvalidConfig:    return "InvalidConfig";
    case ErrorCode::kIoError:          return "IoError";
    case ErrorCode::kTimeout:          return "Timeout";
    case ErrorCode::kParseError:       return "ParseError";
    case ErrorCode::kResultRead:       return "ResultRead";
    case ErrorCode::kModelConsistency: return "ModelConsistency";
    case ErrorCode::kRuleLoad:         return "RuleLoad";
    case ErrorCode::kRuleEvaluation:   return "RuleEvaluation";
    case ErrorCode::kInvariant:        return "Invariant";
    case ErrorCode::kInternal:         return "Internal";
    default:                           return "Unknown";
  }
}

struct ErrorSite final {
  const char* file = "";
  const char* func = "";
  int line = 0;
};

// Invariant failure inside the engine.
// Includes: code + file/line/function for auditability.
class Error final : public std::runtime_error {
 public:
  Error(ErrorCode code, std::string message, ErrorSite site = {})
      : std::runtime_error(build_what(code, message, site)),
        code_(code),
        message_(std::move(message)),
        site_(site) {}

  ErrorCode code() const noexcept { return code_; }
  const std::string& message() const noexcept { return message_; }
  const ErrorSite& where() const noexcept { return site_; }

 private:
  static std::string build_what(ErrorCode code, const std::string& msg, const ErrorSite& site) {
    std::ostringstream oss;
    oss << "[rascheck::Error code=" << to_string(code) << "(" << static_cast<int>(code) << ")] "
        << (msg.empty() ? std::string{"<empty error message>"} : msg);
    if (site.file && *site.file) {
      oss << " @ " << site.file << ":" << site.line;
      if (site.func && *site.func) oss << " (" << site.func << ")";
    }
    return oss.str();
  }

  ErrorCode code_;
  std::string message_;
  ErrorSite site_;
};

[[noreturn]] inline void fail(ErrorCode code, std::string message, ErrorSite site) {
  throw Error(code, std::move(message), site);
}

}  // namespace rascheck

#define RASCHECK_SITE ::rascheck::ErrorSite{__FILE__, __func__, __LINE__}

// Hard fail for states that indicate a programming error, not bad input.
#define RASCHECK_REQUIRE(cond, code, msg)               \
  do {                                                  \
    if (!(cond)) {                                      \
      ::rascheck::fail((code), (msg), RASCHECK_SITE);   \
    }                                                   \
  } while (0)
