#pragma once

#include <string>

namespace rascheck {

enum class ProgressKind : int {
  kStageStarted = 0,
  kStageCompleted = 1,
  kWarning = 2,
};

struct ProgressEvent {
  ProgressKind kind = ProgressKind::kStageStarted;
  std::string stage;   // "parse", "results", "merge", "rules", "evaluate", "report"
  std::string detail;  // file path, rule id, warning text ...
};

// Receives structured progress events. Implementations must not block the
// run; on_event is noexcept, so a sink that can fail has to contain its own
// errors.
struct IProgressSink {
  virtual ~IProgressSink() = default;
  virtual void on_event(const ProgressEvent& ev) noexcept = 0;
};

// Forwards events to the engine log (DEBUG for stages, WARN for warnings).
class LogProgressSink final : public IProgressSink {
 public:
  void on_event(const ProgressEvent& ev) noexcept override;
};

// Drops everything.
class NullProgressSink final : public IProgressSink {
 public:
  void on_event(const ProgressEvent&) noexcept override {}
};

const char* progress_kind_name(ProgressKind k) noexcept;

} // namespace rascheck
