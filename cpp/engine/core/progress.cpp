#include "engine/core/progress.hpp"

#include "engine/core/logging.hpp"

namespace rascheck {

const char* progress_kind_name(ProgressKind k) noexcept {
  switch (k) {
    case ProgressKind::kStageStarted:   return "started";
    case ProgressKind::kStageCompleted: return "completed";
    case ProgressKind::kWarning:        return "warning";
    default:                            return "unknown";
  }
}

void LogProgressSink::on_event(const ProgressEvent& ev) noexcept {
  try {
    if (ev.kind == ProgressKind::kWarning) {
      log_warn("[" + ev.stage + "] " + ev.detail);
      return;
    }
    std::string msg = "[" + ev.stage + "] " + progress_kind_name(ev.kind);
    if (!ev.detail.empty()) msg += ": " + ev.detail;
    log_debug(msg);
  } catch (const std::exception&) {
    // String building failed (allocation). Logging is best effort.
  }
}

} // namespace rascheck
