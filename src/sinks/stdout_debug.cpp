#include "sinks/stdout_debug.hpp"

#include <cstdio>
#include <string>

namespace sleep_agent::sinks {

bool StdoutDebugSink::publish(const model::TickReport& report) {
  std::string reasons;
  for (const auto& reason : report.reasons) {
    if (!reasons.empty()) {
      reasons += "; ";
    }
    reasons += reason.check_name + ": " + reason.reason;
  }

  const std::string wake_at = report.wake_at.has_value() ? core::format_utc(*report.wake_at) : "-";
  std::printf("[tick] busy=%d idle_s=%.1f suspend_due=%d suspended=%d wake_at=%s reasons=%s\n",
              report.busy ? 1 : 0, report.idle_seconds, report.suspend_due ? 1 : 0, report.suspend_succeeded ? 1 : 0,
              wake_at.c_str(), reasons.empty() ? "-" : reasons.c_str());
  return std::fflush(stdout) == 0;
}

}  // namespace sleep_agent::sinks
