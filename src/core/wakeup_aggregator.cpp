#include "core/wakeup_aggregator.hpp"

#include <exception>
#include <iostream>

namespace sleep_agent::core {

WakeupAggregator::WakeupAggregator(const checks::CheckRegistry& registry, const bool debug)
    : registry_(registry), debug_(debug) {}

std::optional<TimePoint> WakeupAggregator::aggregate(const TimePoint now, const model::SystemSnapshot& snapshot) {
  std::optional<TimePoint> earliest;
  const checks::CheckContext context{now, snapshot};

  for (const auto& check : registry_.wakeup_checks()) {
    std::optional<TimePoint> candidate;
    try {
      const checks::Verdict verdict = check->evaluate(context);
      if (verdict.kind() != checks::CheckKind::WAKEUP) {
        ++failures_;
        std::cerr << "[wakeup] check '" << check->name() << "' returned an activity verdict; ignoring it\n";
        continue;
      }
      candidate = verdict.wake_at();
    } catch (const std::exception& ex) {
      ++failures_;
      std::cerr << "[wakeup] check '" << check->name() << "' failed: " << ex.what() << "; ignoring it\n";
      continue;
    } catch (...) {
      ++failures_;
      std::cerr << "[wakeup] check '" << check->name() << "' failed: unknown exception; ignoring it\n";
      continue;
    }

    if (!candidate.has_value()) {
      if (debug_) {
        std::cerr << "[wakeup] " << check->name() << ": no wakeup required\n";
      }
      continue;
    }

    if (*candidate <= now) {
      if (debug_) {
        std::cerr << "[wakeup] " << check->name() << ": discarding past wakeup " << format_utc(*candidate) << '\n';
      }
      continue;
    }

    if (debug_) {
      std::cerr << "[wakeup] " << check->name() << ": wakeup at " << format_utc(*candidate) << '\n';
    }
    if (!earliest.has_value() || *candidate < *earliest) {
      earliest = candidate;
    }
  }

  return earliest;
}

}  // namespace sleep_agent::core
