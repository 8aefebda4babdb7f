#include "core/daemon.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <utility>

#include "model/system_snapshot.hpp"

namespace sleep_agent::core {

Daemon::Daemon(DaemonOptions options, checks::CheckRegistry registry, Clock clock, Waiter& waiter,
               SuspendAction& suspend_action, SuspendHooks& hooks)
    : options_(std::move(options)),
      registry_(std::move(registry)),
      clock_(std::move(clock)),
      waiter_(waiter),
      suspend_action_(suspend_action),
      hooks_(hooks),
      evaluator_(registry_, options_.debug),
      aggregator_(registry_, options_.debug),
      tracker_(options_.idle_time) {
  if (!clock_) {
    clock_ = system_now;
  }
}

void Daemon::add_sink(std::unique_ptr<sinks::StatusSink> sink) {
  if (sink != nullptr) {
    sinks_.push_back({std::move(sink), true});
  }
}

DaemonStats Daemon::run_for_ticks(const std::size_t total_ticks) {
  for (std::size_t i = 0; total_ticks == 0 || i < total_ticks; ++i) {
    const auto cycle_start = std::chrono::steady_clock::now();

    tick();

    if (total_ticks != 0 && i + 1 == total_ticks) {
      break;
    }

    const auto elapsed = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - cycle_start);
    const Duration wait = std::max(Duration{0}, options_.interval - elapsed);
    if (!waiter_.wait_for(wait)) {
      stats_.stopped = true;
      std::cerr << "[daemon] shutdown requested; stopping after " << stats_.ticks_executed << " ticks\n";
      break;
    }
  }

  return stats_;
}

model::TickReport Daemon::tick() {
  const TimePoint now = clock_();
  const model::SystemSnapshot snapshot{options_.proc_root};

  model::TickReport report{};
  report.time = now;

  ActivityResult activity = evaluator_.evaluate_all(now, snapshot);
  stats_.check_failures += activity.failures;
  report.busy = activity.busy;
  report.reasons = std::move(activity.reasons);

  tracker_.update(report.busy, now);
  report.idle_since = tracker_.idle_since();
  if (report.idle_since.has_value()) {
    report.idle_seconds = seconds_between(*report.idle_since, now);
  }
  report.suspend_due = tracker_.suspend_due(now);

  if (options_.debug) {
    std::cerr << "[daemon] tick busy=" << (report.busy ? "true" : "false") << " idle_s=" << report.idle_seconds
              << " suspend_due=" << (report.suspend_due ? "true" : "false") << '\n';
  }

  if (report.suspend_due) {
    suspend_cycle(now, snapshot, report);
  }

  ++stats_.ticks_executed;
  report.counters.ticks = stats_.ticks_executed;
  report.counters.suspends = stats_.suspends;
  report.counters.suspend_failures = stats_.suspend_failures;
  report.counters.skipped_suspends = stats_.skipped_suspends;
  report.counters.check_failures = stats_.check_failures;

  publish_sinks(report);
  return report;
}

void Daemon::suspend_cycle(const TimePoint now, const model::SystemSnapshot& snapshot, model::TickReport& report) {
  const std::uint64_t wakeup_failures_before = aggregator_.failures();
  const std::optional<TimePoint> wake_at = aggregator_.aggregate(now, snapshot);
  stats_.check_failures += aggregator_.failures() - wakeup_failures_before;
  report.wake_at = wake_at;

  if (wake_at.has_value() && *wake_at - now < options_.min_sleep_time) {
    ++stats_.skipped_suspends;
    report.suspend_skipped = true;
    std::cerr << "[daemon] next wakeup at " << format_utc(*wake_at) << " is closer than min_sleep_time; not suspending\n";
    return;
  }

  std::optional<TimePoint> alarm{};
  if (wake_at.has_value()) {
    alarm = std::max(now, *wake_at - options_.wakeup_delta);
    std::cerr << "[daemon] system idle; suspending with wakeup at " << format_utc(*alarm) << '\n';
  } else {
    std::cerr << "[daemon] system idle; suspending without wakeup\n";
  }

  report.suspend_attempted = true;
  report.suspend_succeeded = run_suspend(alarm);
  if (report.suspend_succeeded) {
    ++stats_.suspends;
    std::cerr << "[daemon] resumed from suspend\n";
  } else {
    ++stats_.suspend_failures;
    std::cerr << "[daemon] suspend failed; continuing\n";
  }

  tracker_.reset();
}

bool Daemon::run_suspend(const std::optional<TimePoint>& alarm) {
  try {
    hooks_.run_pre_suspend(alarm);
  } catch (const std::exception& ex) {
    std::cerr << "[suspend] pre-suspend hooks failed: " << ex.what() << '\n';
  } catch (...) {
    std::cerr << "[suspend] pre-suspend hooks failed: unknown exception\n";
  }

  bool suspended = false;
  try {
    suspended = suspend_action_.suspend(alarm);
  } catch (const std::exception& ex) {
    std::cerr << "[suspend] suspend action failed: " << ex.what() << '\n';
    return false;
  } catch (...) {
    std::cerr << "[suspend] suspend action failed: unknown exception\n";
    return false;
  }

  if (suspended) {
    try {
      hooks_.run_post_suspend();
    } catch (const std::exception& ex) {
      std::cerr << "[suspend] post-suspend hooks failed: " << ex.what() << '\n';
    } catch (...) {
      std::cerr << "[suspend] post-suspend hooks failed: unknown exception\n";
    }
  }
  return suspended;
}

void Daemon::publish_sinks(const model::TickReport& report) {
  for (auto& registration : sinks_) {
    bool ok = false;
    try {
      ok = registration.sink->publish(report);
    } catch (const std::exception& ex) {
      std::cerr << "[" << registration.sink->name() << "] publish threw: " << ex.what() << '\n';
    } catch (...) {
      std::cerr << "[" << registration.sink->name() << "] publish threw: unknown exception\n";
    }

    if (!ok) {
      if (registration.was_ok) {
        std::cerr << "[" << registration.sink->name() << "] publish failed\n";
        registration.was_ok = false;
      }
    } else if (!registration.was_ok) {
      std::cerr << "[" << registration.sink->name() << "] publish recovered\n";
      registration.was_ok = true;
    }
  }
}

}  // namespace sleep_agent::core
