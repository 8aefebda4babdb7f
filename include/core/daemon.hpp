#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "checks/registry.hpp"
#include "core/activity_evaluator.hpp"
#include "core/idle_tracker.hpp"
#include "core/suspend.hpp"
#include "core/timestamp.hpp"
#include "core/waiter.hpp"
#include "core/wakeup_aggregator.hpp"
#include "model/tick_report.hpp"
#include "sinks/status_sink.hpp"

namespace sleep_agent::core {

struct DaemonOptions {
  Duration interval{std::chrono::seconds(30)};
  Duration idle_time{std::chrono::minutes(5)};
  Duration min_sleep_time{std::chrono::minutes(20)};
  Duration wakeup_delta{std::chrono::seconds(30)};
  bool debug{false};
  std::string proc_root{"/proc"};
};

struct DaemonStats {
  std::size_t ticks_executed{0};
  std::uint64_t suspends{0};
  std::uint64_t suspend_failures{0};
  std::uint64_t skipped_suspends{0};
  std::uint64_t check_failures{0};
  bool stopped{false};
};

// The suspend scheduler. Single threaded: checks, the suspend action and the
// hooks all run on the thread that calls run_for_ticks().
class Daemon {
 public:
  Daemon(DaemonOptions options, checks::CheckRegistry registry, Clock clock, Waiter& waiter,
         SuspendAction& suspend_action, SuspendHooks& hooks);

  Daemon(const Daemon&) = delete;
  Daemon& operator=(const Daemon&) = delete;

  void add_sink(std::unique_ptr<sinks::StatusSink> sink);

  // Runs `total_ticks` ticks, or until shutdown when `total_ticks` is 0. There
  // is no wait after the last tick.
  DaemonStats run_for_ticks(std::size_t total_ticks);
  DaemonStats run() { return run_for_ticks(0); }

  // One evaluation cycle, suspending the host when due.
  model::TickReport tick();

  [[nodiscard]] const IdleTracker& tracker() const noexcept { return tracker_; }
  [[nodiscard]] const DaemonStats& stats() const noexcept { return stats_; }

 private:
  struct SinkRegistration {
    std::unique_ptr<sinks::StatusSink> sink;
    bool was_ok{true};
  };

  void suspend_cycle(TimePoint now, const model::SystemSnapshot& snapshot, model::TickReport& report);
  bool run_suspend(const std::optional<TimePoint>& alarm);
  void publish_sinks(const model::TickReport& report);

  DaemonOptions options_;
  checks::CheckRegistry registry_;
  Clock clock_;
  Waiter& waiter_;
  SuspendAction& suspend_action_;
  SuspendHooks& hooks_;

  ActivityEvaluator evaluator_;
  WakeupAggregator aggregator_;
  IdleTracker tracker_;
  std::vector<SinkRegistration> sinks_{};
  DaemonStats stats_{};
};

}  // namespace sleep_agent::core
