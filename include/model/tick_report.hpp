#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/timestamp.hpp"

namespace sleep_agent::model {

struct ActivityReason {
  std::string check_name{};
  std::string reason{};
  bool failed{false};
};

// Everything one scheduler tick decided. Handed to the status sinks.
struct TickReport {
  struct Counters {
    std::uint64_t ticks{0};
    std::uint64_t suspends{0};
    std::uint64_t suspend_failures{0};
    std::uint64_t skipped_suspends{0};
    std::uint64_t check_failures{0};
  };

  core::TimePoint time{};
  bool busy{false};
  std::vector<ActivityReason> reasons{};
  std::optional<core::TimePoint> idle_since{};
  double idle_seconds{0.0};
  bool suspend_due{false};
  bool suspend_attempted{false};
  bool suspend_succeeded{false};
  bool suspend_skipped{false};
  std::optional<core::TimePoint> wake_at{};

  Counters counters{};
};

}  // namespace sleep_agent::model
