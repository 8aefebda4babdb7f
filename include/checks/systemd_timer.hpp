#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "checks/check.hpp"
#include "checks/systemd_bus.hpp"
#include "core/options.hpp"
#include "core/timestamp.hpp"

namespace sleep_agent::checks {

// Wakes up for the next run of any systemd timer whose unit name matches
// `match` from its first character.
class SystemdTimerWakeup final : public Check {
 public:
  SystemdTimerWakeup(std::string name, const std::string& match, std::shared_ptr<SystemdBus> bus);

  static std::vector<core::OptionSpec> option_specs();
  static std::unique_ptr<Check> create(const std::string& name, const core::CheckOptions& options);

  Verdict evaluate(const CheckContext& context) override;

 private:
  std::regex match_;
  std::shared_ptr<SystemdBus> bus_;
};

// Wall clock time of a timer's next elapse. A monotonic elapse is placed
// relative to `now` using the current CLOCK_MONOTONIC reading.
std::optional<core::TimePoint> next_elapse(const TimerSchedule& schedule, core::TimePoint now,
                                           std::uint64_t monotonic_now_usec);

}  // namespace sleep_agent::checks
