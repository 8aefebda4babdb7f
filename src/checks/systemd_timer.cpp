#include "checks/systemd_timer.hpp"

#include <time.h>

#include <limits>
#include <utility>

namespace sleep_agent::checks {

namespace {

constexpr std::uint64_t kInfinityUsec = std::numeric_limits<std::uint64_t>::max();

// Largest microsecond count a TimePoint duration can hold.
constexpr std::uint64_t max_time_point_usec() {
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::microseconds>(core::TimePoint::duration::max()).count());
}

bool is_set(const std::uint64_t usec) { return usec != 0 && usec != kInfinityUsec; }

std::uint64_t monotonic_now_usec() {
  timespec now{};
  if (clock_gettime(CLOCK_MONOTONIC, &now) != 0) {
    throw CheckError("CLOCK_MONOTONIC unavailable");
  }
  return static_cast<std::uint64_t>(now.tv_sec) * 1'000'000ULL + static_cast<std::uint64_t>(now.tv_nsec) / 1'000ULL;
}

std::regex compile_match(const std::string& owner, const std::string& pattern) {
  try {
    return std::regex(pattern);
  } catch (const std::regex_error& error) {
    throw core::ConfigError(owner + ": invalid regular expression for match: " + error.what());
  }
}

}  // namespace

std::optional<core::TimePoint> next_elapse(const TimerSchedule& schedule, const core::TimePoint now,
                                           const std::uint64_t monotonic_now_usec) {
  if (is_set(schedule.next_realtime_usec)) {
    if (schedule.next_realtime_usec > max_time_point_usec()) {
      return std::nullopt;
    }
    return core::TimePoint{std::chrono::duration_cast<core::TimePoint::duration>(
        std::chrono::microseconds(static_cast<std::int64_t>(schedule.next_realtime_usec)))};
  }

  if (is_set(schedule.next_monotonic_usec)) {
    if (schedule.next_monotonic_usec <= monotonic_now_usec) {
      return now;
    }
    const std::uint64_t remaining = schedule.next_monotonic_usec - monotonic_now_usec;
    const auto headroom = std::chrono::duration_cast<std::chrono::microseconds>(core::TimePoint::max() - now).count();
    if (headroom <= 0 || remaining > static_cast<std::uint64_t>(headroom)) {
      return std::nullopt;
    }
    return now + std::chrono::microseconds(static_cast<std::int64_t>(remaining));
  }

  return std::nullopt;
}

SystemdTimerWakeup::SystemdTimerWakeup(std::string name, const std::string& match, std::shared_ptr<SystemdBus> bus)
    : Check(name, CheckKind::WAKEUP), match_(compile_match(name, match)), bus_(std::move(bus)) {}

std::vector<core::OptionSpec> SystemdTimerWakeup::option_specs() {
  return {{"match", core::OptionType::STRING, true, ""}};
}

std::unique_ptr<Check> SystemdTimerWakeup::create(const std::string& name, const core::CheckOptions& options) {
  return std::make_unique<SystemdTimerWakeup>(name, options.get_string("match"), make_system_bus());
}

Verdict SystemdTimerWakeup::evaluate(const CheckContext& context) {
  const std::vector<TimerSchedule> schedules = bus_->list_timers();
  const std::uint64_t monotonic_now = monotonic_now_usec();

  std::optional<core::TimePoint> earliest;
  for (const TimerSchedule& schedule : schedules) {
    if (!std::regex_search(schedule.unit, match_, std::regex_constants::match_continuous)) {
      continue;
    }
    const auto elapse = next_elapse(schedule, context.now, monotonic_now);
    if (elapse.has_value() && (!earliest.has_value() || *elapse < *earliest)) {
      earliest = elapse;
    }
  }

  return earliest.has_value() ? Verdict::at(*earliest) : Verdict::none();
}

}  // namespace sleep_agent::checks
