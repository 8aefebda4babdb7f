#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace sleep_agent::core {

using TimePoint = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;
using Clock = std::function<TimePoint()>;

inline TimePoint system_now() { return std::chrono::system_clock::now(); }

inline std::int64_t to_unix_seconds(const TimePoint time) {
  return std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
}

inline std::uint64_t to_unix_ms(const TimePoint time) {
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count());
}

// True when `seconds` fits a TimePoint. from_unix_seconds requires it.
inline bool fits_time_point(const double seconds) {
  const double limit =
      std::chrono::duration_cast<std::chrono::duration<double>>(TimePoint::duration::max()).count();
  return seconds > -limit && seconds < limit;
}

inline TimePoint from_unix_seconds(const double seconds) {
  return TimePoint{std::chrono::duration_cast<std::chrono::system_clock::duration>(
      std::chrono::duration<double>(seconds))};
}

inline double seconds_between(const TimePoint from, const TimePoint to) {
  return std::chrono::duration_cast<std::chrono::duration<double>>(to - from).count();
}

// ISO-8601 UTC, second resolution.
std::string format_utc(TimePoint time);

}  // namespace sleep_agent::core
