#include "core/timestamp.hpp"

#include <ctime>

namespace sleep_agent::core {

std::string format_utc(const TimePoint time) {
  const std::time_t seconds = std::chrono::system_clock::to_time_t(time);
  std::tm utc{};
  if (gmtime_r(&seconds, &utc) == nullptr) {
    return std::to_string(static_cast<long long>(seconds));
  }

  char buffer[32]{};
  const std::size_t written = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
  return std::string(buffer, written);
}

}  // namespace sleep_agent::core
