#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace sleep_agent::checks {

struct LoginSession {
  std::string id{};
  std::string type{};
  std::string state{};
  bool idle_hint{false};
};

// Next elapse of a systemd timer unit in microseconds; 0 means unset.
struct TimerSchedule {
  std::string unit{};
  std::uint64_t next_realtime_usec{0};
  std::uint64_t next_monotonic_usec{0};
};

// Queries against logind and the systemd manager on the system bus. Failures
// are reported as CheckError.
class SystemdBus {
 public:
  virtual ~SystemdBus() = default;

  virtual std::vector<LoginSession> list_sessions() = 0;
  virtual std::vector<TimerSchedule> list_timers() = 0;
};

// sd-bus backed implementation. Connects on first use and reconnects after a
// failed call.
std::shared_ptr<SystemdBus> make_system_bus();

}  // namespace sleep_agent::checks
