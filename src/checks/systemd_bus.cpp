#include "checks/systemd_bus.hpp"

#include <systemd/sd-bus.h>

#include <cstdlib>
#include <cstring>
#include <utility>

#include "checks/check.hpp"

namespace sleep_agent::checks {

namespace {

constexpr const char* kLogindService = "org.freedesktop.login1";
constexpr const char* kLogindPath = "/org/freedesktop/login1";
constexpr const char* kLogindManager = "org.freedesktop.login1.Manager";
constexpr const char* kLogindSession = "org.freedesktop.login1.Session";

constexpr const char* kSystemdService = "org.freedesktop.systemd1";
constexpr const char* kSystemdPath = "/org/freedesktop/systemd1";
constexpr const char* kSystemdManager = "org.freedesktop.systemd1.Manager";
constexpr const char* kSystemdTimer = "org.freedesktop.systemd1.Timer";

constexpr const char* kTimerSuffix = ".timer";

struct BusDeleter {
  void operator()(sd_bus* bus) const noexcept { sd_bus_flush_close_unref(bus); }
};

struct MessageDeleter {
  void operator()(sd_bus_message* message) const noexcept { sd_bus_message_unref(message); }
};

using MessagePtr = std::unique_ptr<sd_bus_message, MessageDeleter>;

class BusError {
 public:
  BusError() = default;
  ~BusError() { sd_bus_error_free(&error_); }

  BusError(const BusError&) = delete;
  BusError& operator=(const BusError&) = delete;

  sd_bus_error* get() noexcept { return &error_; }

  [[nodiscard]] std::string describe(const int result) const {
    if (sd_bus_error_is_set(&error_) && error_.message != nullptr) {
      return error_.message;
    }
    return std::strerror(-result);
  }

 private:
  sd_bus_error error_{};
};

bool ends_with(const std::string& value, const std::string& suffix) {
  return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

class SdBusSystemd final : public SystemdBus {
 public:
  std::vector<LoginSession> list_sessions() override;
  std::vector<TimerSchedule> list_timers() override;

 private:
  sd_bus* connection();
  [[noreturn]] void fail(const std::string& what, int result, const BusError& error);

  MessagePtr call(const char* service, const char* path, const char* interface, const char* method);
  std::string string_property(const char* service, const std::string& path, const char* interface,
                              const char* property);
  bool bool_property(const char* service, const std::string& path, const char* interface, const char* property);
  std::uint64_t u64_property(const char* service, const std::string& path, const char* interface,
                             const char* property);

  std::unique_ptr<sd_bus, BusDeleter> bus_{};
};

sd_bus* SdBusSystemd::connection() {
  if (bus_ != nullptr) {
    return bus_.get();
  }

  sd_bus* bus = nullptr;
  const int r = sd_bus_open_system(&bus);
  if (r < 0) {
    sd_bus_unref(bus);
    throw CheckError("failed to connect to system bus: " + std::string(std::strerror(-r)));
  }
  bus_.reset(bus);
  return bus;
}

void SdBusSystemd::fail(const std::string& what, const int result, const BusError& error) {
  bus_.reset();
  throw CheckError(what + " failed: " + error.describe(result));
}

MessagePtr SdBusSystemd::call(const char* service, const char* path, const char* interface, const char* method) {
  BusError error;
  sd_bus_message* reply = nullptr;
  const int r = sd_bus_call_method(connection(), service, path, interface, method, error.get(), &reply, "");
  MessagePtr owned(reply);
  if (r < 0) {
    fail(std::string(method), r, error);
  }
  return owned;
}

std::string SdBusSystemd::string_property(const char* service, const std::string& path, const char* interface,
                                          const char* property) {
  BusError error;
  char* value = nullptr;
  const int r = sd_bus_get_property_string(connection(), service, path.c_str(), interface, property, error.get(), &value);
  if (r < 0) {
    fail("reading " + std::string(property) + " of " + path, r, error);
  }
  std::string owned(value != nullptr ? value : "");
  std::free(value);
  return owned;
}

bool SdBusSystemd::bool_property(const char* service, const std::string& path, const char* interface,
                                 const char* property) {
  BusError error;
  int value = 0;
  const int r = sd_bus_get_property_trivial(connection(), service, path.c_str(), interface, property, error.get(), 'b',
                                            &value);
  if (r < 0) {
    fail("reading " + std::string(property) + " of " + path, r, error);
  }
  return value != 0;
}

std::uint64_t SdBusSystemd::u64_property(const char* service, const std::string& path, const char* interface,
                                         const char* property) {
  BusError error;
  std::uint64_t value = 0;
  const int r = sd_bus_get_property_trivial(connection(), service, path.c_str(), interface, property, error.get(), 't',
                                            &value);
  if (r < 0) {
    fail("reading " + std::string(property) + " of " + path, r, error);
  }
  return value;
}

std::vector<LoginSession> SdBusSystemd::list_sessions() {
  const MessagePtr reply = call(kLogindService, kLogindPath, kLogindManager, "ListSessions");
  const BusError parse_error;

  int r = sd_bus_message_enter_container(reply.get(), SD_BUS_TYPE_ARRAY, "(susso)");
  if (r < 0) {
    fail("parsing ListSessions", r, parse_error);
  }

  std::vector<std::pair<std::string, std::string>> listed;
  const char* id = nullptr;
  std::uint32_t uid = 0;
  const char* user = nullptr;
  const char* seat = nullptr;
  const char* path = nullptr;
  while ((r = sd_bus_message_read(reply.get(), "(susso)", &id, &uid, &user, &seat, &path)) > 0) {
    listed.emplace_back(id, path);
  }
  if (r < 0) {
    fail("parsing ListSessions", r, parse_error);
  }

  std::vector<LoginSession> sessions;
  sessions.reserve(listed.size());
  for (const auto& [session_id, session_path] : listed) {
    LoginSession session{};
    session.id = session_id;
    session.type = string_property(kLogindService, session_path, kLogindSession, "Type");
    session.state = string_property(kLogindService, session_path, kLogindSession, "State");
    session.idle_hint = bool_property(kLogindService, session_path, kLogindSession, "IdleHint");
    sessions.push_back(std::move(session));
  }
  return sessions;
}

std::vector<TimerSchedule> SdBusSystemd::list_timers() {
  const MessagePtr reply = call(kSystemdService, kSystemdPath, kSystemdManager, "ListUnits");
  const BusError parse_error;

  int r = sd_bus_message_enter_container(reply.get(), SD_BUS_TYPE_ARRAY, "(ssssssouso)");
  if (r < 0) {
    fail("parsing ListUnits", r, parse_error);
  }

  std::vector<std::pair<std::string, std::string>> timers;
  const char* name = nullptr;
  const char* description = nullptr;
  const char* load_state = nullptr;
  const char* active_state = nullptr;
  const char* sub_state = nullptr;
  const char* following = nullptr;
  const char* path = nullptr;
  std::uint32_t job_id = 0;
  const char* job_type = nullptr;
  const char* job_path = nullptr;
  while ((r = sd_bus_message_read(reply.get(), "(ssssssouso)", &name, &description, &load_state, &active_state,
                                  &sub_state, &following, &path, &job_id, &job_type, &job_path)) > 0) {
    if (ends_with(name, kTimerSuffix)) {
      timers.emplace_back(name, path);
    }
  }
  if (r < 0) {
    fail("parsing ListUnits", r, parse_error);
  }

  std::vector<TimerSchedule> schedules;
  schedules.reserve(timers.size());
  for (const auto& [unit, unit_path] : timers) {
    TimerSchedule schedule{};
    schedule.unit = unit;
    schedule.next_realtime_usec = u64_property(kSystemdService, unit_path, kSystemdTimer, "NextElapseUSecRealtime");
    schedule.next_monotonic_usec = u64_property(kSystemdService, unit_path, kSystemdTimer, "NextElapseUSecMonotonic");
    schedules.push_back(std::move(schedule));
  }
  return schedules;
}

}  // namespace

std::shared_ptr<SystemdBus> make_system_bus() { return std::make_shared<SdBusSystemd>(); }

}  // namespace sleep_agent::checks
