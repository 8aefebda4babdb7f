#pragma once

#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

#include "core/options.hpp"
#include "core/timestamp.hpp"

namespace sleep_agent::core {

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string key_prefix{"host:sleep"};
  bool enabled{false};
};

// One configured check instance. `class_name` defaults to `name`.
struct CheckConfig {
  std::string name{};
  std::string class_name{};
  bool enabled{false};
  RawOptions options{};
};

struct DaemonConfig {
  Duration interval{std::chrono::seconds(30)};
  Duration idle_time{std::chrono::minutes(5)};
  Duration min_sleep_time{std::chrono::minutes(20)};
  Duration wakeup_delta{std::chrono::seconds(30)};
  Duration command_timeout{std::chrono::seconds(30)};
  std::string suspend_cmd{};
  std::string wakeup_cmd{};
  std::string notify_cmd_wakeup{};
  std::string notify_cmd_no_wakeup{};
  std::string notify_cmd_resume{};
  std::string status_file{};
  bool stdout_debug{false};
  bool debug{false};
  RedisConfig redis{};
  std::vector<CheckConfig> activity_checks{};
  std::vector<CheckConfig> wakeup_checks{};
};

DaemonConfig parse_daemon_config(std::istream& input);
DaemonConfig load_daemon_config(const std::string& path);

}  // namespace sleep_agent::core
