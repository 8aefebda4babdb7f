#include <cstddef>
#include <exception>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include "checks/registry.hpp"
#include "core/config.hpp"
#include "core/daemon.hpp"
#include "core/suspend.hpp"
#include "core/waiter.hpp"
#include "sinks/json_status.hpp"
#include "sinks/redis_ts.hpp"
#include "sinks/stdout_debug.hpp"

namespace {

constexpr const char* kDefaultConfigPath = "/etc/sleep-agent.yaml";

struct CommandLine {
  std::string config_path{kDefaultConfigPath};
  std::size_t run_for_ticks{0};
  bool debug{false};
  bool help{false};
};

void print_usage(std::ostream& output) {
  output << "usage: sleep-agent [-c|--config PATH] [-r|--run-for N] [-d|--debug]\n";
}

CommandLine parse_command_line(const int argc, char** argv) {
  CommandLine command_line{};
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      command_line.help = true;
    } else if (arg == "-d" || arg == "--debug") {
      command_line.debug = true;
    } else if (arg == "-c" || arg == "--config") {
      if (i + 1 >= argc) {
        throw std::invalid_argument(arg + " needs a path");
      }
      command_line.config_path = argv[++i];
    } else if (arg == "-r" || arg == "--run-for") {
      if (i + 1 >= argc) {
        throw std::invalid_argument(arg + " needs a tick count");
      }
      const std::string value = argv[++i];
      std::size_t consumed = 0;
      const unsigned long long ticks = std::stoull(value, &consumed);
      if (consumed != value.size() || value.front() == '-') {
        throw std::invalid_argument("invalid tick count: " + value);
      }
      command_line.run_for_ticks = static_cast<std::size_t>(ticks);
    } else {
      throw std::invalid_argument("unknown argument: " + arg);
    }
  }
  return command_line;
}

std::string format_config_settings(const sleep_agent::core::DaemonConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[config] loaded " << config_path
         << " | interval_ms=" << config.interval.count()
         << " | idle_time_ms=" << config.idle_time.count()
         << " | min_sleep_time_ms=" << config.min_sleep_time.count()
         << " | wakeup_delta_ms=" << config.wakeup_delta.count()
         << " | activity_checks=" << config.activity_checks.size()
         << " | wakeup_checks=" << config.wakeup_checks.size()
         << " | stdout_debug=" << (config.stdout_debug ? "true" : "false")
         << " | status_file=" << (config.status_file.empty() ? "none" : config.status_file)
         << " | redis_enabled=" << (config.redis.enabled ? "true" : "false");

  if (config.redis.enabled) {
    output << " | redis_address=";
    if (!config.redis.unix_socket.empty()) {
      output << "unix://" << config.redis.unix_socket;
    } else {
      output << config.redis.host << ':' << config.redis.port;
    }
  }
  return output.str();
}

std::unique_ptr<sleep_agent::sinks::RedisTsSink> make_redis_sink(const sleep_agent::core::RedisConfig& config) {
  sleep_agent::sinks::RedisTsOptions options{};
  options.host = config.host;
  options.port = config.port;
  options.unix_socket = config.unix_socket;
  options.key_prefix = config.key_prefix;

  auto sink = std::make_unique<sleep_agent::sinks::RedisTsSink>(options);
  const std::string address =
      options.unix_socket.empty() ? options.host + ':' + std::to_string(options.port) : "unix://" + options.unix_socket;
  if (sink->check_connectivity()) {
    std::cerr << "[daemon] redis connectivity confirmed at " << address << '\n';
  } else {
    std::cerr << "[daemon] redis connectivity check failed at " << address << '\n';
  }
  return sink;
}

}  // namespace

int main(int argc, char** argv) {
  CommandLine command_line{};
  try {
    command_line = parse_command_line(argc, argv);
  } catch (const std::exception& ex) {
    std::cerr << "argument error: " << ex.what() << '\n';
    print_usage(std::cerr);
    return 2;
  }
  if (command_line.help) {
    print_usage(std::cout);
    return 0;
  }

  // Must happen before any other thread or child exists so that every thread
  // inherits the blocked mask.
  std::unique_ptr<sleep_agent::core::SignalWaiter> waiter;
  try {
    waiter = std::make_unique<sleep_agent::core::SignalWaiter>();
  } catch (const std::exception& ex) {
    std::cerr << "[daemon] " << ex.what() << '\n';
    return 1;
  }

  sleep_agent::core::DaemonConfig config{};
  sleep_agent::checks::CheckRegistry registry{};
  try {
    config = sleep_agent::core::load_daemon_config(command_line.config_path);
    if (command_line.debug) {
      config.debug = true;
    }
    std::cerr << format_config_settings(config, command_line.config_path) << '\n';
    registry = sleep_agent::checks::build_registry(config, sleep_agent::checks::builtin_check_classes());
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  if (registry.activity_checks().empty()) {
    std::cerr << "[daemon] no activity checks enabled; the system will be considered idle on every tick\n";
  }

  sleep_agent::core::CommandSuspendAction suspend_action{config.suspend_cmd, config.wakeup_cmd,
                                                        config.command_timeout};
  sleep_agent::core::CommandHooks hooks{
      {config.notify_cmd_wakeup, config.notify_cmd_no_wakeup, config.notify_cmd_resume}, config.command_timeout};

  sleep_agent::core::DaemonOptions options{};
  options.interval = config.interval;
  options.idle_time = config.idle_time;
  options.min_sleep_time = config.min_sleep_time;
  options.wakeup_delta = config.wakeup_delta;
  options.debug = config.debug;

  sleep_agent::core::Daemon daemon{options, std::move(registry), sleep_agent::core::system_now, *waiter,
                                   suspend_action, hooks};
  if (config.stdout_debug) {
    daemon.add_sink(std::make_unique<sleep_agent::sinks::StdoutDebugSink>());
  }
  if (!config.status_file.empty()) {
    daemon.add_sink(std::make_unique<sleep_agent::sinks::JsonStatusSink>(config.status_file));
  }
  if (config.redis.enabled) {
    daemon.add_sink(make_redis_sink(config.redis));
  }

  const sleep_agent::core::DaemonStats stats =
      command_line.run_for_ticks == 0 ? daemon.run() : daemon.run_for_ticks(command_line.run_for_ticks);
  std::cerr << "[daemon] exiting cleanly after " << stats.ticks_executed << " ticks, " << stats.suspends
            << " suspends, " << stats.suspend_failures << " failed suspends\n";

  return 0;
}
