#include "core/config.hpp"

#include <algorithm>
#include <fstream>
#include <istream>
#include <string>
#include <vector>

namespace sleep_agent::core {
namespace {

constexpr const char* kActivitySection = "activity";
constexpr const char* kWakeupSection = "wakeup";

// A quote opening a value protects '#' until the matching quote.
std::string strip_comment(const std::string& line) {
  char quote = '\0';
  char previous = '\0';
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (quote != '\0') {
      if (c == quote) {
        quote = '\0';
      }
    } else if ((c == '"' || c == '\'') && previous == ':') {
      quote = c;
    } else if (c == '#' && (i == 0 || line[i - 1] == ' ' || line[i - 1] == '\t')) {
      return line.substr(0, i);
    }
    if (c != ' ' && c != '\t') {
      previous = c;
    }
  }
  return line;
}

std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

std::vector<CheckConfig>* check_list(DaemonConfig& config, const std::string& section) {
  if (section == kActivitySection) {
    return &config.activity_checks;
  }
  if (section == kWakeupSection) {
    return &config.wakeup_checks;
  }
  return nullptr;
}

CheckConfig& find_or_add_check(std::vector<CheckConfig>& checks, const std::string& name) {
  const auto it = std::find_if(checks.begin(), checks.end(), [&name](const CheckConfig& check) { return check.name == name; });
  if (it != checks.end()) {
    return *it;
  }
  CheckConfig check{};
  check.name = name;
  check.class_name = name;
  checks.push_back(std::move(check));
  return checks.back();
}

void declare_check(DaemonConfig& config, const std::string& section, const std::string& name) {
  auto* checks = check_list(config, section);
  if (checks == nullptr) {
    return;
  }
  const bool duplicate =
      std::any_of(checks->begin(), checks->end(), [&name](const CheckConfig& check) { return check.name == name; });
  if (duplicate) {
    throw ConfigError("duplicate " + section + " check '" + name + "'");
  }
  find_or_add_check(*checks, name);
}

void apply_check_option(DaemonConfig& config, const std::vector<std::string>& sections, const std::string& key,
                        const std::string& value) {
  if (sections.size() != 2) {
    throw ConfigError("options of " + sections.front() + " checks must be nested below a check name: '" + key + "'");
  }

  CheckConfig& check = find_or_add_check(*check_list(config, sections[0]), sections[1]);
  if (key == "class") {
    if (value.empty()) {
      throw ConfigError(check.name + ": class must not be empty");
    }
    check.class_name = value;
    return;
  }

  if (key == "enabled") {
    check.enabled = parse_bool(value);
    return;
  }

  if (check.options.find(key) != check.options.end()) {
    throw ConfigError(check.name + ": option '" + key + "' given twice");
  }
  check.options[key] = value;
}

void apply_daemon_value(DaemonConfig& config, const std::string& key, const std::string& value) {
  if (key == "interval") {
    config.interval = parse_duration(value);
    if (config.interval.count() <= 0) {
      throw ConfigError("daemon.interval must be greater than 0");
    }
    return;
  }

  if (key == "idle_time") {
    config.idle_time = parse_duration(value);
    return;
  }

  if (key == "min_sleep_time") {
    config.min_sleep_time = parse_duration(value);
    return;
  }

  if (key == "wakeup_delta") {
    config.wakeup_delta = parse_duration(value);
    return;
  }

  if (key == "command_timeout") {
    config.command_timeout = parse_duration(value);
    if (config.command_timeout.count() <= 0) {
      throw ConfigError("daemon.command_timeout must be greater than 0");
    }
    return;
  }

  if (key == "suspend_cmd") {
    config.suspend_cmd = value;
    return;
  }

  if (key == "wakeup_cmd") {
    config.wakeup_cmd = value;
    return;
  }

  if (key == "notify_cmd_wakeup") {
    config.notify_cmd_wakeup = value;
    return;
  }

  if (key == "notify_cmd_no_wakeup") {
    config.notify_cmd_no_wakeup = value;
    return;
  }

  if (key == "notify_cmd_resume") {
    config.notify_cmd_resume = value;
    return;
  }

  if (key == "status_file") {
    config.status_file = value;
    return;
  }

  if (key == "stdout_debug") {
    config.stdout_debug = parse_bool(value);
    return;
  }

  if (key == "debug") {
    config.debug = parse_bool(value);
    return;
  }

  throw ConfigError("unknown option daemon." + key);
}

void apply_redis_value(DaemonConfig& config, const std::string& key, const std::string& value) {
  if (key == "key_prefix") {
    if (value.empty()) {
      throw ConfigError("redis.key_prefix must not be empty");
    }
    config.redis.key_prefix = value;
    return;
  }

  if (key != "address") {
    throw ConfigError("unknown option redis." + key);
  }

  config.redis.enabled = !value.empty();
  if (value.rfind("unix://", 0) == 0) {
    config.redis.unix_socket = value.substr(std::string("unix://").size());
    config.redis.host.clear();
    config.redis.port = 0;
    return;
  }

  if (!value.empty() && value.front() == '/') {
    config.redis.unix_socket = value;
    config.redis.host.clear();
    config.redis.port = 0;
    return;
  }

  config.redis.unix_socket.clear();
  const auto split = value.find(':');
  if (split == std::string::npos) {
    config.redis.host = value;
    return;
  }

  config.redis.host = value.substr(0, split);
  int parsed_port = 0;
  try {
    parsed_port = std::stoi(value.substr(split + 1));
  } catch (const std::exception&) {
    throw ConfigError("redis.address has an invalid port: " + value);
  }
  if (parsed_port <= 0 || parsed_port > 65535) {
    throw ConfigError("redis.address port must be in range 1..65535");
  }

  config.redis.port = static_cast<std::uint16_t>(parsed_port);
}

void apply_key_value(DaemonConfig& config, const std::vector<std::string>& sections, const std::string& key,
                     const std::string& value) {
  if (sections.empty()) {
    throw ConfigError("top-level key '" + key + "' is not inside a section");
  }

  if (check_list(config, sections.front()) != nullptr) {
    apply_check_option(config, sections, key, value);
    return;
  }

  if (sections.size() != 1) {
    throw ConfigError("unexpected nesting below " + sections.front() + ": '" + key + "'");
  }

  if (sections.front() == "daemon") {
    apply_daemon_value(config, key, value);
    return;
  }

  if (sections.front() == "redis") {
    apply_redis_value(config, key, value);
    return;
  }

  throw ConfigError("unknown section '" + sections.front() + "'");
}

}  // namespace

DaemonConfig parse_daemon_config(std::istream& input) {
  DaemonConfig config{};

  std::vector<std::string> sections;
  std::string line;
  std::size_t line_number = 0;
  while (std::getline(input, line)) {
    ++line_number;
    line = strip_comment(line);

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      throw ConfigError("line " + std::to_string(line_number) + ": expected 'key: value'");
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string raw_value = trim(stripped.substr(colon_pos + 1));
    const std::string value = unquote(raw_value);

    if (depth > sections.size()) {
      throw ConfigError("line " + std::to_string(line_number) + ": unexpected indentation");
    }
    if (sections.size() > depth) {
      sections.resize(depth);
    }

    try {
      // Only top-level sections and check names open a nested block.
      const bool opens_section =
          raw_value.empty() && (depth == 0 || (depth == 1 && check_list(config, sections[0]) != nullptr));
      if (opens_section) {
        sections.push_back(key);
        if (depth == 1) {
          declare_check(config, sections[0], key);
        }
        continue;
      }

      apply_key_value(config, sections, key, value);
    } catch (const ConfigError& error) {
      throw ConfigError("line " + std::to_string(line_number) + ": " + error.what());
    }
  }

  if (config.suspend_cmd.empty()) {
    throw ConfigError("daemon.suspend_cmd is required");
  }

  return config;
}

DaemonConfig load_daemon_config(const std::string& path) {
  std::ifstream input(path);
  if (!input.is_open()) {
    throw ConfigError("unable to open config file: " + path);
  }
  return parse_daemon_config(input);
}

}  // namespace sleep_agent::core
