#include "checks/wakeup_command.hpp"

#include <utility>

#include "checks/wakeup_file.hpp"
#include "core/command.hpp"

namespace sleep_agent::checks {

CommandWakeup::CommandWakeup(std::string name, std::string command, const core::Duration timeout)
    : Check(std::move(name), CheckKind::WAKEUP), command_(std::move(command)), timeout_(timeout) {}

std::vector<core::OptionSpec> CommandWakeup::option_specs() {
  return {
      {"command", core::OptionType::STRING, true, ""},
      {"timeout", core::OptionType::DURATION, false, "30s"},
  };
}

std::unique_ptr<Check> CommandWakeup::create(const std::string& name, const core::CheckOptions& options) {
  const std::string& command = options.get_string("command");
  if (command.empty()) {
    throw core::ConfigError(name + ": command must not be empty");
  }
  const core::Duration timeout = options.get_duration("timeout");
  if (timeout.count() <= 0) {
    throw core::ConfigError(name + ": timeout must be greater than 0");
  }
  return std::make_unique<CommandWakeup>(name, command, timeout);
}

Verdict CommandWakeup::evaluate(const CheckContext& /*context*/) {
  const core::CommandResult result = core::run_command(command_, timeout_);
  if (result.exit_code != 0) {
    throw CheckError("command exited with status " + std::to_string(result.exit_code) + ": " + command_);
  }

  const std::string first_line = core::trim(result.output.substr(0, result.output.find('\n')));
  if (first_line.empty()) {
    return Verdict::none();
  }
  return Verdict::at(parse_unix_timestamp(first_line));
}

}  // namespace sleep_agent::checks
