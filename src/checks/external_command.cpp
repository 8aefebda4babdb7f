#include "checks/external_command.hpp"

#include <utility>

#include "core/command.hpp"

namespace sleep_agent::checks {

namespace {
constexpr int kCommandNotFound = 127;
}

ExternalCommandCheck::ExternalCommandCheck(std::string name, std::string command, const core::Duration timeout)
    : Check(std::move(name), CheckKind::ACTIVITY), command_(std::move(command)), timeout_(timeout) {}

std::vector<core::OptionSpec> ExternalCommandCheck::option_specs() {
  return {
      {"command", core::OptionType::STRING, true, ""},
      {"timeout", core::OptionType::DURATION, false, "30s"},
  };
}

std::unique_ptr<Check> ExternalCommandCheck::create(const std::string& name, const core::CheckOptions& options) {
  const std::string& command = options.get_string("command");
  if (command.empty()) {
    throw core::ConfigError(name + ": command must not be empty");
  }
  const core::Duration timeout = options.get_duration("timeout");
  if (timeout.count() <= 0) {
    throw core::ConfigError(name + ": timeout must be greater than 0");
  }
  return std::make_unique<ExternalCommandCheck>(name, command, timeout);
}

Verdict ExternalCommandCheck::evaluate(const CheckContext& /*context*/) {
  const core::CommandResult result = core::run_command(command_, timeout_);
  if (result.exit_code == kCommandNotFound) {
    throw CheckError("command not found: " + command_);
  }
  if (result.exit_code == 0) {
    return Verdict::busy("Command " + command_ + " succeeded");
  }
  return Verdict::idle();
}

}  // namespace sleep_agent::checks
