#pragma once

#include <stdexcept>
#include <string>

#include "core/timestamp.hpp"

namespace sleep_agent::core {

// Spawn failures and timeouts. A non-zero exit status is not an error here.
class CommandError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct CommandResult {
  int exit_code{-1};
  std::string output{};
};

// Runs `command` through /bin/sh -c and captures stdout. The child is killed
// when `timeout` elapses; a zero timeout waits for the command indefinitely.
CommandResult run_command(const std::string& command, Duration timeout);

// Replaces every "{timestamp}" with the Unix time of `time` in whole seconds.
std::string substitute_timestamp(const std::string& command_template, TimePoint time);

}  // namespace sleep_agent::core
