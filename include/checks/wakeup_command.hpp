#pragma once

#include <memory>
#include <string>
#include <vector>

#include "checks/check.hpp"
#include "core/options.hpp"

namespace sleep_agent::checks {

// Runs a command that prints the next wakeup as Unix seconds, or nothing.
class CommandWakeup final : public Check {
 public:
  CommandWakeup(std::string name, std::string command, core::Duration timeout);

  static std::vector<core::OptionSpec> option_specs();
  static std::unique_ptr<Check> create(const std::string& name, const core::CheckOptions& options);

  Verdict evaluate(const CheckContext& context) override;

 private:
  std::string command_;
  core::Duration timeout_;
};

}  // namespace sleep_agent::checks
