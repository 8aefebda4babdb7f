#pragma once

#include <memory>
#include <string>
#include <vector>

#include "checks/check.hpp"
#include "core/options.hpp"

namespace sleep_agent::checks {

// Busy while `command` exits with status 0.
class ExternalCommandCheck final : public Check {
 public:
  ExternalCommandCheck(std::string name, std::string command, core::Duration timeout);

  static std::vector<core::OptionSpec> option_specs();
  static std::unique_ptr<Check> create(const std::string& name, const core::CheckOptions& options);

  Verdict evaluate(const CheckContext& context) override;

 private:
  std::string command_;
  core::Duration timeout_;
};

}  // namespace sleep_agent::checks
