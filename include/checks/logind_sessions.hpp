#pragma once

#include <memory>
#include <string>
#include <vector>

#include "checks/check.hpp"
#include "checks/systemd_bus.hpp"
#include "core/options.hpp"

namespace sleep_agent::checks {

// Busy while a logind session of a watched type and state has IdleHint unset.
class LogindSessionsIdleCheck final : public Check {
 public:
  LogindSessionsIdleCheck(std::string name, std::vector<std::string> types, std::vector<std::string> states,
                          std::shared_ptr<SystemdBus> bus);

  static std::vector<core::OptionSpec> option_specs();
  static std::unique_ptr<Check> create(const std::string& name, const core::CheckOptions& options);

  Verdict evaluate(const CheckContext& context) override;

 private:
  std::vector<std::string> types_;
  std::vector<std::string> states_;
  std::shared_ptr<SystemdBus> bus_;
};

}  // namespace sleep_agent::checks
