#pragma once

#include <memory>
#include <string>
#include <vector>

#include "checks/check.hpp"
#include "core/options.hpp"

namespace sleep_agent::checks {

// Always requests a wakeup a fixed delay after the evaluation time.
class PeriodicWakeup final : public Check {
 public:
  PeriodicWakeup(std::string name, core::Duration delta);

  static std::vector<core::OptionSpec> option_specs();
  static std::unique_ptr<Check> create(const std::string& name, const core::CheckOptions& options);

  Verdict evaluate(const CheckContext& context) override;

 private:
  core::Duration delta_;
};

}  // namespace sleep_agent::checks
