#pragma once

#include <memory>
#include <string>
#include <vector>

#include "checks/check.hpp"
#include "core/options.hpp"

namespace sleep_agent::checks {

// Busy while the one-minute load average is above a threshold.
class LoadCheck final : public Check {
 public:
  LoadCheck(std::string name, float threshold);

  static std::vector<core::OptionSpec> option_specs();
  static std::unique_ptr<Check> create(const std::string& name, const core::CheckOptions& options);

  Verdict evaluate(const CheckContext& context) override;

 private:
  float threshold_;
};

}  // namespace sleep_agent::checks
