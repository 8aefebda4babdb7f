#pragma once

#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

#include "checks/check.hpp"
#include "core/options.hpp"

namespace sleep_agent::checks {

class ProcessesCheck final : public Check {
 public:
  ProcessesCheck(std::string name, std::vector<std::string> processes);

  static std::vector<core::OptionSpec> option_specs();
  static std::unique_ptr<Check> create(const std::string& name, const core::CheckOptions& options);

  Verdict evaluate(const CheckContext& context) override;

 private:
  std::unordered_set<std::string> processes_;
};

}  // namespace sleep_agent::checks
