#pragma once

#include <memory>
#include <regex>
#include <string>
#include <vector>

#include "checks/check.hpp"
#include "core/options.hpp"

namespace sleep_agent::checks {

// Busy while a logged-in user session matches all three patterns. Sessions are
// read from the utmp database.
class UsersCheck final : public Check {
 public:
  UsersCheck(std::string name, const std::string& user_pattern, const std::string& terminal_pattern,
             const std::string& host_pattern, std::string utmp_path);

  static std::vector<core::OptionSpec> option_specs();
  static std::unique_ptr<Check> create(const std::string& name, const core::CheckOptions& options);

  Verdict evaluate(const CheckContext& context) override;

 private:
  std::regex user_;
  std::regex terminal_;
  std::regex host_;
  std::string utmp_path_;
};

}  // namespace sleep_agent::checks
