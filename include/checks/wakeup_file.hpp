#pragma once

#include <memory>
#include <string>
#include <vector>

#include "checks/check.hpp"
#include "core/options.hpp"

namespace sleep_agent::checks {

// Wakeup time stored as Unix seconds on the first line of a file. A missing
// file means no wakeup is scheduled.
class FileWakeup final : public Check {
 public:
  FileWakeup(std::string name, std::string path);

  static std::vector<core::OptionSpec> option_specs();
  static std::unique_ptr<Check> create(const std::string& name, const core::CheckOptions& options);

  Verdict evaluate(const CheckContext& context) override;

 private:
  std::string path_;
};

// Parses one line holding Unix seconds. Throws CheckError.
core::TimePoint parse_unix_timestamp(const std::string& line);

}  // namespace sleep_agent::checks
