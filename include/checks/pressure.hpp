#pragma once

#include <cstddef>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>

#include "checks/check.hpp"
#include "core/options.hpp"

namespace sleep_agent::checks {

// Busy while the PSI "some avg10" stall percentage of a resource is above a
// threshold. Reads /proc/pressure/<resource>.
class PressureCheck final : public Check {
 public:
  PressureCheck(std::string name, std::string resource, float threshold, const std::string& pressure_root = "/proc/pressure");
  ~PressureCheck() override;

  PressureCheck(const PressureCheck&) = delete;
  PressureCheck& operator=(const PressureCheck&) = delete;

  static std::vector<core::OptionSpec> option_specs();
  static std::unique_ptr<Check> create(const std::string& name, const core::CheckOptions& options);

  Verdict evaluate(const CheckContext& context) override;

  static bool parse_some_avg10(const char* data, std::size_t size, float& value) noexcept;

 private:
  static constexpr std::size_t kReadBufferSize = 256;

  std::string resource_;
  std::string path_;
  std::FILE* file_{nullptr};
  float threshold_;
};

}  // namespace sleep_agent::checks
