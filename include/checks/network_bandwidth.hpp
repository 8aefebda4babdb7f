#pragma once

#include <cstdint>
#include <cstdio>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "checks/check.hpp"
#include "core/options.hpp"

namespace sleep_agent::checks {

// Busy while an interface moves more bytes per second than the thresholds
// allow. The first evaluation only records the counters.
class NetworkBandwidthCheck final : public Check {
 public:
  NetworkBandwidthCheck(std::string name, const std::vector<std::string>& interfaces, double threshold_receive,
                        double threshold_send, const std::string& sys_class_net = "/sys/class/net");
  ~NetworkBandwidthCheck() override;

  static std::vector<core::OptionSpec> option_specs();
  static std::unique_ptr<Check> create(const std::string& name, const core::CheckOptions& options);

  Verdict evaluate(const CheckContext& context) override;

 private:
  struct InterfaceSource {
    std::string name{};
    std::FILE* rx_bytes_file{nullptr};
    std::FILE* tx_bytes_file{nullptr};
    std::uint64_t prev_rx_bytes{0};
    std::uint64_t prev_tx_bytes{0};
  };

  static bool read_u64_file(std::FILE* file, std::uint64_t& value) noexcept;

  std::vector<InterfaceSource> interfaces_{};
  double threshold_receive_;
  double threshold_send_;
  std::optional<core::TimePoint> prev_time_{};
};

}  // namespace sleep_agent::checks
