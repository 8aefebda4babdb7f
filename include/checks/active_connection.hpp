#pragma once

#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "checks/check.hpp"
#include "core/options.hpp"

namespace sleep_agent::checks {

// Busy while an established TCP connection uses one of the configured local
// ports. Reads <proc>/net/tcp and <proc>/net/tcp6.
class ActiveConnectionCheck final : public Check {
 public:
  ActiveConnectionCheck(std::string name, std::set<std::uint16_t> ports);

  static std::vector<core::OptionSpec> option_specs();
  static std::unique_ptr<Check> create(const std::string& name, const core::CheckOptions& options);

  Verdict evaluate(const CheckContext& context) override;

  // Local ports of ESTABLISHED entries in one /proc/net/tcp* table.
  static std::set<std::uint16_t> parse_established_ports(const std::string& table);

 private:
  std::set<std::uint16_t> ports_;
};

}  // namespace sleep_agent::checks
