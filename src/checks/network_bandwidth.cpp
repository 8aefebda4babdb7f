#include "checks/network_bandwidth.hpp"

#include <cstdio>
#include <filesystem>
#include <utility>

namespace sleep_agent::checks {

namespace {

void close_file(std::FILE*& file) noexcept {
  if (file != nullptr) {
    std::fclose(file);
    file = nullptr;
  }
}

}  // namespace

NetworkBandwidthCheck::NetworkBandwidthCheck(std::string name, const std::vector<std::string>& interfaces,
                                             const double threshold_receive, const double threshold_send,
                                             const std::string& sys_class_net)
    : Check(std::move(name), CheckKind::ACTIVITY), threshold_receive_(threshold_receive), threshold_send_(threshold_send) {
  for (const auto& iface : interfaces) {
    const std::string base = sys_class_net + "/" + iface;
    if (!std::filesystem::exists(base)) {
      for (InterfaceSource& source : interfaces_) {
        close_file(source.rx_bytes_file);
        close_file(source.tx_bytes_file);
      }
      throw core::ConfigError(this->name() + ": unknown network interface '" + iface + "'");
    }

    InterfaceSource source{};
    source.name = iface;
    source.rx_bytes_file = std::fopen((base + "/statistics/rx_bytes").c_str(), "r");
    source.tx_bytes_file = std::fopen((base + "/statistics/tx_bytes").c_str(), "r");
    interfaces_.push_back(source);
  }
}

NetworkBandwidthCheck::~NetworkBandwidthCheck() {
  for (InterfaceSource& source : interfaces_) {
    close_file(source.rx_bytes_file);
    close_file(source.tx_bytes_file);
  }
}

std::vector<core::OptionSpec> NetworkBandwidthCheck::option_specs() {
  return {
      {"interfaces", core::OptionType::STRING, true, ""},
      {"threshold_receive", core::OptionType::NUMBER, false, "100"},
      {"threshold_send", core::OptionType::NUMBER, false, "100"},
  };
}

std::unique_ptr<Check> NetworkBandwidthCheck::create(const std::string& name, const core::CheckOptions& options) {
  const auto interfaces = core::split_list(options.get_string("interfaces"));
  if (interfaces.empty()) {
    throw core::ConfigError(name + ": interfaces must list at least one interface");
  }
  const double threshold_receive = options.get_number("threshold_receive");
  const double threshold_send = options.get_number("threshold_send");
  if (threshold_receive < 0.0 || threshold_send < 0.0) {
    throw core::ConfigError(name + ": thresholds must not be negative");
  }
  return std::make_unique<NetworkBandwidthCheck>(name, interfaces, threshold_receive, threshold_send);
}

Verdict NetworkBandwidthCheck::evaluate(const CheckContext& context) {
  struct Counters {
    std::uint64_t rx{0};
    std::uint64_t tx{0};
  };
  std::vector<Counters> current(interfaces_.size());

  for (std::size_t i = 0; i < interfaces_.size(); ++i) {
    const InterfaceSource& source = interfaces_[i];
    if (!read_u64_file(source.rx_bytes_file, current[i].rx) || !read_u64_file(source.tx_bytes_file, current[i].tx)) {
      throw CheckError("unable to read byte counters of interface " + source.name);
    }
  }

  const std::optional<core::TimePoint> prev_time = prev_time_;
  prev_time_ = context.now;

  const double elapsed = prev_time.has_value() ? core::seconds_between(*prev_time, context.now) : 0.0;
  std::string reason;
  for (std::size_t i = 0; i < interfaces_.size(); ++i) {
    InterfaceSource& source = interfaces_[i];
    const std::uint64_t delta_rx = current[i].rx >= source.prev_rx_bytes ? current[i].rx - source.prev_rx_bytes : 0;
    const std::uint64_t delta_tx = current[i].tx >= source.prev_tx_bytes ? current[i].tx - source.prev_tx_bytes : 0;
    source.prev_rx_bytes = current[i].rx;
    source.prev_tx_bytes = current[i].tx;

    if (elapsed <= 0.0 || !reason.empty()) {
      continue;
    }

    const double receive_rate = static_cast<double>(delta_rx) / elapsed;
    const double send_rate = static_cast<double>(delta_tx) / elapsed;

    char buffer[160]{};
    if (receive_rate > threshold_receive_) {
      std::snprintf(buffer, sizeof(buffer), "Interface %s receiving %.1f B/s > threshold %.1f B/s",
                    source.name.c_str(), receive_rate, threshold_receive_);
      reason = buffer;
    } else if (send_rate > threshold_send_) {
      std::snprintf(buffer, sizeof(buffer), "Interface %s sending %.1f B/s > threshold %.1f B/s", source.name.c_str(),
                    send_rate, threshold_send_);
      reason = buffer;
    }
  }

  return reason.empty() ? Verdict::idle() : Verdict::busy(reason);
}

bool NetworkBandwidthCheck::read_u64_file(std::FILE* file, std::uint64_t& value) noexcept {
  if (file == nullptr) {
    value = 0;
    return false;
  }

  if (std::fseek(file, 0L, SEEK_SET) != 0) {
    value = 0;
    return false;
  }

  unsigned long long parsed = 0;
  if (std::fscanf(file, "%llu", &parsed) != 1) {
    std::clearerr(file);
    value = 0;
    return false;
  }

  value = static_cast<std::uint64_t>(parsed);
  return true;
}

}  // namespace sleep_agent::checks
