#include "checks/active_connection.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>

namespace sleep_agent::checks {

namespace {

constexpr const char* kTcpEstablished = "01";

bool read_table(const std::string& path, std::string& content) {
  std::ifstream input(path);
  if (!input.is_open()) {
    return false;
  }
  std::ostringstream buffer;
  buffer << input.rdbuf();
  content = buffer.str();
  return true;
}

}  // namespace

ActiveConnectionCheck::ActiveConnectionCheck(std::string name, std::set<std::uint16_t> ports)
    : Check(std::move(name), CheckKind::ACTIVITY), ports_(std::move(ports)) {}

std::vector<core::OptionSpec> ActiveConnectionCheck::option_specs() {
  return {{"ports", core::OptionType::STRING, true, ""}};
}

std::unique_ptr<Check> ActiveConnectionCheck::create(const std::string& name, const core::CheckOptions& options) {
  std::set<std::uint16_t> ports;
  for (const auto& item : core::split_list(options.get_string("ports"))) {
    const double port = core::parse_number(item);
    if (port < 1.0 || port > 65535.0 || static_cast<double>(static_cast<int>(port)) != port) {
      throw core::ConfigError(name + ": invalid port '" + item + "'");
    }
    ports.insert(static_cast<std::uint16_t>(port));
  }
  if (ports.empty()) {
    throw core::ConfigError(name + ": ports must list at least one port");
  }
  return std::make_unique<ActiveConnectionCheck>(name, std::move(ports));
}

std::set<std::uint16_t> ActiveConnectionCheck::parse_established_ports(const std::string& table) {
  std::set<std::uint16_t> established;
  std::istringstream lines(table);
  std::string line;
  std::getline(lines, line);  // header

  while (std::getline(lines, line)) {
    std::istringstream fields(line);
    std::string slot;
    std::string local_address;
    std::string remote_address;
    std::string state;
    if (!(fields >> slot >> local_address >> remote_address >> state)) {
      continue;
    }
    if (state != kTcpEstablished) {
      continue;
    }

    const auto colon = local_address.rfind(':');
    if (colon == std::string::npos) {
      continue;
    }
    char* end = nullptr;
    const std::string port_hex = local_address.substr(colon + 1);
    const unsigned long port = std::strtoul(port_hex.c_str(), &end, 16);
    if (end == port_hex.c_str() || port > 65535UL) {
      continue;
    }
    established.insert(static_cast<std::uint16_t>(port));
  }
  return established;
}

Verdict ActiveConnectionCheck::evaluate(const CheckContext& context) {
  const std::string base = context.snapshot.proc_root() + "/net/";

  std::string ipv4;
  if (!read_table(base + "tcp", ipv4)) {
    throw CheckError("unable to read " + base + "tcp");
  }
  auto established = parse_established_ports(ipv4);

  std::string ipv6;
  if (read_table(base + "tcp6", ipv6)) {
    const auto established_v6 = parse_established_ports(ipv6);
    established.insert(established_v6.begin(), established_v6.end());
  }

  std::string matched;
  for (const std::uint16_t port : ports_) {
    if (established.find(port) == established.end()) {
      continue;
    }
    if (!matched.empty()) {
      matched += ", ";
    }
    matched += std::to_string(port);
  }

  if (matched.empty()) {
    return Verdict::idle();
  }
  return Verdict::busy("Ports " + matched + " are connected");
}

}  // namespace sleep_agent::checks
