#include "checks/logind_sessions.hpp"

#include <algorithm>
#include <utility>

namespace sleep_agent::checks {

namespace {

bool contains(const std::vector<std::string>& values, const std::string& value) {
  return std::find(values.begin(), values.end(), value) != values.end();
}

}  // namespace

LogindSessionsIdleCheck::LogindSessionsIdleCheck(std::string name, std::vector<std::string> types,
                                                 std::vector<std::string> states, std::shared_ptr<SystemdBus> bus)
    : Check(std::move(name), CheckKind::ACTIVITY),
      types_(std::move(types)),
      states_(std::move(states)),
      bus_(std::move(bus)) {}

std::vector<core::OptionSpec> LogindSessionsIdleCheck::option_specs() {
  return {
      {"types", core::OptionType::STRING, false, "tty,x11,wayland"},
      {"states", core::OptionType::STRING, false, "active,online"},
  };
}

std::unique_ptr<Check> LogindSessionsIdleCheck::create(const std::string& name, const core::CheckOptions& options) {
  auto types = core::split_list(options.get_string("types"));
  auto states = core::split_list(options.get_string("states"));
  if (types.empty() || states.empty()) {
    throw core::ConfigError(name + ": types and states must not be empty");
  }
  return std::make_unique<LogindSessionsIdleCheck>(name, std::move(types), std::move(states), make_system_bus());
}

Verdict LogindSessionsIdleCheck::evaluate(const CheckContext& /*context*/) {
  for (const LoginSession& session : bus_->list_sessions()) {
    if (!contains(types_, session.type) || !contains(states_, session.state)) {
      continue;
    }
    if (!session.idle_hint) {
      return Verdict::busy("Login session " + session.id + " is not idle");
    }
  }
  return Verdict::idle();
}

}  // namespace sleep_agent::checks
