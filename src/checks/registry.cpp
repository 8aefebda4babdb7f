#include "checks/registry.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

#include "checks/active_connection.hpp"
#include "checks/external_command.hpp"
#include "checks/load.hpp"
#include "checks/logind_sessions.hpp"
#include "checks/network_bandwidth.hpp"
#include "checks/pressure.hpp"
#include "checks/processes.hpp"
#include "checks/systemd_timer.hpp"
#include "checks/users.hpp"
#include "checks/wakeup_command.hpp"
#include "checks/wakeup_file.hpp"
#include "checks/wakeup_periodic.hpp"

namespace sleep_agent::checks {

namespace {

template <typename CheckType>
CheckClass describe(const char* class_name, const CheckKind kind) {
  return CheckClass{class_name, kind, CheckType::option_specs(), &CheckType::create};
}

void build_kind(CheckRegistry& registry, const std::vector<core::CheckConfig>& configs, const CheckKind kind,
                const CheckFactoryTable& factories) {
  for (const auto& config : configs) {
    if (factories.find(kind, config.class_name) == nullptr) {
      throw core::ConfigError(std::string("unknown ") + to_string(kind) + " check class '" + config.class_name +
                              "' for check '" + config.name + "'");
    }

    if (!config.enabled) {
      std::cerr << "[checks] " << to_string(kind) << " check '" << config.name << "' is disabled\n";
      continue;
    }

    registry.add(factories.create(kind, config));
    std::cerr << "[checks] registered " << to_string(kind) << " check '" << config.name << "' (" << config.class_name
              << ")\n";
  }
}

}  // namespace

void CheckFactoryTable::add(CheckClass check_class) {
  const auto it = std::find_if(classes_.begin(), classes_.end(), [&check_class](const CheckClass& existing) {
    return existing.kind == check_class.kind && existing.class_name == check_class.class_name;
  });
  if (it != classes_.end()) {
    *it = std::move(check_class);
    return;
  }
  classes_.push_back(std::move(check_class));
}

const CheckClass* CheckFactoryTable::find(const CheckKind kind, const std::string& class_name) const {
  const auto it = std::find_if(classes_.begin(), classes_.end(), [kind, &class_name](const CheckClass& existing) {
    return existing.kind == kind && existing.class_name == class_name;
  });
  return it == classes_.end() ? nullptr : &*it;
}

std::unique_ptr<Check> CheckFactoryTable::create(const CheckKind kind, const core::CheckConfig& config) const {
  const CheckClass* check_class = find(kind, config.class_name);
  if (check_class == nullptr) {
    throw core::ConfigError(std::string("unknown ") + to_string(kind) + " check class '" + config.class_name + "'");
  }

  const auto options = core::CheckOptions::parse(config.name, config.options, check_class->options);
  auto check = check_class->create(config.name, options);
  if (check == nullptr || check->kind() != kind) {
    throw core::ConfigError("check class '" + config.class_name + "' did not produce a " + to_string(kind) + " check");
  }
  return check;
}

CheckFactoryTable builtin_check_classes() {
  CheckFactoryTable table;
  table.add(describe<LoadCheck>("Load", CheckKind::ACTIVITY));
  table.add(describe<ProcessesCheck>("Processes", CheckKind::ACTIVITY));
  table.add(describe<UsersCheck>("Users", CheckKind::ACTIVITY));
  table.add(describe<ActiveConnectionCheck>("ActiveConnection", CheckKind::ACTIVITY));
  table.add(describe<NetworkBandwidthCheck>("NetworkBandwidth", CheckKind::ACTIVITY));
  table.add(describe<PressureCheck>("Pressure", CheckKind::ACTIVITY));
  table.add(describe<ExternalCommandCheck>("ExternalCommand", CheckKind::ACTIVITY));
  table.add(describe<LogindSessionsIdleCheck>("LogindSessionsIdle", CheckKind::ACTIVITY));
  table.add(describe<FileWakeup>("File", CheckKind::WAKEUP));
  table.add(describe<CommandWakeup>("Command", CheckKind::WAKEUP));
  table.add(describe<PeriodicWakeup>("Periodic", CheckKind::WAKEUP));
  table.add(describe<SystemdTimerWakeup>("SystemdTimer", CheckKind::WAKEUP));
  return table;
}

void CheckRegistry::add(std::unique_ptr<Check> check) {
  auto& checks = check->kind() == CheckKind::ACTIVITY ? activity_ : wakeup_;
  const bool duplicate = std::any_of(checks.begin(), checks.end(),
                                     [&check](const std::unique_ptr<Check>& existing) { return existing->name() == check->name(); });
  if (duplicate) {
    throw core::ConfigError(std::string("duplicate ") + to_string(check->kind()) + " check '" + check->name() + "'");
  }
  checks.push_back(std::move(check));
}

CheckRegistry build_registry(const core::DaemonConfig& config, const CheckFactoryTable& factories) {
  CheckRegistry registry;
  build_kind(registry, config.activity_checks, CheckKind::ACTIVITY, factories);
  build_kind(registry, config.wakeup_checks, CheckKind::WAKEUP, factories);
  return registry;
}

}  // namespace sleep_agent::checks
