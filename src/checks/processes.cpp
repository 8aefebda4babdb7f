#include "checks/processes.hpp"

#include <utility>

namespace sleep_agent::checks {

ProcessesCheck::ProcessesCheck(std::string name, std::vector<std::string> processes)
    : Check(std::move(name), CheckKind::ACTIVITY), processes_(processes.begin(), processes.end()) {}

std::vector<core::OptionSpec> ProcessesCheck::option_specs() {
  return {{"processes", core::OptionType::STRING, true, ""}};
}

std::unique_ptr<Check> ProcessesCheck::create(const std::string& name, const core::CheckOptions& options) {
  auto processes = core::split_list(options.get_string("processes"));
  if (processes.empty()) {
    throw core::ConfigError(name + ": processes must list at least one process name");
  }
  return std::make_unique<ProcessesCheck>(name, std::move(processes));
}

Verdict ProcessesCheck::evaluate(const CheckContext& context) {
  for (const auto& process : context.snapshot.processes()) {
    if (processes_.find(process.name) != processes_.end()) {
      return Verdict::busy("Process " + process.name + " is running");
    }
  }
  return Verdict::idle();
}

}  // namespace sleep_agent::checks
