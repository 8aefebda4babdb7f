#include "checks/wakeup_periodic.hpp"

#include <cmath>
#include <utility>

namespace sleep_agent::checks {

namespace {

double unit_seconds(const std::string& owner, const std::string& unit) {
  if (unit == "seconds") {
    return 1.0;
  }
  if (unit == "minutes") {
    return 60.0;
  }
  if (unit == "hours") {
    return 3600.0;
  }
  if (unit == "days") {
    return 86400.0;
  }
  if (unit == "weeks") {
    return 7.0 * 86400.0;
  }
  throw core::ConfigError(owner + ": unsupported unit '" + unit + "'");
}

}  // namespace

PeriodicWakeup::PeriodicWakeup(std::string name, const core::Duration delta)
    : Check(std::move(name), CheckKind::WAKEUP), delta_(delta) {}

std::vector<core::OptionSpec> PeriodicWakeup::option_specs() {
  return {
      {"interval", core::OptionType::DURATION, false, ""},
      {"unit", core::OptionType::STRING, false, ""},
      {"value", core::OptionType::NUMBER, false, ""},
  };
}

std::unique_ptr<Check> PeriodicWakeup::create(const std::string& name, const core::CheckOptions& options) {
  const bool has_interval = options.has("interval");
  const bool has_unit_value = options.has("unit") || options.has("value");
  if (has_interval == has_unit_value) {
    throw core::ConfigError(name + ": configure either interval or unit and value");
  }

  core::Duration delta{0};
  if (has_interval) {
    delta = options.get_duration("interval");
  } else {
    if (!options.has("unit") || !options.has("value")) {
      throw core::ConfigError(name + ": unit and value must be given together");
    }
    const double seconds = options.get_number("value") * unit_seconds(name, options.get_string("unit"));
    delta = core::Duration(static_cast<core::Duration::rep>(std::llround(seconds * 1000.0)));
  }

  if (delta.count() <= 0) {
    throw core::ConfigError(name + ": wakeup delay must be greater than 0");
  }
  return std::make_unique<PeriodicWakeup>(name, delta);
}

Verdict PeriodicWakeup::evaluate(const CheckContext& context) {
  return Verdict::at(context.now + std::chrono::duration_cast<core::TimePoint::duration>(delta_));
}

}  // namespace sleep_agent::checks
