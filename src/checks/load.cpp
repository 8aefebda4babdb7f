#include "checks/load.hpp"

#include <cstdio>
#include <utility>

namespace sleep_agent::checks {

LoadCheck::LoadCheck(std::string name, const float threshold)
    : Check(std::move(name), CheckKind::ACTIVITY), threshold_(threshold) {}

std::vector<core::OptionSpec> LoadCheck::option_specs() {
  return {{"threshold", core::OptionType::NUMBER, false, "2.5"}};
}

std::unique_ptr<Check> LoadCheck::create(const std::string& name, const core::CheckOptions& options) {
  const double threshold = options.get_number("threshold");
  if (threshold < 0.0) {
    throw core::ConfigError(name + ": threshold must not be negative");
  }
  return std::make_unique<LoadCheck>(name, static_cast<float>(threshold));
}

Verdict LoadCheck::evaluate(const CheckContext& context) {
  const float load = context.snapshot.load_average().one;
  if (load <= threshold_) {
    return Verdict::idle();
  }

  char reason[96]{};
  std::snprintf(reason, sizeof(reason), "Load %.2f > threshold %.2f", load, threshold_);
  return Verdict::busy(reason);
}

}  // namespace sleep_agent::checks
