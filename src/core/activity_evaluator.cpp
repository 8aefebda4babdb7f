#include "core/activity_evaluator.hpp"

#include <exception>
#include <iostream>
#include <string>

namespace sleep_agent::core {

ActivityEvaluator::ActivityEvaluator(const checks::CheckRegistry& registry, const bool debug)
    : registry_(registry), debug_(debug) {}

ActivityResult ActivityEvaluator::evaluate_all(const TimePoint now, const model::SystemSnapshot& snapshot) {
  ActivityResult result{};
  const checks::CheckContext context{now, snapshot};

  for (const auto& check : registry_.activity_checks()) {
    std::string failure;
    try {
      const checks::Verdict verdict = check->evaluate(context);
      if (verdict.kind() != checks::CheckKind::ACTIVITY) {
        failure = "returned a wakeup verdict";
      } else if (verdict.is_busy()) {
        result.busy = true;
        result.reasons.push_back({check->name(), verdict.reason(), false});
        if (debug_) {
          std::cerr << "[checks] " << check->name() << ": busy (" << verdict.reason() << ")\n";
        }
        continue;
      } else {
        if (debug_) {
          std::cerr << "[checks] " << check->name() << ": idle\n";
        }
        continue;
      }
    } catch (const std::exception& ex) {
      failure = ex.what();
    } catch (...) {
      failure = "unknown exception";
    }

    ++result.failures;
    result.busy = true;
    result.reasons.push_back({check->name(), "check failed: " + failure, true});
    std::cerr << "[checks] activity check '" << check->name() << "' failed: " << failure
              << "; treating system as busy\n";
  }

  return result;
}

}  // namespace sleep_agent::core
