#pragma once

#include <cstddef>
#include <vector>

#include "checks/registry.hpp"
#include "core/timestamp.hpp"
#include "model/system_snapshot.hpp"
#include "model/tick_report.hpp"

namespace sleep_agent::core {

struct ActivityResult {
  bool busy{false};
  // Busy and failed checks in registration order.
  std::vector<model::ActivityReason> reasons{};
  std::size_t failures{0};
};

// Runs every activity check once per tick. A check that throws or returns a
// wakeup verdict counts as busy.
class ActivityEvaluator {
 public:
  explicit ActivityEvaluator(const checks::CheckRegistry& registry, bool debug = false);

  ActivityResult evaluate_all(TimePoint now, const model::SystemSnapshot& snapshot);

 private:
  const checks::CheckRegistry& registry_;
  bool debug_;
};

}  // namespace sleep_agent::core
