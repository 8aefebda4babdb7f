#pragma once

#include <cstdint>
#include <optional>

#include "checks/registry.hpp"
#include "core/timestamp.hpp"
#include "model/system_snapshot.hpp"

namespace sleep_agent::core {

// Earliest future wakeup requested by any wakeup check. Failing checks and
// times at or before `now` contribute nothing.
class WakeupAggregator {
 public:
  explicit WakeupAggregator(const checks::CheckRegistry& registry, bool debug = false);

  std::optional<TimePoint> aggregate(TimePoint now, const model::SystemSnapshot& snapshot);

  [[nodiscard]] std::uint64_t failures() const noexcept { return failures_; }

 private:
  const checks::CheckRegistry& registry_;
  bool debug_;
  std::uint64_t failures_{0};
};

}  // namespace sleep_agent::core
