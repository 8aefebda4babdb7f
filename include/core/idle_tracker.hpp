#pragma once

#include <cstdint>
#include <optional>

#include "core/timestamp.hpp"

namespace sleep_agent::core {

enum class IdleState : std::uint8_t {
  ACTIVE = 0,
  IDLING = 1,
};

// Turns per-tick busy/idle verdicts into a suspend decision. The idle start
// is fixed by the first idle tick after a busy one and is cleared by the next
// busy tick.
class IdleTracker {
 public:
  explicit IdleTracker(Duration threshold);

  void update(bool busy, TimePoint now) noexcept;

  // Inclusive: due once exactly `threshold` of idleness has been observed.
  [[nodiscard]] bool suspend_due(TimePoint now) const noexcept;

  void reset() noexcept;

  [[nodiscard]] IdleState state() const noexcept { return state_; }
  [[nodiscard]] const std::optional<TimePoint>& idle_since() const noexcept { return idle_since_; }
  [[nodiscard]] Duration threshold() const noexcept { return threshold_; }

 private:
  Duration threshold_;
  IdleState state_{IdleState::ACTIVE};
  std::optional<TimePoint> idle_since_{};
};

}  // namespace sleep_agent::core
