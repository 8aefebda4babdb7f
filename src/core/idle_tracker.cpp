#include "core/idle_tracker.hpp"

namespace sleep_agent::core {

IdleTracker::IdleTracker(const Duration threshold) : threshold_(threshold) {}

void IdleTracker::update(const bool busy, const TimePoint now) noexcept {
  switch (state_) {
    case IdleState::ACTIVE:
      if (!busy) {
        state_ = IdleState::IDLING;
        idle_since_ = now;
      }
      break;

    case IdleState::IDLING:
      if (busy) {
        reset();
      }
      break;
  }
}

bool IdleTracker::suspend_due(const TimePoint now) const noexcept {
  if (state_ != IdleState::IDLING || !idle_since_.has_value()) {
    return false;
  }
  return now - *idle_since_ >= threshold_;
}

void IdleTracker::reset() noexcept {
  state_ = IdleState::ACTIVE;
  idle_since_.reset();
}

}  // namespace sleep_agent::core
