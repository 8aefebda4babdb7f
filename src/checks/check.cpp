#include "checks/check.hpp"

#include <utility>

namespace sleep_agent::checks {

const char* to_string(const CheckKind kind) noexcept {
  switch (kind) {
    case CheckKind::ACTIVITY:
      return "activity";
    case CheckKind::WAKEUP:
      return "wakeup";
  }
  return "unknown";
}

Verdict Verdict::idle() { return Verdict(CheckKind::ACTIVITY); }

Verdict Verdict::busy(std::string reason) {
  Verdict verdict(CheckKind::ACTIVITY);
  verdict.busy_ = true;
  verdict.reason_ = std::move(reason);
  return verdict;
}

Verdict Verdict::none() { return Verdict(CheckKind::WAKEUP); }

Verdict Verdict::at(const core::TimePoint wake_at) {
  Verdict verdict(CheckKind::WAKEUP);
  verdict.wake_at_ = wake_at;
  return verdict;
}

Check::Check(std::string name, const CheckKind kind) : name_(std::move(name)), kind_(kind) {}

}  // namespace sleep_agent::checks
