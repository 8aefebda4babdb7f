#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include "core/timestamp.hpp"
#include "model/system_snapshot.hpp"

namespace sleep_agent::checks {

enum class CheckKind : std::uint8_t {
  ACTIVITY = 0,
  WAKEUP = 1,
};

const char* to_string(CheckKind kind) noexcept;

// Temporary failure while gathering data for a verdict. Never fatal.
class CheckError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class Verdict {
 public:
  static Verdict idle();
  static Verdict busy(std::string reason);
  static Verdict none();
  static Verdict at(core::TimePoint wake_at);

  [[nodiscard]] CheckKind kind() const noexcept { return kind_; }
  [[nodiscard]] bool is_busy() const noexcept { return busy_; }
  [[nodiscard]] const std::string& reason() const noexcept { return reason_; }
  [[nodiscard]] const std::optional<core::TimePoint>& wake_at() const noexcept { return wake_at_; }

 private:
  explicit Verdict(CheckKind kind) : kind_(kind) {}

  CheckKind kind_;
  bool busy_{false};
  std::string reason_{};
  std::optional<core::TimePoint> wake_at_{};
};

struct CheckContext {
  core::TimePoint now;
  const model::SystemSnapshot& snapshot;
};

class Check {
 public:
  Check(std::string name, CheckKind kind);
  virtual ~Check() = default;

  Check(const Check&) = delete;
  Check& operator=(const Check&) = delete;

  [[nodiscard]] const std::string& name() const noexcept { return name_; }
  [[nodiscard]] CheckKind kind() const noexcept { return kind_; }

  // Activity checks return idle() or busy(); wakeup checks return none() or at().
  // Failures are reported by throwing, preferably CheckError.
  virtual Verdict evaluate(const CheckContext& context) = 0;

 private:
  std::string name_;
  CheckKind kind_;
};

}  // namespace sleep_agent::checks
