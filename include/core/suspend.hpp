#pragma once

#include <optional>
#include <string>

#include "core/timestamp.hpp"

namespace sleep_agent::core {

class SuspendAction {
 public:
  virtual ~SuspendAction() = default;

  // Suspends the host and returns after resume. When `wake_at` is set a wake
  // alarm is armed first. Returns false if the host could not be suspended.
  virtual bool suspend(const std::optional<TimePoint>& wake_at) = 0;
};

class SuspendHooks {
 public:
  virtual ~SuspendHooks() = default;

  virtual void run_pre_suspend(const std::optional<TimePoint>& wake_at) = 0;
  virtual void run_post_suspend() = 0;
};

// Arms the alarm with `wakeup_cmd` and suspends with `suspend_cmd`. Both may
// contain "{timestamp}".
class CommandSuspendAction final : public SuspendAction {
 public:
  CommandSuspendAction(std::string suspend_cmd, std::string wakeup_cmd, Duration wakeup_cmd_timeout);

  bool suspend(const std::optional<TimePoint>& wake_at) override;

 private:
  std::string suspend_cmd_;
  std::string wakeup_cmd_;
  Duration wakeup_cmd_timeout_;
};

// Notification commands. Failures are logged and never propagate.
class CommandHooks final : public SuspendHooks {
 public:
  struct Commands {
    std::string notify_wakeup{};
    std::string notify_no_wakeup{};
    std::string notify_resume{};
  };

  CommandHooks(Commands commands, Duration timeout);

  void run_pre_suspend(const std::optional<TimePoint>& wake_at) override;
  void run_post_suspend() override;

 private:
  void run_hook(const char* hook, const std::string& command) noexcept;

  Commands commands_;
  Duration timeout_;
};

}  // namespace sleep_agent::core
