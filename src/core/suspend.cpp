#include "core/suspend.hpp"

#include <exception>
#include <iostream>
#include <utility>

#include "core/command.hpp"

namespace sleep_agent::core {

CommandSuspendAction::CommandSuspendAction(std::string suspend_cmd, std::string wakeup_cmd,
                                           const Duration wakeup_cmd_timeout)
    : suspend_cmd_(std::move(suspend_cmd)), wakeup_cmd_(std::move(wakeup_cmd)), wakeup_cmd_timeout_(wakeup_cmd_timeout) {}

bool CommandSuspendAction::suspend(const std::optional<TimePoint>& wake_at) {
  if (wake_at.has_value()) {
    if (wakeup_cmd_.empty()) {
      std::cerr << "[suspend] no wakeup_cmd configured; cannot arm alarm for " << format_utc(*wake_at) << '\n';
    } else {
      const std::string command = substitute_timestamp(wakeup_cmd_, *wake_at);
      try {
        const CommandResult result = run_command(command, wakeup_cmd_timeout_);
        if (result.exit_code != 0) {
          std::cerr << "[suspend] wakeup command exited with status " << result.exit_code << ": " << command << '\n';
          return false;
        }
      } catch (const CommandError& ex) {
        std::cerr << "[suspend] wakeup command failed: " << ex.what() << '\n';
        return false;
      }
      std::cerr << "[suspend] wake alarm armed for " << format_utc(*wake_at) << '\n';
    }
  }

  const std::string command = wake_at.has_value() ? substitute_timestamp(suspend_cmd_, *wake_at) : suspend_cmd_;
  try {
    // Blocks until the system resumes; no timeout.
    const CommandResult result = run_command(command, Duration{0});
    if (result.exit_code != 0) {
      std::cerr << "[suspend] suspend command exited with status " << result.exit_code << ": " << command << '\n';
      return false;
    }
  } catch (const CommandError& ex) {
    std::cerr << "[suspend] suspend command failed: " << ex.what() << '\n';
    return false;
  }
  return true;
}

CommandHooks::CommandHooks(Commands commands, const Duration timeout) : commands_(std::move(commands)), timeout_(timeout) {}

void CommandHooks::run_pre_suspend(const std::optional<TimePoint>& wake_at) {
  if (wake_at.has_value()) {
    if (!commands_.notify_wakeup.empty()) {
      run_hook("notify_cmd_wakeup", substitute_timestamp(commands_.notify_wakeup, *wake_at));
    }
    return;
  }
  run_hook("notify_cmd_no_wakeup", commands_.notify_no_wakeup);
}

void CommandHooks::run_post_suspend() { run_hook("notify_cmd_resume", commands_.notify_resume); }

void CommandHooks::run_hook(const char* hook, const std::string& command) noexcept {
  if (command.empty()) {
    return;
  }

  try {
    const CommandResult result = run_command(command, timeout_);
    if (result.exit_code != 0) {
      std::cerr << "[suspend] " << hook << " exited with status " << result.exit_code << '\n';
    }
  } catch (const std::exception& ex) {
    std::cerr << "[suspend] " << hook << " failed: " << ex.what() << '\n';
  }
}

}  // namespace sleep_agent::core
