#pragma once

#include "core/timestamp.hpp"

namespace sleep_agent::core {

class Waiter {
 public:
  virtual ~Waiter() = default;

  // Blocks for up to `duration`. Returns false once shutdown was requested.
  virtual bool wait_for(Duration duration) = 0;
};

// Routes SIGINT, SIGTERM and SIGQUIT into a signalfd so that a shutdown
// request ends the inter-tick wait at once and never interrupts a tick.
class SignalWaiter final : public Waiter {
 public:
  // Blocks the signals for the calling thread. Throws std::runtime_error.
  SignalWaiter();
  ~SignalWaiter() override;

  SignalWaiter(const SignalWaiter&) = delete;
  SignalWaiter& operator=(const SignalWaiter&) = delete;

  bool wait_for(Duration duration) override;

  [[nodiscard]] bool shutdown_requested() const noexcept { return shutdown_requested_; }

 private:
  int signal_fd_{-1};
  bool shutdown_requested_{false};
};

}  // namespace sleep_agent::core
