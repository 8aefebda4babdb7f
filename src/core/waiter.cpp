#include "core/waiter.hpp"

#include <poll.h>
#include <signal.h>
#include <sys/signalfd.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>

namespace sleep_agent::core {

SignalWaiter::SignalWaiter() {
  sigset_t sigset;
  sigemptyset(&sigset);
  sigaddset(&sigset, SIGINT);
  sigaddset(&sigset, SIGTERM);
  sigaddset(&sigset, SIGQUIT);
  if (sigprocmask(SIG_BLOCK, &sigset, nullptr) != 0) {
    throw std::runtime_error("sigprocmask failed: " + std::string(std::strerror(errno)));
  }

  signal_fd_ = signalfd(-1, &sigset, SFD_CLOEXEC);
  if (signal_fd_ < 0) {
    throw std::runtime_error("signalfd failed: " + std::string(std::strerror(errno)));
  }
}

SignalWaiter::~SignalWaiter() {
  if (signal_fd_ >= 0) {
    close(signal_fd_);
    signal_fd_ = -1;
  }
}

bool SignalWaiter::wait_for(const Duration duration) {
  if (shutdown_requested_) {
    return false;
  }

  const auto deadline = std::chrono::steady_clock::now() + duration;
  while (true) {
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    const int timeout_ms = static_cast<int>(std::max<long long>(0, std::min<long long>(remaining.count(), 60'000)));

    pollfd fd{signal_fd_, POLLIN, 0};
    const int ready = poll(&fd, 1, timeout_ms);

    if (ready > 0) {
      signalfd_siginfo info{};
      if (::read(signal_fd_, &info, sizeof(info)) == static_cast<ssize_t>(sizeof(info))) {
        std::cerr << "[daemon] received signal " << info.ssi_signo << "; shutting down\n";
        shutdown_requested_ = true;
        return false;
      }
      continue;
    }

    if (ready < 0 && errno != EINTR) {
      std::cerr << "[daemon] poll failed: '" << std::strerror(errno) << "' (" << errno << ")\n";
      return true;
    }

    if (std::chrono::steady_clock::now() >= deadline) {
      return true;
    }
  }
}

}  // namespace sleep_agent::core
