#include "core/command.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>

namespace sleep_agent::core {

namespace {

constexpr const char* kTimestampPlaceholder = "{timestamp}";
constexpr long long kMaxPollMs = 60LL * 60LL * 1000LL;
constexpr int kReapPollMs = 10;

void reap(const pid_t pid, int& status) noexcept {
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      status = -1;
      return;
    }
  }
}

// Waits for the child until `deadline`. Returns false when it is still running.
bool reap_before(const pid_t pid, int& status, const std::chrono::steady_clock::time_point deadline) noexcept {
  while (true) {
    const pid_t reaped = waitpid(pid, &status, WNOHANG);
    if (reaped == pid) {
      return true;
    }
    if (reaped < 0 && errno != EINTR) {
      status = -1;
      return true;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    poll(nullptr, 0, kReapPollMs);
  }
}

}  // namespace

CommandResult run_command(const std::string& command, const Duration timeout) {
  int pipe_fds[2]{};
  if (pipe2(pipe_fds, O_CLOEXEC) != 0) {
    throw CommandError("pipe failed: " + std::string(std::strerror(errno)));
  }

  const pid_t pid = fork();
  if (pid < 0) {
    const int fork_errno = errno;
    close(pipe_fds[0]);
    close(pipe_fds[1]);
    throw CommandError("fork failed: " + std::string(std::strerror(fork_errno)));
  }

  if (pid == 0) {
    sigset_t unblocked;
    sigemptyset(&unblocked);
    sigprocmask(SIG_SETMASK, &unblocked, nullptr);

    dup2(pipe_fds[1], STDOUT_FILENO);
    close(pipe_fds[0]);
    close(pipe_fds[1]);

    execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
    _exit(127);
  }

  close(pipe_fds[1]);
  const int read_fd = pipe_fds[0];

  CommandResult result{};
  const bool bounded = timeout.count() > 0;
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  bool timed_out = false;
  char chunk[4096]{};

  while (true) {
    int poll_timeout_ms = -1;
    if (bounded) {
      const auto remaining =
          std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
      if (remaining.count() <= 0) {
        timed_out = true;
        break;
      }
      poll_timeout_ms = static_cast<int>(std::min<long long>(remaining.count(), kMaxPollMs));
    }

    pollfd fd{read_fd, POLLIN, 0};
    const int ready = poll(&fd, 1, poll_timeout_ms);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    if (ready == 0) {
      timed_out = true;
      break;
    }

    const ssize_t bytes_read = ::read(read_fd, chunk, sizeof(chunk));
    if (bytes_read > 0) {
      result.output.append(chunk, static_cast<std::size_t>(bytes_read));
      continue;
    }
    if (bytes_read < 0 && errno == EINTR) {
      continue;
    }
    break;
  }

  close(read_fd);

  // The child may close or redirect stdout and keep running.
  int status = 0;
  if (!timed_out && bounded && !reap_before(pid, status, deadline)) {
    timed_out = true;
  }

  if (timed_out) {
    kill(pid, SIGKILL);
    reap(pid, status);
  } else if (!bounded) {
    reap(pid, status);
  }

  if (timed_out) {
    throw CommandError("command timed out after " + std::to_string(timeout.count()) + " ms: " + command);
  }
  if (status < 0) {
    throw CommandError("waitpid failed for command: " + command);
  }

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  return result;
}

std::string substitute_timestamp(const std::string& command_template, const TimePoint time) {
  const std::string timestamp = std::to_string(static_cast<long long>(to_unix_seconds(time)));
  const std::size_t placeholder_size = std::strlen(kTimestampPlaceholder);

  std::string command = command_template;
  std::size_t pos = command.find(kTimestampPlaceholder);
  while (pos != std::string::npos) {
    command.replace(pos, placeholder_size, timestamp);
    pos = command.find(kTimestampPlaceholder, pos + timestamp.size());
  }
  return command;
}

}  // namespace sleep_agent::core
