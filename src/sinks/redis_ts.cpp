#include "sinks/redis_ts.hpp"

#include <cstring>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <hiredis/hiredis.h>

namespace sleep_agent::sinks {
namespace {

struct Sample {
  const char* suffix;
  double value;
};

bool is_error_reply(const redisReply* reply, const char* fragment) {
  return reply->type == REDIS_REPLY_ERROR && reply->str != nullptr && std::strstr(reply->str, fragment) != nullptr;
}

std::vector<Sample> samples_of(const model::TickReport& report) {
  const double next_wakeup =
      report.wake_at.has_value() ? static_cast<double>(core::to_unix_seconds(*report.wake_at)) : 0.0;
  return {
      {"state:busy", report.busy ? 1.0 : 0.0},
      {"state:idle_seconds", report.idle_seconds},
      {"state:suspend_due", report.suspend_due ? 1.0 : 0.0},
      {"state:next_wakeup", next_wakeup},
      {"daemon:heartbeat", static_cast<double>(core::to_unix_ms(report.time))},
      {"daemon:check_failures", static_cast<double>(report.counters.check_failures)},
      {"daemon:suspends", static_cast<double>(report.counters.suspends)},
      {"daemon:suspend_failures", static_cast<double>(report.counters.suspend_failures)},
  };
}

}  // namespace

const std::vector<std::string>& RedisTsSink::metric_suffixes() {
  static const std::vector<std::string> kSuffixes = [] {
    std::vector<std::string> suffixes;
    for (const Sample& sample : samples_of(model::TickReport{})) {
      suffixes.emplace_back(sample.suffix);
    }
    return suffixes;
  }();
  return kSuffixes;
}

RedisTsSink::RedisTsSink(RedisTsOptions options) : options_(std::move(options)) {
  const std::size_t arg_count = 1 + (metric_suffixes().size() * 3);
  command_args_.reserve(arg_count);
  command_argv_.reserve(arg_count);
  command_argv_len_.reserve(arg_count);
}

RedisTsSink::~RedisTsSink() = default;

void RedisTsSink::ContextDeleter::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

bool RedisTsSink::check_connectivity() { return ensure_connected(); }

bool RedisTsSink::ensure_connected() {
  if (!timeseries_available_) {
    return false;
  }
  if (context_ == nullptr || context_->err != REDIS_OK) {
    return reconnect();
  }
  return true;
}

bool RedisTsSink::reconnect() {
  context_.reset();

  timeval timeout{};
  timeout.tv_sec = static_cast<time_t>(options_.connect_timeout_ms / 1000);
  timeout.tv_usec = static_cast<suseconds_t>((options_.connect_timeout_ms % 1000) * 1000);

  const bool use_socket = !options_.unix_socket.empty();
  std::unique_ptr<redisContext, ContextDeleter> context(
      use_socket ? redisConnectUnixWithTimeout(options_.unix_socket.c_str(), timeout)
                 : redisConnectWithTimeout(options_.host.c_str(), static_cast<int>(options_.port), timeout));
  if (context == nullptr) {
    std::cerr << "[redis] unable to allocate a connection context\n";
    return false;
  }
  if (context->err != REDIS_OK) {
    std::cerr << "[redis] connection to "
              << (use_socket ? "unix://" + options_.unix_socket : options_.host + ':' + std::to_string(options_.port))
              << " failed: " << context->errstr << '\n';
    return false;
  }

  context_ = std::move(context);
  if (!ensure_schema()) {
    context_.reset();
    return false;
  }
  return true;
}

bool RedisTsSink::ensure_schema() {
  if (schema_ready_) {
    return true;
  }

  for (const std::string& suffix : metric_suffixes()) {
    const std::string key = options_.key_prefix + ":" + suffix;
    auto* reply = static_cast<redisReply*>(redisCommand(context_.get(), "TS.CREATE %s DUPLICATE_POLICY LAST", key.c_str()));
    if (reply == nullptr) {
      return false;
    }

    if (is_error_reply(reply, "unknown command")) {
      freeReplyObject(reply);
      std::cerr << "[redis] server has no TimeSeries module; redis publishing disabled\n";
      timeseries_available_ = false;
      return false;
    }
    if (reply->type == REDIS_REPLY_ERROR && !is_error_reply(reply, "already exists")) {
      std::cerr << "[redis] TS.CREATE " << key << " rejected: " << (reply->str != nullptr ? reply->str : "?") << '\n';
      freeReplyObject(reply);
      return false;
    }
    freeReplyObject(reply);
  }

  schema_ready_ = true;
  return true;
}

bool RedisTsSink::publish(const model::TickReport& report) {
  if (!ensure_connected()) {
    return false;
  }
  if (publish_impl(report)) {
    return true;
  }
  // One fresh connection per tick; a second failure waits for the next tick.
  return reconnect() && publish_impl(report);
}

bool RedisTsSink::publish_impl(const model::TickReport& report) {
  const std::string timestamp = std::to_string(core::to_unix_ms(report.time));

  command_args_.clear();
  command_args_.emplace_back("TS.MADD");
  for (const Sample& sample : samples_of(report)) {
    command_args_.push_back(options_.key_prefix + ":" + sample.suffix);
    command_args_.push_back(timestamp);
    command_args_.push_back(std::to_string(sample.value));
  }

  command_argv_.clear();
  command_argv_len_.clear();
  for (const std::string& arg : command_args_) {
    command_argv_.push_back(arg.c_str());
    command_argv_len_.push_back(arg.size());
  }

  auto* reply = static_cast<redisReply*>(redisCommandArgv(context_.get(), static_cast<int>(command_argv_.size()),
                                                          command_argv_.data(), command_argv_len_.data()));
  if (reply == nullptr) {
    return false;
  }
  const bool accepted = reply->type != REDIS_REPLY_ERROR;
  if (!accepted && reply->str != nullptr) {
    std::cerr << "[redis] TS.MADD rejected: " << reply->str << '\n';
  }
  freeReplyObject(reply);
  return accepted;
}

}  // namespace sleep_agent::sinks
