#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "sinks/status_sink.hpp"

struct redisContext;

namespace sleep_agent::sinks {

struct RedisTsOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string key_prefix{"host:sleep"};
  std::uint32_t connect_timeout_ms{1000};
};

// Publishes tick metrics to RedisTimeSeries, one TS.MADD per tick.
class RedisTsSink final : public StatusSink {
 public:
  explicit RedisTsSink(RedisTsOptions options = {});
  ~RedisTsSink() override;

  RedisTsSink(const RedisTsSink&) = delete;
  RedisTsSink& operator=(const RedisTsSink&) = delete;

  [[nodiscard]] const char* name() const noexcept override { return "redis"; }

  bool check_connectivity();
  bool publish(const model::TickReport& report) override;

  static const std::vector<std::string>& metric_suffixes();

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const;
  };

  bool ensure_connected();
  bool reconnect();
  bool ensure_schema();
  bool publish_impl(const model::TickReport& report);

  RedisTsOptions options_;
  std::unique_ptr<redisContext, ContextDeleter> context_;
  std::vector<std::string> command_args_;
  std::vector<const char*> command_argv_;
  std::vector<std::size_t> command_argv_len_;
  bool timeseries_available_{true};
  bool schema_ready_{false};
};

}  // namespace sleep_agent::sinks
