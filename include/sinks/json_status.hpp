#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "sinks/status_sink.hpp"

namespace sleep_agent::sinks {

// Replaces `path` with a JSON rendering of the latest tick.
class JsonStatusSink final : public StatusSink {
 public:
  explicit JsonStatusSink(std::string path);

  [[nodiscard]] const char* name() const noexcept override { return "status_file"; }

  bool publish(const model::TickReport& report) override;

  static nlohmann::json to_json(const model::TickReport& report);

 private:
  std::string path_;
};

}  // namespace sleep_agent::sinks
