#pragma once

#include "sinks/status_sink.hpp"

namespace sleep_agent::sinks {

class StdoutDebugSink final : public StatusSink {
 public:
  [[nodiscard]] const char* name() const noexcept override { return "stdout"; }

  bool publish(const model::TickReport& report) override;
};

}  // namespace sleep_agent::sinks
