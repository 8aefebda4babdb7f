#pragma once

#include "model/tick_report.hpp"

namespace sleep_agent::sinks {

class StatusSink {
 public:
  virtual ~StatusSink() = default;

  [[nodiscard]] virtual const char* name() const noexcept = 0;

  // Returns false when the report could not be delivered.
  virtual bool publish(const model::TickReport& report) = 0;
};

}  // namespace sleep_agent::sinks
