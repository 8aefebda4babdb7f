#pragma once

#include <optional>
#include <string>
#include <vector>

namespace sleep_agent::model {

struct ProcessInfo {
  int pid{0};
  std::string name{};
};

struct LoadAverage {
  float one{0.0F};
  float five{0.0F};
  float fifteen{0.0F};
};

// Host state shared by all checks of one tick. Each source is read at most once
// per snapshot; a new snapshot is created for every tick.
class SystemSnapshot {
 public:
  explicit SystemSnapshot(std::string proc_root = "/proc");

  // Both accessors throw std::runtime_error when the source cannot be read.
  [[nodiscard]] const std::vector<ProcessInfo>& processes() const;
  [[nodiscard]] const LoadAverage& load_average() const;

  [[nodiscard]] const std::string& proc_root() const noexcept;

 private:
  std::string proc_root_;
  mutable std::optional<std::vector<ProcessInfo>> processes_{};
  mutable std::optional<LoadAverage> load_average_{};
};

}  // namespace sleep_agent::model
