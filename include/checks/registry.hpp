#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "checks/check.hpp"
#include "core/config.hpp"
#include "core/options.hpp"

namespace sleep_agent::checks {

// How to build one check class from its validated options.
struct CheckClass {
  std::string class_name;
  CheckKind kind{CheckKind::ACTIVITY};
  std::vector<core::OptionSpec> options{};
  std::function<std::unique_ptr<Check>(const std::string& name, const core::CheckOptions& options)> create{};
};

class CheckFactoryTable {
 public:
  // Replaces an existing class of the same kind and name.
  void add(CheckClass check_class);

  [[nodiscard]] const CheckClass* find(CheckKind kind, const std::string& class_name) const;

  // Instantiates a check; option validation errors surface as core::ConfigError.
  [[nodiscard]] std::unique_ptr<Check> create(CheckKind kind, const core::CheckConfig& config) const;

 private:
  std::vector<CheckClass> classes_{};
};

CheckFactoryTable builtin_check_classes();

// Owns the enabled checks in registration order, split by kind.
class CheckRegistry {
 public:
  CheckRegistry() = default;

  CheckRegistry(CheckRegistry&&) noexcept = default;
  CheckRegistry& operator=(CheckRegistry&&) noexcept = default;

  // Throws core::ConfigError when a check of the same kind and name exists.
  void add(std::unique_ptr<Check> check);

  [[nodiscard]] const std::vector<std::unique_ptr<Check>>& activity_checks() const noexcept { return activity_; }
  [[nodiscard]] const std::vector<std::unique_ptr<Check>>& wakeup_checks() const noexcept { return wakeup_; }
  [[nodiscard]] std::size_t size() const noexcept { return activity_.size() + wakeup_.size(); }

 private:
  std::vector<std::unique_ptr<Check>> activity_{};
  std::vector<std::unique_ptr<Check>> wakeup_{};
};

// Builds every enabled check of `config`. Disabled checks are skipped but their
// class name must still be known.
CheckRegistry build_registry(const core::DaemonConfig& config, const CheckFactoryTable& factories);

}  // namespace sleep_agent::checks
