#pragma once

#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/timestamp.hpp"

namespace sleep_agent::core {

// Raised for every configuration mistake. Always fatal at startup.
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

enum class OptionType {
  STRING,
  NUMBER,
  BOOLEAN,
  DURATION,
};

struct OptionSpec {
  std::string name;
  OptionType type{OptionType::STRING};
  bool required{false};
  // Raw text applied when the option is absent. Empty means "no default".
  std::string default_value{};
};

using RawOptions = std::unordered_map<std::string, std::string>;

class CheckOptions {
 public:
  // Validates `raw` against `specs`: unknown keys, missing required keys and
  // values that do not convert to the declared type throw ConfigError.
  static CheckOptions parse(const std::string& owner, const RawOptions& raw, const std::vector<OptionSpec>& specs);

  [[nodiscard]] bool has(const std::string& name) const;

  [[nodiscard]] const std::string& get_string(const std::string& name) const;
  [[nodiscard]] double get_number(const std::string& name) const;
  [[nodiscard]] bool get_bool(const std::string& name) const;
  [[nodiscard]] Duration get_duration(const std::string& name) const;

 private:
  struct Value {
    OptionType type{OptionType::STRING};
    std::string text{};
    double number{0.0};
    bool boolean{false};
    Duration duration{0};
  };

  const Value& lookup(const std::string& name, OptionType type) const;

  std::string owner_{};
  std::unordered_map<std::string, Value> values_{};
};

std::string trim(const std::string& value);
std::string to_lower(const std::string& value);
std::vector<std::string> split_list(const std::string& value, char separator = ',');

// The parsers below throw ConfigError on malformed input.
bool parse_bool(const std::string& value);
double parse_number(const std::string& value);
// Accepts "250ms", "30s", "5m", "2h", "1d"; a bare number means seconds.
Duration parse_duration(const std::string& value);

}  // namespace sleep_agent::core
