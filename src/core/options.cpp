#include "core/options.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <utility>

namespace sleep_agent::core {
namespace {

const char* type_name(const OptionType type) {
  switch (type) {
    case OptionType::STRING:
      return "string";
    case OptionType::NUMBER:
      return "number";
    case OptionType::BOOLEAN:
      return "boolean";
    case OptionType::DURATION:
      return "duration";
  }
  return "unknown";
}

bool parse_double_prefix(const std::string& value, double& parsed, std::string& suffix) {
  const char* begin = value.c_str();
  char* end = nullptr;
  errno = 0;
  parsed = std::strtod(begin, &end);
  if (end == begin || errno != 0 || !std::isfinite(parsed)) {
    return false;
  }
  suffix = trim(std::string(end));
  return true;
}

}  // namespace

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string to_lower(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (const char c : value) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

std::vector<std::string> split_list(const std::string& value, const char separator) {
  std::vector<std::string> items;
  std::size_t start = 0;
  while (start <= value.size()) {
    const auto pos = value.find(separator, start);
    const std::string item = trim(value.substr(start, pos == std::string::npos ? std::string::npos : pos - start));
    if (!item.empty()) {
      items.push_back(item);
    }
    if (pos == std::string::npos) {
      break;
    }
    start = pos + 1;
  }
  return items;
}

bool parse_bool(const std::string& value) {
  const std::string lower = to_lower(trim(value));
  if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
    return true;
  }
  if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
    return false;
  }
  throw ConfigError("invalid boolean value '" + value + "'");
}

double parse_number(const std::string& value) {
  double parsed = 0.0;
  std::string suffix;
  if (!parse_double_prefix(trim(value), parsed, suffix) || !suffix.empty()) {
    throw ConfigError("invalid number '" + value + "'");
  }
  return parsed;
}

Duration parse_duration(const std::string& value) {
  double amount = 0.0;
  std::string suffix;
  if (!parse_double_prefix(trim(value), amount, suffix)) {
    throw ConfigError("invalid duration '" + value + "'");
  }
  if (amount < 0.0) {
    throw ConfigError("duration must not be negative: '" + value + "'");
  }

  double scale_ms = 0.0;
  const std::string unit = to_lower(suffix);
  if (unit.empty() || unit == "s") {
    scale_ms = 1000.0;
  } else if (unit == "ms") {
    scale_ms = 1.0;
  } else if (unit == "m") {
    scale_ms = 60.0 * 1000.0;
  } else if (unit == "h") {
    scale_ms = 3600.0 * 1000.0;
  } else if (unit == "d") {
    scale_ms = 86400.0 * 1000.0;
  } else {
    throw ConfigError("unknown duration unit '" + suffix + "' in '" + value + "'");
  }

  return Duration(static_cast<Duration::rep>(std::llround(amount * scale_ms)));
}

CheckOptions CheckOptions::parse(const std::string& owner, const RawOptions& raw,
                                 const std::vector<OptionSpec>& specs) {
  for (const auto& [key, value] : raw) {
    (void)value;
    const bool known = std::any_of(specs.begin(), specs.end(), [&key](const OptionSpec& spec) { return spec.name == key; });
    if (!known) {
      throw ConfigError(owner + ": unknown option '" + key + "'");
    }
  }

  CheckOptions options;
  options.owner_ = owner;
  for (const auto& spec : specs) {
    const auto it = raw.find(spec.name);
    std::string text;
    if (it != raw.end()) {
      text = it->second;
    } else if (spec.required) {
      throw ConfigError(owner + ": missing required option '" + spec.name + "'");
    } else if (spec.default_value.empty()) {
      continue;
    } else {
      text = spec.default_value;
    }

    Value parsed{};
    parsed.type = spec.type;
    parsed.text = text;
    try {
      switch (spec.type) {
        case OptionType::STRING:
          break;
        case OptionType::NUMBER:
          parsed.number = parse_number(text);
          break;
        case OptionType::BOOLEAN:
          parsed.boolean = parse_bool(text);
          break;
        case OptionType::DURATION:
          parsed.duration = parse_duration(text);
          break;
      }
    } catch (const ConfigError& error) {
      throw ConfigError(owner + ": option '" + spec.name + "': " + error.what());
    }
    options.values_[spec.name] = std::move(parsed);
  }

  return options;
}

bool CheckOptions::has(const std::string& name) const { return values_.find(name) != values_.end(); }

const CheckOptions::Value& CheckOptions::lookup(const std::string& name, const OptionType type) const {
  const auto it = values_.find(name);
  if (it == values_.end()) {
    throw ConfigError(owner_ + ": option '" + name + "' is not set");
  }
  if (it->second.type != type) {
    throw ConfigError(owner_ + ": option '" + name + "' is not a " + type_name(type));
  }
  return it->second;
}

const std::string& CheckOptions::get_string(const std::string& name) const {
  return lookup(name, OptionType::STRING).text;
}

double CheckOptions::get_number(const std::string& name) const { return lookup(name, OptionType::NUMBER).number; }

bool CheckOptions::get_bool(const std::string& name) const { return lookup(name, OptionType::BOOLEAN).boolean; }

Duration CheckOptions::get_duration(const std::string& name) const {
  return lookup(name, OptionType::DURATION).duration;
}

}  // namespace sleep_agent::core
