#include "checks/wakeup_file.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <utility>

namespace sleep_agent::checks {

core::TimePoint parse_unix_timestamp(const std::string& line) {
  const std::string value = core::trim(line);
  const char* begin = value.c_str();
  char* end = nullptr;
  errno = 0;
  const double seconds = std::strtod(begin, &end);
  if (end == begin || errno != 0 || !std::isfinite(seconds) || !core::trim(std::string(end)).empty()) {
    throw CheckError("'" + value + "' is not a Unix timestamp");
  }
  if (!core::fits_time_point(seconds)) {
    throw CheckError("Unix timestamp " + value + " is out of range");
  }
  return core::from_unix_seconds(seconds);
}

FileWakeup::FileWakeup(std::string name, std::string path)
    : Check(std::move(name), CheckKind::WAKEUP), path_(std::move(path)) {}

std::vector<core::OptionSpec> FileWakeup::option_specs() { return {{"path", core::OptionType::STRING, true, ""}}; }

std::unique_ptr<Check> FileWakeup::create(const std::string& name, const core::CheckOptions& options) {
  if (options.get_string("path").empty()) {
    throw core::ConfigError(name + ": path must not be empty");
  }
  return std::make_unique<FileWakeup>(name, options.get_string("path"));
}

Verdict FileWakeup::evaluate(const CheckContext& /*context*/) {
  std::error_code error;
  if (!std::filesystem::exists(path_, error)) {
    return Verdict::none();
  }

  std::ifstream input(path_);
  std::string first_line;
  if (!input.is_open() || !std::getline(input, first_line)) {
    throw CheckError("next wakeup time cannot be read from " + path_);
  }
  return Verdict::at(parse_unix_timestamp(first_line));
}

}  // namespace sleep_agent::checks
