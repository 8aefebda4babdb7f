#include "checks/pressure.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <utility>

namespace sleep_agent::checks {

PressureCheck::PressureCheck(std::string name, std::string resource, const float threshold,
                             const std::string& pressure_root)
    : Check(std::move(name), CheckKind::ACTIVITY),
      resource_(std::move(resource)),
      path_(pressure_root + "/" + resource_),
      file_(std::fopen(path_.c_str(), "r")),
      threshold_(threshold) {}

PressureCheck::~PressureCheck() {
  if (file_ != nullptr) {
    std::fclose(file_);
    file_ = nullptr;
  }
}

std::vector<core::OptionSpec> PressureCheck::option_specs() {
  return {
      {"resource", core::OptionType::STRING, false, "cpu"},
      {"threshold", core::OptionType::NUMBER, false, "10"},
  };
}

std::unique_ptr<Check> PressureCheck::create(const std::string& name, const core::CheckOptions& options) {
  const std::string& resource = options.get_string("resource");
  if (resource != "cpu" && resource != "memory" && resource != "io") {
    throw core::ConfigError(name + ": resource must be one of cpu, memory, io");
  }
  const double threshold = options.get_number("threshold");
  if (threshold < 0.0 || threshold > 100.0) {
    throw core::ConfigError(name + ": threshold must be within 0..100");
  }
  return std::make_unique<PressureCheck>(name, resource, static_cast<float>(threshold));
}

Verdict PressureCheck::evaluate(const CheckContext& /*context*/) {
  if (file_ == nullptr) {
    file_ = std::fopen(path_.c_str(), "r");
    if (file_ == nullptr) {
      throw CheckError("unable to open " + path_ + ": " + std::strerror(errno));
    }
  }

  if (std::fseek(file_, 0L, SEEK_SET) != 0) {
    throw CheckError("unable to rewind " + path_);
  }

  char buffer[kReadBufferSize]{};
  const std::size_t bytes_read = std::fread(buffer, 1, sizeof(buffer) - 1, file_);
  if (bytes_read == 0U) {
    if (std::ferror(file_) != 0) {
      std::clearerr(file_);
    }
    throw CheckError("no data in " + path_);
  }

  float avg10 = 0.0F;
  if (!parse_some_avg10(buffer, bytes_read, avg10)) {
    throw CheckError("unable to parse " + path_);
  }

  if (avg10 <= threshold_) {
    return Verdict::idle();
  }

  char reason[96]{};
  std::snprintf(reason, sizeof(reason), "%s pressure %.2f%% > threshold %.2f%%", resource_.c_str(), avg10, threshold_);
  return Verdict::busy(reason);
}

bool PressureCheck::parse_some_avg10(const char* data, const std::size_t size, float& value) noexcept {
  constexpr char line_prefix[] = "some";
  constexpr char needle[] = "avg10=";
  constexpr std::size_t prefix_size = sizeof(line_prefix) - 1;
  constexpr std::size_t needle_size = sizeof(needle) - 1;

  if (size < prefix_size || std::memcmp(data, line_prefix, prefix_size) != 0) {
    return false;
  }

  for (std::size_t i = prefix_size; (i + needle_size) <= size && data[i] != '\n'; ++i) {
    if (std::memcmp(data + i, needle, needle_size) != 0) {
      continue;
    }

    const char* value_begin = data + i + needle_size;
    char* value_end = nullptr;
    errno = 0;
    const float parsed = std::strtof(value_begin, &value_end);
    if (errno != 0 || value_end == value_begin) {
      return false;
    }
    value = parsed;
    return true;
  }

  return false;
}

}  // namespace sleep_agent::checks
