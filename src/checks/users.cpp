#include "checks/users.hpp"

#include <utmp.h>

#include <cstring>
#include <fstream>
#include <utility>

namespace sleep_agent::checks {

namespace {

template <std::size_t N>
std::string fixed_field(const char (&field)[N]) {
  return std::string(field, strnlen(field, N));
}

std::regex compile(const std::string& owner, const char* option, const std::string& pattern) {
  try {
    return std::regex(pattern);
  } catch (const std::regex_error& error) {
    throw core::ConfigError(owner + ": invalid regular expression for " + option + ": " + error.what());
  }
}

}  // namespace

UsersCheck::UsersCheck(std::string name, const std::string& user_pattern, const std::string& terminal_pattern,
                       const std::string& host_pattern, std::string utmp_path)
    : Check(name, CheckKind::ACTIVITY),
      user_(compile(name, "name", user_pattern)),
      terminal_(compile(name, "terminal", terminal_pattern)),
      host_(compile(name, "host", host_pattern)),
      utmp_path_(std::move(utmp_path)) {}

std::vector<core::OptionSpec> UsersCheck::option_specs() {
  return {
      {"name", core::OptionType::STRING, false, ".*"},
      {"terminal", core::OptionType::STRING, false, ".*"},
      {"host", core::OptionType::STRING, false, ".*"},
      {"utmp_file", core::OptionType::STRING, false, _PATH_UTMP},
  };
}

std::unique_ptr<Check> UsersCheck::create(const std::string& name, const core::CheckOptions& options) {
  return std::make_unique<UsersCheck>(name, options.get_string("name"), options.get_string("terminal"),
                                      options.get_string("host"), options.get_string("utmp_file"));
}

Verdict UsersCheck::evaluate(const CheckContext& /*context*/) {
  std::ifstream input(utmp_path_, std::ios::binary);
  if (!input.is_open()) {
    throw CheckError("unable to open " + utmp_path_);
  }

  utmp entry{};
  while (input.read(reinterpret_cast<char*>(&entry), sizeof(entry))) {
    if (entry.ut_type != USER_PROCESS) {
      continue;
    }

    const std::string user = fixed_field(entry.ut_user);
    const std::string terminal = fixed_field(entry.ut_line);
    const std::string host = fixed_field(entry.ut_host);
    if (std::regex_match(user, user_) && std::regex_match(terminal, terminal_) && std::regex_match(host, host_)) {
      return Verdict::busy("User " + user + " is logged in on terminal " + terminal +
                           (host.empty() ? std::string{} : " from " + host));
    }
  }

  if (input.bad()) {
    throw CheckError("error while reading " + utmp_path_);
  }
  return Verdict::idle();
}

}  // namespace sleep_agent::checks
