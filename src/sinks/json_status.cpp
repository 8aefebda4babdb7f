#include "sinks/json_status.hpp"

#include <cstdio>
#include <fstream>
#include <utility>

namespace sleep_agent::sinks {

namespace {

nlohmann::json optional_time(const std::optional<core::TimePoint>& time) {
  if (!time.has_value()) {
    return nullptr;
  }
  return {{"unix", core::to_unix_seconds(*time)}, {"utc", core::format_utc(*time)}};
}

}  // namespace

JsonStatusSink::JsonStatusSink(std::string path) : path_(std::move(path)) {}

nlohmann::json JsonStatusSink::to_json(const model::TickReport& report) {
  nlohmann::json reasons = nlohmann::json::array();
  for (const auto& reason : report.reasons) {
    reasons.push_back({{"check", reason.check_name}, {"reason", reason.reason}, {"failed", reason.failed}});
  }

  return nlohmann::json{
      {"time", optional_time(report.time)},
      {"busy", report.busy},
      {"reasons", reasons},
      {"idle_since", optional_time(report.idle_since)},
      {"idle_seconds", report.idle_seconds},
      {"suspend",
       {{"due", report.suspend_due},
        {"attempted", report.suspend_attempted},
        {"succeeded", report.suspend_succeeded},
        {"skipped", report.suspend_skipped},
        {"wake_at", optional_time(report.wake_at)}}},
      {"counters",
       {{"ticks", report.counters.ticks},
        {"suspends", report.counters.suspends},
        {"suspend_failures", report.counters.suspend_failures},
        {"skipped_suspends", report.counters.skipped_suspends},
        {"check_failures", report.counters.check_failures}}},
  };
}

bool JsonStatusSink::publish(const model::TickReport& report) {
  const std::string temp_path = path_ + ".tmp";
  {
    std::ofstream out(temp_path, std::ios::trunc);
    if (!out.is_open()) {
      return false;
    }
    out << to_json(report).dump(2) << '\n';
    if (!out.good()) {
      return false;
    }
  }
  return std::rename(temp_path.c_str(), path_.c_str()) == 0;
}

}  // namespace sleep_agent::sinks
