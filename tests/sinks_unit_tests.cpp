#include <cstdarg>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include <unistd.h>

#include <hiredis/hiredis.h>
#include <nlohmann/json.hpp>

#include "core/timestamp.hpp"
#include "model/tick_report.hpp"
#include "sinks/json_status.hpp"
#include "sinks/redis_ts.hpp"
#include "sinks/stdout_debug.hpp"

using sleep_agent::core::TimePoint;
using sleep_agent::model::TickReport;
using sleep_agent::sinks::JsonStatusSink;
using sleep_agent::sinks::RedisTsOptions;
using sleep_agent::sinks::RedisTsSink;
using sleep_agent::sinks::StdoutDebugSink;

namespace {

struct RedisMockState {
  int tcp_connects{0};
  int unix_connects{0};
  std::string last_unix_path{};
  std::vector<std::string> created_keys{};
  std::vector<std::string> last_argv{};
  int command_argv_calls{0};
  int fail_next_argv{0};
  const char* create_error{nullptr};
};

RedisMockState g_redis_mock{};

redisContext* make_context() {
  auto* context = static_cast<redisContext*>(std::calloc(1, sizeof(redisContext)));
  context->err = REDIS_OK;
  return context;
}

redisReply* make_reply(const int type, const char* str = nullptr) {
  auto* reply = static_cast<redisReply*>(std::calloc(1, sizeof(redisReply)));
  reply->type = type;
  if (str != nullptr) {
    reply->str = strdup(str);
    reply->len = std::strlen(str);
  }
  return reply;
}

}  // namespace

extern "C" {

redisContext* redisConnectWithTimeout(const char*, int, const struct timeval) {
  g_redis_mock.tcp_connects += 1;
  return make_context();
}

redisContext* redisConnectUnixWithTimeout(const char* path, const struct timeval) {
  g_redis_mock.unix_connects += 1;
  g_redis_mock.last_unix_path = path;
  return make_context();
}

void redisFree(redisContext* c) { std::free(c); }

void* redisCommand(redisContext*, const char* format, ...) {
  if (std::strncmp(format, "TS.CREATE", 9) == 0) {
    va_list args;
    va_start(args, format);
    g_redis_mock.created_keys.emplace_back(va_arg(args, const char*));
    va_end(args);
    if (g_redis_mock.create_error != nullptr) {
      return make_reply(REDIS_REPLY_ERROR, g_redis_mock.create_error);
    }
  }
  return make_reply(REDIS_REPLY_STATUS);
}

void* redisCommandArgv(redisContext*, int argc, const char** argv, const size_t*) {
  g_redis_mock.command_argv_calls += 1;
  if (g_redis_mock.fail_next_argv > 0) {
    g_redis_mock.fail_next_argv -= 1;
    return nullptr;
  }
  g_redis_mock.last_argv.clear();
  for (int i = 0; i < argc; ++i) {
    g_redis_mock.last_argv.emplace_back(argv[i]);
  }
  return make_reply(REDIS_REPLY_ARRAY);
}

void freeReplyObject(void* reply) {
  if (reply == nullptr) {
    return;
  }
  std::free(static_cast<redisReply*>(reply)->str);
  std::free(reply);
}

}  // extern "C"

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

TickReport sample_report() {
  TickReport report{};
  report.time = TimePoint{} + std::chrono::milliseconds(1'700'000'000'250LL);
  report.busy = false;
  report.idle_since = TimePoint{} + std::chrono::seconds(1'699'999'700LL);
  report.idle_seconds = 300.25;
  report.suspend_due = true;
  report.suspend_attempted = true;
  report.suspend_succeeded = true;
  report.wake_at = TimePoint{} + std::chrono::seconds(1'700'007'200LL);
  report.counters.ticks = 11;
  report.counters.suspends = 2;
  report.counters.suspend_failures = 1;
  report.counters.check_failures = 4;
  return report;
}

int test_redis_sink_publishes_tick_metrics() {
  g_redis_mock = {};

  RedisTsOptions options{};
  options.key_prefix = "nas:sleep";
  RedisTsSink sink(options);

  if (!sink.publish(sample_report())) {
    return fail("test_redis_sink_publishes_tick_metrics", "publish should succeed");
  }

  if (g_redis_mock.created_keys.size() != RedisTsSink::metric_suffixes().size() ||
      g_redis_mock.created_keys.front() != "nas:sleep:state:busy") {
    return fail("test_redis_sink_publishes_tick_metrics", "every series should be created once");
  }

  const auto& argv = g_redis_mock.last_argv;
  if (argv.size() != 1 + (8 * 3) || argv[0] != "TS.MADD") {
    return fail("test_redis_sink_publishes_tick_metrics", "expected one TS.MADD with eight samples");
  }

  const auto value_of = [&argv](const std::string& key) -> std::string {
    for (std::size_t i = 1; i + 2 < argv.size(); i += 3) {
      if (argv[i] == key) {
        return argv[i + 2];
      }
    }
    return {};
  };

  if (argv[2] != "1700000000250") {
    return fail("test_redis_sink_publishes_tick_metrics", "samples should carry the tick time in ms");
  }
  if (value_of("nas:sleep:state:busy") != std::to_string(0.0) ||
      value_of("nas:sleep:state:suspend_due") != std::to_string(1.0)) {
    return fail("test_redis_sink_publishes_tick_metrics", "state flags published incorrectly");
  }
  if (value_of("nas:sleep:state:idle_seconds") != std::to_string(300.25)) {
    return fail("test_redis_sink_publishes_tick_metrics", "idle seconds published incorrectly");
  }
  if (value_of("nas:sleep:state:next_wakeup") != std::to_string(1700007200.0)) {
    return fail("test_redis_sink_publishes_tick_metrics", "next wakeup published incorrectly");
  }
  if (value_of("nas:sleep:daemon:suspends") != std::to_string(2.0) ||
      value_of("nas:sleep:daemon:check_failures") != std::to_string(4.0)) {
    return fail("test_redis_sink_publishes_tick_metrics", "counters published incorrectly");
  }

  // The schema is created once per sink.
  if (!sink.publish(sample_report()) || g_redis_mock.created_keys.size() != RedisTsSink::metric_suffixes().size()) {
    return fail("test_redis_sink_publishes_tick_metrics", "second publish should not recreate series");
  }

  return 0;
}

int test_redis_sink_reconnects_once() {
  g_redis_mock = {};
  RedisTsSink sink{};

  g_redis_mock.fail_next_argv = 1;
  if (!sink.publish(sample_report())) {
    return fail("test_redis_sink_reconnects_once", "publish should succeed after one reconnect");
  }
  if (g_redis_mock.tcp_connects != 2 || g_redis_mock.command_argv_calls != 2) {
    return fail("test_redis_sink_reconnects_once", "expected exactly one reconnect and retry");
  }

  g_redis_mock.fail_next_argv = 2;
  if (sink.publish(sample_report())) {
    return fail("test_redis_sink_reconnects_once", "second failure after reconnect should be reported");
  }

  return 0;
}

int test_redis_sink_disables_without_timeseries_module() {
  g_redis_mock = {};
  g_redis_mock.create_error = "ERR unknown command 'TS.CREATE', with args beginning with: ";
  RedisTsSink sink{};

  if (sink.publish(sample_report())) {
    return fail("test_redis_sink_disables_without_timeseries_module", "publish should fail without the module");
  }
  const int connects = g_redis_mock.tcp_connects;
  if (sink.publish(sample_report()) || g_redis_mock.tcp_connects != connects || g_redis_mock.command_argv_calls != 0) {
    return fail("test_redis_sink_disables_without_timeseries_module", "sink should stay disabled");
  }

  g_redis_mock = {};
  g_redis_mock.create_error = "ERR TSDB: key already exists";
  RedisTsSink existing{};
  if (!existing.publish(sample_report())) {
    return fail("test_redis_sink_disables_without_timeseries_module", "existing series are not an error");
  }

  return 0;
}

int test_redis_sink_unix_socket() {
  g_redis_mock = {};
  RedisTsOptions options{};
  options.unix_socket = "/run/redis/redis.sock";
  RedisTsSink sink(options);

  if (!sink.check_connectivity() || g_redis_mock.unix_connects != 1 || g_redis_mock.tcp_connects != 0 ||
      g_redis_mock.last_unix_path != "/run/redis/redis.sock") {
    return fail("test_redis_sink_unix_socket", "unix socket should be preferred");
  }
  return 0;
}

int test_json_status_sink() {
  const auto dir = std::filesystem::temp_directory_path() /
                   ("sleep_agent_status_" + std::to_string(static_cast<long>(::getpid())));
  std::filesystem::create_directories(dir);
  const auto path = dir / "status.json";

  TickReport report = sample_report();
  report.busy = true;
  report.reasons.push_back({"ssh", "Ports 22 are connected", false});
  report.reasons.push_back({"load", "check failed: unable to open /proc/loadavg", true});

  JsonStatusSink sink(path.string());
  if (!sink.publish(report)) {
    std::filesystem::remove_all(dir);
    return fail("test_json_status_sink", "publish should succeed");
  }

  nlohmann::json document;
  {
    std::ifstream in(path);
    document = nlohmann::json::parse(in);
  }
  const bool temp_left = std::filesystem::exists(path.string() + ".tmp");
  std::filesystem::remove_all(dir);

  if (temp_left) {
    return fail("test_json_status_sink", "temporary file should be renamed into place");
  }
  if (!document["busy"].get<bool>() || document["reasons"].size() != 2 ||
      document["reasons"][1]["failed"].get<bool>() != true || document["reasons"][0]["check"] != "ssh") {
    return fail("test_json_status_sink", "activity section rendered incorrectly");
  }
  if (document["suspend"]["wake_at"]["unix"].get<long long>() != 1700007200LL ||
      document["suspend"]["wake_at"]["utc"] != "2023-11-15T00:13:20Z") {
    return fail("test_json_status_sink", "wakeup time rendered incorrectly");
  }
  if (document["counters"]["ticks"].get<int>() != 11) {
    return fail("test_json_status_sink", "counters rendered incorrectly");
  }

  TickReport fresh{};
  const auto rendered = JsonStatusSink::to_json(fresh);
  if (!rendered["idle_since"].is_null() || !rendered["suspend"]["wake_at"].is_null()) {
    return fail("test_json_status_sink", "absent times should be null");
  }

  JsonStatusSink unwritable((dir / "missing" / "status.json").string());
  if (unwritable.publish(report)) {
    return fail("test_json_status_sink", "unwritable path should fail");
  }

  return 0;
}

int test_stdout_sink() {
  StdoutDebugSink sink;
  if (!sink.publish(sample_report())) {
    return fail("test_stdout_sink", "stdout publish should succeed");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_redis_sink_publishes_tick_metrics(); rc != 0) return rc;
  if (int rc = test_redis_sink_reconnects_once(); rc != 0) return rc;
  if (int rc = test_redis_sink_disables_without_timeseries_module(); rc != 0) return rc;
  if (int rc = test_redis_sink_unix_socket(); rc != 0) return rc;
  if (int rc = test_json_status_sink(); rc != 0) return rc;
  if (int rc = test_stdout_sink(); rc != 0) return rc;

  std::cout << "[PASS] sinks unit tests\n";
  return 0;
}
