#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <unistd.h>
#include <utmp.h>

#include "checks/active_connection.hpp"
#include "checks/check.hpp"
#include "checks/external_command.hpp"
#include "checks/load.hpp"
#include "checks/logind_sessions.hpp"
#include "checks/network_bandwidth.hpp"
#include "checks/pressure.hpp"
#include "checks/processes.hpp"
#include "checks/registry.hpp"
#include "checks/systemd_bus.hpp"
#include "checks/systemd_timer.hpp"
#include "checks/users.hpp"
#include "checks/wakeup_command.hpp"
#include "checks/wakeup_file.hpp"
#include "checks/wakeup_periodic.hpp"
#include "core/command.hpp"
#include "core/config.hpp"
#include "core/options.hpp"
#include "core/timestamp.hpp"
#include "model/system_snapshot.hpp"

using sleep_agent::checks::ActiveConnectionCheck;
using sleep_agent::checks::CheckContext;
using sleep_agent::checks::CheckError;
using sleep_agent::checks::CheckKind;
using sleep_agent::checks::CommandWakeup;
using sleep_agent::checks::ExternalCommandCheck;
using sleep_agent::checks::FileWakeup;
using sleep_agent::checks::LoadCheck;
using sleep_agent::checks::LoginSession;
using sleep_agent::checks::LogindSessionsIdleCheck;
using sleep_agent::checks::NetworkBandwidthCheck;
using sleep_agent::checks::PressureCheck;
using sleep_agent::checks::ProcessesCheck;
using sleep_agent::checks::SystemdBus;
using sleep_agent::checks::SystemdTimerWakeup;
using sleep_agent::checks::TimerSchedule;
using sleep_agent::checks::UsersCheck;
using sleep_agent::checks::Verdict;
using sleep_agent::core::CheckConfig;
using sleep_agent::core::CommandError;
using sleep_agent::core::ConfigError;
using sleep_agent::core::TimePoint;
using sleep_agent::core::from_unix_seconds;
using sleep_agent::model::SystemSnapshot;
using namespace std::chrono_literals;

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

bool almost_equal(double a, double b, double eps = 1e-3) { return std::fabs(a - b) <= eps; }

// Scratch directory removed when the test returns.
class TempDir {
 public:
  explicit TempDir(const std::string& tag)
      : path_(std::filesystem::temp_directory_path() /
              ("sleep_agent_" + tag + "_" + std::to_string(static_cast<long>(::getpid())))) {
    std::filesystem::remove_all(path_);
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code error;
    std::filesystem::remove_all(path_, error);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

  void write(const std::string& relative, const std::string& content) const {
    const auto file = path_ / relative;
    std::filesystem::create_directories(file.parent_path());
    std::ofstream out(file, std::ios::trunc);
    out << content;
  }

 private:
  std::filesystem::path path_;
};

TimePoint at_seconds(const long seconds) { return TimePoint{} + std::chrono::seconds(1'700'000'000 + seconds); }

// Canned logind and systemd answers.
class FakeSystemdBus final : public SystemdBus {
 public:
  std::vector<LoginSession> list_sessions() override {
    ++calls;
    if (unreachable) {
      throw CheckError("failed to connect to system bus");
    }
    return sessions;
  }

  std::vector<TimerSchedule> list_timers() override {
    ++calls;
    if (unreachable) {
      throw CheckError("failed to connect to system bus");
    }
    return timers;
  }

  std::vector<LoginSession> sessions{};
  std::vector<TimerSchedule> timers{};
  bool unreachable{false};
  int calls{0};
};

template <typename Fn>
bool throws_check_error(Fn&& fn) {
  try {
    fn();
  } catch (const CheckError&) {
    return true;
  }
  return false;
}

template <typename Fn>
bool throws_config_error(Fn&& fn) {
  try {
    fn();
  } catch (const ConfigError&) {
    return true;
  }
  return false;
}

int test_snapshot_reads_proc_tree() {
  TempDir proc("snapshot");
  proc.write("123/comm", "smbd\n");
  proc.write("45/comm", "bash\n");
  proc.write("self/comm", "ignored\n");
  proc.write("loadavg", "0.42 0.30 0.10 1/200 1234\n");

  const SystemSnapshot snapshot{proc.path().string()};
  const auto& processes = snapshot.processes();
  if (processes.size() != 2) {
    return fail("test_snapshot_reads_proc_tree", "only numeric directories are processes");
  }
  if (!almost_equal(snapshot.load_average().one, 0.42) || !almost_equal(snapshot.load_average().fifteen, 0.10)) {
    return fail("test_snapshot_reads_proc_tree", "loadavg parsed incorrectly");
  }

  TempDir empty("snapshot_empty");
  const SystemSnapshot broken{empty.path().string()};
  bool threw = false;
  try {
    (void)broken.load_average();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  if (!threw) {
    return fail("test_snapshot_reads_proc_tree", "missing loadavg should throw");
  }

  return 0;
}

int test_load_check() {
  TempDir proc("load");
  proc.write("loadavg", "3.10 1.00 0.50 2/300 999\n");

  LoadCheck check("load", 2.5F);
  const SystemSnapshot busy_snapshot{proc.path().string()};
  const Verdict busy = check.evaluate(CheckContext{at_seconds(0), busy_snapshot});
  if (!busy.is_busy() || busy.reason() != "Load 3.10 > threshold 2.50") {
    return fail("test_load_check", "load above threshold should be busy");
  }

  proc.write("loadavg", "2.50 1.00 0.50 2/300 999\n");
  const SystemSnapshot idle_snapshot{proc.path().string()};
  if (check.evaluate(CheckContext{at_seconds(30), idle_snapshot}).is_busy()) {
    return fail("test_load_check", "load equal to the threshold is idle");
  }

  return 0;
}

int test_processes_check() {
  TempDir proc("processes");
  proc.write("100/comm", "smbd\n");
  proc.write("200/comm", "sshd\n");
  const SystemSnapshot snapshot{proc.path().string()};

  ProcessesCheck sharing("sharing", {"smbd", "nfsd"});
  const Verdict busy = sharing.evaluate(CheckContext{at_seconds(0), snapshot});
  if (!busy.is_busy() || busy.reason() != "Process smbd is running") {
    return fail("test_processes_check", "running process should make the check busy");
  }

  ProcessesCheck media("media", {"vlc"});
  if (media.evaluate(CheckContext{at_seconds(0), snapshot}).is_busy()) {
    return fail("test_processes_check", "absent process should be idle");
  }

  return 0;
}

int test_active_connection_check() {
  const std::string tcp =
      "  sl  local_address rem_address   st tx_queue rx_queue tr tm->when retrnsmt   uid  timeout inode\n"
      "   0: 0100007F:0016 0100007F:C350 01 00000000:00000000 00:00000000 00000000     0        0 1 1\n"
      "   1: 00000000:0050 00000000:0000 0A 00000000:00000000 00:00000000 00000000     0        0 2 1\n";
  const std::string tcp6 =
      "  sl  local_address                         remote_address                        st\n"
      "   0: 00000000000000000000000001000000:01BB 00000000000000000000000001000000:D431 01 0 0\n";

  const auto established = ActiveConnectionCheck::parse_established_ports(tcp);
  if (established.size() != 1 || established.count(22) != 1) {
    return fail("test_active_connection_check", "only ESTABLISHED rows should be reported");
  }

  TempDir proc("connections");
  proc.write("net/tcp", tcp);
  proc.write("net/tcp6", tcp6);
  const SystemSnapshot snapshot{proc.path().string()};

  ActiveConnectionCheck ssh("ssh", {22, 443});
  const Verdict busy = ssh.evaluate(CheckContext{at_seconds(0), snapshot});
  if (!busy.is_busy() || busy.reason() != "Ports 22, 443 are connected") {
    return fail("test_active_connection_check", "IPv4 and IPv6 connections should both count");
  }

  ActiveConnectionCheck web("web", {80});
  if (web.evaluate(CheckContext{at_seconds(0), snapshot}).is_busy()) {
    return fail("test_active_connection_check", "listening socket is not a connection");
  }

  TempDir empty("connections_empty");
  const SystemSnapshot broken{empty.path().string()};
  if (!throws_check_error([&]() { (void)web.evaluate(CheckContext{at_seconds(0), broken}); })) {
    return fail("test_active_connection_check", "missing tcp table should throw");
  }

  const auto factories = sleep_agent::checks::builtin_check_classes();
  if (!throws_config_error([&]() {
        (void)factories.create(CheckKind::ACTIVITY, CheckConfig{"bad", "ActiveConnection", true, {{"ports", "22,70000"}}});
      })) {
    return fail("test_active_connection_check", "out of range port should throw");
  }

  return 0;
}

int test_network_bandwidth_check() {
  TempDir sys("net");
  sys.write("eth0/statistics/rx_bytes", "1000\n");
  sys.write("eth0/statistics/tx_bytes", "2000\n");

  NetworkBandwidthCheck check("net", {"eth0"}, 100.0, 100.0, sys.path().string());
  const SystemSnapshot snapshot{};

  if (check.evaluate(CheckContext{at_seconds(0), snapshot}).is_busy()) {
    return fail("test_network_bandwidth_check", "first evaluation only records counters");
  }

  sys.write("eth0/statistics/rx_bytes", "6000\n");
  sys.write("eth0/statistics/tx_bytes", "2050\n");
  const Verdict busy = check.evaluate(CheckContext{at_seconds(10), snapshot});
  if (!busy.is_busy() || busy.reason() != "Interface eth0 receiving 500.0 B/s > threshold 100.0 B/s") {
    return fail("test_network_bandwidth_check", "receive rate above threshold should be busy");
  }

  if (check.evaluate(CheckContext{at_seconds(20), snapshot}).is_busy()) {
    return fail("test_network_bandwidth_check", "unchanged counters should be idle");
  }

  if (!throws_config_error([&]() { NetworkBandwidthCheck missing("net", {"eth0", "wlan9"}, 1.0, 1.0, sys.path().string()); })) {
    return fail("test_network_bandwidth_check", "unknown interface should throw");
  }

  return 0;
}

int test_pressure_check() {
  const char* sample = "some avg10=12.50 avg60=3.00 avg300=1.00 total=1234\nfull avg10=0.00 avg60=0.00 avg300=0.00 total=0\n";
  float value = 0.0F;
  if (!PressureCheck::parse_some_avg10(sample, std::strlen(sample), value) || !almost_equal(value, 12.5)) {
    return fail("test_pressure_check", "some avg10 should parse");
  }

  const char* full_first = "full avg10=12.50 avg60=3.00 avg300=1.00 total=1234\n";
  if (PressureCheck::parse_some_avg10(full_first, std::strlen(full_first), value)) {
    return fail("test_pressure_check", "a table not starting with 'some' is rejected");
  }

  TempDir pressure("pressure");
  pressure.write("io", sample);
  PressureCheck check("io", "io", 10.0F, pressure.path().string());
  const SystemSnapshot snapshot{};

  const Verdict busy = check.evaluate(CheckContext{at_seconds(0), snapshot});
  if (!busy.is_busy() || busy.reason() != "io pressure 12.50% > threshold 10.00%") {
    return fail("test_pressure_check", "pressure above threshold should be busy");
  }

  pressure.write("io", "some avg10=1.00 avg60=3.00 avg300=1.00 total=1234\n");
  if (check.evaluate(CheckContext{at_seconds(10), snapshot}).is_busy()) {
    return fail("test_pressure_check", "pressure below threshold should be idle");
  }

  PressureCheck missing("cpu", "cpu", 10.0F, pressure.path().string());
  if (!throws_check_error([&]() { (void)missing.evaluate(CheckContext{at_seconds(0), snapshot}); })) {
    return fail("test_pressure_check", "missing pressure file should throw");
  }

  return 0;
}

utmp make_session(const short type, const char* user, const char* line, const char* host) {
  utmp entry{};
  entry.ut_type = type;
  std::strncpy(entry.ut_user, user, sizeof(entry.ut_user));
  std::strncpy(entry.ut_line, line, sizeof(entry.ut_line));
  std::strncpy(entry.ut_host, host, sizeof(entry.ut_host));
  return entry;
}

int test_users_check() {
  TempDir dir("users");
  const auto utmp_path = (dir.path() / "utmp").string();
  {
    std::ofstream out(utmp_path, std::ios::binary);
    const utmp login = make_session(LOGIN_PROCESS, "LOGIN", "tty1", "");
    const utmp alice = make_session(USER_PROCESS, "alice", "pts/0", "10.0.0.2");
    out.write(reinterpret_cast<const char*>(&login), sizeof(login));
    out.write(reinterpret_cast<const char*>(&alice), sizeof(alice));
  }
  const SystemSnapshot snapshot{};

  UsersCheck anyone("users", ".*", ".*", ".*", utmp_path);
  const Verdict busy = anyone.evaluate(CheckContext{at_seconds(0), snapshot});
  if (!busy.is_busy() || busy.reason() != "User alice is logged in on terminal pts/0 from 10.0.0.2") {
    return fail("test_users_check", "logged in user should be busy");
  }

  UsersCheck bob("bob", "bob", ".*", ".*", utmp_path);
  if (bob.evaluate(CheckContext{at_seconds(0), snapshot}).is_busy()) {
    return fail("test_users_check", "non-matching user should be idle");
  }

  UsersCheck console("console", ".*", "tty.*", ".*", utmp_path);
  if (console.evaluate(CheckContext{at_seconds(0), snapshot}).is_busy()) {
    return fail("test_users_check", "login prompts are not user sessions");
  }

  if (!throws_config_error([&]() { UsersCheck invalid("invalid", "(", ".*", ".*", utmp_path); })) {
    return fail("test_users_check", "invalid regex should throw");
  }

  UsersCheck missing("missing", ".*", ".*", ".*", (dir.path() / "absent").string());
  if (!throws_check_error([&]() { (void)missing.evaluate(CheckContext{at_seconds(0), snapshot}); })) {
    return fail("test_users_check", "missing utmp file should throw");
  }

  return 0;
}

int test_run_command() {
  const auto output = sleep_agent::core::run_command("printf 'first\\nsecond'", 5s);
  if (output.exit_code != 0 || output.output != "first\nsecond") {
    return fail("test_run_command", "stdout should be captured");
  }

  if (sleep_agent::core::run_command("exit 3", 5s).exit_code != 3) {
    return fail("test_run_command", "exit status should be reported");
  }

  bool timed_out = false;
  const auto started = std::chrono::steady_clock::now();
  try {
    (void)sleep_agent::core::run_command("sleep 5", 200ms);
  } catch (const CommandError&) {
    timed_out = true;
  }
  if (!timed_out || std::chrono::steady_clock::now() - started > 3s) {
    return fail("test_run_command", "slow command should be killed at the timeout");
  }

  // Closing stdout early must not escape the deadline.
  timed_out = false;
  const auto detached_start = std::chrono::steady_clock::now();
  try {
    (void)sleep_agent::core::run_command("exec >/dev/null; sleep 3", 300ms);
  } catch (const CommandError&) {
    timed_out = true;
  }
  if (!timed_out || std::chrono::steady_clock::now() - detached_start > 2s) {
    return fail("test_run_command", "command without stdout should still be killed at the timeout");
  }

  const std::string command =
      sleep_agent::core::substitute_timestamp("rtcwake -m no -t {timestamp} # {timestamp}", from_unix_seconds(1700000000.0));
  if (command != "rtcwake -m no -t 1700000000 # 1700000000") {
    return fail("test_run_command", "every timestamp placeholder should be replaced");
  }

  return 0;
}

int test_external_command_check() {
  const SystemSnapshot snapshot{};

  ExternalCommandCheck succeeding("job", "true", 5s);
  const Verdict busy = succeeding.evaluate(CheckContext{at_seconds(0), snapshot});
  if (!busy.is_busy() || busy.reason() != "Command true succeeded") {
    return fail("test_external_command_check", "exit status 0 means busy");
  }

  ExternalCommandCheck failing("job", "false", 5s);
  if (failing.evaluate(CheckContext{at_seconds(0), snapshot}).is_busy()) {
    return fail("test_external_command_check", "non-zero exit status means idle");
  }

  ExternalCommandCheck missing("job", "exit 127", 5s);
  if (!throws_check_error([&]() { (void)missing.evaluate(CheckContext{at_seconds(0), snapshot}); })) {
    return fail("test_external_command_check", "command not found should throw");
  }

  return 0;
}

int test_file_wakeup() {
  TempDir dir("wakeup_file");
  const auto path = (dir.path() / "next").string();
  const SystemSnapshot snapshot{};
  FileWakeup check("file", path);

  const Verdict none = check.evaluate(CheckContext{at_seconds(0), snapshot});
  if (none.kind() != CheckKind::WAKEUP || none.wake_at().has_value()) {
    return fail("test_file_wakeup", "missing file means no wakeup");
  }

  dir.write("next", "1700000600\n# written by the recorder\n");
  const Verdict at = check.evaluate(CheckContext{at_seconds(0), snapshot});
  if (at.wake_at() != from_unix_seconds(1700000600.0)) {
    return fail("test_file_wakeup", "first line holds the wakeup time");
  }

  dir.write("next", "tomorrow\n");
  if (!throws_check_error([&]() { (void)check.evaluate(CheckContext{at_seconds(0), snapshot}); })) {
    return fail("test_file_wakeup", "garbage should throw");
  }

  dir.write("next", "1e30\n");
  if (!throws_check_error([&]() { (void)check.evaluate(CheckContext{at_seconds(0), snapshot}); })) {
    return fail("test_file_wakeup", "timestamp beyond the clock range should throw");
  }

  return 0;
}

int test_command_wakeup() {
  const SystemSnapshot snapshot{};

  CommandWakeup printing("cmd", "echo 1700000600", 5s);
  if (printing.evaluate(CheckContext{at_seconds(0), snapshot}).wake_at() != from_unix_seconds(1700000600.0)) {
    return fail("test_command_wakeup", "printed timestamp should be used");
  }

  CommandWakeup silent("cmd", "true", 5s);
  if (silent.evaluate(CheckContext{at_seconds(0), snapshot}).wake_at().has_value()) {
    return fail("test_command_wakeup", "empty output means no wakeup");
  }

  CommandWakeup failing("cmd", "exit 3", 5s);
  if (!throws_check_error([&]() { (void)failing.evaluate(CheckContext{at_seconds(0), snapshot}); })) {
    return fail("test_command_wakeup", "non-zero exit status should throw");
  }

  CommandWakeup garbage("cmd", "echo soon", 5s);
  if (!throws_check_error([&]() { (void)garbage.evaluate(CheckContext{at_seconds(0), snapshot}); })) {
    return fail("test_command_wakeup", "unparsable output should throw");
  }

  CommandWakeup distant("cmd", "echo -1e39", 5s);
  if (!throws_check_error([&]() { (void)distant.evaluate(CheckContext{at_seconds(0), snapshot}); })) {
    return fail("test_command_wakeup", "timestamp beyond the clock range should throw");
  }

  return 0;
}

int test_periodic_wakeup() {
  const auto factories = sleep_agent::checks::builtin_check_classes();
  const SystemSnapshot snapshot{};

  auto by_unit =
      factories.create(CheckKind::WAKEUP, CheckConfig{"backup", "Periodic", true, {{"unit", "hours"}, {"value", "2"}}});
  if (by_unit->evaluate(CheckContext{at_seconds(0), snapshot}).wake_at() != at_seconds(0) + 2h) {
    return fail("test_periodic_wakeup", "unit and value should define the delay");
  }

  auto by_interval = factories.create(CheckKind::WAKEUP, CheckConfig{"poll", "Periodic", true, {{"interval", "90s"}}});
  if (by_interval->evaluate(CheckContext{at_seconds(10), snapshot}).wake_at() != at_seconds(100)) {
    return fail("test_periodic_wakeup", "interval should define the delay");
  }

  if (!throws_config_error([&]() {
        (void)factories.create(CheckKind::WAKEUP,
                               CheckConfig{"both", "Periodic", true, {{"interval", "90s"}, {"unit", "days"}, {"value", "1"}}});
      })) {
    return fail("test_periodic_wakeup", "interval together with unit should throw");
  }
  if (!throws_config_error([&]() {
        (void)factories.create(CheckKind::WAKEUP,
                               CheckConfig{"fortnight", "Periodic", true, {{"unit", "fortnights"}, {"value", "1"}}});
      })) {
    return fail("test_periodic_wakeup", "unknown unit should throw");
  }

  return 0;
}

int test_logind_sessions_idle_check() {
  const SystemSnapshot snapshot{};
  auto bus = std::make_shared<FakeSystemdBus>();
  LogindSessionsIdleCheck check("logind", {"tty", "x11", "wayland"}, {"active", "online"}, bus);

  bus->sessions = {{"c1", "greeter", "active", false}, {"3", "x11", "closing", false}, {"4", "tty", "online", true}};
  if (check.evaluate(CheckContext{at_seconds(0), snapshot}).is_busy()) {
    return fail("test_logind_sessions_idle_check", "idle or unwatched sessions should not keep the system busy");
  }

  bus->sessions.push_back({"7", "wayland", "active", false});
  const Verdict busy = check.evaluate(CheckContext{at_seconds(0), snapshot});
  if (!busy.is_busy() || busy.reason() != "Login session 7 is not idle") {
    return fail("test_logind_sessions_idle_check", "active non-idle session should be busy");
  }

  bus->unreachable = true;
  if (!throws_check_error([&]() { (void)check.evaluate(CheckContext{at_seconds(0), snapshot}); })) {
    return fail("test_logind_sessions_idle_check", "bus failure should throw");
  }

  const auto factories = sleep_agent::checks::builtin_check_classes();
  if (!throws_config_error([&]() {
        (void)factories.create(CheckKind::ACTIVITY, CheckConfig{"logind", "LogindSessionsIdle", true, {{"types", " , "}}});
      })) {
    return fail("test_logind_sessions_idle_check", "empty type list should throw");
  }
  if (factories.find(CheckKind::ACTIVITY, "LogindSessionsIdle") == nullptr) {
    return fail("test_logind_sessions_idle_check", "check class should be registered");
  }

  return 0;
}

int test_systemd_timer_wakeup() {
  const SystemSnapshot snapshot{};
  const TimePoint now = at_seconds(0);
  constexpr std::uint64_t kNowUsec = 1'700'000'000ULL * 1'000'000ULL;

  TimerSchedule calendar{"backup.timer", kNowUsec + 7'200'000'000ULL, 0};
  if (sleep_agent::checks::next_elapse(calendar, now, 0) != now + 2h) {
    return fail("test_systemd_timer_wakeup", "realtime elapse is a wall clock time");
  }
  TimerSchedule relative{"fstrim.timer", 0, 5'000'000'000ULL};
  if (sleep_agent::checks::next_elapse(relative, now, 2'000'000'000ULL) != now + 3000s) {
    return fail("test_systemd_timer_wakeup", "monotonic elapse is relative to the current monotonic clock");
  }
  if (sleep_agent::checks::next_elapse(TimerSchedule{"idle.timer", 0, 0}, now, 0).has_value() ||
      sleep_agent::checks::next_elapse(TimerSchedule{"never.timer", ~0ULL, 0}, now, 0).has_value()) {
    return fail("test_systemd_timer_wakeup", "unset elapse means no wakeup");
  }

  auto bus = std::make_shared<FakeSystemdBus>();
  bus->timers = {
      {"backup-nightly.timer", kNowUsec + 7'200'000'000ULL, 0},
      {"backup-weekly.timer", kNowUsec + 3'600'000'000ULL, 0},
      {"logrotate.timer", kNowUsec + 600'000'000ULL, 0},
      {"my-backup.timer", kNowUsec + 60'000'000ULL, 0},
  };
  SystemdTimerWakeup check("timers", "backup-.*", bus);
  const Verdict wake = check.evaluate(CheckContext{now, snapshot});
  if (wake.kind() != CheckKind::WAKEUP || wake.wake_at() != now + 1h) {
    return fail("test_systemd_timer_wakeup", "earliest matching timer should be chosen");
  }

  SystemdTimerWakeup unmatched("timers", "certbot", bus);
  if (unmatched.evaluate(CheckContext{now, snapshot}).wake_at().has_value()) {
    return fail("test_systemd_timer_wakeup", "no matching timer means no wakeup");
  }

  bus->unreachable = true;
  if (!throws_check_error([&]() { (void)check.evaluate(CheckContext{now, snapshot}); })) {
    return fail("test_systemd_timer_wakeup", "bus failure should throw");
  }

  if (!throws_config_error([&]() { SystemdTimerWakeup broken("timers", "backup-(", bus); })) {
    return fail("test_systemd_timer_wakeup", "invalid pattern should throw");
  }
  const auto factories = sleep_agent::checks::builtin_check_classes();
  if (!throws_config_error(
          [&]() { (void)factories.create(CheckKind::WAKEUP, CheckConfig{"timers", "SystemdTimer", true, {}}); })) {
    return fail("test_systemd_timer_wakeup", "match is required");
  }

  return 0;
}

}  // namespace

int main() {
  if (int rc = test_snapshot_reads_proc_tree(); rc != 0) return rc;
  if (int rc = test_load_check(); rc != 0) return rc;
  if (int rc = test_processes_check(); rc != 0) return rc;
  if (int rc = test_active_connection_check(); rc != 0) return rc;
  if (int rc = test_network_bandwidth_check(); rc != 0) return rc;
  if (int rc = test_pressure_check(); rc != 0) return rc;
  if (int rc = test_users_check(); rc != 0) return rc;
  if (int rc = test_run_command(); rc != 0) return rc;
  if (int rc = test_external_command_check(); rc != 0) return rc;
  if (int rc = test_file_wakeup(); rc != 0) return rc;
  if (int rc = test_command_wakeup(); rc != 0) return rc;
  if (int rc = test_periodic_wakeup(); rc != 0) return rc;
  if (int rc = test_logind_sessions_idle_check(); rc != 0) return rc;
  if (int rc = test_systemd_timer_wakeup(); rc != 0) return rc;

  std::cout << "[PASS] checks unit tests\n";
  return 0;
}
