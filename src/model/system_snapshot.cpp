#include "model/system_snapshot.hpp"

#include <cctype>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace sleep_agent::model {

namespace {

bool is_pid_directory(const std::string& name) {
  if (name.empty()) {
    return false;
  }
  for (const char c : name) {
    if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
      return false;
    }
  }
  return true;
}

}  // namespace

SystemSnapshot::SystemSnapshot(std::string proc_root) : proc_root_(std::move(proc_root)) {}

const std::vector<ProcessInfo>& SystemSnapshot::processes() const {
  if (processes_.has_value()) {
    return *processes_;
  }

  std::vector<ProcessInfo> processes;
  try {
    for (const auto& entry : std::filesystem::directory_iterator(proc_root_)) {
      const std::string pid = entry.path().filename().string();
      if (!is_pid_directory(pid)) {
        continue;
      }

      // Processes may exit between listing and reading; skip those.
      std::ifstream comm(entry.path() / "comm");
      std::string name;
      if (!comm.is_open() || !std::getline(comm, name)) {
        continue;
      }
      processes.push_back({std::stoi(pid), name});
    }
  } catch (const std::filesystem::filesystem_error& error) {
    throw std::runtime_error("unable to list processes in " + proc_root_ + ": " + error.what());
  }

  processes_ = std::move(processes);
  return *processes_;
}

const LoadAverage& SystemSnapshot::load_average() const {
  if (load_average_.has_value()) {
    return *load_average_;
  }

  const std::string path = proc_root_ + "/loadavg";
  std::FILE* file = std::fopen(path.c_str(), "r");
  if (file == nullptr) {
    throw std::runtime_error("unable to open " + path);
  }

  LoadAverage load{};
  const int parsed = std::fscanf(file, "%f %f %f", &load.one, &load.five, &load.fifteen);
  std::fclose(file);
  if (parsed != 3) {
    throw std::runtime_error("unable to parse " + path);
  }

  load_average_ = load;
  return *load_average_;
}

const std::string& SystemSnapshot::proc_root() const noexcept { return proc_root_; }

}  // namespace sleep_agent::model
