#pragma once

#include <sys/types.h>

#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace obs_remote::process {

enum class SignalResult {
  kSignalled,
  kNotFound,
  kFailed,
};

class ProcessInspector {
 public:
  virtual std::optional<pid_t> find_running(const std::string& app_name) = 0;
  virtual SignalResult send_terminate_signal(pid_t pid) = 0;
  virtual ~ProcessInspector() = default;
};

class ProcessLauncher {
 public:
  // Starts the executable detached from the caller. Returns the exec error, if any.
  virtual std::error_code spawn(const std::string& executable, const std::vector<std::string>& environment) = 0;
  virtual ~ProcessLauncher() = default;
};

// Scans a procfs tree. proc_root and self_pid are injectable for tests.
class LinuxProcessInspector final : public ProcessInspector {
 public:
  explicit LinuxProcessInspector(std::string controller_name, std::string proc_root = "/proc");
  LinuxProcessInspector(std::string controller_name, std::string proc_root, pid_t self_pid);

  std::optional<pid_t> find_running(const std::string& app_name) override;
  SignalResult send_terminate_signal(pid_t pid) override;

 private:
  std::string controller_name_;
  std::string proc_root_;
  pid_t self_pid_;
};

class LinuxProcessLauncher final : public ProcessLauncher {
 public:
  std::error_code spawn(const std::string& executable, const std::vector<std::string>& environment) override;
};

struct ProcessEntry {
  pid_t pid{0};
  std::string name{};
  char state{'?'};
};

// Parses the contents of /proc/<pid>/stat.
std::optional<ProcessEntry> parse_proc_stat(const std::string& contents);

bool is_target_process(const ProcessEntry& entry, const std::string& app_name, const std::string& controller_name,
                       pid_t self_pid);

std::vector<std::string> current_environment();

std::vector<std::string> sanitized_environment(const std::vector<std::string>& environment,
                                               const std::vector<std::string>& stripped);

}  // namespace obs_remote::process
