#include "process/process_control.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <utility>

extern char** environ;

namespace obs_remote::process {
namespace {

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::optional<pid_t> parse_pid(const std::string& value) {
  int parsed = 0;
  const auto result = std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (result.ec != std::errc{} || result.ptr != value.data() + value.size() || parsed <= 0) {
    return std::nullopt;
  }
  return static_cast<pid_t>(parsed);
}

std::vector<char*> to_argv(std::vector<std::string>& values) {
  std::vector<char*> out;
  out.reserve(values.size() + 1);
  for (auto& value : values) {
    out.push_back(value.data());
  }
  out.push_back(nullptr);
  return out;
}

}  // namespace

std::optional<ProcessEntry> parse_proc_stat(const std::string& contents) {
  // "<pid> (<comm>) <state> ..." where comm may itself contain spaces and parentheses.
  const auto open = contents.find('(');
  const auto close = contents.rfind(')');
  if (open == std::string::npos || close == std::string::npos || close < open || close + 2 >= contents.size()) {
    return std::nullopt;
  }

  std::string pid_field = contents.substr(0, open);
  while (!pid_field.empty() && pid_field.back() == ' ') {
    pid_field.pop_back();
  }
  const auto pid = parse_pid(pid_field);
  if (!pid.has_value()) {
    return std::nullopt;
  }

  ProcessEntry entry{};
  entry.pid = *pid;
  entry.name = contents.substr(open + 1, close - open - 1);
  entry.state = contents[close + 2];
  return entry;
}

bool is_target_process(const ProcessEntry& entry, const std::string& app_name, const std::string& controller_name,
                       const pid_t self_pid) {
  if (entry.pid == self_pid || entry.name.empty()) {
    return false;
  }

  const std::string name = to_lower(entry.name);
  if (name.find("python") != std::string::npos) {
    return false;
  }
  if (!controller_name.empty() && name.find(to_lower(controller_name)) != std::string::npos) {
    return false;
  }
  if (name.find(to_lower(app_name)) == std::string::npos) {
    return false;
  }

  // Zombie or dead: gone for our purposes even though the pid still exists.
  return entry.state != 'Z' && entry.state != 'X' && entry.state != 'x';
}

LinuxProcessInspector::LinuxProcessInspector(std::string controller_name, std::string proc_root)
    : LinuxProcessInspector(std::move(controller_name), std::move(proc_root), ::getpid()) {}

LinuxProcessInspector::LinuxProcessInspector(std::string controller_name, std::string proc_root, const pid_t self_pid)
    : controller_name_(std::move(controller_name)), proc_root_(std::move(proc_root)), self_pid_(self_pid) {}

std::optional<pid_t> LinuxProcessInspector::find_running(const std::string& app_name) {
  std::vector<ProcessEntry> matches;

  std::error_code ec;
  for (std::filesystem::directory_iterator it(proc_root_, ec), end; !ec && it != end; it.increment(ec)) {
    if (!parse_pid(it->path().filename().string()).has_value()) {
      continue;
    }

    // Processes exit between listing and reading; an unreadable entry is simply skipped.
    std::ifstream stat_file(it->path() / "stat");
    if (!stat_file.is_open()) {
      continue;
    }
    const std::string contents((std::istreambuf_iterator<char>(stat_file)), std::istreambuf_iterator<char>());

    const auto entry = parse_proc_stat(contents);
    if (entry.has_value() && is_target_process(*entry, app_name, controller_name_, self_pid_)) {
      matches.push_back(*entry);
    }
  }

  if (ec) {
    std::cerr << "[process] unable to scan " << proc_root_ << ": " << ec.message() << '\n';
  }
  if (matches.empty()) {
    return std::nullopt;
  }

  const auto lowest = std::min_element(matches.begin(), matches.end(),
                                       [](const ProcessEntry& a, const ProcessEntry& b) { return a.pid < b.pid; });
  return lowest->pid;
}

SignalResult LinuxProcessInspector::send_terminate_signal(const pid_t pid) {
  if (::kill(pid, SIGINT) == 0) {
    return SignalResult::kSignalled;
  }
  if (errno == ESRCH) {
    return SignalResult::kNotFound;
  }
  return SignalResult::kFailed;
}

std::error_code LinuxProcessLauncher::spawn(const std::string& executable, const std::vector<std::string>& environment) {
  std::vector<std::string> args{executable};
  std::vector<std::string> env = environment;
  const auto argv = to_argv(args);
  const auto envp = to_argv(env);

  // Carries the child's exec errno back; closes on a successful exec.
  int status_pipe[2]{};
  if (::pipe2(status_pipe, O_CLOEXEC) != 0) {
    return {errno, std::system_category()};
  }

  const pid_t pid = ::fork();
  if (pid < 0) {
    const int error = errno;
    ::close(status_pipe[0]);
    ::close(status_pipe[1]);
    return {error, std::system_category()};
  }

  if (pid == 0) {
    ::close(status_pipe[0]);
    ::setsid();

    // SIG_IGN survives exec; the launched application gets default dispositions.
    ::signal(SIGCHLD, SIG_DFL);
    ::signal(SIGINT, SIG_DFL);
    ::signal(SIGTERM, SIG_DFL);

    const int devnull = ::open("/dev/null", O_RDWR);
    if (devnull >= 0) {
      ::dup2(devnull, STDOUT_FILENO);
      ::dup2(devnull, STDERR_FILENO);
      if (devnull > STDERR_FILENO) {
        ::close(devnull);
      }
    }

    ::execvpe(argv[0], argv.data(), envp.data());
    const int error = errno;
    const ssize_t written = ::write(status_pipe[1], &error, sizeof(error));
    (void)written;
    ::_exit(127);
  }

  ::close(status_pipe[1]);

  int child_error = 0;
  ssize_t bytes_read = 0;
  do {
    bytes_read = ::read(status_pipe[0], &child_error, sizeof(child_error));
  } while (bytes_read < 0 && errno == EINTR);
  ::close(status_pipe[0]);

  if (bytes_read == static_cast<ssize_t>(sizeof(child_error))) {
    ::waitpid(pid, nullptr, 0);
    return {child_error, std::system_category()};
  }
  return {};
}

std::vector<std::string> current_environment() {
  std::vector<std::string> out;
  for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
    out.emplace_back(*entry);
  }
  return out;
}

std::vector<std::string> sanitized_environment(const std::vector<std::string>& environment,
                                               const std::vector<std::string>& stripped) {
  std::vector<std::string> out;
  out.reserve(environment.size());
  for (const auto& entry : environment) {
    const auto equals = entry.find('=');
    const std::string name = entry.substr(0, equals);
    if (std::find(stripped.begin(), stripped.end(), name) != stripped.end()) {
      continue;
    }
    out.push_back(entry);
  }
  return out;
}

}  // namespace obs_remote::process
