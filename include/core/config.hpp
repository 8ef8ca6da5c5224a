#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace obs_remote::core {

struct ControllerConfig {
  std::string host{"localhost"};
  std::uint16_t port{4455};
  std::string password{};
  std::uint16_t trigger_code{0};

  std::chrono::milliseconds long_press_threshold{1000};
  std::chrono::milliseconds reconnect_delay{2000};
  std::chrono::milliseconds scan_interval{2000};
  std::chrono::milliseconds toggle_cooldown{2000};
  std::chrono::milliseconds io_timeout{3000};

  std::string app_name{"obs"};
  std::string executable{"obs"};
  std::string controller_name{"obs-remote"};
  std::vector<std::string> stripped_environment{"PYTHONPATH", "PYTHONHOME"};
};

struct CommandLine {
  ControllerConfig config{};
  bool help_requested{false};
};

// Throws std::runtime_error on unknown flags, missing values, or a missing --code.
CommandLine parse_command_line(int argc, const char* const* argv);

std::string usage(const std::string& program);

std::string format_config_settings(const ControllerConfig& config);

}  // namespace obs_remote::core
