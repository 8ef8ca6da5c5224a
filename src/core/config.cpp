#include "core/config.hpp"

#include <linux/input-event-codes.h>

#include <sstream>
#include <stdexcept>
#include <string>

namespace obs_remote::core {
namespace {

long parse_integer(const std::string& flag, const std::string& value) {
  std::size_t consumed = 0;
  long parsed = 0;
  try {
    parsed = std::stol(value, &consumed, 10);
  } catch (const std::exception&) {
    throw std::runtime_error(flag + " expects an integer, got '" + value + "'");
  }
  if (consumed != value.size()) {
    throw std::runtime_error(flag + " expects an integer, got '" + value + "'");
  }
  return parsed;
}

void apply_flag(ControllerConfig& config, bool& code_seen, const std::string& flag, const std::string& value) {
  if (flag == "--host") {
    if (value.empty()) {
      throw std::runtime_error("--host must not be empty");
    }
    config.host = value;
    return;
  }

  if (flag == "--port") {
    const auto port = parse_integer(flag, value);
    if (port <= 0 || port > 65535) {
      throw std::runtime_error("--port must be in range 1..65535");
    }
    config.port = static_cast<std::uint16_t>(port);
    return;
  }

  if (flag == "--password") {
    config.password = value;
    return;
  }

  if (flag == "--code") {
    const auto code = parse_integer(flag, value);
    if (code < 0 || code > KEY_MAX) {
      throw std::runtime_error("--code must be in range 0.." + std::to_string(KEY_MAX));
    }
    config.trigger_code = static_cast<std::uint16_t>(code);
    code_seen = true;
    return;
  }

  throw std::runtime_error("unknown argument: " + flag);
}

}  // namespace

CommandLine parse_command_line(const int argc, const char* const* argv) {
  CommandLine command_line{};
  bool code_seen = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      command_line.help_requested = true;
      return command_line;
    }

    if (arg.rfind("--", 0) != 0) {
      throw std::runtime_error("unexpected argument: " + arg);
    }

    const auto equals = arg.find('=');
    if (equals != std::string::npos) {
      apply_flag(command_line.config, code_seen, arg.substr(0, equals), arg.substr(equals + 1));
      continue;
    }

    if (i + 1 >= argc) {
      throw std::runtime_error(arg + " requires a value");
    }
    apply_flag(command_line.config, code_seen, arg, argv[++i]);
  }

  if (!code_seen) {
    throw std::runtime_error("the following argument is required: --code");
  }

  return command_line;
}

std::string usage(const std::string& program) {
  std::ostringstream output;
  output << "usage: " << program << " [--host HOST] [--port PORT] [--password PASSWORD] --code CODE\n"
         << "\n"
         << "Short press of the trigger key toggles OBS recording; holding it for one second\n"
         << "launches or closes OBS.\n"
         << "\n"
         << "  --host HOST          OBS WebSocket host (default: localhost)\n"
         << "  --port PORT          OBS WebSocket port (default: 4455)\n"
         << "  --password PASSWORD  OBS WebSocket password (default: none)\n"
         << "  --code CODE          input key code to listen for (e.g. 28)\n";
  return output.str();
}

std::string format_config_settings(const ControllerConfig& config) {
  std::ostringstream output;
  output << "[controller] host=" << config.host
         << " | port=" << config.port
         << " | password=" << (config.password.empty() ? "<none>" : "<set>")
         << " | code=" << config.trigger_code
         << " | long_press_ms=" << config.long_press_threshold.count()
         << " | reconnect_delay_ms=" << config.reconnect_delay.count()
         << " | toggle_cooldown_ms=" << config.toggle_cooldown.count()
         << " | executable=" << config.executable;
  return output.str();
}

}  // namespace obs_remote::core
