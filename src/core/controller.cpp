#include "core/controller.hpp"

#include <csignal>
#include <iostream>
#include <utility>

#include "control/obs_websocket_client.hpp"

namespace obs_remote::core {
namespace {

DispatcherOptions dispatcher_options(const ControllerConfig& config) {
  DispatcherOptions options{};
  options.app_name = config.app_name;
  options.executable = config.executable;
  options.toggle_cooldown = config.toggle_cooldown;
  options.stripped_environment = config.stripped_environment;
  return options;
}

input::WatcherOptions watcher_options(const ControllerConfig& config) {
  input::WatcherOptions options{};
  options.trigger_code = config.trigger_code;
  options.scan_interval = config.scan_interval;
  options.long_press_threshold = config.long_press_threshold;
  return options;
}

}  // namespace

ControllerAdapters make_system_adapters(boost::asio::io_context& io, const ControllerConfig& config) {
  control::ObsConnectionOptions connection{};
  connection.host = config.host;
  connection.port = config.port;
  connection.password = config.password;
  connection.io_timeout = config.io_timeout;

  ControllerAdapters adapters{};
  adapters.input = input::make_evdev_subsystem();
  adapters.client = std::make_unique<control::ObsWebSocketClient>(io, connection);
  adapters.inspector = std::make_unique<process::LinuxProcessInspector>(config.controller_name);
  adapters.launcher = std::make_unique<process::LinuxProcessLauncher>();
  return adapters;
}

Controller::Controller(ControllerConfig config) : Controller(std::move(config), &make_system_adapters) {}

Controller::Controller(ControllerConfig config, const AdapterFactory& make_adapters)
    : config_(std::move(config)),
      adapters_(make_adapters(io_, config_)),
      dispatcher_(state_, *adapters_.client, *adapters_.inspector, *adapters_.launcher, dispatcher_options(config_)),
      supervisor_(io_, *adapters_.client, state_, config_.reconnect_delay),
      watcher_(io_, *adapters_.input, state_, dispatcher_, watcher_options(config_)),
      signals_(io_, SIGINT, SIGTERM) {}

int Controller::run() {
  signals_.async_wait([this](const boost::system::error_code& ec, int /*signal*/) {
    if (ec) {
      return;
    }
    std::cerr << "[controller] shutdown signal received; exiting cleanly\n";
    io_.stop();
  });

  supervisor_.start();
  watcher_.start();

  io_.run();
  return 0;
}

void Controller::stop() { io_.stop(); }

boost::asio::io_context& Controller::io_context() noexcept { return io_; }

const ControllerState& Controller::state() const noexcept { return state_; }

}  // namespace obs_remote::core
