#pragma once

#include <functional>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "control/reconnect_supervisor.hpp"
#include "control/remote_control_client.hpp"
#include "core/action_dispatcher.hpp"
#include "core/config.hpp"
#include "core/controller_state.hpp"
#include "input/device_watcher.hpp"
#include "input/input_device.hpp"
#include "process/process_control.hpp"

namespace obs_remote::core {

struct ControllerAdapters {
  std::unique_ptr<input::InputSubsystem> input{};
  std::unique_ptr<control::RemoteControlClient> client{};
  std::unique_ptr<process::ProcessInspector> inspector{};
  std::unique_ptr<process::ProcessLauncher> launcher{};
};

// Adapters are built against the controller's event loop.
using AdapterFactory = std::function<ControllerAdapters(boost::asio::io_context&, const ControllerConfig&)>;

ControllerAdapters make_system_adapters(boost::asio::io_context& io, const ControllerConfig& config);

// Owns the event loop and everything scheduled on it.
class Controller {
 public:
  explicit Controller(ControllerConfig config);
  Controller(ControllerConfig config, const AdapterFactory& make_adapters);

  Controller(const Controller&) = delete;
  Controller& operator=(const Controller&) = delete;

  // Runs until SIGINT/SIGTERM or stop(). Returns the process exit status.
  int run();
  void stop();

  boost::asio::io_context& io_context() noexcept;
  [[nodiscard]] const ControllerState& state() const noexcept;

 private:
  ControllerConfig config_;
  ControllerState state_{};
  boost::asio::io_context io_{};
  ControllerAdapters adapters_;
  ActionDispatcher dispatcher_;
  control::ReconnectSupervisor supervisor_;
  input::DeviceWatcher watcher_;
  boost::asio::signal_set signals_;
};

}  // namespace obs_remote::core
