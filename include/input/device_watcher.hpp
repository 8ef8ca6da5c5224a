#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "core/actions.hpp"
#include "core/controller_state.hpp"
#include "input/input_device.hpp"

namespace obs_remote::input {

struct WatcherOptions {
  std::uint16_t trigger_code{0};
  std::chrono::milliseconds scan_interval{2000};
  std::chrono::milliseconds long_press_threshold{1000};
};

class DeviceWatcher {
 public:
  DeviceWatcher(boost::asio::io_context& io, InputSubsystem& subsystem, core::ControllerState& state,
                core::Actions& actions, WatcherOptions options);

  DeviceWatcher(const DeviceWatcher&) = delete;
  DeviceWatcher& operator=(const DeviceWatcher&) = delete;

  // Scans immediately, then once per scan_interval for the life of the io_context.
  void start();

  // One pass over the device list. Returns the number of devices newly monitored.
  std::size_t scan();

 private:
  void schedule_next();
  bool monitor(const std::string& path);

  boost::asio::io_context& io_;
  InputSubsystem& subsystem_;
  core::ControllerState& state_;
  core::Actions& actions_;
  WatcherOptions options_;
  boost::asio::steady_timer timer_;
};

}  // namespace obs_remote::input
