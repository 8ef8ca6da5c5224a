#include "input/device_watcher.hpp"

#include <iostream>
#include <memory>
#include <string>

#include "input/event_classifier.hpp"

namespace obs_remote::input {

DeviceWatcher::DeviceWatcher(boost::asio::io_context& io, InputSubsystem& subsystem, core::ControllerState& state,
                             core::Actions& actions, WatcherOptions options)
    : io_(io), subsystem_(subsystem), state_(state), actions_(actions), options_(options), timer_(io) {}

void DeviceWatcher::start() {
  scan();
  schedule_next();
}

std::size_t DeviceWatcher::scan() {
  std::size_t added = 0;
  for (const auto& path : subsystem_.list_devices()) {
    if (state_.devices.find(path) != state_.devices.end()) {
      continue;
    }
    if (monitor(path)) {
      ++added;
    }
  }
  return added;
}

void DeviceWatcher::schedule_next() {
  timer_.expires_after(options_.scan_interval);
  timer_.async_wait([this](const boost::system::error_code& ec) {
    if (ec) {
      return;
    }
    scan();
    schedule_next();
  });
}

bool DeviceWatcher::monitor(const std::string& path) {
  // Open failures (permissions, device mid-removal) are retried on the next scan.
  std::error_code ec;
  auto device = subsystem_.open(path, ec);
  if (device == nullptr) {
    return false;
  }

  const auto caps = device->capabilities();
  if (!caps.has_value() || !caps->has_key(options_.trigger_code)) {
    return false;
  }

  const std::string name = device->name();
  auto classifier = std::make_shared<EventClassifier>(io_, std::move(device), options_.trigger_code,
                                                      options_.long_press_threshold, state_, actions_);
  state_.devices[path] = core::MonitoredDevice{path, name, classifier};

  if (!classifier->start()) {
    return false;
  }

  std::cout << "Monitoring: " << name << std::endl;
  return true;
}

}  // namespace obs_remote::input
