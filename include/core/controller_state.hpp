#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace obs_remote::input {
class EventClassifier;
}  // namespace obs_remote::input

namespace obs_remote::core {

struct MonitoredDevice {
  std::string path{};
  std::string name{};
  std::weak_ptr<input::EventClassifier> task{};
};

// Shared by every component on the controller's io_context. Handlers run one at a
// time, so fields are only ever touched between suspension points.
//
//   connected         set true only by ReconnectSupervisor; anyone may clear it.
//   last_toggle_time  written only by ActionDispatcher::toggle_application.
//   devices           inserted by DeviceWatcher, erased by the owning EventClassifier.
struct ControllerState {
  bool connected{false};
  std::optional<std::chrono::steady_clock::time_point> last_toggle_time{};
  std::unordered_map<std::string, MonitoredDevice> devices{};
};

}  // namespace obs_remote::core
