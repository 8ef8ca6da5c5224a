#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <system_error>
#include <vector>

namespace obs_remote::input {

struct DeviceCapabilities {
  std::set<std::uint16_t> event_types{};
  std::set<std::uint16_t> key_codes{};

  [[nodiscard]] bool has_key(std::uint16_t code) const;
};

// An opened input device. The handle is released when the object is destroyed.
class InputDevice {
 public:
  virtual const std::string& path() const = 0;
  virtual const std::string& name() const = 0;
  virtual std::optional<DeviceCapabilities> capabilities() const = 0;
  // Keys currently held down, sampled from the live hardware state.
  virtual std::optional<std::set<std::uint16_t>> active_keys() const = 0;
  // Readable descriptor yielding a stream of struct input_event records.
  virtual int native_handle() const = 0;
  virtual ~InputDevice() = default;
};

class InputSubsystem {
 public:
  virtual std::vector<std::string> list_devices() = 0;
  virtual std::unique_ptr<InputDevice> open(const std::string& path, std::error_code& ec) = 0;
  virtual ~InputSubsystem() = default;
};

std::unique_ptr<InputSubsystem> make_evdev_subsystem(std::string device_dir = "/dev/input");

}  // namespace obs_remote::input
