#include "input/input_device.hpp"

#include <fcntl.h>
#include <linux/input.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <climits>
#include <filesystem>
#include <utility>

namespace obs_remote::input {
namespace {

constexpr std::size_t kBitsPerLong = sizeof(unsigned long) * CHAR_BIT;

constexpr std::size_t longs_for_bits(const std::size_t bits) { return (bits + kBitsPerLong - 1) / kBitsPerLong; }

template <std::size_t N>
bool test_bit(const std::array<unsigned long, N>& bits, const std::size_t bit) {
  return (bits[bit / kBitsPerLong] >> (bit % kBitsPerLong)) & 1UL;
}

template <std::size_t N>
std::set<std::uint16_t> collect_bits(const std::array<unsigned long, N>& bits, const std::size_t max_bit) {
  std::set<std::uint16_t> out;
  for (std::size_t bit = 0; bit <= max_bit; ++bit) {
    if (test_bit(bits, bit)) {
      out.insert(static_cast<std::uint16_t>(bit));
    }
  }
  return out;
}

class EvdevDevice final : public InputDevice {
 public:
  EvdevDevice(std::string path, const int fd) : path_(std::move(path)), fd_(fd) {
    char name[256]{};
    if (ioctl(fd_, EVIOCGNAME(sizeof(name) - 1), name) >= 0) {
      name_ = name;
    } else {
      name_ = path_;
    }
  }

  ~EvdevDevice() override {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  EvdevDevice(const EvdevDevice&) = delete;
  EvdevDevice& operator=(const EvdevDevice&) = delete;

  const std::string& path() const override { return path_; }
  const std::string& name() const override { return name_; }

  std::optional<DeviceCapabilities> capabilities() const override {
    std::array<unsigned long, longs_for_bits(EV_MAX + 1)> type_bits{};
    if (ioctl(fd_, EVIOCGBIT(0, sizeof(type_bits)), type_bits.data()) < 0) {
      return std::nullopt;
    }

    DeviceCapabilities caps{};
    caps.event_types = collect_bits(type_bits, EV_MAX);
    if (!test_bit(type_bits, EV_KEY)) {
      return caps;
    }

    std::array<unsigned long, longs_for_bits(KEY_MAX + 1)> key_bits{};
    if (ioctl(fd_, EVIOCGBIT(EV_KEY, sizeof(key_bits)), key_bits.data()) < 0) {
      return std::nullopt;
    }
    caps.key_codes = collect_bits(key_bits, KEY_MAX);
    return caps;
  }

  std::optional<std::set<std::uint16_t>> active_keys() const override {
    std::array<unsigned long, longs_for_bits(KEY_MAX + 1)> key_state{};
    if (ioctl(fd_, EVIOCGKEY(sizeof(key_state)), key_state.data()) < 0) {
      return std::nullopt;
    }
    return collect_bits(key_state, KEY_MAX);
  }

  int native_handle() const override { return fd_; }

 private:
  std::string path_;
  std::string name_{};
  int fd_{-1};
};

class EvdevSubsystem final : public InputSubsystem {
 public:
  explicit EvdevSubsystem(std::string device_dir) : device_dir_(std::move(device_dir)) {}

  std::vector<std::string> list_devices() override {
    std::vector<std::string> paths;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(device_dir_, ec), end; !ec && it != end; it.increment(ec)) {
      const auto filename = it->path().filename().string();
      if (filename.rfind("event", 0) == 0) {
        paths.push_back(it->path().string());
      }
    }
    std::sort(paths.begin(), paths.end());
    return paths;
  }

  std::unique_ptr<InputDevice> open(const std::string& path, std::error_code& ec) override {
    const int fd = ::open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) {
      ec.assign(errno, std::system_category());
      return nullptr;
    }
    ec.clear();
    return std::make_unique<EvdevDevice>(path, fd);
  }

 private:
  std::string device_dir_;
};

}  // namespace

bool DeviceCapabilities::has_key(const std::uint16_t code) const {
  return event_types.count(EV_KEY) != 0 && key_codes.count(code) != 0;
}

std::unique_ptr<InputSubsystem> make_evdev_subsystem(std::string device_dir) {
  return std::make_unique<EvdevSubsystem>(std::move(device_dir));
}

}  // namespace obs_remote::input
