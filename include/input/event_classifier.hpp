#pragma once

#include <linux/input.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/system/error_code.hpp>

#include "core/actions.hpp"
#include "core/controller_state.hpp"
#include "input/input_device.hpp"
#include "input/press_classifier.hpp"

namespace obs_remote::input {

// Reads one device's event stream and turns trigger presses into actions. Kept
// alive by its own pending handlers; removes its MonitoredDevice entry on exit.
class EventClassifier : public std::enable_shared_from_this<EventClassifier> {
 public:
  EventClassifier(boost::asio::io_context& io, std::unique_ptr<InputDevice> device, std::uint16_t trigger_code,
                  std::chrono::milliseconds long_press_threshold, core::ControllerState& state,
                  core::Actions& actions);
  ~EventClassifier();

  EventClassifier(const EventClassifier&) = delete;
  EventClassifier& operator=(const EventClassifier&) = delete;

  bool start();

  [[nodiscard]] const std::string& path() const noexcept;
  [[nodiscard]] const std::string& name() const noexcept;
  [[nodiscard]] bool running() const noexcept;

 private:
  void read_events();
  void on_read(const boost::system::error_code& ec, std::size_t bytes_read);
  void handle_event(const input_event& event);
  void schedule_long_press_check(std::uint64_t generation);
  void check_long_press(std::uint64_t generation);
  void stop(const std::string& reason);

  boost::asio::io_context& io_;
  std::unique_ptr<InputDevice> device_;
  std::string path_;
  std::string name_;
  std::uint16_t trigger_code_;
  core::ControllerState& state_;
  core::Actions& actions_;
  PressClassifier press_;
  boost::asio::posix::stream_descriptor descriptor_;
  std::vector<unsigned char> read_chunk_;
  std::vector<unsigned char> pending_;
  bool running_{false};
  // The watcher registers the entry before constructing; cleared once erased.
  bool registered_{true};
};

}  // namespace obs_remote::input
