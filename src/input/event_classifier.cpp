#include "input/event_classifier.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>
#include <utility>

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/steady_timer.hpp>

namespace obs_remote::input {
namespace {

constexpr std::size_t kEventsPerRead = 64;

constexpr int kKeyUp = 0;
constexpr int kKeyDown = 1;

}  // namespace

EventClassifier::EventClassifier(boost::asio::io_context& io, std::unique_ptr<InputDevice> device,
                                 const std::uint16_t trigger_code, const std::chrono::milliseconds long_press_threshold,
                                 core::ControllerState& state, core::Actions& actions)
    : io_(io),
      device_(std::move(device)),
      path_(device_->path()),
      name_(device_->name()),
      trigger_code_(trigger_code),
      state_(state),
      actions_(actions),
      press_(long_press_threshold),
      descriptor_(io),
      read_chunk_(kEventsPerRead * sizeof(input_event)) {}

EventClassifier::~EventClassifier() {
  if (registered_) {
    state_.devices.erase(path_);
  }
}

bool EventClassifier::start() {
  // The launcher forks; a device handle must not survive into the launched application.
  const int fd = ::fcntl(device_->native_handle(), F_DUPFD_CLOEXEC, 0);
  if (fd < 0) {
    std::cerr << "[classifier] " << name_ << ": unable to duplicate handle: " << std::strerror(errno) << '\n';
    stop("start failed");
    return false;
  }

  boost::system::error_code ec;
  descriptor_.assign(fd, ec);
  if (ec) {
    ::close(fd);
    std::cerr << "[classifier] " << name_ << ": unable to watch handle: " << ec.message() << '\n';
    stop("start failed");
    return false;
  }

  running_ = true;
  read_events();
  return true;
}

const std::string& EventClassifier::path() const noexcept { return path_; }

const std::string& EventClassifier::name() const noexcept { return name_; }

bool EventClassifier::running() const noexcept { return running_; }

void EventClassifier::read_events() {
  descriptor_.async_read_some(boost::asio::buffer(read_chunk_),
                              [self = shared_from_this()](const boost::system::error_code& ec,
                                                          const std::size_t bytes_read) {
                                self->on_read(ec, bytes_read);
                              });
}

void EventClassifier::on_read(const boost::system::error_code& ec, const std::size_t bytes_read) {
  if (ec) {
    stop(ec == boost::asio::error::eof ? "end of stream" : ec.message());
    return;
  }

  pending_.insert(pending_.end(), read_chunk_.begin(), read_chunk_.begin() + static_cast<std::ptrdiff_t>(bytes_read));

  std::size_t offset = 0;
  while (pending_.size() - offset >= sizeof(input_event)) {
    input_event event{};
    std::memcpy(&event, pending_.data() + offset, sizeof(event));
    offset += sizeof(event);
    handle_event(event);
  }
  pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(offset));

  if (running_) {
    read_events();
  }
}

void EventClassifier::handle_event(const input_event& event) {
  if (event.type != EV_KEY || event.code != trigger_code_) {
    return;
  }

  const auto now = PressClassifier::Clock::now();
  if (event.value == kKeyDown) {
    schedule_long_press_check(press_.key_down(now));
    return;
  }

  // Auto-repeat (value 2) is not a new press.
  if (event.value != kKeyUp) {
    return;
  }

  if (press_.key_up(now) != PressAction::kShortPress || !state_.connected) {
    return;
  }

  std::cout << "[" << name_ << "] Toggle Recording." << std::endl;
  actions_.toggle_recording([name = name_](const core::RecordingOutcome outcome) {
    if (outcome != core::RecordingOutcome::kToggled) {
      std::cerr << "[classifier] " << name << ": recording toggle dropped (" << core::to_string(outcome) << ")\n";
    }
  });
}

void EventClassifier::schedule_long_press_check(const std::uint64_t generation) {
  auto timer = std::make_shared<boost::asio::steady_timer>(io_, press_.threshold());
  timer->async_wait([self = shared_from_this(), timer, generation](const boost::system::error_code& ec) {
    if (ec) {
      return;
    }
    self->check_long_press(generation);
  });
}

void EventClassifier::check_long_press(const std::uint64_t generation) {
  if (!running_) {
    return;
  }

  // Sample the hardware, not the event stream: a key-up may still be queued unread.
  const auto keys = device_->active_keys();
  const bool held = keys.has_value() && keys->count(trigger_code_) != 0;
  if (press_.long_press_check(generation, held) != PressAction::kLongPress) {
    return;
  }

  std::cout << "Hold detected: Toggling OBS Application." << std::endl;
  // Cooldown drops are silent; every other outcome reports itself.
  actions_.toggle_application(PressClassifier::Clock::now(), [](core::ApplicationOutcome) {});
}

void EventClassifier::stop(const std::string& reason) {
  const bool was_running = running_;
  running_ = false;

  boost::system::error_code close_ec;
  descriptor_.close(close_ec);

  if (registered_) {
    state_.devices.erase(path_);
    registered_ = false;
  }

  if (was_running) {
    std::cerr << "[classifier] " << name_ << " (" << path_ << ") stopped: " << reason << '\n';
  }
}

}  // namespace obs_remote::input
