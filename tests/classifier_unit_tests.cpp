#include <fcntl.h>
#include <linux/input.h>

#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>

#include <boost/asio/io_context.hpp>

#include "core/controller_state.hpp"
#include "fakes.hpp"
#include "input/device_watcher.hpp"
#include "input/event_classifier.hpp"
#include "input/press_classifier.hpp"

using obs_remote::core::ControllerState;
using obs_remote::input::DeviceWatcher;
using obs_remote::input::EventClassifier;
using obs_remote::input::PressAction;
using obs_remote::input::PressClassifier;
using obs_remote::input::WatcherOptions;
using obs_remote::testing::CountingActions;
using obs_remote::testing::FakeInputDevice;
using obs_remote::testing::FakeInputSubsystem;
using obs_remote::testing::FakeKeyboard;
using obs_remote::testing::Script;
using obs_remote::testing::fail;
using obs_remote::testing::key_caps;

using namespace std::chrono_literals;

namespace {

constexpr std::uint16_t kTrigger = KEY_ENTER;

struct ClassifierRun {
  std::size_t recording_toggles{0};
  std::size_t application_toggles{0};
};

// Feeds one scripted press through a real EventClassifier reading from a pipe.
ClassifierRun run_press(const std::chrono::milliseconds threshold, const std::chrono::milliseconds hold,
                        const bool connected) {
  ControllerState state{};
  state.connected = connected;
  CountingActions actions;
  boost::asio::io_context io;

  auto keyboard = std::make_shared<FakeKeyboard>();
  auto device = std::make_unique<FakeInputDevice>("/dev/input/event7", "Test Pedal", key_caps({kTrigger}), keyboard,
                                                  nullptr);
  state.devices["/dev/input/event7"] = obs_remote::core::MonitoredDevice{"/dev/input/event7", "Test Pedal", {}};

  {
    auto classifier = std::make_shared<EventClassifier>(io, std::move(device), kTrigger, threshold, state, actions);
    if (!classifier->start()) {
      return {};
    }
  }

  Script script(io);
  script.at(10ms, [&keyboard]() { keyboard->press(kTrigger); });
  script.at(10ms + hold, [&keyboard]() { keyboard->release(kTrigger); });
  io.run_for(10ms + hold + threshold + 150ms);

  return ClassifierRun{actions.recording_toggles, actions.application_toggles};
}

int test_press_classifier_short_press_boundary() {
  const auto t0 = PressClassifier::Clock::time_point{} + 10s;
  PressClassifier press(1s);

  press.key_down(t0);
  if (press.key_up(t0 + 999ms) != PressAction::kShortPress) {
    return fail("test_press_classifier_short_press_boundary", "999ms release should be a short press");
  }

  press.key_down(t0 + 2s);
  if (press.key_up(t0 + 3s) != PressAction::kNone) {
    return fail("test_press_classifier_short_press_boundary", "release at exactly the threshold is not short");
  }

  if (press.key_up(t0 + 4s) != PressAction::kNone) {
    return fail("test_press_classifier_short_press_boundary", "key-up while idle must be ignored");
  }

  return 0;
}

int test_press_classifier_long_press_suppresses_key_up() {
  const auto t0 = PressClassifier::Clock::time_point{} + 10s;
  PressClassifier press(1s);

  const auto generation = press.key_down(t0);
  if (press.long_press_check(generation, true) != PressAction::kLongPress) {
    return fail("test_press_classifier_long_press_suppresses_key_up", "held key should fire a long press");
  }
  if (!press.long_press_fired()) {
    return fail("test_press_classifier_long_press_suppresses_key_up", "long press flag should be set");
  }
  if (press.long_press_check(generation, true) != PressAction::kNone) {
    return fail("test_press_classifier_long_press_suppresses_key_up", "long press must fire once per window");
  }
  if (press.key_up(t0 + 200ms) != PressAction::kNone) {
    return fail("test_press_classifier_long_press_suppresses_key_up", "key-up after long press must be a no-op");
  }
  if (press.pressed()) {
    return fail("test_press_classifier_long_press_suppresses_key_up", "key-up should return to idle");
  }

  return 0;
}

int test_press_classifier_released_key_and_stale_checks() {
  const auto t0 = PressClassifier::Clock::time_point{} + 10s;
  PressClassifier press(1s);

  const auto first = press.key_down(t0);
  if (press.long_press_check(first, false) != PressAction::kNone) {
    return fail("test_press_classifier_released_key_and_stale_checks", "released key must not fire");
  }

  (void)press.key_up(t0 + 100ms);
  const auto second = press.key_down(t0 + 500ms);
  if (press.long_press_check(first, true) != PressAction::kNone) {
    return fail("test_press_classifier_released_key_and_stale_checks", "superseded check must not fire");
  }
  if (press.long_press_check(second, true) != PressAction::kLongPress) {
    return fail("test_press_classifier_released_key_and_stale_checks", "current check should fire");
  }

  return 0;
}

int test_short_presses_toggle_recording_once() {
  for (const auto hold : {5ms, 40ms, 120ms}) {
    const auto run = run_press(250ms, hold, true);
    if (run.recording_toggles != 1) {
      return fail("test_short_presses_toggle_recording_once", "short press should toggle recording exactly once");
    }
    if (run.application_toggles != 0) {
      return fail("test_short_presses_toggle_recording_once", "short press must not toggle the application");
    }
  }
  return 0;
}

int test_short_press_dropped_while_disconnected() {
  const auto run = run_press(250ms, 40ms, false);
  if (run.recording_toggles != 0 || run.application_toggles != 0) {
    return fail("test_short_press_dropped_while_disconnected", "disconnected short press must produce no actions");
  }
  return 0;
}

int test_long_press_toggles_application_once() {
  const auto run = run_press(100ms, 300ms, true);
  if (run.application_toggles != 1) {
    return fail("test_long_press_toggles_application_once", "held key should toggle the application once");
  }
  if (run.recording_toggles != 0) {
    return fail("test_long_press_toggles_application_once", "key-up after a long press must be a no-op");
  }
  return 0;
}

int test_long_press_check_skipped_when_key_state_unreadable() {
  ControllerState state{};
  state.connected = true;
  CountingActions actions;
  boost::asio::io_context io;

  auto keyboard = std::make_shared<FakeKeyboard>();
  keyboard->fail_active_keys = true;
  {
    auto classifier = std::make_shared<EventClassifier>(
        io, std::make_unique<FakeInputDevice>("/dev/input/event3", "Pedal", key_caps({kTrigger}), keyboard, nullptr),
        kTrigger, 80ms, state, actions);
    if (!classifier->start()) {
      return fail("test_long_press_check_skipped_when_key_state_unreadable", "classifier failed to start");
    }
  }

  Script script(io);
  script.at(5ms, [&keyboard]() { keyboard->press(kTrigger); });
  io.run_for(250ms);

  if (actions.application_toggles != 0 || actions.recording_toggles != 0) {
    return fail("test_long_press_check_skipped_when_key_state_unreadable", "unreadable key state must be a no-op");
  }
  return 0;
}

int test_classifier_handle_closed_on_exec() {
  namespace fs = std::filesystem;

  ControllerState state{};
  CountingActions actions;
  boost::asio::io_context io;

  auto keyboard = std::make_shared<FakeKeyboard>();
  auto classifier = std::make_shared<EventClassifier>(
      io, std::make_unique<FakeInputDevice>("/dev/input/event8", "Pedal", key_caps({kTrigger}), keyboard, nullptr),
      kTrigger, 200ms, state, actions);
  if (!classifier->start()) {
    return fail("test_classifier_handle_closed_on_exec", "classifier failed to start");
  }

  // Every descriptor naming the same pipe, other than the original, belongs to the classifier.
  std::error_code ec;
  const auto pipe = fs::read_symlink("/proc/self/fd/" + std::to_string(keyboard->read_fd()), ec);
  if (ec) {
    return fail("test_classifier_handle_closed_on_exec", "unable to resolve the device handle");
  }

  std::size_t duplicates = 0;
  for (const auto& entry : fs::directory_iterator("/proc/self/fd", ec)) {
    const std::string name = entry.path().filename().string();
    const int fd = std::stoi(name);
    std::error_code link_ec;
    if (fd == keyboard->read_fd() || fs::read_symlink(entry.path(), link_ec) != pipe || link_ec) {
      continue;
    }
    ++duplicates;
    const int flags = ::fcntl(fd, F_GETFD);
    if (flags < 0 || (flags & FD_CLOEXEC) == 0) {
      return fail("test_classifier_handle_closed_on_exec", "duplicated device handle must be close-on-exec");
    }
  }
  if (ec || duplicates != 1) {
    return fail("test_classifier_handle_closed_on_exec", "classifier should hold exactly one copy of the handle");
  }
  return 0;
}

int test_other_keys_and_autorepeat_ignored() {
  ControllerState state{};
  state.connected = true;
  CountingActions actions;
  boost::asio::io_context io;

  auto keyboard = std::make_shared<FakeKeyboard>();
  {
    auto classifier = std::make_shared<EventClassifier>(
        io, std::make_unique<FakeInputDevice>("/dev/input/event4", "Keyboard", key_caps({kTrigger, KEY_A}), keyboard,
                                              nullptr),
        kTrigger, 200ms, state, actions);
    if (!classifier->start()) {
      return fail("test_other_keys_and_autorepeat_ignored", "classifier failed to start");
    }
  }

  Script script(io);
  script.at(5ms, [&keyboard]() {
    keyboard->press(KEY_A);
    keyboard->release(KEY_A);
    keyboard->press(kTrigger);
    keyboard->emit(EV_KEY, kTrigger, 2);
    keyboard->emit(EV_KEY, kTrigger, 2);
  });
  script.at(30ms, [&keyboard]() { keyboard->release(kTrigger); });
  io.run_for(350ms);

  if (actions.recording_toggles != 1) {
    return fail("test_other_keys_and_autorepeat_ignored", "auto-repeat must not restart the press window");
  }
  if (actions.application_toggles != 0) {
    return fail("test_other_keys_and_autorepeat_ignored", "other keys must not produce actions");
  }
  return 0;
}

int test_classifier_deregisters_on_stream_end() {
  ControllerState state{};
  CountingActions actions;
  FakeInputSubsystem subsystem;
  boost::asio::io_context io;
  auto& pedal = subsystem.add("/dev/input/event5", "Foot Pedal", key_caps({kTrigger}));

  WatcherOptions options{};
  options.trigger_code = kTrigger;
  DeviceWatcher watcher(io, subsystem, state, actions, options);

  if (watcher.scan() != 1 || state.devices.count("/dev/input/event5") != 1) {
    return fail("test_classifier_deregisters_on_stream_end", "eligible device should be monitored");
  }

  pedal.keyboard->close_writer();
  io.run_for(100ms);

  if (!state.devices.empty()) {
    return fail("test_classifier_deregisters_on_stream_end", "classifier must remove its entry when the stream ends");
  }
  if (*pedal.closed != 1) {
    return fail("test_classifier_deregisters_on_stream_end", "device handle should be released with the classifier");
  }

  pedal.keyboard = std::make_shared<FakeKeyboard>();
  if (watcher.scan() != 1 || pedal.opens != 2) {
    return fail("test_classifier_deregisters_on_stream_end", "returning device should be rediscovered");
  }

  return 0;
}

int test_watcher_assigns_one_classifier_per_eligible_device() {
  ControllerState state{};
  CountingActions actions;
  FakeInputSubsystem subsystem;
  boost::asio::io_context io;
  auto& pedal = subsystem.add("/dev/input/event1", "Foot Pedal", key_caps({kTrigger}));
  auto& mouse = subsystem.add("/dev/input/event2", "Mouse", key_caps({BTN_LEFT, BTN_RIGHT}));
  auto& locked = subsystem.add("/dev/input/event9", "Locked Keyboard", key_caps({kTrigger}));
  locked.fail_open = true;

  WatcherOptions options{};
  options.trigger_code = kTrigger;
  DeviceWatcher watcher(io, subsystem, state, actions, options);

  for (int i = 0; i < 3; ++i) {
    watcher.scan();
    io.poll();
  }

  if (pedal.opens != 1 || state.devices.count("/dev/input/event1") != 1) {
    return fail("test_watcher_assigns_one_classifier_per_eligible_device", "eligible device should get exactly one classifier");
  }
  const auto task = state.devices.at("/dev/input/event1").task.lock();
  if (task == nullptr || !task->running() || task->name() != "Foot Pedal") {
    return fail("test_watcher_assigns_one_classifier_per_eligible_device", "registered classifier should be running");
  }

  if (state.devices.count("/dev/input/event2") != 0) {
    return fail("test_watcher_assigns_one_classifier_per_eligible_device", "device without trigger code must be skipped");
  }
  if (mouse.opens != 3 || *mouse.closed != 3) {
    return fail("test_watcher_assigns_one_classifier_per_eligible_device", "rejected device handle must be released each scan");
  }

  if (state.devices.count("/dev/input/event9") != 0) {
    return fail("test_watcher_assigns_one_classifier_per_eligible_device", "unopenable device must be skipped");
  }
  locked.fail_open = false;
  if (watcher.scan() != 1 || state.devices.count("/dev/input/event9") != 1) {
    return fail("test_watcher_assigns_one_classifier_per_eligible_device", "unopenable device should be retried next scan");
  }

  return 0;
}

int test_watcher_rescans_on_interval() {
  ControllerState state{};
  CountingActions actions;
  FakeInputSubsystem subsystem;
  boost::asio::io_context io;
  subsystem.add("/dev/input/event1", "Foot Pedal", key_caps({kTrigger}));

  WatcherOptions options{};
  options.trigger_code = kTrigger;
  options.scan_interval = 20ms;
  DeviceWatcher watcher(io, subsystem, state, actions, options);
  watcher.start();

  Script script(io);
  script.at(50ms, [&subsystem]() { subsystem.add("/dev/input/event6", "Hotplugged Pedal", key_caps({kTrigger})); });
  io.run_for(150ms);

  if (state.devices.size() != 2) {
    return fail("test_watcher_rescans_on_interval", "hot-plugged device should be picked up by a later scan");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_press_classifier_short_press_boundary(); rc != 0) {
    return rc;
  }
  if (int rc = test_press_classifier_long_press_suppresses_key_up(); rc != 0) {
    return rc;
  }
  if (int rc = test_press_classifier_released_key_and_stale_checks(); rc != 0) {
    return rc;
  }
  if (int rc = test_short_presses_toggle_recording_once(); rc != 0) {
    return rc;
  }
  if (int rc = test_short_press_dropped_while_disconnected(); rc != 0) {
    return rc;
  }
  if (int rc = test_long_press_toggles_application_once(); rc != 0) {
    return rc;
  }
  if (int rc = test_long_press_check_skipped_when_key_state_unreadable(); rc != 0) {
    return rc;
  }
  if (int rc = test_classifier_handle_closed_on_exec(); rc != 0) {
    return rc;
  }
  if (int rc = test_other_keys_and_autorepeat_ignored(); rc != 0) {
    return rc;
  }
  if (int rc = test_classifier_deregisters_on_stream_end(); rc != 0) {
    return rc;
  }
  if (int rc = test_watcher_assigns_one_classifier_per_eligible_device(); rc != 0) {
    return rc;
  }
  if (int rc = test_watcher_rescans_on_interval(); rc != 0) {
    return rc;
  }

  std::cout << "[PASS] classifier unit tests\n";
  return 0;
}
