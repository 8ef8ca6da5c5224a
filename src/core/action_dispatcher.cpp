#include "core/action_dispatcher.hpp"

#include <iostream>
#include <utility>

namespace obs_remote::core {

const char* to_string(const RecordingOutcome outcome) noexcept {
  switch (outcome) {
    case RecordingOutcome::kToggled:
      return "toggled";
    case RecordingOutcome::kNotConnected:
      return "not_connected";
    case RecordingOutcome::kFailed:
      return "failed";
  }
  return "unknown";
}

const char* to_string(const ApplicationOutcome outcome) noexcept {
  switch (outcome) {
    case ApplicationOutcome::kCooldown:
      return "cooldown";
    case ApplicationOutcome::kRecordingActive:
      return "recording_active";
    case ApplicationOutcome::kClosed:
      return "closed";
    case ApplicationOutcome::kAlreadyClosed:
      return "already_closed";
    case ApplicationOutcome::kCloseFailed:
      return "close_failed";
    case ApplicationOutcome::kLaunched:
      return "launched";
    case ApplicationOutcome::kLaunchFailed:
      return "launch_failed";
  }
  return "unknown";
}

ActionDispatcher::ActionDispatcher(ControllerState& state, control::RemoteControlClient& client,
                                   process::ProcessInspector& inspector, process::ProcessLauncher& launcher,
                                   DispatcherOptions options)
    : state_(state), client_(client), inspector_(inspector), launcher_(launcher), options_(std::move(options)) {}

void ActionDispatcher::toggle_recording(RecordingCallback done) {
  if (!state_.connected) {
    done(RecordingOutcome::kNotConnected);
    return;
  }

  client_.async_call(control::kToggleRecord, nlohmann::json::object(),
                     [this, done = std::move(done)](const control::CallResponse& response) {
                       if (!response.ok) {
                         std::cerr << "[dispatcher] " << control::kToggleRecord << " failed: " << response.error
                                   << '\n';
                         state_.connected = false;
                         done(RecordingOutcome::kFailed);
                         return;
                       }
                       done(RecordingOutcome::kToggled);
                     });
}

void ActionDispatcher::toggle_application(const std::chrono::steady_clock::time_point now, ApplicationCallback done) {
  // Checked and stamped before any suspension, so overlapping requests collapse.
  if (state_.last_toggle_time.has_value() && now - *state_.last_toggle_time < options_.toggle_cooldown) {
    done(ApplicationOutcome::kCooldown);
    return;
  }
  state_.last_toggle_time = now;

  const auto pid = inspector_.find_running(options_.app_name);
  if (!pid.has_value()) {
    done(launch_application());
    return;
  }

  query_recording_active([this, target = *pid, done = std::move(done)](const bool recording) {
    if (recording) {
      std::cout << "Cannot close " << options_.app_name << ": Recording is active." << std::endl;
      done(ApplicationOutcome::kRecordingActive);
      return;
    }
    done(close_application(target));
  });
}

void ActionDispatcher::query_recording_active(std::function<void(bool)> done) {
  if (!state_.connected) {
    done(false);
    return;
  }

  client_.async_call(control::kGetRecordStatus, nlohmann::json::object(),
                     [this, done = std::move(done)](const control::CallResponse& response) {
                       if (!response.ok) {
                         std::cerr << "[dispatcher] " << control::kGetRecordStatus << " failed: " << response.error
                                   << '\n';
                         state_.connected = false;
                         done(false);
                         return;
                       }
                       const auto active = response.data.find("outputActive");
                       done(active != response.data.end() && active->is_boolean() && active->get<bool>());
                     });
}

ApplicationOutcome ActionDispatcher::close_application(const pid_t pid) {
  std::cout << "Closing " << options_.app_name << " (PID " << pid << ") gracefully..." << std::endl;
  const auto result = inspector_.send_terminate_signal(pid);
  state_.connected = false;

  switch (result) {
    case process::SignalResult::kSignalled:
      return ApplicationOutcome::kClosed;
    case process::SignalResult::kNotFound:
      return ApplicationOutcome::kAlreadyClosed;
    case process::SignalResult::kFailed:
      break;
  }
  std::cerr << "[dispatcher] unable to signal PID " << pid << '\n';
  return ApplicationOutcome::kCloseFailed;
}

ApplicationOutcome ActionDispatcher::launch_application() {
  std::cout << "Launching " << options_.app_name << "..." << std::endl;

  const auto environment = process::sanitized_environment(process::current_environment(),
                                                           options_.stripped_environment);
  const auto ec = launcher_.spawn(options_.executable, environment);
  if (ec) {
    if (ec == std::errc::no_such_file_or_directory) {
      std::cout << "Error: Command '" << options_.executable << "' not found." << std::endl;
    } else {
      std::cerr << "[dispatcher] failed to launch " << options_.executable << ": " << ec.message() << '\n';
    }
    return ApplicationOutcome::kLaunchFailed;
  }

  state_.connected = false;
  return ApplicationOutcome::kLaunched;
}

}  // namespace obs_remote::core
