#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include "control/remote_control_client.hpp"
#include "core/actions.hpp"
#include "core/controller_state.hpp"
#include "process/process_control.hpp"

namespace obs_remote::core {

struct DispatcherOptions {
  std::string app_name{"obs"};
  std::string executable{"obs"};
  std::chrono::milliseconds toggle_cooldown{2000};
  std::vector<std::string> stripped_environment{};
};

class ActionDispatcher final : public Actions {
 public:
  ActionDispatcher(ControllerState& state, control::RemoteControlClient& client, process::ProcessInspector& inspector,
                   process::ProcessLauncher& launcher, DispatcherOptions options);

  void toggle_recording(RecordingCallback done) override;
  void toggle_application(std::chrono::steady_clock::time_point now, ApplicationCallback done) override;

 private:
  // Reports false when disconnected or when the query fails.
  void query_recording_active(std::function<void(bool)> done);
  ApplicationOutcome close_application(pid_t pid);
  ApplicationOutcome launch_application();

  ControllerState& state_;
  control::RemoteControlClient& client_;
  process::ProcessInspector& inspector_;
  process::ProcessLauncher& launcher_;
  DispatcherOptions options_;
};

}  // namespace obs_remote::core
