#pragma once

#include <chrono>
#include <functional>

namespace obs_remote::core {

enum class RecordingOutcome {
  kToggled,
  kNotConnected,
  kFailed,
};

enum class ApplicationOutcome {
  kCooldown,
  kRecordingActive,
  kClosed,
  kAlreadyClosed,
  kCloseFailed,
  kLaunched,
  kLaunchFailed,
};

const char* to_string(RecordingOutcome outcome) noexcept;
const char* to_string(ApplicationOutcome outcome) noexcept;

using RecordingCallback = std::function<void(RecordingOutcome)>;
using ApplicationCallback = std::function<void(ApplicationOutcome)>;

// The two things a press can ask for. Both must be safe to call spuriously, and
// report their outcome once, possibly after the event loop has moved on.
class Actions {
 public:
  virtual void toggle_recording(RecordingCallback done) = 0;
  virtual void toggle_application(std::chrono::steady_clock::time_point now, ApplicationCallback done) = 0;
  virtual ~Actions() = default;
};

}  // namespace obs_remote::core
