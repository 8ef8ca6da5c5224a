#pragma once

#include <chrono>
#include <cstdint>

namespace obs_remote::input {

enum class PressAction {
  kNone,
  kShortPress,
  kLongPress,
};

// Per-device press window bookkeeping. Timing comes from the caller, so the
// classification is independent of how long-press checks get scheduled.
class PressClassifier {
 public:
  using Clock = std::chrono::steady_clock;

  explicit PressClassifier(Clock::duration threshold);

  // Opens a new press window, superseding any previous one. Returns its generation.
  std::uint64_t key_down(Clock::time_point now) noexcept;

  PressAction key_up(Clock::time_point now) noexcept;

  // Result of the scheduled check for the window opened by `generation`.
  PressAction long_press_check(std::uint64_t generation, bool key_held) noexcept;

  [[nodiscard]] bool pressed() const noexcept;
  [[nodiscard]] bool long_press_fired() const noexcept;
  [[nodiscard]] Clock::duration threshold() const noexcept;

 private:
  Clock::duration threshold_;
  Clock::time_point start_time_{};
  std::uint64_t generation_{0};
  bool pressed_{false};
  bool long_press_fired_{false};
};

}  // namespace obs_remote::input
