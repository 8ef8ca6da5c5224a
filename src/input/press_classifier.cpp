#include "input/press_classifier.hpp"

namespace obs_remote::input {

PressClassifier::PressClassifier(const Clock::duration threshold) : threshold_(threshold) {}

std::uint64_t PressClassifier::key_down(const Clock::time_point now) noexcept {
  start_time_ = now;
  long_press_fired_ = false;
  pressed_ = true;
  return ++generation_;
}

PressAction PressClassifier::key_up(const Clock::time_point now) noexcept {
  if (!pressed_) {
    return PressAction::kNone;
  }
  pressed_ = false;

  if (long_press_fired_) {
    return PressAction::kNone;
  }
  if (now - start_time_ < threshold_) {
    return PressAction::kShortPress;
  }
  return PressAction::kNone;
}

PressAction PressClassifier::long_press_check(const std::uint64_t generation, const bool key_held) noexcept {
  if (generation != generation_ || !pressed_ || long_press_fired_ || !key_held) {
    return PressAction::kNone;
  }
  long_press_fired_ = true;
  return PressAction::kLongPress;
}

bool PressClassifier::pressed() const noexcept { return pressed_; }

bool PressClassifier::long_press_fired() const noexcept { return long_press_fired_; }

PressClassifier::Clock::duration PressClassifier::threshold() const noexcept { return threshold_; }

}  // namespace obs_remote::input
