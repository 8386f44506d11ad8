#pragma once

#include <optional>
#include <string>

#include "brightness.hpp"
#include "config.hpp"
#include "hotkey.hpp"

namespace sdrboost {

enum class EngineState { Uninitialized, Ready, Faulted };

enum class ErrorKind {
  InitializationFailure,
  ConfigIOFailure,
  ValidationFailure,
  PlatformApplyFailure,
};

const char* to_string(EngineState state);
const char* to_string(ErrorKind kind);

// Implemented by whatever presents brightness to the user (tray, console).
class BrightnessObserver {
 public:
  virtual ~BrightnessObserver() = default;

  virtual void on_brightness_changed(double value, bool exact) = 0;
  virtual void on_error(ErrorKind kind, const std::string& message) = 0;
};

enum class Action { Increase, Decrease, Custom };

// First match wins: increase, then decrease, then custom.
std::optional<Action> match_action(const Settings& settings,
                                   ModifierCombo combo, Key key);

// Next step above (direction > 0) or below the given brightness.
double step_brightness(double current, double step_size, int direction);

// Percentage shown to the user; snapped to the step grid unless exact.
int display_percent(double value, double step_size, bool exact);

class BrightnessEngine {
 public:
  BrightnessEngine(ConfigStore& config, BrightnessPort& port,
                   BrightnessObserver& observer, bool verbose = false);

  BrightnessEngine(const BrightnessEngine&) = delete;
  BrightnessEngine& operator=(const BrightnessEngine&) = delete;

  void mark_ready();
  void mark_faulted(const std::string& reason);
  EngineState state() const { return state_; }
  const std::string& fault_reason() const { return fault_reason_; }

  // Each returns true when the brightness changed.
  bool increase();
  bool decrease();
  bool apply_custom();
  bool handle_hotkey(ModifierCombo combo, Key key);

  // Pushes the current value to the display without stepping.
  bool restore();
  // Takes a brightness from an accepted settings edit.
  void set_current(double value);

  double value() const { return value_; }
  bool last_was_custom() const { return last_was_custom_; }
  int display_percent() const;

 private:
  bool step(int direction);
  bool commit(double old_value, double new_value);

  ConfigStore& config_;
  BrightnessPort& port_;
  BrightnessObserver& observer_;
  bool verbose_;
  EngineState state_ = EngineState::Uninitialized;
  std::string fault_reason_;
  double value_;
  bool last_was_custom_ = false;
};

}  // namespace sdrboost
