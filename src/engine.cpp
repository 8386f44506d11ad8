#include "sdrboost/engine.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace sdrboost {

namespace {

constexpr double CHANGE_EPSILON = 0.001;
// Stored values are rounded to 2 decimals, so a grid point can be off by up
// to half a hundredth of the range. Expressed in percent.
constexpr double GRID_TOLERANCE_PCT =
    (0.005 + 1e-9) / (MAX_BRIGHTNESS - MIN_BRIGHTNESS) * 100.0;

std::string describe(double value) {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(2) << value << " ("
     << std::setprecision(0) << brightness_to_percent(value) << "%)";
  return ss.str();
}

}  // namespace

const char* to_string(EngineState state) {
  switch (state) {
    case EngineState::Uninitialized:
      return "uninitialized";
    case EngineState::Ready:
      return "ready";
    case EngineState::Faulted:
      return "faulted";
  }
  return "unknown";
}

const char* to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InitializationFailure:
      return "initialization failure";
    case ErrorKind::ConfigIOFailure:
      return "config I/O failure";
    case ErrorKind::ValidationFailure:
      return "validation failure";
    case ErrorKind::PlatformApplyFailure:
      return "platform apply failure";
  }
  return "unknown error";
}

std::optional<Action> match_action(const Settings& settings,
                                   ModifierCombo combo, Key key) {
  HotkeyBinding pressed{combo, key};
  if (pressed == settings.increase) return Action::Increase;
  if (pressed == settings.decrease) return Action::Decrease;
  if (pressed == settings.custom) return Action::Custom;
  return std::nullopt;
}

double step_brightness(double current, double step_size, int direction) {
  double step_pct = step_size * 100.0;
  double steps = brightness_to_percent(current) / step_pct;
  double nearest = std::round(steps);
  if (std::fabs(steps - nearest) * step_pct <= GRID_TOLERANCE_PCT) {
    steps = nearest;
  }

  double new_pct;
  if (direction > 0) {
    new_pct = std::min(100.0, std::ceil(steps) * step_pct + step_pct);
  } else {
    new_pct = std::max(0.0, std::floor(steps) * step_pct - step_pct);
  }
  return normalize_brightness(percent_to_brightness(new_pct));
}

int display_percent(double value, double step_size, bool exact) {
  double pct = brightness_to_percent(value);
  if (!exact && step_size > 0.0) {
    double step_pct = step_size * 100.0;
    pct = std::round(pct / step_pct) * step_pct;
  }
  return static_cast<int>(std::lround(std::clamp(pct, 0.0, 100.0)));
}

BrightnessEngine::BrightnessEngine(ConfigStore& config, BrightnessPort& port,
                                   BrightnessObserver& observer, bool verbose)
    : config_(config),
      port_(port),
      observer_(observer),
      verbose_(verbose),
      value_(config.settings().current_brightness) {}

void BrightnessEngine::mark_ready() {
  value_ = normalize_brightness(config_.settings().current_brightness);
  state_ = EngineState::Ready;
  if (verbose_) {
    std::cout << "engine: ready at " << describe(value_) << "\n";
  }
}

void BrightnessEngine::mark_faulted(const std::string& reason) {
  state_ = EngineState::Faulted;
  fault_reason_ = reason;
  observer_.on_error(ErrorKind::InitializationFailure, reason);
}

bool BrightnessEngine::increase() {
  return step(+1);
}

bool BrightnessEngine::decrease() {
  return step(-1);
}

bool BrightnessEngine::step(int direction) {
  if (state_ != EngineState::Ready) {
    return false;
  }

  double live = port_.get_current(value_);
  double target =
      step_brightness(live, config_.settings().step_size, direction);
  last_was_custom_ = false;

  if (verbose_) {
    std::cout << "engine: " << (direction > 0 ? "increase" : "decrease")
              << " " << describe(live) << " -> " << describe(target) << "\n";
  }

  value_ = normalize_brightness(live);
  return commit(live, target);
}

bool BrightnessEngine::apply_custom() {
  if (state_ != EngineState::Ready) {
    return false;
  }

  double live = port_.get_current(value_);
  double target = normalize_brightness(config_.settings().custom_brightness);
  last_was_custom_ = true;

  if (verbose_) {
    std::cout << "engine: custom " << describe(live) << " -> "
              << describe(target) << "\n";
  }

  value_ = normalize_brightness(live);
  return commit(live, target);
}

bool BrightnessEngine::handle_hotkey(ModifierCombo combo, Key key) {
  if (state_ != EngineState::Ready) {
    return false;
  }

  auto action = match_action(config_.settings(), combo, key);
  if (!action) {
    return false;
  }

  switch (*action) {
    case Action::Increase:
      return increase();
    case Action::Decrease:
      return decrease();
    case Action::Custom:
      return apply_custom();
  }
  return false;
}

bool BrightnessEngine::commit(double old_value, double new_value) {
  if (std::fabs(new_value - old_value) <= CHANGE_EPSILON) {
    return false;
  }

  // The logical value moves first and stays put if the display call fails.
  value_ = new_value;
  config_.set_current_brightness(value_);

  if (!port_.apply(value_)) {
    observer_.on_error(ErrorKind::PlatformApplyFailure,
                       "Failed to set brightness to " + describe(value_));
    return false;
  }

  observer_.on_brightness_changed(value_, last_was_custom_);

  if (!config_.save()) {
    observer_.on_error(ErrorKind::ConfigIOFailure,
                       config_.last_io_error().value_or("Failed to save"));
  }
  return true;
}

bool BrightnessEngine::restore() {
  if (state_ != EngineState::Ready) {
    return false;
  }

  if (!port_.apply(value_)) {
    observer_.on_error(ErrorKind::PlatformApplyFailure,
                       "Failed to restore brightness " + describe(value_));
    return false;
  }
  observer_.on_brightness_changed(value_, last_was_custom_);
  return true;
}

void BrightnessEngine::set_current(double value) {
  value_ = normalize_brightness(value);
}

int BrightnessEngine::display_percent() const {
  return sdrboost::display_percent(value_, config_.settings().step_size,
                                   last_was_custom_);
}

}  // namespace sdrboost
