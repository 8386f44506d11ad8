#include "sdrboost/brightness.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>

#include "sdrboost/platform.hpp"

namespace sdrboost {

double normalize_brightness(double value) {
  if (!std::isfinite(value)) {
    return DEFAULT_BRIGHTNESS;
  }
  double clamped = std::clamp(value, MIN_BRIGHTNESS, MAX_BRIGHTNESS);
  return std::round(clamped * 100.0) / 100.0;
}

double brightness_to_percent(double value) {
  return (value - MIN_BRIGHTNESS) / (MAX_BRIGHTNESS - MIN_BRIGHTNESS) * 100.0;
}

double percent_to_brightness(double percent) {
  return MIN_BRIGHTNESS + percent / 100.0 * (MAX_BRIGHTNESS - MIN_BRIGHTNESS);
}

BrightnessPort::BrightnessPort(bool verbose) : verbose_(verbose) {}

bool BrightnessPort::initialize(std::string& error) {
  auto api = open_boost_api(error);
  if (!api) {
    return false;
  }
  attach(std::move(api));
  return true;
}

void BrightnessPort::attach(std::unique_ptr<BoostApi> api) {
  api_ = std::move(api);
}

double BrightnessPort::get_current(double last_known) {
  if (!api_) {
    return last_known;
  }

  std::optional<double> live;
  try {
    live = api_->get_boost();
  } catch (const std::exception& e) {
    if (verbose_) {
      std::cerr << "port: boost query threw: " << e.what() << "\n";
    }
  }

  if (!live || !std::isfinite(*live)) {
    if (verbose_) {
      std::cout << "port: boost query failed, using " << last_known << "\n";
    }
    return last_known;
  }
  return *live;
}

bool BrightnessPort::apply(double value) {
  if (!api_) {
    return false;
  }

  try {
    return api_->set_boost(std::clamp(value, MIN_BRIGHTNESS, MAX_BRIGHTNESS));
  } catch (const std::exception& e) {
    if (verbose_) {
      std::cerr << "port: boost update threw: " << e.what() << "\n";
    }
    return false;
  }
}

}  // namespace sdrboost
