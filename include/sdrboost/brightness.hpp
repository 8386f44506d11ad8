#pragma once

#include <memory>
#include <optional>
#include <string>

namespace sdrboost {

constexpr double MIN_BRIGHTNESS = 1.2;
constexpr double MAX_BRIGHTNESS = 6.0;
constexpr double DEFAULT_BRIGHTNESS = 3.6;

// Clamp into [MIN_BRIGHTNESS, MAX_BRIGHTNESS] and round to 2 decimals.
double normalize_brightness(double value);

double brightness_to_percent(double value);
double percent_to_brightness(double percent);

// Compositor entry points resolved for one display.
class BoostApi {
 public:
  virtual ~BoostApi() = default;

  // nullopt when the query fails.
  virtual std::optional<double> get_boost() = 0;
  virtual bool set_boost(double value) = 0;
};

class BrightnessPort {
 public:
  explicit BrightnessPort(bool verbose = false);

  BrightnessPort(const BrightnessPort&) = delete;
  BrightnessPort& operator=(const BrightnessPort&) = delete;

  // Resolves the platform entry points for the primary display.
  bool initialize(std::string& error);
  // Takes an already resolved capability (tests, alternative backends).
  void attach(std::unique_ptr<BoostApi> api);

  bool is_initialized() const { return api_ != nullptr; }

  // Live boost value, or last_known if it cannot be read.
  double get_current(double last_known);
  bool apply(double value);

 private:
  bool verbose_;
  std::unique_ptr<BoostApi> api_;
};

}  // namespace sdrboost
