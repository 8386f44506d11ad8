#pragma once

#include <optional>
#include <string>

#include "brightness.hpp"
#include "hotkey.hpp"

namespace sdrboost {

constexpr double DEFAULT_STEP_SIZE = 0.05;
constexpr double MIN_STEP_SIZE = 0.01;
constexpr double MAX_STEP_SIZE = 0.5;

struct Settings {
  HotkeyBinding increase{ModifierCombo::Control, Key::F2};
  HotkeyBinding decrease{ModifierCombo::Control, Key::F1};
  HotkeyBinding custom{ModifierCombo::ControlShift, Key::F3};
  double current_brightness = DEFAULT_BRIGHTNESS;
  double step_size = DEFAULT_STEP_SIZE;
  double custom_brightness = DEFAULT_BRIGHTNESS;
};

struct ValidationError {
  std::string field;
  std::string message;
};

enum class LoadResult {
  Loaded,
  Created,         // file was missing, defaults written
  CreatedUnsaved,  // file was missing, writing defaults failed
  Defaulted,       // read or parse failure, defaults kept in memory
};

// Checks an edited record; nullopt when it is acceptable.
std::optional<ValidationError> validate_settings(const Settings& settings);

// Pulls every numeric field back into range. Bindings are left alone.
Settings clamp_settings(Settings settings);

class ConfigStore {
 public:
  explicit ConfigStore(std::string path, bool verbose = false);

  static std::string get_config_dir();
  static std::string get_config_path();

  const std::string& path() const { return path_; }
  const Settings& settings() const { return settings_; }

  LoadResult load();
  bool save();

  // Validates, replaces, persists. A failed save keeps the new settings in
  // memory and is reported through last_io_error().
  std::optional<ValidationError> update(const Settings& settings);
  std::optional<ValidationError> reset();

  void set_current_brightness(double value);

  const std::optional<std::string>& last_io_error() const {
    return last_io_error_;
  }

  static std::string serialize(const Settings& settings);
  // Applies the load-time repairs; nullopt if the text is not a JSON object.
  static std::optional<Settings> parse(const std::string& text,
                                       std::string& error);

 private:
  std::string path_;
  bool verbose_;
  Settings settings_;
  std::optional<std::string> last_io_error_;
};

}  // namespace sdrboost
