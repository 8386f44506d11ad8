#include "sdrboost/config.hpp"

#include <picojson.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

namespace sdrboost {

namespace {

constexpr const char* CONFIG_FILE = "brightness_settings.json";

std::string get_string(const picojson::value& v, const std::string& key,
                       const std::string& def = "") {
  if (!v.is<picojson::object>()) return def;
  const auto& obj = v.get<picojson::object>();
  auto it = obj.find(key);
  if (it == obj.end() || !it->second.is<std::string>()) return def;
  return it->second.get<std::string>();
}

double get_double(const picojson::value& v, const std::string& key,
                  double def) {
  if (!v.is<picojson::object>()) return def;
  const auto& obj = v.get<picojson::object>();
  auto it = obj.find(key);
  if (it == obj.end() || !it->second.is<double>()) return def;
  return it->second.get<double>();
}

HotkeyBinding get_binding(const picojson::value& v, const std::string& prefix,
                          const HotkeyBinding& def) {
  auto mods = parse_modifiers(get_string(v, prefix + "Modifiers",
                                         to_string(def.modifiers)));
  auto key = parse_key(get_string(v, prefix + "Key", to_string(def.key)));
  if (!mods || !key || !validate_hotkey(*mods, *key)) {
    return def;
  }
  return HotkeyBinding{*mods, *key};
}

bool bindings_distinct(const Settings& s) {
  return s.increase != s.decrease && s.increase != s.custom &&
         s.decrease != s.custom;
}

double repair_step_size(double step) {
  if (!std::isfinite(step) || step <= 0.0) {
    return DEFAULT_STEP_SIZE;
  }
  return std::clamp(step, MIN_STEP_SIZE, MAX_STEP_SIZE);
}

std::optional<ValidationError> check_binding(const std::string& field,
                                             const HotkeyBinding& binding) {
  if (!validate_hotkey(binding.modifiers, binding.key)) {
    return ValidationError{field, "Invalid " + field + " hotkey: " +
                                      to_string(binding) +
                                      " (a modifier combination is required)"};
  }
  return std::nullopt;
}

}  // namespace

std::optional<ValidationError> validate_settings(const Settings& settings) {
  if (auto err = check_binding("increase", settings.increase)) return err;
  if (auto err = check_binding("decrease", settings.decrease)) return err;
  if (auto err = check_binding("custom", settings.custom)) return err;

  if (settings.increase == settings.decrease) {
    return ValidationError{"decrease",
                           "Increase and Decrease hotkeys cannot be the same."};
  }
  if (settings.increase == settings.custom) {
    return ValidationError{"custom",
                           "Increase and Custom hotkeys cannot be the same."};
  }
  if (settings.decrease == settings.custom) {
    return ValidationError{"custom",
                           "Decrease and Custom hotkeys cannot be the same."};
  }

  if (!std::isfinite(settings.step_size) || settings.step_size <= 0.0 ||
      settings.step_size > MAX_STEP_SIZE) {
    return ValidationError{
        "stepSize",
        "Step size must be above 0% and at most 50% (below 1% is raised to "
        "1%)."};
  }

  double custom_pct = brightness_to_percent(settings.custom_brightness);
  if (!std::isfinite(custom_pct) || custom_pct < -1e-9 ||
      custom_pct > 100.0 + 1e-9) {
    return ValidationError{"customBrightness",
                           "Custom brightness must be between 0% and 100%."};
  }

  if (!std::isfinite(settings.current_brightness)) {
    return ValidationError{"currentBrightness",
                           "Current brightness must be a number."};
  }

  return std::nullopt;
}

Settings clamp_settings(Settings settings) {
  settings.step_size = repair_step_size(settings.step_size);
  settings.current_brightness = normalize_brightness(settings.current_brightness);
  settings.custom_brightness = normalize_brightness(settings.custom_brightness);
  return settings;
}

ConfigStore::ConfigStore(std::string path, bool verbose)
    : path_(path.empty() ? get_config_path() : std::move(path)),
      verbose_(verbose) {}

std::string ConfigStore::get_config_dir() {
#ifdef _WIN32
  const char* appdata = std::getenv("APPDATA");
  if (appdata && *appdata) {
    return std::string(appdata) + "\\sdrboost";
  }
#endif

  const char* xdg_config = std::getenv("XDG_CONFIG_HOME");
  if (xdg_config && *xdg_config) {
    return std::string(xdg_config) + "/sdrboost";
  }

  const char* home = std::getenv("HOME");
  if (home && *home) {
    return std::string(home) + "/.config/sdrboost";
  }

  return ".config/sdrboost";
}

std::string ConfigStore::get_config_path() {
  return (fs::path(get_config_dir()) / CONFIG_FILE).string();
}

std::optional<Settings> ConfigStore::parse(const std::string& text,
                                           std::string& error) {
  picojson::value json;
  error = picojson::parse(json, text);
  if (!error.empty()) {
    return std::nullopt;
  }
  if (!json.is<picojson::object>()) {
    error = "settings root is not a JSON object";
    return std::nullopt;
  }

  const Settings defaults;
  Settings settings;
  settings.increase = get_binding(json, "increase", defaults.increase);
  settings.decrease = get_binding(json, "decrease", defaults.decrease);
  settings.custom = get_binding(json, "custom", defaults.custom);
  if (!bindings_distinct(settings)) {
    settings.increase = defaults.increase;
    settings.decrease = defaults.decrease;
    settings.custom = defaults.custom;
  }

  settings.current_brightness =
      get_double(json, "currentBrightness", DEFAULT_BRIGHTNESS);
  settings.step_size = get_double(json, "stepSize", DEFAULT_STEP_SIZE);
  settings.custom_brightness =
      get_double(json, "customBrightness", DEFAULT_BRIGHTNESS);

  return clamp_settings(settings);
}

std::string ConfigStore::serialize(const Settings& settings) {
  picojson::object obj;
  obj["increaseModifiers"] =
      picojson::value(to_string(settings.increase.modifiers));
  obj["increaseKey"] = picojson::value(to_string(settings.increase.key));
  obj["decreaseModifiers"] =
      picojson::value(to_string(settings.decrease.modifiers));
  obj["decreaseKey"] = picojson::value(to_string(settings.decrease.key));
  obj["customModifiers"] = picojson::value(to_string(settings.custom.modifiers));
  obj["customKey"] = picojson::value(to_string(settings.custom.key));
  obj["currentBrightness"] = picojson::value(settings.current_brightness);
  obj["stepSize"] = picojson::value(settings.step_size);
  obj["customBrightness"] = picojson::value(settings.custom_brightness);

  return picojson::value(obj).serialize(true);
}

LoadResult ConfigStore::load() {
  std::error_code ec;
  if (!fs::exists(path_, ec)) {
    settings_ = Settings{};
    if (verbose_) {
      std::cout << "config: " << path_ << " not found, writing defaults\n";
    }
    return save() ? LoadResult::Created : LoadResult::CreatedUnsaved;
  }

  std::ifstream file(path_);
  if (!file) {
    last_io_error_ = "Failed to open " + path_;
    settings_ = Settings{};
    return LoadResult::Defaulted;
  }

  std::ostringstream ss;
  ss << file.rdbuf();

  std::string err;
  auto parsed = parse(ss.str(), err);
  if (!parsed) {
    last_io_error_ = "Failed to parse " + path_ + ": " + err;
    settings_ = Settings{};
    return LoadResult::Defaulted;
  }

  settings_ = *parsed;
  last_io_error_.reset();

  if (verbose_) {
    std::cout << "config: increase=" << to_string(settings_.increase)
              << " decrease=" << to_string(settings_.decrease)
              << " custom=" << to_string(settings_.custom)
              << " step=" << settings_.step_size * 100.0 << "%"
              << " brightness=" << settings_.current_brightness << "\n";
  }
  return LoadResult::Loaded;
}

bool ConfigStore::save() {
  std::error_code ec;
  fs::path dir = fs::path(path_).parent_path();
  if (!dir.empty()) {
    fs::create_directories(dir, ec);
    if (ec) {
      last_io_error_ = "Failed to create " + dir.string() + ": " + ec.message();
      return false;
    }
  }

  std::ofstream file(path_);
  if (!file) {
    last_io_error_ = "Failed to write " + path_;
    return false;
  }

  file << serialize(settings_) << "\n";
  if (!file.good()) {
    last_io_error_ = "Failed to write " + path_;
    return false;
  }

  last_io_error_.reset();
  if (verbose_) {
    std::cout << "config: saved " << path_ << "\n";
  }
  return true;
}

std::optional<ValidationError> ConfigStore::update(const Settings& settings) {
  if (auto err = validate_settings(settings)) {
    if (verbose_) {
      std::cerr << "config: rejected " << err->field << ": " << err->message
                << "\n";
    }
    return err;
  }

  settings_ = clamp_settings(settings);
  if (!save() && verbose_) {
    std::cerr << "config: " << *last_io_error_ << "\n";
  }
  return std::nullopt;
}

std::optional<ValidationError> ConfigStore::reset() {
  return update(Settings{});
}

void ConfigStore::set_current_brightness(double value) {
  settings_.current_brightness = normalize_brightness(value);
}

}  // namespace sdrboost
