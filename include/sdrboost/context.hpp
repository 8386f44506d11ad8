#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "brightness.hpp"
#include "config.hpp"
#include "engine.hpp"
#include "hotkey_listener.hpp"
#include "platform.hpp"

namespace sdrboost {

// Owns every piece of process-wide brightness state. The hook callback and
// settings edits are the only writers and both go through mutex_.
class EngineContext {
 public:
  EngineContext(std::string config_path, BrightnessObserver& observer,
                bool verbose = false);
  ~EngineContext();

  EngineContext(const EngineContext&) = delete;
  EngineContext& operator=(const EngineContext&) = delete;

  LoadResult load();

  // Uninitialized -> Ready, or -> Faulted. Loads the config if load() was
  // not called. With a hook the stored brightness is pushed to the display;
  // without one only the one-shot operations are usable.
  bool start(bool install_hook = true);
  bool start(std::unique_ptr<BoostApi> api,
             std::unique_ptr<KeyStateReader> keys,
             std::unique_ptr<KeyboardHook> hook);
  void stop();

  bool increase();
  bool decrease();
  bool apply_custom();

  std::optional<ValidationError> update_settings(const Settings& settings);
  std::optional<ValidationError> reset_settings();

  Settings settings() const;
  EngineState state() const;
  double brightness() const;
  int display_percent() const;
  const std::string& config_path() const { return config_.path(); }

  HotkeyListener* listener() { return listener_.get(); }

 private:
  void on_hotkey(ModifierCombo combo, Key key);
  void report_config_error();
  std::optional<ValidationError> apply_edit(
      const std::optional<ValidationError>& result);

  mutable std::mutex mutex_;
  BrightnessObserver& observer_;
  bool verbose_;
  bool loaded_ = false;
  ConfigStore config_;
  BrightnessPort port_;
  BrightnessEngine engine_;
  std::unique_ptr<KeyStateReader> keys_;
  std::unique_ptr<HotkeyListener> listener_;
  std::unique_ptr<KeyboardHook> hook_;
};

}  // namespace sdrboost
