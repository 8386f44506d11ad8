#include "sdrboost/context.hpp"

#include <iostream>

namespace sdrboost {

EngineContext::EngineContext(std::string config_path,
                             BrightnessObserver& observer, bool verbose)
    : observer_(observer),
      verbose_(verbose),
      config_(std::move(config_path), verbose),
      port_(verbose),
      engine_(config_, port_, observer, verbose) {}

EngineContext::~EngineContext() {
  stop();
}

LoadResult EngineContext::load() {
  std::lock_guard<std::mutex> lock(mutex_);

  LoadResult result = config_.load();
  loaded_ = true;
  engine_.set_current(config_.settings().current_brightness);

  if (result == LoadResult::Defaulted ||
      result == LoadResult::CreatedUnsaved) {
    report_config_error();
  }
  return result;
}

bool EngineContext::start(bool install_hook) {
  std::string error;
  auto api = open_boost_api(error);
  if (!api) {
    if (!loaded_) load();
    std::lock_guard<std::mutex> lock(mutex_);
    if (engine_.state() == EngineState::Uninitialized) {
      engine_.mark_faulted(error);
    }
    return false;
  }

  std::unique_ptr<KeyStateReader> keys;
  std::unique_ptr<KeyboardHook> hook;
  if (install_hook) {
    keys = create_key_state_reader();
    hook = create_keyboard_hook();
  }
  return start(std::move(api), std::move(keys), std::move(hook));
}

bool EngineContext::start(std::unique_ptr<BoostApi> api,
                          std::unique_ptr<KeyStateReader> keys,
                          std::unique_ptr<KeyboardHook> hook) {
  if (!loaded_) load();
  std::lock_guard<std::mutex> lock(mutex_);

  if (engine_.state() != EngineState::Uninitialized) {
    return engine_.state() == EngineState::Ready;
  }

  if (!api) {
    engine_.mark_faulted("No brightness backend available");
    return false;
  }
  port_.attach(std::move(api));

  if (hook) {
    if (!keys) {
      engine_.mark_faulted("No key state reader available");
      return false;
    }
    keys_ = std::move(keys);
    listener_ = std::make_unique<HotkeyListener>(
        *keys_, [this](ModifierCombo combo, Key key) { on_hotkey(combo, key); },
        verbose_);

    std::string error;
    if (!hook->install(*listener_, error)) {
      listener_.reset();
      engine_.mark_faulted("Failed to set keyboard hook: " + error);
      return false;
    }
    hook_ = std::move(hook);
  }

  engine_.mark_ready();
  // One-shot operations step from whatever the display shows now.
  if (hook_) {
    engine_.restore();
  }
  return true;
}

void EngineContext::stop() {
  if (hook_) {
    hook_->uninstall();
    hook_.reset();
    if (verbose_) {
      std::cout << "context: keyboard hook removed\n";
    }
  }
}

void EngineContext::on_hotkey(ModifierCombo combo, Key key) {
  std::lock_guard<std::mutex> lock(mutex_);
  engine_.handle_hotkey(combo, key);
}

bool EngineContext::increase() {
  std::lock_guard<std::mutex> lock(mutex_);
  return engine_.increase();
}

bool EngineContext::decrease() {
  std::lock_guard<std::mutex> lock(mutex_);
  return engine_.decrease();
}

bool EngineContext::apply_custom() {
  std::lock_guard<std::mutex> lock(mutex_);
  return engine_.apply_custom();
}

std::optional<ValidationError> EngineContext::update_settings(
    const Settings& settings) {
  std::lock_guard<std::mutex> lock(mutex_);
  return apply_edit(config_.update(settings));
}

std::optional<ValidationError> EngineContext::reset_settings() {
  std::lock_guard<std::mutex> lock(mutex_);
  return apply_edit(config_.reset());
}

std::optional<ValidationError> EngineContext::apply_edit(
    const std::optional<ValidationError>& result) {
  if (result) {
    observer_.on_error(ErrorKind::ValidationFailure, result->message);
    return result;
  }

  engine_.set_current(config_.settings().current_brightness);
  if (config_.last_io_error()) {
    report_config_error();
  }
  return std::nullopt;
}

void EngineContext::report_config_error() {
  observer_.on_error(ErrorKind::ConfigIOFailure,
                     config_.last_io_error().value_or("Unknown config error"));
}

Settings EngineContext::settings() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return config_.settings();
}

EngineState EngineContext::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return engine_.state();
}

double EngineContext::brightness() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return engine_.value();
}

int EngineContext::display_percent() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return engine_.display_percent();
}

}  // namespace sdrboost
