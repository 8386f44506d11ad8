#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "sdrboost/brightness.hpp"
#include "sdrboost/engine.hpp"
#include "sdrboost/hotkey_listener.hpp"
#include "sdrboost/platform.hpp"

namespace sdrboost::fakes {

struct BoostState {
  double value = DEFAULT_BRIGHTNESS;
  bool fail_get = false;
  bool fail_set = false;
  bool throw_set = false;
  std::vector<double> applied;
};

class FakeBoostApi : public BoostApi {
 public:
  explicit FakeBoostApi(std::shared_ptr<BoostState> state)
      : state_(std::move(state)) {}

  std::optional<double> get_boost() override {
    if (state_->fail_get) return std::nullopt;
    return state_->value;
  }

  bool set_boost(double value) override {
    if (state_->throw_set) throw std::runtime_error("compositor call failed");
    if (state_->fail_set) return false;
    state_->value = value;
    state_->applied.push_back(value);
    return true;
  }

 private:
  std::shared_ptr<BoostState> state_;
};

class FakeKeys : public KeyStateReader {
 public:
  bool is_down(int vk_code) const override { return down.count(vk_code) > 0; }

  void press(std::initializer_list<int> keys) {
    down.clear();
    down.insert(keys);
  }

  std::set<int> down;
};

struct HookState {
  HotkeyListener* listener = nullptr;
  bool fail = false;
  bool installed = false;
};

class FakeHook : public KeyboardHook {
 public:
  explicit FakeHook(std::shared_ptr<HookState> state)
      : state_(std::move(state)) {}

  bool install(HotkeyListener& listener, std::string& error) override {
    if (state_->fail) {
      error = "hook refused";
      return false;
    }
    state_->listener = &listener;
    state_->installed = true;
    return true;
  }

  void uninstall() override {
    state_->listener = nullptr;
    state_->installed = false;
  }

 private:
  std::shared_ptr<HookState> state_;
};

class RecordingObserver : public BrightnessObserver {
 public:
  void on_brightness_changed(double value, bool exact) override {
    changes.emplace_back(value, exact);
  }

  void on_error(ErrorKind kind, const std::string& message) override {
    errors.emplace_back(kind, message);
  }

  bool has_error(ErrorKind kind) const {
    for (const auto& e : errors) {
      if (e.first == kind) return true;
    }
    return false;
  }

  std::vector<std::pair<double, bool>> changes;
  std::vector<std::pair<ErrorKind, std::string>> errors;
};

class TempDir {
 public:
  TempDir() {
    static std::atomic<int> counter{0};
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path_ = std::filesystem::temp_directory_path() /
            ("sdrboost-test-" + std::to_string(stamp) + "-" +
             std::to_string(counter++));
    std::filesystem::create_directories(path_);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }
  std::string file(const std::string& name) const {
    return (path_ / name).string();
  }

 private:
  std::filesystem::path path_;
};

}  // namespace sdrboost::fakes
