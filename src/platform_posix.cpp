#include "sdrboost/platform.hpp"

#include <atomic>
#include <chrono>
#include <thread>

namespace sdrboost {

namespace {

constexpr const char* UNSUPPORTED =
    "SDR boost control requires the Windows desktop compositor";

class NullKeyStateReader : public KeyStateReader {
 public:
  bool is_down(int) const override { return false; }
};

class UnsupportedKeyboardHook : public KeyboardHook {
 public:
  bool install(HotkeyListener&, std::string& error) override {
    error = UNSUPPORTED;
    return false;
  }
  void uninstall() override {}
};

// Set from a signal handler.
std::atomic<bool> g_quit{false};

}  // namespace

std::unique_ptr<BoostApi> open_boost_api(std::string& error) {
  error = UNSUPPORTED;
  return nullptr;
}

std::unique_ptr<KeyStateReader> create_key_state_reader() {
  return std::make_unique<NullKeyStateReader>();
}

std::unique_ptr<KeyboardHook> create_keyboard_hook() {
  return std::make_unique<UnsupportedKeyboardHook>();
}

int run_message_loop() {
  while (!g_quit.exchange(false)) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  return 0;
}

void quit_message_loop() {
  g_quit.store(true);
}

}  // namespace sdrboost
