#pragma once

#include <memory>
#include <string>

#include "brightness.hpp"

namespace sdrboost {

class HotkeyListener;

class KeyStateReader {
 public:
  virtual ~KeyStateReader() = default;

  // State of the key at the moment of the call, not of the queued event.
  virtual bool is_down(int vk_code) const = 0;
};

class KeyboardHook {
 public:
  virtual ~KeyboardHook() = default;

  // Every event is passed on to the next hook whether or not it matched.
  virtual bool install(HotkeyListener& listener, std::string& error) = 0;
  virtual void uninstall() = 0;
};

// Primary display boost entry points; nullptr and a reason on failure.
std::unique_ptr<BoostApi> open_boost_api(std::string& error);

std::unique_ptr<KeyStateReader> create_key_state_reader();
std::unique_ptr<KeyboardHook> create_keyboard_hook();

// Pumps input for the installed hook until quit_message_loop() is called.
int run_message_loop();
void quit_message_loop();

}  // namespace sdrboost
