#pragma once

#include <cstdint>
#include <functional>

#include "hotkey.hpp"
#include "platform.hpp"

namespace sdrboost {

// Decodes raw key-down events into (modifier combo, key) pairs.
class HotkeyListener {
 public:
  using Handler = std::function<void(ModifierCombo, Key)>;

  HotkeyListener(const KeyStateReader& keys, Handler handler,
                 bool verbose = false);

  HotkeyListener(const HotkeyListener&) = delete;
  HotkeyListener& operator=(const HotkeyListener&) = delete;

  // Runs on the input thread for every key-down. Unrecognised keys and
  // combos are dropped; errors raised by the handler are counted and dropped.
  void on_key_down(int vk_code) noexcept;

  ModifierCombo sample_modifiers() const;

  uint64_t events_seen() const { return events_seen_; }
  uint64_t events_dispatched() const { return events_dispatched_; }
  uint64_t handler_errors() const { return handler_errors_; }

 private:
  const KeyStateReader& keys_;
  Handler handler_;
  bool verbose_;
  uint64_t events_seen_ = 0;
  uint64_t events_dispatched_ = 0;
  uint64_t handler_errors_ = 0;
};

}  // namespace sdrboost
