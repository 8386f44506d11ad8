#include "sdrboost/hotkey_listener.hpp"

#include <exception>
#include <iostream>

namespace sdrboost {

HotkeyListener::HotkeyListener(const KeyStateReader& keys, Handler handler,
                               bool verbose)
    : keys_(keys), handler_(std::move(handler)), verbose_(verbose) {}

ModifierCombo HotkeyListener::sample_modifiers() const {
  return classify_modifiers(keys_.is_down(vk::CONTROL),
                            keys_.is_down(vk::SHIFT), keys_.is_down(vk::MENU));
}

void HotkeyListener::on_key_down(int vk_code) noexcept {
  ++events_seen_;

  try {
    auto key = key_from_vk(vk_code);
    if (!key) {
      return;
    }

    ModifierCombo combo = sample_modifiers();
    if (combo == ModifierCombo::None) {
      return;
    }

    if (verbose_) {
      std::cout << "hook: detected " << to_string(HotkeyBinding{combo, *key})
                << "\n";
    }

    ++events_dispatched_;
    if (handler_) {
      handler_(combo, *key);
    }
  } catch (const std::exception& e) {
    ++handler_errors_;
    if (verbose_) {
      std::cerr << "hook: dropped error: " << e.what() << "\n";
    }
  } catch (...) {
    // Nothing may unwind into the system hook chain.
    ++handler_errors_;
    if (verbose_) {
      std::cerr << "hook: dropped non-standard exception\n";
    }
  }
}

}  // namespace sdrboost
