#pragma once

#include <optional>
#include <string>
#include <vector>

namespace sdrboost {

// Virtual-key codes as delivered by the low-level keyboard hook.
namespace vk {
constexpr int SHIFT = 0x10;
constexpr int CONTROL = 0x11;
constexpr int MENU = 0x12;  // Alt
constexpr int PRIOR = 0x21;  // PageUp
constexpr int NEXT = 0x22;   // PageDown
constexpr int END = 0x23;
constexpr int HOME = 0x24;
constexpr int UP = 0x26;
constexpr int DOWN = 0x28;
constexpr int F1 = 0x70;
constexpr int F24 = 0x87;
constexpr int OEM_PLUS = 0xBB;
constexpr int OEM_MINUS = 0xBD;
}  // namespace vk

enum class ModifierCombo {
  None,
  Control,
  Shift,
  ControlShift,
  ShiftAlt,
  ControlShiftAlt,
};

enum class Key {
  F1, F2, F3, F4, F5, F6, F7, F8, F9, F10, F11, F12,
  F13, F14, F15, F16, F17, F18, F19, F20, F21, F22, F23, F24,
  Up,
  Down,
  PageUp,
  PageDown,
  Home,
  End,
  Plus,
  Minus,
};

struct HotkeyBinding {
  ModifierCombo modifiers = ModifierCombo::None;
  Key key = Key::F1;

  bool operator==(const HotkeyBinding& other) const {
    return modifiers == other.modifiers && key == other.key;
  }
  bool operator!=(const HotkeyBinding& other) const {
    return !(*this == other);
  }
};

// Only the six recognised combinations map to something other than None;
// Alt alone or Control+Alt are None.
ModifierCombo classify_modifiers(bool control, bool shift, bool alt);

std::optional<Key> key_from_vk(int vk_code);
int key_to_vk(Key key);

std::string to_string(ModifierCombo combo);
std::string to_string(Key key);
std::string to_string(const HotkeyBinding& binding);

// "None" is not parseable; the empty string is.
std::optional<ModifierCombo> parse_modifiers(const std::string& text);
// Accepts the canonical names plus "+" and "-".
std::optional<Key> parse_key(const std::string& text);
// "Control+Shift+F3" style; the key is the last '+'-separated token.
std::optional<HotkeyBinding> parse_binding(const std::string& text);

bool validate_hotkey(ModifierCombo combo, Key key);
bool validate_hotkey(const std::string& modifiers, const std::string& key);

const std::vector<ModifierCombo>& bindable_modifiers();
const std::vector<Key>& accepted_keys();

}  // namespace sdrboost
