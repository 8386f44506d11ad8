#include "sdrboost/hotkey.hpp"

#include <array>

namespace sdrboost {

namespace {

struct KeyName {
  Key key;
  const char* name;
  int vk_code;
};

constexpr std::array<KeyName, 32> KEY_TABLE = {{
    {Key::F1, "F1", vk::F1},          {Key::F2, "F2", vk::F1 + 1},
    {Key::F3, "F3", vk::F1 + 2},      {Key::F4, "F4", vk::F1 + 3},
    {Key::F5, "F5", vk::F1 + 4},      {Key::F6, "F6", vk::F1 + 5},
    {Key::F7, "F7", vk::F1 + 6},      {Key::F8, "F8", vk::F1 + 7},
    {Key::F9, "F9", vk::F1 + 8},      {Key::F10, "F10", vk::F1 + 9},
    {Key::F11, "F11", vk::F1 + 10},   {Key::F12, "F12", vk::F1 + 11},
    {Key::F13, "F13", vk::F1 + 12},   {Key::F14, "F14", vk::F1 + 13},
    {Key::F15, "F15", vk::F1 + 14},   {Key::F16, "F16", vk::F1 + 15},
    {Key::F17, "F17", vk::F1 + 16},   {Key::F18, "F18", vk::F1 + 17},
    {Key::F19, "F19", vk::F1 + 18},   {Key::F20, "F20", vk::F1 + 19},
    {Key::F21, "F21", vk::F1 + 20},   {Key::F22, "F22", vk::F1 + 21},
    {Key::F23, "F23", vk::F1 + 22},   {Key::F24, "F24", vk::F24},
    {Key::Up, "Up", vk::UP},          {Key::Down, "Down", vk::DOWN},
    {Key::PageUp, "PageUp", vk::PRIOR}, {Key::PageDown, "PageDown", vk::NEXT},
    {Key::Home, "Home", vk::HOME},    {Key::End, "End", vk::END},
    {Key::Plus, "OemPlus", vk::OEM_PLUS},
    {Key::Minus, "OemMinus", vk::OEM_MINUS},
}};

struct ComboName {
  ModifierCombo combo;
  const char* name;
};

constexpr std::array<ComboName, 6> COMBO_TABLE = {{
    {ModifierCombo::None, ""},
    {ModifierCombo::Control, "Control"},
    {ModifierCombo::Shift, "Shift"},
    {ModifierCombo::ControlShift, "Control+Shift"},
    {ModifierCombo::ShiftAlt, "Shift+Alt"},
    {ModifierCombo::ControlShiftAlt, "Control+Shift+Alt"},
}};

bool is_accepted(Key key) {
  for (const auto& entry : KEY_TABLE) {
    if (entry.key == key) {
      return true;
    }
  }
  return false;
}

}  // namespace

ModifierCombo classify_modifiers(bool control, bool shift, bool alt) {
  if (control && shift && alt) return ModifierCombo::ControlShiftAlt;
  if (alt) {
    return shift && !control ? ModifierCombo::ShiftAlt : ModifierCombo::None;
  }
  if (control && shift) return ModifierCombo::ControlShift;
  if (shift) return ModifierCombo::Shift;
  if (control) return ModifierCombo::Control;
  return ModifierCombo::None;
}

std::optional<Key> key_from_vk(int vk_code) {
  for (const auto& entry : KEY_TABLE) {
    if (entry.vk_code == vk_code) {
      return entry.key;
    }
  }
  return std::nullopt;
}

int key_to_vk(Key key) {
  return KEY_TABLE[static_cast<size_t>(key)].vk_code;
}

std::string to_string(ModifierCombo combo) {
  return COMBO_TABLE[static_cast<size_t>(combo)].name;
}

std::string to_string(Key key) {
  return KEY_TABLE[static_cast<size_t>(key)].name;
}

std::string to_string(const HotkeyBinding& binding) {
  std::string mods = to_string(binding.modifiers);
  if (mods.empty()) return to_string(binding.key);
  return mods + "+" + to_string(binding.key);
}

std::optional<ModifierCombo> parse_modifiers(const std::string& text) {
  for (const auto& entry : COMBO_TABLE) {
    if (text == entry.name) {
      return entry.combo;
    }
  }
  return std::nullopt;
}

std::optional<Key> parse_key(const std::string& text) {
  if (text == "+") return Key::Plus;
  if (text == "-") return Key::Minus;
  for (const auto& entry : KEY_TABLE) {
    if (text == entry.name) {
      return entry.key;
    }
  }
  return std::nullopt;
}

std::optional<HotkeyBinding> parse_binding(const std::string& text) {
  if (text.empty()) return std::nullopt;

  // "Control++" binds the plus key itself.
  std::string mods;
  std::string key;
  if (text.size() >= 2 && text.back() == '+' && text[text.size() - 2] == '+') {
    mods = text.substr(0, text.size() - 2);
    key = "+";
  } else {
    auto pos = text.rfind('+');
    if (pos == std::string::npos) {
      key = text;
    } else {
      mods = text.substr(0, pos);
      key = text.substr(pos + 1);
    }
  }

  auto combo = parse_modifiers(mods);
  auto parsed_key = parse_key(key);
  if (!combo || !parsed_key) {
    return std::nullopt;
  }
  return HotkeyBinding{*combo, *parsed_key};
}

bool validate_hotkey(ModifierCombo combo, Key key) {
  return combo != ModifierCombo::None && is_accepted(key);
}

bool validate_hotkey(const std::string& modifiers, const std::string& key) {
  auto combo = parse_modifiers(modifiers);
  auto parsed_key = parse_key(key);
  return combo && parsed_key && validate_hotkey(*combo, *parsed_key);
}

const std::vector<ModifierCombo>& bindable_modifiers() {
  static const std::vector<ModifierCombo> combos = {
      ModifierCombo::Control,      ModifierCombo::Shift,
      ModifierCombo::ControlShift, ModifierCombo::ShiftAlt,
      ModifierCombo::ControlShiftAlt,
  };
  return combos;
}

const std::vector<Key>& accepted_keys() {
  static const std::vector<Key> keys = [] {
    std::vector<Key> all;
    for (const auto& entry : KEY_TABLE) {
      all.push_back(entry.key);
    }
    return all;
  }();
  return keys;
}

}  // namespace sdrboost
