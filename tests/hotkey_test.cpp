#include "sdrboost/hotkey.hpp"

#include <gtest/gtest.h>

namespace sdrboost {
namespace {

TEST(ClassifyModifiers, RecognisedCombinations) {
  EXPECT_EQ(classify_modifiers(false, false, false), ModifierCombo::None);
  EXPECT_EQ(classify_modifiers(true, false, false), ModifierCombo::Control);
  EXPECT_EQ(classify_modifiers(false, true, false), ModifierCombo::Shift);
  EXPECT_EQ(classify_modifiers(true, true, false), ModifierCombo::ControlShift);
  EXPECT_EQ(classify_modifiers(false, true, true), ModifierCombo::ShiftAlt);
  EXPECT_EQ(classify_modifiers(true, true, true),
            ModifierCombo::ControlShiftAlt);
}

TEST(ClassifyModifiers, AltAloneAndControlAltAreNone) {
  EXPECT_EQ(classify_modifiers(false, false, true), ModifierCombo::None);
  EXPECT_EQ(classify_modifiers(true, false, true), ModifierCombo::None);
}

TEST(KeyFromVk, DecodesAcceptedKeys) {
  EXPECT_EQ(key_from_vk(vk::F1), Key::F1);
  EXPECT_EQ(key_from_vk(vk::F1 + 1), Key::F2);
  EXPECT_EQ(key_from_vk(vk::F24), Key::F24);
  EXPECT_EQ(key_from_vk(vk::PRIOR), Key::PageUp);
  EXPECT_EQ(key_from_vk(vk::NEXT), Key::PageDown);
  EXPECT_EQ(key_from_vk(vk::HOME), Key::Home);
  EXPECT_EQ(key_from_vk(vk::END), Key::End);
  EXPECT_EQ(key_from_vk(vk::UP), Key::Up);
  EXPECT_EQ(key_from_vk(vk::DOWN), Key::Down);
  EXPECT_EQ(key_from_vk(vk::OEM_PLUS), Key::Plus);
  EXPECT_EQ(key_from_vk(vk::OEM_MINUS), Key::Minus);
}

TEST(KeyFromVk, IgnoresEverythingElse) {
  EXPECT_FALSE(key_from_vk('A').has_value());
  EXPECT_FALSE(key_from_vk(vk::F24 + 1).has_value());
  EXPECT_FALSE(key_from_vk(vk::CONTROL).has_value());
  EXPECT_FALSE(key_from_vk(0x25).has_value());  // Left arrow
}

TEST(KeyFromVk, VkLookupIsConsistent) {
  for (Key key : accepted_keys()) {
    EXPECT_EQ(key_from_vk(key_to_vk(key)), key) << to_string(key);
  }
}

TEST(ParseBinding, ModifiersAndKey) {
  auto b = parse_binding("Control+Shift+Alt+End");
  ASSERT_TRUE(b);
  EXPECT_EQ(b->modifiers, ModifierCombo::ControlShiftAlt);
  EXPECT_EQ(b->key, Key::End);

  b = parse_binding("Shift+Alt+PageDown");
  ASSERT_TRUE(b);
  EXPECT_EQ(b->modifiers, ModifierCombo::ShiftAlt);
  EXPECT_EQ(b->key, Key::PageDown);
}

TEST(ParseBinding, PlusAndMinusKeys) {
  auto plus = parse_binding("Control++");
  ASSERT_TRUE(plus);
  EXPECT_EQ(plus->modifiers, ModifierCombo::Control);
  EXPECT_EQ(plus->key, Key::Plus);

  auto minus = parse_binding("Shift+-");
  ASSERT_TRUE(minus);
  EXPECT_EQ(minus->modifiers, ModifierCombo::Shift);
  EXPECT_EQ(minus->key, Key::Minus);

  auto named = parse_binding("Control+OemMinus");
  ASSERT_TRUE(named);
  EXPECT_EQ(named->key, Key::Minus);
}

TEST(ParseBinding, RejectsUnknownParts) {
  EXPECT_FALSE(parse_binding(""));
  EXPECT_FALSE(parse_binding("Alt+F2"));
  EXPECT_FALSE(parse_binding("Control+Alt+F2"));
  EXPECT_FALSE(parse_binding("Control+Q"));
  EXPECT_FALSE(parse_binding("Control+F25"));
}

TEST(ParseBinding, BareKeyHasNoModifiers) {
  auto b = parse_binding("F2");
  ASSERT_TRUE(b);
  EXPECT_EQ(b->modifiers, ModifierCombo::None);
  EXPECT_FALSE(validate_hotkey(b->modifiers, b->key));
}

TEST(ToString, UsesStoredNames) {
  EXPECT_EQ(to_string(HotkeyBinding{ModifierCombo::ControlShift, Key::F3}),
            "Control+Shift+F3");
  EXPECT_EQ(to_string(Key::Plus), "OemPlus");
  EXPECT_EQ(to_string(ModifierCombo::None), "");
}

TEST(ValidateHotkey, RequiresModifierAndAcceptedKey) {
  EXPECT_TRUE(validate_hotkey("Control", "F1"));
  EXPECT_TRUE(validate_hotkey("Shift+Alt", "Home"));
  EXPECT_TRUE(validate_hotkey("Control", "+"));
  EXPECT_FALSE(validate_hotkey("", "F1"));
  EXPECT_FALSE(validate_hotkey("Alt", "F1"));
  EXPECT_FALSE(validate_hotkey("Control+Alt", "F1"));
  EXPECT_FALSE(validate_hotkey("Control", "Space"));
  EXPECT_FALSE(validate_hotkey(ModifierCombo::None, Key::F5));
  EXPECT_TRUE(validate_hotkey(ModifierCombo::ShiftAlt, Key::Minus));
  EXPECT_FALSE(validate_hotkey(ModifierCombo::Control, static_cast<Key>(99)));
}

TEST(BindableModifiers, ExcludesNone) {
  const auto& combos = bindable_modifiers();
  EXPECT_EQ(combos.size(), 5u);
  for (auto combo : combos) {
    EXPECT_NE(combo, ModifierCombo::None);
  }
  EXPECT_EQ(accepted_keys().size(), 32u);
}

}  // namespace
}  // namespace sdrboost
