#include "sdrboost/hotkey_listener.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <utility>
#include <vector>

#include "fakes.hpp"

namespace sdrboost {
namespace {

using fakes::FakeKeys;

class HotkeyListenerTest : public ::testing::Test {
 protected:
  HotkeyListenerTest()
      : listener_(keys_, [this](ModifierCombo combo, Key key) {
          if (throw_next_) {
            throw_next_ = false;
            throw std::runtime_error("matching failed");
          }
          seen_.emplace_back(combo, key);
        }) {}

  FakeKeys keys_;
  std::vector<std::pair<ModifierCombo, Key>> seen_;
  bool throw_next_ = false;
  HotkeyListener listener_;
};

TEST_F(HotkeyListenerTest, ForwardsRecognisedCombo) {
  keys_.press({vk::CONTROL});
  listener_.on_key_down(vk::F1 + 1);

  ASSERT_EQ(seen_.size(), 1u);
  EXPECT_EQ(seen_[0].first, ModifierCombo::Control);
  EXPECT_EQ(seen_[0].second, Key::F2);
}

TEST_F(HotkeyListenerTest, SamplesModifiersAtEachEvent) {
  keys_.press({vk::CONTROL, vk::SHIFT});
  listener_.on_key_down(vk::HOME);
  keys_.press({vk::SHIFT, vk::MENU});
  listener_.on_key_down(vk::HOME);
  keys_.press({vk::CONTROL, vk::SHIFT, vk::MENU});
  listener_.on_key_down(vk::OEM_MINUS);

  ASSERT_EQ(seen_.size(), 3u);
  EXPECT_EQ(seen_[0].first, ModifierCombo::ControlShift);
  EXPECT_EQ(seen_[1].first, ModifierCombo::ShiftAlt);
  EXPECT_EQ(seen_[2].first, ModifierCombo::ControlShiftAlt);
  EXPECT_EQ(seen_[2].second, Key::Minus);
}

TEST_F(HotkeyListenerTest, IgnoresUnrecognisedModifiers) {
  listener_.on_key_down(vk::F1);
  keys_.press({vk::MENU});
  listener_.on_key_down(vk::F1);
  keys_.press({vk::CONTROL, vk::MENU});
  listener_.on_key_down(vk::F1);

  EXPECT_TRUE(seen_.empty());
  EXPECT_EQ(listener_.events_seen(), 3u);
  EXPECT_EQ(listener_.events_dispatched(), 0u);
}

TEST_F(HotkeyListenerTest, IgnoresUnacceptedKeys) {
  keys_.press({vk::CONTROL});
  listener_.on_key_down('A');
  listener_.on_key_down(0x25);  // Left arrow
  listener_.on_key_down(vk::CONTROL);

  EXPECT_TRUE(seen_.empty());
  EXPECT_EQ(listener_.events_seen(), 3u);
}

TEST_F(HotkeyListenerTest, HandlerErrorsAreSwallowed) {
  keys_.press({vk::CONTROL});
  throw_next_ = true;

  EXPECT_NO_THROW(listener_.on_key_down(vk::F1));
  EXPECT_EQ(listener_.handler_errors(), 1u);
  EXPECT_TRUE(seen_.empty());

  listener_.on_key_down(vk::F1);
  ASSERT_EQ(seen_.size(), 1u);
  EXPECT_EQ(seen_[0].second, Key::F1);
}

TEST(HotkeyListener, NonStandardExceptionsAreSwallowed) {
  FakeKeys keys;
  keys.press({vk::CONTROL});
  int calls = 0;
  HotkeyListener listener(keys, [&calls](ModifierCombo, Key) {
    if (++calls == 1) throw 42;
  });

  EXPECT_NO_THROW(listener.on_key_down(vk::F1 + 1));
  EXPECT_EQ(listener.handler_errors(), 1u);

  listener.on_key_down(vk::F1 + 1);
  EXPECT_EQ(calls, 2);
  EXPECT_EQ(listener.handler_errors(), 1u);
  EXPECT_EQ(listener.events_dispatched(), 2u);
}

TEST(HotkeyListener, WorksWithoutHandler) {
  FakeKeys keys;
  keys.press({vk::SHIFT});
  HotkeyListener listener(keys, nullptr);
  EXPECT_NO_THROW(listener.on_key_down(vk::UP));
  EXPECT_EQ(listener.events_dispatched(), 1u);
  EXPECT_EQ(listener.sample_modifiers(), ModifierCombo::Shift);
}

}  // namespace
}  // namespace sdrboost
