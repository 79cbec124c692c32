#include <gtest/gtest.h>

#include <memory>

#include "lockclean/config/settings_store.hpp"
#include "lockclean/error/exception.hpp"
#include "lockclean/hotkey/trigger_record.hpp"
#include "lockclean/hotkey/trigger_store.hpp"
#include "lockclean/input/keycodes.hpp"

using namespace lockclean;
using namespace lockclean::hotkey;
using json = nlohmann::json;

namespace keycode = lockclean::input::keycode;

class TriggerStoreTest : public ::testing::Test {
protected:
    std::shared_ptr<config::MemorySettingsStore> settings =
        std::make_shared<config::MemorySettingsStore>();
    TriggerStore store{settings};
};

TEST_F(TriggerStoreTest, MissingRecordLoadsDefault) {
    EXPECT_TRUE(store.load().isDefault());
}

TEST_F(TriggerStoreTest, SaveThenLoad) {
    auto trigger = HotkeyTrigger::combination(
        keycode::ANSI_U, ModifierSet{Modifier::CONTROL, Modifier::COMMAND},
        "u");
    ASSERT_TRUE(store.save(trigger));
    EXPECT_TRUE(settings->contains(TRIGGER_SETTINGS_KEY));
    EXPECT_EQ(store.load(), trigger);
}

TEST_F(TriggerStoreTest, SavingDefaultRemovesRecord) {
    ASSERT_TRUE(store.save(HotkeyTrigger::modifiersOnly(
        ModifierSet{Modifier::OPTION})));
    ASSERT_TRUE(settings->contains(TRIGGER_SETTINGS_KEY));

    ASSERT_TRUE(store.save(HotkeyTrigger::doubleShift()));
    EXPECT_FALSE(settings->contains(TRIGGER_SETTINGS_KEY));
    EXPECT_TRUE(store.load().isDefault());
}

TEST_F(TriggerStoreTest, MalformedRecordFallsBackToDefault) {
    ASSERT_TRUE(settings->set(TRIGGER_SETTINGS_KEY, json{{"keyCode", "x"}}));
    EXPECT_TRUE(store.load().isDefault());

    ASSERT_TRUE(settings->set(TRIGGER_SETTINGS_KEY, json(42)));
    EXPECT_TRUE(store.load().isDefault());
}

TEST_F(TriggerStoreTest, EncodedStringRecordIsAccepted) {
    auto trigger = HotkeyTrigger::combination(keycode::F6, ModifierSet{});
    ASSERT_TRUE(settings->set(TRIGGER_SETTINGS_KEY, serialize(trigger)));
    EXPECT_EQ(store.load(), trigger);
}

TEST(TriggerStoreConstructionTest, NullSettingsThrow) {
    EXPECT_THROW(TriggerStore(nullptr), error::InvalidArgument);
}
