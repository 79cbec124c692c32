#include <gtest/gtest.h>

#include "lockclean/hotkey/recorder.hpp"
#include "lockclean/input/keycodes.hpp"
#include "tests/testing/fake_event_source.hpp"

using namespace lockclean::hotkey;
using lockclean::testing::flagsChanged;
using lockclean::testing::keyDown;
using lockclean::testing::keyUp;

namespace keycode = lockclean::input::keycode;

class HotkeyRecorderTest : public ::testing::Test {
protected:
    HotkeyRecorder recorder;
};

TEST_F(HotkeyRecorderTest, StartsEmpty) {
    EXPECT_FALSE(recorder.candidate().has_value());
    EXPECT_EQ(recorder.displayText(), HotkeyRecorder::PLACEHOLDER);
    EXPECT_FALSE(recorder.accept().has_value());
}

TEST_F(HotkeyRecorderTest, KeyDownBecomesCombination) {
    EXPECT_TRUE(recorder.capture(
        keyDown(keycode::ANSI_K,
                ModifierSet{Modifier::CONTROL, Modifier::OPTION}),
        "k"));
    ASSERT_TRUE(recorder.candidate().has_value());
    EXPECT_EQ(recorder.candidate()->kind(), TriggerKind::COMBINATION);
    EXPECT_EQ(recorder.displayText(), "⌃⌥K");
    EXPECT_FALSE(recorder.hasConflict());
    EXPECT_FALSE(recorder.conflictDescription().has_value());

    auto accepted = recorder.accept();
    ASSERT_TRUE(accepted.has_value());
    EXPECT_EQ(*accepted, *recorder.candidate());
}

TEST_F(HotkeyRecorderTest, ModifierChangeBecomesModifiersOnly) {
    EXPECT_TRUE(recorder.capture(
        flagsChanged(ModifierSet{Modifier::COMMAND, Modifier::OPTION})));
    ASSERT_TRUE(recorder.candidate().has_value());
    EXPECT_EQ(recorder.candidate()->kind(), TriggerKind::MODIFIERS_ONLY);
    EXPECT_EQ(recorder.displayText(), "⌥⌘");
}

TEST_F(HotkeyRecorderTest, ReleaseAndKeyUpAreIgnored) {
    EXPECT_FALSE(recorder.capture(flagsChanged(ModifierSet{})));
    EXPECT_FALSE(recorder.capture(flagsChanged(ModifierSet{Modifier::CAPS_LOCK})));
    EXPECT_FALSE(recorder.capture(keyUp(keycode::ANSI_K)));
    EXPECT_FALSE(recorder.candidate().has_value());
}

TEST_F(HotkeyRecorderTest, ConflictBlocksAccept) {
    recorder.capture(keyDown(keycode::ANSI_C, ModifierSet{Modifier::COMMAND}),
                     "c");
    EXPECT_TRUE(recorder.hasConflict());
    EXPECT_EQ(recorder.conflictDescription(), "Conflict: Copy");
    EXPECT_FALSE(recorder.accept().has_value());

    recorder.capture(keyDown(keycode::ANSI_C,
                             ModifierSet{Modifier::COMMAND, Modifier::SHIFT}),
                     "c");
    EXPECT_FALSE(recorder.hasConflict());
    EXPECT_TRUE(recorder.accept().has_value());
}

TEST_F(HotkeyRecorderTest, ClearDropsCandidate) {
    recorder.capture(keyDown(keycode::ANSI_Q, ModifierSet{Modifier::COMMAND}));
    EXPECT_TRUE(recorder.hasConflict());
    recorder.clear();
    EXPECT_FALSE(recorder.candidate().has_value());
    EXPECT_FALSE(recorder.hasConflict());
}
