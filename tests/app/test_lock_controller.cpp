#include <gtest/gtest.h>

#include <memory>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "lockclean/app/lock_controller.hpp"
#include "lockclean/config/settings_store.hpp"
#include "lockclean/hotkey/trigger_record.hpp"
#include "lockclean/input/keycodes.hpp"
#include "tests/testing/fake_event_source.hpp"

using namespace lockclean;
using namespace lockclean::app;
using namespace std::chrono_literals;
using blocker::LockMode;
using hotkey::HotkeyTrigger;
using input::Modifier;
using input::ModifierSet;
using input::TapDecision;
using lockclean::testing::FakeEventSource;
using lockclean::testing::flagsChanged;
using lockclean::testing::keyDown;

namespace keycode = lockclean::input::keycode;

class LockControllerTest : public ::testing::Test {
protected:
    void SetUp() override { create(); }

    void create() {
        controller.reset();
        triggers = std::make_shared<hotkey::TriggerStore>(settings);
        controller = std::make_unique<LockController>(source, context,
                                                      triggers);
        statusToken = controller->subscribeStatus(
            [this](const LockStatus& status) { statuses.push_back(status); });
    }

    void pressShiftTwice(std::chrono::milliseconds at) {
        const ModifierSet shift{Modifier::SHIFT};
        source->emit(flagsChanged(shift, at));
        source->emit(flagsChanged({}, at + 50ms));
        source->emit(flagsChanged(shift, at + 200ms));
        source->emit(flagsChanged({}, at + 250ms));
    }

    void drain() {
        context.restart();
        context.poll();
    }

    boost::asio::io_context context;
    std::shared_ptr<FakeEventSource> source =
        std::make_shared<FakeEventSource>();
    std::shared_ptr<config::MemorySettingsStore> settings =
        std::make_shared<config::MemorySettingsStore>();
    std::shared_ptr<hotkey::TriggerStore> triggers;
    std::unique_ptr<LockController> controller;
    std::vector<LockStatus> statuses;
    LockController::Token statusToken = 0;
};

TEST_F(LockControllerTest, InitialState) {
    ASSERT_TRUE(controller->start());
    EXPECT_EQ(controller->mode(), LockMode::NONE);
    EXPECT_EQ(controller->statusText(), "Status: Unlocked");
    EXPECT_EQ(controller->unlockHint(), "Press Shift twice to unlock");
    EXPECT_EQ(controller->unlockTriggerLabel(), "Unlock Hotkey: Double Shift");
}

TEST_F(LockControllerTest, LockKeyboardThenUnlockWithDoubleShift) {
    ASSERT_TRUE(controller->start());
    ASSERT_TRUE(controller->lock(LockMode::KEYBOARD));
    EXPECT_EQ(controller->statusText(), "Status: Keyboard Locked");
    ASSERT_EQ(statuses.size(), 1u);
    EXPECT_EQ(statuses[0].kind, StatusKind::LOCKED);
    EXPECT_EQ(statuses[0].title, "Keyboard Locked");
    EXPECT_EQ(statuses[0].message, "Press Shift twice to unlock");

    // Swallowed by the blocker, still seen by the detector.
    EXPECT_EQ(source->emit(flagsChanged(ModifierSet{Modifier::SHIFT}, 0ms)),
              TapDecision::CONSUME);
    source->emit(flagsChanged({}, 50ms));
    source->emit(flagsChanged(ModifierSet{Modifier::SHIFT}, 300ms));
    drain();

    EXPECT_EQ(controller->mode(), LockMode::NONE);
    EXPECT_FALSE(controller->inputBlocker().isActive());
    ASSERT_EQ(statuses.size(), 2u);
    EXPECT_EQ(statuses[1].kind, StatusKind::UNLOCKED);
    EXPECT_EQ(statuses[1].title, "Unlocked");
    EXPECT_EQ(statuses[1].message, "Input is now enabled");
    EXPECT_EQ(source->emit(keyDown(keycode::ANSI_A)), TapDecision::PASS);
}

TEST_F(LockControllerTest, LockMouse) {
    source->setCursor({10, 20});
    ASSERT_TRUE(controller->start());
    ASSERT_TRUE(controller->lock(LockMode::MOUSE));
    EXPECT_EQ(controller->statusText(), "Status: Mouse Locked");
    EXPECT_EQ(statuses.back().title, "Mouse Locked");
    EXPECT_EQ(controller->inputBlocker().frozenPosition(),
              (input::Point{10, 20}));

    pressShiftTwice(0ms);
    drain();
    EXPECT_EQ(controller->mode(), LockMode::NONE);
}

TEST_F(LockControllerTest, UnlockWhileUnlockedIsIgnored) {
    ASSERT_TRUE(controller->start());
    controller->unlock();
    pressShiftTwice(0ms);
    drain();
    EXPECT_TRUE(statuses.empty());
}

TEST_F(LockControllerTest, SecondLockReplacesMode) {
    ASSERT_TRUE(controller->start());
    ASSERT_TRUE(controller->lock(LockMode::KEYBOARD));
    ASSERT_TRUE(controller->lock(LockMode::MOUSE));
    EXPECT_EQ(controller->mode(), LockMode::MOUSE);
    EXPECT_EQ(controller->inputBlocker().mode(), LockMode::MOUSE);
    // Detector observer plus one blocker filter.
    EXPECT_EQ(source->registrations(), 2u);
}

TEST_F(LockControllerTest, LockNoneUnlocks) {
    ASSERT_TRUE(controller->start());
    ASSERT_TRUE(controller->lock(LockMode::KEYBOARD));
    ASSERT_TRUE(controller->lock(LockMode::NONE));
    EXPECT_EQ(controller->mode(), LockMode::NONE);
    EXPECT_EQ(statuses.back().kind, StatusKind::UNLOCKED);
}

TEST_F(LockControllerTest, PermissionDeniedIsReported) {
    source->denyAccess = true;
    auto started = controller->start();
    EXPECT_FALSE(started);
    ASSERT_EQ(statuses.size(), 1u);
    EXPECT_EQ(statuses[0].kind, StatusKind::PERMISSION_REQUIRED);

    auto locked = controller->lock(LockMode::KEYBOARD);
    EXPECT_EQ(locked.error(), error::InputErrorCode::ACCESS_DENIED);
    EXPECT_EQ(controller->mode(), LockMode::NONE);
    EXPECT_EQ(statuses.back().kind, StatusKind::PERMISSION_REQUIRED);
}

TEST_F(LockControllerTest, CustomTriggerIsPersistedAndUsed) {
    ASSERT_TRUE(controller->start());
    auto trigger = HotkeyTrigger::combination(
        keycode::ANSI_U, ModifierSet{Modifier::CONTROL, Modifier::OPTION},
        "u");
    EXPECT_TRUE(controller->setUnlockTrigger(trigger).empty());
    EXPECT_EQ(controller->unlockHint(), "Press ⌃⌥U to unlock");
    EXPECT_EQ(controller->unlockTriggerLabel(), "Unlock Hotkey: ⌃⌥U");
    EXPECT_EQ(triggers->load(), trigger);

    ASSERT_TRUE(controller->lock(LockMode::KEYBOARD));
    EXPECT_EQ(statuses.back().message, "Press ⌃⌥U to unlock");
    pressShiftTwice(0ms);
    drain();
    EXPECT_EQ(controller->mode(), LockMode::KEYBOARD);

    EXPECT_EQ(source->emit(keyDown(keycode::ANSI_U,
                                   ModifierSet{Modifier::CONTROL,
                                               Modifier::OPTION})),
              TapDecision::CONSUME);
    drain();
    EXPECT_EQ(controller->mode(), LockMode::NONE);
}

TEST_F(LockControllerTest, ConflictingTriggerIsRefused) {
    ASSERT_TRUE(controller->start());
    auto conflicts = controller->setUnlockTrigger(HotkeyTrigger::combination(
        keycode::ANSI_V, ModifierSet{Modifier::COMMAND}, "v"));
    EXPECT_EQ(conflicts, (std::vector<std::string>{"Paste"}));
    EXPECT_TRUE(controller->unlockDetector().trigger().isDefault());
    EXPECT_FALSE(settings->contains(hotkey::TRIGGER_SETTINGS_KEY));
}

TEST_F(LockControllerTest, SavedTriggerIsLoadedOnConstruction) {
    auto trigger =
        HotkeyTrigger::modifiersOnly(ModifierSet{Modifier::COMMAND,
                                                 Modifier::CONTROL});
    ASSERT_TRUE(settings->set(hotkey::TRIGGER_SETTINGS_KEY,
                              hotkey::toJson(hotkey::toRecord(trigger))));
    create();
    EXPECT_EQ(controller->unlockDetector().trigger(), trigger);
    EXPECT_EQ(controller->unlockTriggerLabel(), "Unlock Hotkey: ⌃⌘");
}

TEST_F(LockControllerTest, ShutdownReleasesEverything) {
    ASSERT_TRUE(controller->start());
    ASSERT_TRUE(controller->lock(LockMode::MOUSE));
    controller->shutdown();
    EXPECT_EQ(controller->mode(), LockMode::NONE);
    EXPECT_FALSE(controller->unlockDetector().isRunning());
    EXPECT_EQ(source->registrations(), 0u);
}

TEST_F(LockControllerTest, ContextDrainsAfterShutdown) {
    ASSERT_TRUE(controller->start());
    ASSERT_TRUE(controller->lock(LockMode::KEYBOARD));
    pressShiftTwice(0ms);
    controller->shutdown();

    // No work may outlive shutdown, so run() returns without stop().
    context.restart();
    context.run();
    EXPECT_TRUE(context.stopped());

    EXPECT_EQ(source->emit(keyDown(keycode::ANSI_A)), TapDecision::PASS);
    context.restart();
    EXPECT_EQ(context.poll(), 0u);
}
