#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <memory>
#include <thread>

#include "lockclean/blocker/input_blocker.hpp"
#include "lockclean/input/keycodes.hpp"
#include "tests/testing/fake_event_source.hpp"
#include "tests/testing/mock_event_source.hpp"

using namespace lockclean;
using namespace lockclean::blocker;
using lockclean::testing::FakeEventSource;
using lockclean::testing::flagsChanged;
using lockclean::testing::keyDown;
using lockclean::testing::keyUp;
using lockclean::testing::MockEventSource;
using lockclean::testing::pointerEvent;
using input::EventType;
using input::InputEvent;
using input::Point;
using input::TapDecision;

namespace keycode = lockclean::input::keycode;

namespace {
auto systemDefined() -> InputEvent {
    InputEvent event;
    event.type = EventType::SYSTEM_DEFINED;
    return event;
}
}  // namespace

class InputBlockerTest : public ::testing::Test {
protected:
    void SetUp() override {
        source = std::make_shared<FakeEventSource>();
        source->setCursor(Point{100, 200});
        blocker = std::make_unique<InputBlocker>(source);
    }

    std::shared_ptr<FakeEventSource> source;
    std::unique_ptr<InputBlocker> blocker;
};

TEST_F(InputBlockerTest, InactiveByDefault) {
    EXPECT_FALSE(blocker->isActive());
    EXPECT_EQ(blocker->mode(), LockMode::NONE);
    EXPECT_FALSE(blocker->frozenPosition().has_value());
    EXPECT_EQ(source->emit(keyDown(keycode::ANSI_A)), TapDecision::PASS);
}

TEST_F(InputBlockerTest, KeyboardModeConsumesKeyboardOnly) {
    ASSERT_TRUE(blocker->start(LockMode::KEYBOARD));
    EXPECT_TRUE(blocker->isActive());
    EXPECT_EQ(blocker->mode(), LockMode::KEYBOARD);
    EXPECT_FALSE(blocker->frozenPosition().has_value());

    EXPECT_EQ(source->emit(keyDown(keycode::ANSI_A)), TapDecision::CONSUME);
    EXPECT_EQ(source->emit(keyUp(keycode::ANSI_A)), TapDecision::CONSUME);
    EXPECT_EQ(source->emit(flagsChanged(input::ModifierSet{
                  input::Modifier::SHIFT})),
              TapDecision::CONSUME);
    EXPECT_EQ(source->emit(systemDefined()), TapDecision::CONSUME);
    EXPECT_EQ(source->emit(pointerEvent(EventType::LEFT_MOUSE_DOWN, {})),
              TapDecision::PASS);
    EXPECT_EQ(blocker->consumedCount(), 4u);
}

TEST_F(InputBlockerTest, MouseModeFreezesCursor) {
    ASSERT_TRUE(blocker->start(LockMode::MOUSE));
    ASSERT_TRUE(blocker->frozenPosition().has_value());
    EXPECT_EQ(*blocker->frozenPosition(), (Point{100, 200}));

    EXPECT_EQ(source->emit(pointerEvent(EventType::MOUSE_MOVED, {130, 210})),
              TapDecision::CONSUME);
    EXPECT_EQ(source->emit(
                  pointerEvent(EventType::LEFT_MOUSE_DRAGGED, {90, 180})),
              TapDecision::CONSUME);
    EXPECT_EQ(source->emit(
                  pointerEvent(EventType::OTHER_MOUSE_DRAGGED, {0, 0})),
              TapDecision::CONSUME);
    EXPECT_EQ(source->emit(pointerEvent(EventType::SCROLL_WHEEL, {100, 200})),
              TapDecision::CONSUME);
    EXPECT_EQ(source->emit(
                  pointerEvent(EventType::RIGHT_MOUSE_DOWN, {100, 200})),
              TapDecision::CONSUME);

    auto warps = source->warps();
    ASSERT_EQ(warps.size(), 3u);
    for (const auto& warp : warps) {
        EXPECT_EQ(warp, (Point{100, 200}));
    }
    EXPECT_EQ(source->cursorPosition(), (Point{100, 200}));
    EXPECT_EQ(source->emit(keyDown(keycode::ANSI_A)), TapDecision::PASS);
}

TEST_F(InputBlockerTest, MotionAtFrozenPointSkipsWarp) {
    ASSERT_TRUE(blocker->start(LockMode::MOUSE));
    EXPECT_EQ(source->emit(pointerEvent(EventType::MOUSE_MOVED, {100, 200})),
              TapDecision::CONSUME);
    EXPECT_TRUE(source->warps().empty());
}

TEST_F(InputBlockerTest, StartReplacesPreviousMode) {
    ASSERT_TRUE(blocker->start(LockMode::KEYBOARD));
    ASSERT_TRUE(blocker->start(LockMode::MOUSE));
    EXPECT_EQ(blocker->mode(), LockMode::MOUSE);
    EXPECT_EQ(source->registrations(), 1u);
    EXPECT_EQ(source->emit(keyDown(keycode::ANSI_A)), TapDecision::PASS);
    EXPECT_EQ(source->emit(pointerEvent(EventType::LEFT_MOUSE_UP, {})),
              TapDecision::CONSUME);
}

TEST_F(InputBlockerTest, StopIsIdempotent) {
    ASSERT_TRUE(blocker->start(LockMode::MOUSE));
    blocker->stop();
    blocker->stop();
    EXPECT_FALSE(blocker->isActive());
    EXPECT_EQ(blocker->mode(), LockMode::NONE);
    EXPECT_FALSE(blocker->frozenPosition().has_value());
    EXPECT_EQ(source->registrations(), 0u);
    EXPECT_EQ(source->unregisterCalls, 1);
    EXPECT_EQ(source->emit(pointerEvent(EventType::MOUSE_MOVED, {5, 5})),
              TapDecision::PASS);
}

TEST_F(InputBlockerTest, StartNoneStops) {
    ASSERT_TRUE(blocker->start(LockMode::KEYBOARD));
    ASSERT_TRUE(blocker->start(LockMode::NONE));
    EXPECT_FALSE(blocker->isActive());
    EXPECT_EQ(source->registrations(), 0u);
}

TEST_F(InputBlockerTest, RestartResetsConsumedCount) {
    ASSERT_TRUE(blocker->start(LockMode::KEYBOARD));
    source->emit(keyDown(keycode::ANSI_A));
    EXPECT_EQ(blocker->consumedCount(), 1u);
    ASSERT_TRUE(blocker->start(LockMode::KEYBOARD));
    EXPECT_EQ(blocker->consumedCount(), 0u);
}

TEST_F(InputBlockerTest, PermissionDeniedLeavesInactive) {
    source->denyAccess = true;
    auto result = blocker->start(LockMode::KEYBOARD);
    EXPECT_FALSE(result);
    EXPECT_EQ(result.error(), error::InputErrorCode::ACCESS_DENIED);
    EXPECT_FALSE(blocker->isActive());
    EXPECT_EQ(blocker->mode(), LockMode::NONE);
    EXPECT_NO_THROW(blocker->stop());
}

TEST_F(InputBlockerTest, ReenablesTapDisabledBySystem) {
    ASSERT_TRUE(blocker->start(LockMode::KEYBOARD));
    source->disableBySystem(EventType::TAP_DISABLED_BY_USER_INPUT);
    EXPECT_TRUE(source->hookEnabled());
    EXPECT_EQ(source->reenableCalls, 1);
    EXPECT_EQ(source->emit(keyDown(keycode::ANSI_A)), TapDecision::CONSUME);
}

namespace {
// Holds the tap thread inside the blocker's warp until released.
class GatedWarpSource : public FakeEventSource {
public:
    auto warpCursor(Point position) -> error::Result<void> override {
        entered.set_value();
        released.wait();
        return FakeEventSource::warpCursor(position);
    }

    std::promise<void> entered;
    std::shared_future<void> released;
};
}  // namespace

TEST(InputBlockerLifetimeTest, DestructionWaitsForRunningCallback) {
    using namespace std::chrono_literals;
    auto source = std::make_shared<GatedWarpSource>();
    std::promise<void> release;
    source->released = release.get_future().share();
    source->setCursor(Point{10, 10});

    auto blocker = std::make_unique<InputBlocker>(source);
    ASSERT_TRUE(blocker->start(LockMode::MOUSE));

    auto entered = source->entered.get_future();
    std::thread tapThread([&] {
        source->emit(pointerEvent(EventType::MOUSE_MOVED, {50, 50}));
    });
    entered.wait();

    auto destruction =
        std::async(std::launch::async, [&] { blocker.reset(); });
    EXPECT_EQ(destruction.wait_for(50ms), std::future_status::timeout);

    release.set_value();
    destruction.get();
    tapThread.join();
    EXPECT_EQ(source->registrations(), 0u);
    EXPECT_EQ(source->warps(), (std::vector<Point>{{10, 10}}));
}

TEST(InputBlockerMockTest, MouseModeRegistersFilterAndReadsCursor) {
    using ::testing::_;
    using ::testing::InSequence;
    using ::testing::Return;

    auto source = std::make_shared<::testing::StrictMock<MockEventSource>>();
    {
        InSequence order;
        EXPECT_CALL(*source, cursorPosition()).WillOnce(Return(Point{1, 2}));
        EXPECT_CALL(*source,
                    registerTap(input::MOUSE_MASK, input::TapRole::FILTER, _))
            .WillOnce(
                Return(error::Result<input::TapHandle>(input::TapHandle{3})));
        EXPECT_CALL(*source, unregisterTap(input::TapHandle{3}))
            .WillOnce(Return(error::Result<void>()));
    }

    InputBlocker blocker(source);
    ASSERT_TRUE(blocker.start(LockMode::MOUSE));
    EXPECT_EQ(blocker.frozenPosition(), (Point{1, 2}));
}
