#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <string>
#include <thread>
#include <vector>

#include "lockclean/input/event_dispatcher.hpp"

using namespace lockclean::input;

namespace {
auto event(EventType type) -> InputEvent {
    InputEvent e;
    e.type = type;
    return e;
}
}  // namespace

class EventDispatcherTest : public ::testing::Test {
protected:
    EventDispatcher dispatcher;
    std::vector<std::string> calls;
};

TEST_F(EventDispatcherTest, ObserversRunBeforeFilters) {
    dispatcher.add(KEYBOARD_MASK, TapRole::FILTER, [&](const InputEvent&) {
        calls.push_back("filter");
        return TapDecision::CONSUME;
    });
    dispatcher.add(KEYBOARD_MASK, TapRole::OBSERVER, [&](const InputEvent&) {
        calls.push_back("observer");
        return TapDecision::CONSUME;
    });

    EXPECT_EQ(dispatcher.dispatch(event(EventType::KEY_DOWN)),
              TapDecision::CONSUME);
    EXPECT_EQ(calls, (std::vector<std::string>{"observer", "filter"}));
}

TEST_F(EventDispatcherTest, ObserverDecisionIsIgnored) {
    dispatcher.add(KEYBOARD_MASK, TapRole::OBSERVER,
                   [](const InputEvent&) { return TapDecision::CONSUME; });
    EXPECT_EQ(dispatcher.dispatch(event(EventType::KEY_DOWN)),
              TapDecision::PASS);
    EXPECT_FALSE(dispatcher.hasFilters());
}

TEST_F(EventDispatcherTest, MaskSelectsRegistrations) {
    dispatcher.add(MOUSE_MASK, TapRole::FILTER, [&](const InputEvent&) {
        calls.push_back("mouse");
        return TapDecision::CONSUME;
    });
    EXPECT_EQ(dispatcher.dispatch(event(EventType::KEY_DOWN)),
              TapDecision::PASS);
    EXPECT_TRUE(calls.empty());
}

TEST_F(EventDispatcherTest, TapControlReachesEveryRegistration) {
    dispatcher.add(makeMask({EventType::KEY_DOWN}), TapRole::OBSERVER,
                   [&](const InputEvent& e) {
                       calls.push_back(std::string(toString(e.type)));
                       return TapDecision::PASS;
                   });
    dispatcher.add(MOUSE_MASK, TapRole::FILTER, [&](const InputEvent& e) {
        calls.push_back(std::string(toString(e.type)));
        return TapDecision::PASS;
    });
    dispatcher.dispatch(event(EventType::TAP_DISABLED_BY_TIMEOUT));
    EXPECT_EQ(calls.size(), 2u);
}

TEST_F(EventDispatcherTest, DisabledRegistrationsAreSkipped) {
    auto handle =
        dispatcher.add(KEYBOARD_MASK, TapRole::FILTER, [](const InputEvent&) {
            return TapDecision::CONSUME;
        });
    EXPECT_EQ(dispatcher.combinedMask(), KEYBOARD_MASK);

    EXPECT_TRUE(dispatcher.setEnabled(handle, false));
    EXPECT_FALSE(dispatcher.isEnabled(handle));
    EXPECT_EQ(dispatcher.combinedMask(), 0u);
    EXPECT_EQ(dispatcher.dispatch(event(EventType::KEY_UP)),
              TapDecision::PASS);
}

TEST_F(EventDispatcherTest, RemoveUnknownHandleFails) {
    auto handle = dispatcher.add(KEYBOARD_MASK, TapRole::OBSERVER,
                                 [](const InputEvent&) {
                                     return TapDecision::PASS;
                                 });
    EXPECT_TRUE(dispatcher.remove(handle));
    EXPECT_FALSE(dispatcher.remove(handle));
    EXPECT_FALSE(dispatcher.contains(handle));
    EXPECT_EQ(dispatcher.size(), 0u);
}

TEST_F(EventDispatcherTest, ThrowingCallbackDoesNotStopDispatch) {
    dispatcher.add(KEYBOARD_MASK, TapRole::OBSERVER,
                   [](const InputEvent&) -> TapDecision {
                       throw std::runtime_error("boom");
                   });
    dispatcher.add(KEYBOARD_MASK, TapRole::FILTER, [](const InputEvent&) {
        return TapDecision::CONSUME;
    });
    EXPECT_EQ(dispatcher.dispatch(event(EventType::KEY_DOWN)),
              TapDecision::CONSUME);
}

TEST_F(EventDispatcherTest, CallbackMayUnregisterItself) {
    TapHandle handle = INVALID_TAP_HANDLE;
    handle = dispatcher.add(KEYBOARD_MASK, TapRole::FILTER,
                            [&](const InputEvent&) {
                                dispatcher.remove(handle);
                                return TapDecision::CONSUME;
                            });
    EXPECT_EQ(dispatcher.dispatch(event(EventType::KEY_DOWN)),
              TapDecision::CONSUME);
    EXPECT_EQ(dispatcher.dispatch(event(EventType::KEY_DOWN)),
              TapDecision::PASS);
}

TEST_F(EventDispatcherTest, RemoveWaitsForRunningCallback) {
    using namespace std::chrono_literals;
    std::promise<void> entered;
    std::promise<void> release;
    auto released = release.get_future().share();
    std::atomic<bool> finished{false};

    TapHandle handle = dispatcher.add(
        KEYBOARD_MASK, TapRole::FILTER, [&](const InputEvent&) {
            entered.set_value();
            released.wait();
            finished = true;
            return TapDecision::CONSUME;
        });

    std::thread tapThread(
        [&] { dispatcher.dispatch(event(EventType::KEY_DOWN)); });
    entered.get_future().wait();

    auto removal = std::async(std::launch::async,
                              [&] { return dispatcher.remove(handle); });
    EXPECT_EQ(removal.wait_for(50ms), std::future_status::timeout);
    EXPECT_FALSE(dispatcher.contains(handle));

    release.set_value();
    EXPECT_TRUE(removal.get());
    EXPECT_TRUE(finished);
    tapThread.join();
}

TEST_F(EventDispatcherTest, CallbackMayRemoveOthersOnItsOwnThread) {
    TapHandle first = dispatcher.add(KEYBOARD_MASK, TapRole::OBSERVER,
                                     [](const InputEvent&) {
                                         return TapDecision::PASS;
                                     });
    TapHandle second = INVALID_TAP_HANDLE;
    second = dispatcher.add(KEYBOARD_MASK, TapRole::OBSERVER,
                            [&](const InputEvent&) {
                                // Runs inside a dispatch on this thread.
                                EXPECT_TRUE(dispatcher.remove(first));
                                EXPECT_TRUE(dispatcher.remove(second));
                                return TapDecision::PASS;
                            });
    dispatcher.dispatch(event(EventType::KEY_DOWN));
    EXPECT_EQ(dispatcher.size(), 0u);
}
