/*
 * double_press.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-13

Description: Double-press gesture state machine

**************************************************/

#include "double_press.hpp"

#include <spdlog/spdlog.h>

#include "lockclean/error/exception.hpp"

namespace lockclean::hotkey {

using input::EventType;
using input::ModifierSet;

DoublePressTracker::DoublePressTracker(input::Modifier modifier,
                                       std::chrono::nanoseconds window)
    : modifier_(modifier), window_(window) {
    if (window_ <= std::chrono::nanoseconds::zero()) {
        THROW_INVALID_ARGUMENT("Double-press window must be positive");
    }
}

auto DoublePressTracker::state() const noexcept -> PressState {
    return timing_.pressCount > 0 ? PressState::ARMED : PressState::IDLE;
}

void DoublePressTracker::reset() {
    timing_.lastPress.reset();
    timing_.pressCount = 0;
}

void DoublePressTracker::arm(input::Timestamp at) {
    timing_.lastPress = at;
    timing_.pressCount = 1;
}

auto DoublePressTracker::observe(const input::InputEvent& event) -> bool {
    if (event.type == EventType::KEY_DOWN) {
        reset();
        return false;
    }
    if (event.type != EventType::FLAGS_CHANGED) {
        return false;
    }

    auto held = event.modifiers.canonical();
    bool down = held.contains(modifier_);
    bool wasHeld = timing_.keyHeld;
    timing_.keyHeld = down;

    if (!held.empty() && held != ModifierSet{modifier_}) {
        reset();
        return false;
    }
    if (!down || wasHeld) {
        return false;
    }

    if (state() == PressState::IDLE || !timing_.lastPress) {
        arm(event.timestamp);
        return false;
    }

    auto elapsed = event.timestamp - *timing_.lastPress;
    if (elapsed >= std::chrono::nanoseconds::zero() && elapsed < window_) {
        spdlog::debug("[DoublePress] Second press after {} ms",
                      std::chrono::duration_cast<std::chrono::milliseconds>(
                          elapsed)
                          .count());
        reset();
        return true;
    }
    arm(event.timestamp);
    return false;
}

}  // namespace lockclean::hotkey
