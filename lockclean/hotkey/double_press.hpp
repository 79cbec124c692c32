/*
 * double_press.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-13

Description: Double-press gesture state machine

**************************************************/

#ifndef LOCKCLEAN_HOTKEY_DOUBLE_PRESS_HPP
#define LOCKCLEAN_HOTKEY_DOUBLE_PRESS_HPP

#include <chrono>
#include <optional>

#include "lockclean/input/event.hpp"

namespace lockclean::hotkey {

using namespace std::chrono_literals;

inline constexpr std::chrono::milliseconds DEFAULT_DOUBLE_PRESS_WINDOW =
    500ms;

enum class PressState { IDLE, ARMED };

/**
 * @brief Timing state, advanced only by event arrival.
 */
struct PressTimingState {
    std::optional<input::Timestamp> lastPress;
    int pressCount = 0;
    bool keyHeld = false;  ///< The tracked modifier is currently down
};

/**
 * @brief Recognizes a modifier pressed twice within a window with no other
 * modifier held.
 *
 * A press counts when the tracked modifier goes from released to pressed and
 * the canonical modifier set is exactly that modifier. Releasing it does not
 * break the sequence; a key-down or another modifier does.
 */
class DoublePressTracker {
public:
    explicit DoublePressTracker(
        input::Modifier modifier = input::Modifier::SHIFT,
        std::chrono::nanoseconds window = DEFAULT_DOUBLE_PRESS_WINDOW);

    /**
     * @brief Feed one event.
     * @return true exactly when this event completes the gesture.
     */
    auto observe(const input::InputEvent& event) -> bool;

    void reset();

    [[nodiscard]] auto state() const noexcept -> PressState;
    [[nodiscard]] auto timing() const noexcept -> const PressTimingState& {
        return timing_;
    }
    [[nodiscard]] auto window() const noexcept -> std::chrono::nanoseconds {
        return window_;
    }
    [[nodiscard]] auto modifier() const noexcept -> input::Modifier {
        return modifier_;
    }

private:
    void arm(input::Timestamp at);

    input::Modifier modifier_;
    std::chrono::nanoseconds window_;
    PressTimingState timing_;
};

}  // namespace lockclean::hotkey

#endif  // LOCKCLEAN_HOTKEY_DOUBLE_PRESS_HPP
