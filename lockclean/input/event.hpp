/*
 * event.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-12

Description: Platform-independent input event value

**************************************************/

#ifndef LOCKCLEAN_INPUT_EVENT_HPP
#define LOCKCLEAN_INPUT_EVENT_HPP

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <string_view>

#include "keycodes.hpp"
#include "modifiers.hpp"

namespace lockclean::input {

/**
 * @brief Input event classes.
 *
 * Values below 30 match the Quartz event type numbering so a native type maps
 * to the same mask bit. The two tap-disabled notifications are out of band in
 * Quartz and get dedicated bits here.
 */
enum class EventType : std::uint8_t {
    NULL_EVENT = 0,
    LEFT_MOUSE_DOWN = 1,
    LEFT_MOUSE_UP = 2,
    RIGHT_MOUSE_DOWN = 3,
    RIGHT_MOUSE_UP = 4,
    MOUSE_MOVED = 5,
    LEFT_MOUSE_DRAGGED = 6,
    RIGHT_MOUSE_DRAGGED = 7,
    KEY_DOWN = 10,
    KEY_UP = 11,
    FLAGS_CHANGED = 12,
    SYSTEM_DEFINED = 14,  ///< Media, brightness and volume keys
    SCROLL_WHEEL = 22,
    OTHER_MOUSE_DOWN = 25,
    OTHER_MOUSE_UP = 26,
    OTHER_MOUSE_DRAGGED = 27,
    TAP_DISABLED_BY_TIMEOUT = 30,
    TAP_DISABLED_BY_USER_INPUT = 31
};

using EventMask = std::uint64_t;

[[nodiscard]] constexpr auto maskBit(EventType type) noexcept -> EventMask {
    return EventMask{1} << static_cast<unsigned>(type);
}

[[nodiscard]] constexpr auto makeMask(std::initializer_list<EventType> types)
    -> EventMask {
    EventMask mask = 0;
    for (auto type : types) {
        mask |= maskBit(type);
    }
    return mask;
}

[[nodiscard]] constexpr auto maskContains(EventMask mask,
                                          EventType type) noexcept -> bool {
    return (mask & maskBit(type)) != 0;
}

inline constexpr EventMask KEYBOARD_MASK =
    makeMask({EventType::KEY_DOWN, EventType::KEY_UP,
              EventType::FLAGS_CHANGED, EventType::SYSTEM_DEFINED});

inline constexpr EventMask MOUSE_MASK = makeMask(
    {EventType::LEFT_MOUSE_DOWN, EventType::LEFT_MOUSE_UP,
     EventType::RIGHT_MOUSE_DOWN, EventType::RIGHT_MOUSE_UP,
     EventType::OTHER_MOUSE_DOWN, EventType::OTHER_MOUSE_UP,
     EventType::MOUSE_MOVED, EventType::LEFT_MOUSE_DRAGGED,
     EventType::RIGHT_MOUSE_DRAGGED, EventType::OTHER_MOUSE_DRAGGED,
     EventType::SCROLL_WHEEL});

/// Delivered to every registration regardless of its requested mask.
inline constexpr EventMask TAP_CONTROL_MASK =
    makeMask({EventType::TAP_DISABLED_BY_TIMEOUT,
              EventType::TAP_DISABLED_BY_USER_INPUT});

struct Point {
    double x = 0.0;
    double y = 0.0;

    constexpr bool operator==(const Point& other) const noexcept = default;
};

/// Time since an arbitrary fixed origin (system boot for native events).
using Timestamp = std::chrono::nanoseconds;

/**
 * @brief Converts host clock ticks to a Timestamp.
 *
 * Quartz stamps events in mach_absolute_time units; one tick is
 * @p numer / @p denom nanoseconds (125/3 on Apple Silicon, 1/1 on Intel).
 * A zero @p denom is treated as a 1:1 timebase.
 */
[[nodiscard]] auto ticksToTimestamp(std::uint64_t ticks, std::uint32_t numer,
                                    std::uint32_t denom) noexcept -> Timestamp;

/**
 * @brief A single observed input event.
 */
struct InputEvent {
    EventType type = EventType::NULL_EVENT;
    KeyCode keyCode = 0;
    ModifierSet modifiers;
    Timestamp timestamp{0};
    Point location;
};

[[nodiscard]] constexpr auto isTapDisabled(EventType type) noexcept -> bool {
    return type == EventType::TAP_DISABLED_BY_TIMEOUT ||
           type == EventType::TAP_DISABLED_BY_USER_INPUT;
}

[[nodiscard]] constexpr auto isPointerMotion(EventType type) noexcept
    -> bool {
    return type == EventType::MOUSE_MOVED ||
           type == EventType::LEFT_MOUSE_DRAGGED ||
           type == EventType::RIGHT_MOUSE_DRAGGED ||
           type == EventType::OTHER_MOUSE_DRAGGED;
}

[[nodiscard]] auto toString(EventType type) -> std::string_view;

}  // namespace lockclean::input

#endif  // LOCKCLEAN_INPUT_EVENT_HPP
