/*
 * event.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-12

Description: Platform-independent input event value

**************************************************/

#include "event.hpp"

namespace lockclean::input {

auto ticksToTimestamp(std::uint64_t ticks, std::uint32_t numer,
                      std::uint32_t denom) noexcept -> Timestamp {
    if (denom == 0 || numer == denom) {
        return Timestamp(static_cast<Timestamp::rep>(ticks));
    }
    // Split to keep ticks * numer from overflowing 64 bits.
    std::uint64_t whole = ticks / denom;
    std::uint64_t rest = ticks % denom;
    std::uint64_t nanos = whole * numer + rest * numer / denom;
    return Timestamp(static_cast<Timestamp::rep>(nanos));
}

auto toString(EventType type) -> std::string_view {
    switch (type) {
        case EventType::NULL_EVENT:
            return "Null";
        case EventType::LEFT_MOUSE_DOWN:
            return "LeftMouseDown";
        case EventType::LEFT_MOUSE_UP:
            return "LeftMouseUp";
        case EventType::RIGHT_MOUSE_DOWN:
            return "RightMouseDown";
        case EventType::RIGHT_MOUSE_UP:
            return "RightMouseUp";
        case EventType::MOUSE_MOVED:
            return "MouseMoved";
        case EventType::LEFT_MOUSE_DRAGGED:
            return "LeftMouseDragged";
        case EventType::RIGHT_MOUSE_DRAGGED:
            return "RightMouseDragged";
        case EventType::KEY_DOWN:
            return "KeyDown";
        case EventType::KEY_UP:
            return "KeyUp";
        case EventType::FLAGS_CHANGED:
            return "FlagsChanged";
        case EventType::SYSTEM_DEFINED:
            return "SystemDefined";
        case EventType::SCROLL_WHEEL:
            return "ScrollWheel";
        case EventType::OTHER_MOUSE_DOWN:
            return "OtherMouseDown";
        case EventType::OTHER_MOUSE_UP:
            return "OtherMouseUp";
        case EventType::OTHER_MOUSE_DRAGGED:
            return "OtherMouseDragged";
        case EventType::TAP_DISABLED_BY_TIMEOUT:
            return "TapDisabledByTimeout";
        case EventType::TAP_DISABLED_BY_USER_INPUT:
            return "TapDisabledByUserInput";
    }
    return "Unknown";
}

}  // namespace lockclean::input
