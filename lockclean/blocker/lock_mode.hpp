/*
 * lock_mode.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-15

Description: Which input class is locked

**************************************************/

#ifndef LOCKCLEAN_BLOCKER_LOCK_MODE_HPP
#define LOCKCLEAN_BLOCKER_LOCK_MODE_HPP

#include <string_view>

#include "lockclean/input/event.hpp"

namespace lockclean::blocker {

enum class LockMode { NONE, KEYBOARD, MOUSE };

[[nodiscard]] constexpr auto toString(LockMode mode) noexcept
    -> std::string_view {
    switch (mode) {
        case LockMode::KEYBOARD:
            return "Keyboard";
        case LockMode::MOUSE:
            return "Mouse";
        case LockMode::NONE:
            break;
    }
    return "None";
}

/**
 * @brief Event classes swallowed in @p mode.
 */
[[nodiscard]] constexpr auto blockedMask(LockMode mode) noexcept
    -> input::EventMask {
    switch (mode) {
        case LockMode::KEYBOARD:
            return input::KEYBOARD_MASK;
        case LockMode::MOUSE:
            return input::MOUSE_MASK;
        case LockMode::NONE:
            break;
    }
    return 0;
}

}  // namespace lockclean::blocker

#endif  // LOCKCLEAN_BLOCKER_LOCK_MODE_HPP
