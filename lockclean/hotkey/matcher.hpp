/*
 * matcher.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-13

Description: Single-event matching for combination and modifier triggers

**************************************************/

#ifndef LOCKCLEAN_HOTKEY_MATCHER_HPP
#define LOCKCLEAN_HOTKEY_MATCHER_HPP

#include "lockclean/input/event.hpp"
#include "trigger.hpp"

namespace lockclean::hotkey {

/**
 * @brief Whether @p event on its own satisfies @p trigger.
 *
 * Modifier sets are compared exactly after canonicalization, so Command-K
 * does not match Command-Shift-K. Double-press triggers never match a single
 * event; use DoublePressTracker for them.
 */
[[nodiscard]] auto matches(const HotkeyTrigger& trigger,
                           const input::InputEvent& event) -> bool;

}  // namespace lockclean::hotkey

#endif  // LOCKCLEAN_HOTKEY_MATCHER_HPP
