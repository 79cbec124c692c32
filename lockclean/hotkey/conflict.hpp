/*
 * conflict.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-13

Description: Detection of unlock triggers that shadow system shortcuts

**************************************************/

#ifndef LOCKCLEAN_HOTKEY_CONFLICT_HPP
#define LOCKCLEAN_HOTKEY_CONFLICT_HPP

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "trigger.hpp"

namespace lockclean::hotkey {

struct SystemShortcut {
    std::string_view name;
    KeyCode keyCode;
    ModifierSet modifiers;
};

/**
 * @brief The shortcuts a custom trigger must not reuse, in report order.
 */
[[nodiscard]] auto systemShortcuts() noexcept -> std::span<const SystemShortcut>;

/**
 * @brief Names of the system shortcuts @p trigger collides with.
 *
 * Only combination triggers can collide; a collision is an equal key code
 * and an equal canonical modifier set.
 */
[[nodiscard]] auto checkConflicts(const HotkeyTrigger& trigger)
    -> std::vector<std::string>;

}  // namespace lockclean::hotkey

#endif  // LOCKCLEAN_HOTKEY_CONFLICT_HPP
