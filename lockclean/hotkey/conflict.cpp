/*
 * conflict.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-13

Description: Detection of unlock triggers that shadow system shortcuts

**************************************************/

#include "conflict.hpp"

#include <array>

namespace lockclean::hotkey {

namespace {
namespace keycode = input::keycode;

constexpr ModifierSet COMMAND{Modifier::COMMAND};

constexpr std::array SYSTEM_SHORTCUTS = {
    SystemShortcut{"Select All", keycode::ANSI_A, COMMAND},
    SystemShortcut{"Copy", keycode::ANSI_C, COMMAND},
    SystemShortcut{"Paste", keycode::ANSI_V, COMMAND},
    SystemShortcut{"Cut", keycode::ANSI_X, COMMAND},
    SystemShortcut{"Undo", keycode::ANSI_Z, COMMAND},
    SystemShortcut{"Close Window", keycode::ANSI_W, COMMAND},
    SystemShortcut{"Quit", keycode::ANSI_Q, COMMAND},
    SystemShortcut{"Spotlight", keycode::SPACE, COMMAND},
    SystemShortcut{"Switch Apps", keycode::TAB, COMMAND},
};
}  // namespace

auto systemShortcuts() noexcept -> std::span<const SystemShortcut> {
    return SYSTEM_SHORTCUTS;
}

auto checkConflicts(const HotkeyTrigger& trigger) -> std::vector<std::string> {
    std::vector<std::string> conflicts;
    if (trigger.kind() != TriggerKind::COMBINATION) {
        return conflicts;
    }
    auto modifiers = trigger.modifiers().canonical();
    for (const auto& shortcut : SYSTEM_SHORTCUTS) {
        if (trigger.keyCode() == shortcut.keyCode &&
            modifiers == shortcut.modifiers) {
            conflicts.emplace_back(shortcut.name);
        }
    }
    return conflicts;
}

}  // namespace lockclean::hotkey
