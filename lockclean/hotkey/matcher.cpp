/*
 * matcher.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-13

Description: Single-event matching for combination and modifier triggers

**************************************************/

#include "matcher.hpp"

namespace lockclean::hotkey {

using input::EventType;

auto matches(const HotkeyTrigger& trigger, const input::InputEvent& event)
    -> bool {
    auto held = event.modifiers.canonical();
    switch (trigger.kind()) {
        case TriggerKind::COMBINATION:
            return event.type == EventType::KEY_DOWN &&
                   trigger.keyCode() == event.keyCode &&
                   held == trigger.modifiers();
        case TriggerKind::MODIFIERS_ONLY:
            return event.type == EventType::FLAGS_CHANGED &&
                   !trigger.modifiers().empty() &&
                   held == trigger.modifiers();
        case TriggerKind::DOUBLE_PRESS:
            break;
    }
    return false;
}

}  // namespace lockclean::hotkey
