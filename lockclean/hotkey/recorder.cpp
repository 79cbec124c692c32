/*
 * recorder.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-14

Description: Captures a candidate unlock trigger from live key events

**************************************************/

#include "recorder.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include "conflict.hpp"

namespace lockclean::hotkey {

using input::EventType;

auto HotkeyRecorder::capture(const input::InputEvent& event,
                             std::string_view characters) -> bool {
    if (event.type == EventType::KEY_DOWN) {
        setCandidate(HotkeyTrigger::combination(
            event.keyCode, event.modifiers, std::string(characters)));
        return true;
    }
    if (event.type == EventType::FLAGS_CHANGED &&
        !event.modifiers.canonical().empty()) {
        setCandidate(HotkeyTrigger::modifiersOnly(event.modifiers));
        return true;
    }
    return false;
}

void HotkeyRecorder::setCandidate(HotkeyTrigger trigger) {
    conflicts_ = checkConflicts(trigger);
    if (!conflicts_.empty()) {
        spdlog::debug("[HotkeyRecorder] {} conflicts with {}",
                      trigger.displayString(), fmt::join(conflicts_, ", "));
    }
    candidate_ = std::move(trigger);
}

auto HotkeyRecorder::conflictDescription() const
    -> std::optional<std::string> {
    if (conflicts_.empty()) {
        return std::nullopt;
    }
    return fmt::format("Conflict: {}", fmt::join(conflicts_, ", "));
}

auto HotkeyRecorder::displayText() const -> std::string {
    return candidate_ ? candidate_->displayString() : std::string(PLACEHOLDER);
}

auto HotkeyRecorder::accept() const -> std::optional<HotkeyTrigger> {
    if (!candidate_ || hasConflict()) {
        return std::nullopt;
    }
    return candidate_;
}

void HotkeyRecorder::clear() {
    candidate_.reset();
    conflicts_.clear();
}

}  // namespace lockclean::hotkey
