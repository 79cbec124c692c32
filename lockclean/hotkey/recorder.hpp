/*
 * recorder.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-14

Description: Captures a candidate unlock trigger from live key events

**************************************************/

#ifndef LOCKCLEAN_HOTKEY_RECORDER_HPP
#define LOCKCLEAN_HOTKEY_RECORDER_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lockclean/input/event.hpp"
#include "trigger.hpp"

namespace lockclean::hotkey {

/**
 * @brief Builds a trigger from the last key event the user produced and
 * keeps the candidate's conflicts up to date.
 */
class HotkeyRecorder {
public:
    static constexpr std::string_view PLACEHOLDER =
        "Click here and press a key...";

    /**
     * @brief Record a key-down as a combination, or a modifier change with a
     * non-empty canonical set as a modifiers-only trigger.
     * @param characters The key's characters ignoring modifiers.
     * @return true if the candidate changed.
     */
    auto capture(const input::InputEvent& event,
                 std::string_view characters = {}) -> bool;

    [[nodiscard]] auto candidate() const -> const std::optional<HotkeyTrigger>& {
        return candidate_;
    }

    [[nodiscard]] auto conflicts() const -> const std::vector<std::string>& {
        return conflicts_;
    }

    [[nodiscard]] auto hasConflict() const -> bool {
        return !conflicts_.empty();
    }

    /**
     * @return "Conflict: Copy, ..." or nothing when the candidate is free.
     */
    [[nodiscard]] auto conflictDescription() const
        -> std::optional<std::string>;

    /**
     * @brief The candidate's display string, or the placeholder.
     */
    [[nodiscard]] auto displayText() const -> std::string;

    /**
     * @brief The candidate, if there is one and it has no conflict.
     */
    [[nodiscard]] auto accept() const -> std::optional<HotkeyTrigger>;

    void clear();

private:
    void setCandidate(HotkeyTrigger trigger);

    std::optional<HotkeyTrigger> candidate_;
    std::vector<std::string> conflicts_;
};

}  // namespace lockclean::hotkey

#endif  // LOCKCLEAN_HOTKEY_RECORDER_HPP
