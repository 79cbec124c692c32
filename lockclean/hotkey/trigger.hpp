/*
 * trigger.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-13

Description: Unlock hotkey trigger value type

**************************************************/

#ifndef LOCKCLEAN_HOTKEY_TRIGGER_HPP
#define LOCKCLEAN_HOTKEY_TRIGGER_HPP

#include <optional>
#include <string>
#include <string_view>

#include "lockclean/input/keycodes.hpp"
#include "lockclean/input/modifiers.hpp"

namespace lockclean::hotkey {

using input::KeyCode;
using input::Modifier;
using input::ModifierSet;

/**
 * @brief How a trigger is recognized.
 */
enum class TriggerKind {
    DOUBLE_PRESS,   ///< Two presses of a single modifier within a window
    COMBINATION,    ///< One key-down with an exact modifier set
    MODIFIERS_ONLY  ///< A modifier change reaching an exact non-empty set
};

/**
 * @brief Immutable description of the gesture that requests unlock.
 *
 * Modifier sets are stored in canonical form (control, option, shift,
 * command). Instances are replaced wholesale, never mutated.
 */
class HotkeyTrigger {
public:
    /**
     * @brief The built-in trigger: Shift pressed twice with no other
     * modifier held.
     */
    [[nodiscard]] static auto doubleShift() -> HotkeyTrigger;

    /**
     * @brief A key pressed together with exactly @p modifiers.
     * @param characters The key's characters ignoring modifiers, used for
     * display only.
     */
    [[nodiscard]] static auto combination(KeyCode keyCode,
                                          ModifierSet modifiers,
                                          std::string characters = {})
        -> HotkeyTrigger;

    /**
     * @brief Exactly @p modifiers held, without any other key.
     * @throws lockclean::error::InvalidArgument if the canonical set is empty.
     */
    [[nodiscard]] static auto modifiersOnly(ModifierSet modifiers)
        -> HotkeyTrigger;

    [[nodiscard]] auto kind() const noexcept -> TriggerKind { return kind_; }
    [[nodiscard]] auto keyCode() const noexcept -> std::optional<KeyCode> {
        return keyCode_;
    }
    [[nodiscard]] auto modifiers() const noexcept -> ModifierSet {
        return modifiers_;
    }
    [[nodiscard]] auto characters() const noexcept -> const std::string& {
        return characters_;
    }

    [[nodiscard]] auto isDefault() const noexcept -> bool;

    /**
     * @brief Symbolic rendering, e.g. "⌃⌥K" or "⌘Space".
     */
    [[nodiscard]] auto displayString() const -> std::string;

    /**
     * @brief Human-readable description: "Double Shift" for the default,
     * otherwise the display string.
     */
    [[nodiscard]] auto description() const -> std::string;

    bool operator==(const HotkeyTrigger& other) const = default;

private:
    HotkeyTrigger(TriggerKind kind, std::optional<KeyCode> keyCode,
                  ModifierSet modifiers, std::string characters);

    TriggerKind kind_;
    std::optional<KeyCode> keyCode_;
    ModifierSet modifiers_;
    std::string characters_;
};

/**
 * @brief Display name of a key: a glyph or name for special keys, otherwise
 * the upper-cased characters, falling back to the ANSI legend.
 */
[[nodiscard]] auto keyName(KeyCode keyCode, std::string_view characters)
    -> std::string;

[[nodiscard]] auto toString(TriggerKind kind) -> std::string_view;

}  // namespace lockclean::hotkey

#endif  // LOCKCLEAN_HOTKEY_TRIGGER_HPP
