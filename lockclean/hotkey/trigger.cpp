/*
 * trigger.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-13

Description: Unlock hotkey trigger value type

**************************************************/

#include "trigger.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

#include <fmt/format.h>

#include "lockclean/error/exception.hpp"

namespace lockclean::hotkey {

namespace keycode = input::keycode;

namespace {
struct KeyLabel {
    KeyCode keyCode;
    std::string_view label;
};

constexpr std::array SPECIAL_KEYS = {
    KeyLabel{keycode::RETURN, "↩"},
    KeyLabel{keycode::TAB, "⇥"},
    KeyLabel{keycode::SPACE, "Space"},
    KeyLabel{keycode::DELETE, "⌫"},
    KeyLabel{keycode::ESCAPE, "⎋"},
    KeyLabel{keycode::FORWARD_DELETE, "⌦"},
    KeyLabel{keycode::HOME, "↖"},
    KeyLabel{keycode::END, "↘"},
    KeyLabel{keycode::PAGE_UP, "⇞"},
    KeyLabel{keycode::PAGE_DOWN, "⇟"},
    KeyLabel{keycode::LEFT_ARROW, "←"},
    KeyLabel{keycode::RIGHT_ARROW, "→"},
    KeyLabel{keycode::DOWN_ARROW, "↓"},
    KeyLabel{keycode::UP_ARROW, "↑"},
    KeyLabel{keycode::F1, "F1"},
    KeyLabel{keycode::F2, "F2"},
    KeyLabel{keycode::F3, "F3"},
    KeyLabel{keycode::F4, "F4"},
    KeyLabel{keycode::F5, "F5"},
    KeyLabel{keycode::F6, "F6"},
    KeyLabel{keycode::F7, "F7"},
    KeyLabel{keycode::F8, "F8"},
    KeyLabel{keycode::F9, "F9"},
    KeyLabel{keycode::F10, "F10"},
    KeyLabel{keycode::F11, "F11"},
    KeyLabel{keycode::F12, "F12"},
    KeyLabel{keycode::F13, "F13"},
    KeyLabel{keycode::F14, "F14"},
    KeyLabel{keycode::F15, "F15"},
    KeyLabel{keycode::F16, "F16"},
    KeyLabel{keycode::F17, "F17"},
    KeyLabel{keycode::F18, "F18"},
    KeyLabel{keycode::F19, "F19"},
    KeyLabel{keycode::F20, "F20"},
};

// Legends printed on a US ANSI keyboard, used when no characters are known
constexpr std::array ANSI_LEGENDS = {
    KeyLabel{keycode::ANSI_A, "A"}, KeyLabel{keycode::ANSI_B, "B"},
    KeyLabel{keycode::ANSI_C, "C"}, KeyLabel{keycode::ANSI_D, "D"},
    KeyLabel{keycode::ANSI_E, "E"}, KeyLabel{keycode::ANSI_F, "F"},
    KeyLabel{keycode::ANSI_G, "G"}, KeyLabel{keycode::ANSI_H, "H"},
    KeyLabel{keycode::ANSI_I, "I"}, KeyLabel{keycode::ANSI_J, "J"},
    KeyLabel{keycode::ANSI_K, "K"}, KeyLabel{keycode::ANSI_L, "L"},
    KeyLabel{keycode::ANSI_M, "M"}, KeyLabel{keycode::ANSI_N, "N"},
    KeyLabel{keycode::ANSI_O, "O"}, KeyLabel{keycode::ANSI_P, "P"},
    KeyLabel{keycode::ANSI_Q, "Q"}, KeyLabel{keycode::ANSI_R, "R"},
    KeyLabel{keycode::ANSI_S, "S"}, KeyLabel{keycode::ANSI_T, "T"},
    KeyLabel{keycode::ANSI_U, "U"}, KeyLabel{keycode::ANSI_V, "V"},
    KeyLabel{keycode::ANSI_W, "W"}, KeyLabel{keycode::ANSI_X, "X"},
    KeyLabel{keycode::ANSI_Y, "Y"}, KeyLabel{keycode::ANSI_Z, "Z"},
    KeyLabel{keycode::ANSI_0, "0"}, KeyLabel{keycode::ANSI_1, "1"},
    KeyLabel{keycode::ANSI_2, "2"}, KeyLabel{keycode::ANSI_3, "3"},
    KeyLabel{keycode::ANSI_4, "4"}, KeyLabel{keycode::ANSI_5, "5"},
    KeyLabel{keycode::ANSI_6, "6"}, KeyLabel{keycode::ANSI_7, "7"},
    KeyLabel{keycode::ANSI_8, "8"}, KeyLabel{keycode::ANSI_9, "9"},
};

template <std::size_t N>
auto findLabel(const std::array<KeyLabel, N>& table, KeyCode keyCode)
    -> std::optional<std::string_view> {
    auto iter =
        std::find_if(table.begin(), table.end(), [keyCode](const KeyLabel& l) {
            return l.keyCode == keyCode;
        });
    if (iter == table.end()) {
        return std::nullopt;
    }
    return iter->label;
}

auto toUpperAscii(std::string_view text) -> std::string {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) {
                       return static_cast<char>(std::toupper(c));
                   });
    return result;
}
}  // namespace

HotkeyTrigger::HotkeyTrigger(TriggerKind kind, std::optional<KeyCode> keyCode,
                             ModifierSet modifiers, std::string characters)
    : kind_(kind),
      keyCode_(keyCode),
      modifiers_(modifiers.canonical()),
      characters_(std::move(characters)) {}

auto HotkeyTrigger::doubleShift() -> HotkeyTrigger {
    return HotkeyTrigger(TriggerKind::DOUBLE_PRESS, std::nullopt,
                         ModifierSet{Modifier::SHIFT}, {});
}

auto HotkeyTrigger::combination(KeyCode keyCode, ModifierSet modifiers,
                                std::string characters) -> HotkeyTrigger {
    // A stored key code 0 without characters is the legacy modifier-only
    // form, so ANSI A always carries its character.
    if (keyCode == input::keycode::ANSI_A && characters.empty()) {
        characters = "a";
    }
    return HotkeyTrigger(TriggerKind::COMBINATION, keyCode, modifiers,
                         std::move(characters));
}

auto HotkeyTrigger::modifiersOnly(ModifierSet modifiers) -> HotkeyTrigger {
    if (modifiers.canonical().empty()) {
        THROW_INVALID_ARGUMENT(
            "Modifier-only trigger needs at least one of control, option, "
            "shift or command (raw mask {:#x})",
            modifiers.raw());
    }
    return HotkeyTrigger(TriggerKind::MODIFIERS_ONLY, std::nullopt, modifiers,
                         {});
}

auto HotkeyTrigger::isDefault() const noexcept -> bool {
    return *this == doubleShift();
}

auto HotkeyTrigger::displayString() const -> std::string {
    switch (kind_) {
        case TriggerKind::DOUBLE_PRESS:
            return modifiers_.glyphs() + modifiers_.glyphs();
        case TriggerKind::MODIFIERS_ONLY:
            return modifiers_.glyphs();
        case TriggerKind::COMBINATION:
            return modifiers_.glyphs() + keyName(*keyCode_, characters_);
    }
    return {};
}

auto HotkeyTrigger::description() const -> std::string {
    if (isDefault()) {
        return "Double Shift";
    }
    return displayString();
}

auto keyName(KeyCode keyCode, std::string_view characters) -> std::string {
    if (auto special = findLabel(SPECIAL_KEYS, keyCode)) {
        return std::string(*special);
    }
    if (!characters.empty()) {
        return toUpperAscii(characters);
    }
    if (auto legend = findLabel(ANSI_LEGENDS, keyCode)) {
        return std::string(*legend);
    }
    return fmt::format("Key {:#04x}", keyCode);
}

auto toString(TriggerKind kind) -> std::string_view {
    switch (kind) {
        case TriggerKind::DOUBLE_PRESS:
            return "DoublePress";
        case TriggerKind::COMBINATION:
            return "Combination";
        case TriggerKind::MODIFIERS_ONLY:
            return "ModifiersOnly";
    }
    return "Unknown";
}

}  // namespace lockclean::hotkey
