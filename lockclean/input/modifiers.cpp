/*
 * modifiers.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-12

Description: Modifier key flags and sets

**************************************************/

#include "modifiers.hpp"

namespace lockclean::input {

auto ModifierSet::glyphs() const -> std::string {
    std::string result;
    if (contains(Modifier::CONTROL)) {
        result += "⌃";
    }
    if (contains(Modifier::OPTION)) {
        result += "⌥";
    }
    if (contains(Modifier::SHIFT)) {
        result += "⇧";
    }
    if (contains(Modifier::COMMAND)) {
        result += "⌘";
    }
    return result;
}

}  // namespace lockclean::input
