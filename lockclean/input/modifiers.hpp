/*
 * modifiers.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-12

Description: Modifier key flags and sets

**************************************************/

#ifndef LOCKCLEAN_INPUT_MODIFIERS_HPP
#define LOCKCLEAN_INPUT_MODIFIERS_HPP

#include <cstdint>
#include <initializer_list>
#include <string>

namespace lockclean::input {

/**
 * @brief Modifier flags, bit-compatible with the device-independent part of
 * the Quartz and AppKit modifier masks.
 */
enum class Modifier : std::uint64_t {
    CAPS_LOCK = 1ULL << 16,
    SHIFT = 1ULL << 17,
    CONTROL = 1ULL << 18,
    OPTION = 1ULL << 19,
    COMMAND = 1ULL << 20,
    NUMERIC_PAD = 1ULL << 21,
    HELP = 1ULL << 22,
    FUNCTION = 1ULL << 23
};

/// Bits that do not depend on which physical key produced the modifier.
inline constexpr std::uint64_t DEVICE_INDEPENDENT_MASK = 0xFFFF0000ULL;

/// Control, option, shift and command; the only modifiers triggers compare.
inline constexpr std::uint64_t CANONICAL_MASK =
    static_cast<std::uint64_t>(Modifier::CONTROL) |
    static_cast<std::uint64_t>(Modifier::OPTION) |
    static_cast<std::uint64_t>(Modifier::SHIFT) |
    static_cast<std::uint64_t>(Modifier::COMMAND);

/**
 * @brief An immutable set of modifier flags.
 *
 * Constructing from a raw mask strips device-dependent bits so that left and
 * right variants of the same key compare equal.
 */
class ModifierSet {
public:
    constexpr ModifierSet() noexcept = default;

    constexpr explicit ModifierSet(std::uint64_t raw) noexcept
        : raw_(raw & DEVICE_INDEPENDENT_MASK) {}

    constexpr ModifierSet(std::initializer_list<Modifier> modifiers) noexcept {
        for (auto modifier : modifiers) {
            raw_ |= static_cast<std::uint64_t>(modifier);
        }
    }

    [[nodiscard]] constexpr auto raw() const noexcept -> std::uint64_t {
        return raw_;
    }

    [[nodiscard]] constexpr auto contains(Modifier modifier) const noexcept
        -> bool {
        return (raw_ & static_cast<std::uint64_t>(modifier)) != 0;
    }

    [[nodiscard]] constexpr auto empty() const noexcept -> bool {
        return raw_ == 0;
    }

    /**
     * @brief Restrict the set to control, option, shift and command.
     */
    [[nodiscard]] constexpr auto canonical() const noexcept -> ModifierSet {
        return ModifierSet(raw_ & CANONICAL_MASK);
    }

    [[nodiscard]] constexpr auto with(Modifier modifier) const noexcept
        -> ModifierSet {
        return ModifierSet(raw_ | static_cast<std::uint64_t>(modifier));
    }

    [[nodiscard]] constexpr auto without(Modifier modifier) const noexcept
        -> ModifierSet {
        return ModifierSet(raw_ & ~static_cast<std::uint64_t>(modifier));
    }

    constexpr bool operator==(const ModifierSet& other) const noexcept =
        default;

    /**
     * @brief Render the canonical modifiers as glyphs in menu order
     * (control, option, shift, command).
     */
    [[nodiscard]] auto glyphs() const -> std::string;

private:
    std::uint64_t raw_ = 0;
};

}  // namespace lockclean::input

#endif  // LOCKCLEAN_INPUT_MODIFIERS_HPP
