/*
 * trigger_record.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-13

Description: Flat persisted form of an unlock trigger

**************************************************/

#ifndef LOCKCLEAN_HOTKEY_TRIGGER_RECORD_HPP
#define LOCKCLEAN_HOTKEY_TRIGGER_RECORD_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "lockclean/error/result.hpp"
#include "trigger.hpp"

namespace lockclean::hotkey {

using json = nlohmann::json;

/**
 * @brief The record stored under the settings key.
 *
 * JSON form: {"keyCode": 40 | null, "modifiersRawValue": 1048576,
 * "characters": "k"}. A null key code means modifiers only; a legacy record
 * with key code 0 and no characters is read the same way. "doublePress" is
 * only written for double-press triggers.
 */
struct TriggerRecord {
    std::optional<KeyCode> keyCode;
    std::uint64_t modifiersRawValue = 0;
    std::string characters;
    bool doublePress = false;

    bool operator==(const TriggerRecord& other) const = default;
};

[[nodiscard]] auto toRecord(const HotkeyTrigger& trigger) -> TriggerRecord;

/**
 * @brief Validate a record and build the trigger it describes.
 * @return INVALID_RECORD for an empty modifier-only record.
 */
[[nodiscard]] auto fromRecord(const TriggerRecord& record)
    -> error::Result<HotkeyTrigger>;

[[nodiscard]] auto toJson(const TriggerRecord& record) -> json;

/**
 * @return INVALID_RECORD when fields are missing or of the wrong type.
 */
[[nodiscard]] auto recordFromJson(const json& value)
    -> error::Result<TriggerRecord>;

[[nodiscard]] auto serialize(const HotkeyTrigger& trigger) -> std::string;

[[nodiscard]] auto deserialize(std::string_view text)
    -> error::Result<HotkeyTrigger>;

}  // namespace lockclean::hotkey

#endif  // LOCKCLEAN_HOTKEY_TRIGGER_RECORD_HPP
