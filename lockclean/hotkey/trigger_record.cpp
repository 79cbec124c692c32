/*
 * trigger_record.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-13

Description: Flat persisted form of an unlock trigger

**************************************************/

#include "trigger_record.hpp"

#include <limits>

#include <spdlog/spdlog.h>

namespace lockclean::hotkey {

namespace {
constexpr const char* KEY_CODE = "keyCode";
constexpr const char* MODIFIERS = "modifiersRawValue";
constexpr const char* CHARACTERS = "characters";
constexpr const char* DOUBLE_PRESS = "doublePress";
}  // namespace

auto toRecord(const HotkeyTrigger& trigger) -> TriggerRecord {
    TriggerRecord record;
    record.keyCode = trigger.keyCode();
    record.modifiersRawValue = trigger.modifiers().raw();
    record.characters = trigger.characters();
    record.doublePress = trigger.kind() == TriggerKind::DOUBLE_PRESS;
    return record;
}

auto fromRecord(const TriggerRecord& record) -> error::Result<HotkeyTrigger> {
    ModifierSet modifiers(record.modifiersRawValue);

    if (record.doublePress) {
        if (modifiers.canonical() != ModifierSet{Modifier::SHIFT} ||
            record.keyCode) {
            spdlog::warn(
                "[TriggerRecord] Only double Shift is supported as a "
                "double-press trigger");
            return error::InputErrorCode::INVALID_RECORD;
        }
        return HotkeyTrigger::doubleShift();
    }

    bool legacyModifierOnly =
        record.keyCode && *record.keyCode == 0 && record.characters.empty();
    if (!record.keyCode || legacyModifierOnly) {
        if (modifiers.canonical().empty()) {
            spdlog::warn(
                "[TriggerRecord] Modifier-only record without modifiers");
            return error::InputErrorCode::INVALID_RECORD;
        }
        return HotkeyTrigger::modifiersOnly(modifiers);
    }
    return HotkeyTrigger::combination(*record.keyCode, modifiers,
                                      record.characters);
}

auto toJson(const TriggerRecord& record) -> json {
    json value;
    if (record.keyCode) {
        value[KEY_CODE] = *record.keyCode;
    } else {
        value[KEY_CODE] = nullptr;
    }
    value[MODIFIERS] = record.modifiersRawValue;
    value[CHARACTERS] = record.characters;
    if (record.doublePress) {
        value[DOUBLE_PRESS] = true;
    }
    return value;
}

auto recordFromJson(const json& value) -> error::Result<TriggerRecord> {
    if (!value.is_object() || !value.contains(KEY_CODE) ||
        !value.contains(MODIFIERS) || !value.contains(CHARACTERS)) {
        return error::InputErrorCode::INVALID_RECORD;
    }

    const auto& keyCode = value.at(KEY_CODE);
    const auto& modifiers = value.at(MODIFIERS);
    const auto& characters = value.at(CHARACTERS);

    TriggerRecord record;
    if (keyCode.is_number_unsigned()) {
        auto raw = keyCode.get<std::uint64_t>();
        if (raw > std::numeric_limits<KeyCode>::max()) {
            return error::InputErrorCode::INVALID_RECORD;
        }
        record.keyCode = static_cast<KeyCode>(raw);
    } else if (!keyCode.is_null()) {
        return error::InputErrorCode::INVALID_RECORD;
    }

    if (!modifiers.is_number_unsigned() || !characters.is_string()) {
        return error::InputErrorCode::INVALID_RECORD;
    }
    record.modifiersRawValue = modifiers.get<std::uint64_t>();
    record.characters = characters.get<std::string>();

    if (value.contains(DOUBLE_PRESS)) {
        const auto& doublePress = value.at(DOUBLE_PRESS);
        if (!doublePress.is_boolean()) {
            return error::InputErrorCode::INVALID_RECORD;
        }
        record.doublePress = doublePress.get<bool>();
    }
    return record;
}

auto serialize(const HotkeyTrigger& trigger) -> std::string {
    return toJson(toRecord(trigger)).dump();
}

auto deserialize(std::string_view text) -> error::Result<HotkeyTrigger> {
    json value = json::parse(text, nullptr, false);
    if (value.is_discarded()) {
        spdlog::warn("[TriggerRecord] Hotkey record is not valid JSON");
        return error::InputErrorCode::INVALID_RECORD;
    }
    auto record = recordFromJson(value);
    if (!record) {
        spdlog::warn("[TriggerRecord] Hotkey record has unexpected shape: {}",
                     value.dump());
        return record.error();
    }
    return fromRecord(*record);
}

}  // namespace lockclean::hotkey
