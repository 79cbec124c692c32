/*
 * trigger_store.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-14

Description: Loads and saves the unlock trigger in the settings store

**************************************************/

#include "trigger_store.hpp"

#include <spdlog/spdlog.h>

#include "lockclean/error/exception.hpp"
#include "trigger_record.hpp"

namespace lockclean::hotkey {

TriggerStore::TriggerStore(std::shared_ptr<config::ISettingsStore> settings,
                           std::string key)
    : settings_(std::move(settings)), key_(std::move(key)) {
    if (!settings_) {
        THROW_INVALID_ARGUMENT("TriggerStore requires a settings store");
    }
}

auto TriggerStore::load() const -> HotkeyTrigger {
    auto stored = settings_->get(key_);
    if (!stored) {
        return HotkeyTrigger::doubleShift();
    }

    // Older builds stored the record as an encoded JSON string.
    error::Result<HotkeyTrigger> trigger =
        error::InputErrorCode::INVALID_RECORD;
    if (stored->is_string()) {
        trigger = deserialize(stored->get<std::string>());
    } else if (auto record = recordFromJson(*stored)) {
        trigger = fromRecord(*record);
    }
    if (!trigger) {
        spdlog::warn("[TriggerStore] Ignoring unusable '{}' record: {}", key_,
                     trigger.error().message());
        return HotkeyTrigger::doubleShift();
    }
    spdlog::info("[TriggerStore] Loaded unlock trigger {}",
                 trigger->description());
    return *trigger;
}

auto TriggerStore::save(const HotkeyTrigger& trigger) -> error::Result<void> {
    if (trigger.isDefault()) {
        return clear();
    }
    auto result = settings_->set(key_, toJson(toRecord(trigger)));
    if (!result) {
        spdlog::error("[TriggerStore] Failed to save unlock trigger: {}",
                      result.error().message());
        return result;
    }
    spdlog::info("[TriggerStore] Saved unlock trigger {}",
                 trigger.description());
    return result;
}

auto TriggerStore::clear() -> error::Result<void> {
    auto result = settings_->remove(key_);
    if (!result) {
        spdlog::error("[TriggerStore] Failed to clear unlock trigger: {}",
                      result.error().message());
    }
    return result;
}

}  // namespace lockclean::hotkey
