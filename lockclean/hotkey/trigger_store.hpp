/*
 * trigger_store.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-14

Description: Loads and saves the unlock trigger in the settings store

**************************************************/

#ifndef LOCKCLEAN_HOTKEY_TRIGGER_STORE_HPP
#define LOCKCLEAN_HOTKEY_TRIGGER_STORE_HPP

#include <memory>
#include <string>
#include <string_view>

#include "lockclean/config/settings_store.hpp"
#include "lockclean/error/result.hpp"
#include "trigger.hpp"

namespace lockclean::hotkey {

inline constexpr std::string_view TRIGGER_SETTINGS_KEY = "customHotkey";

class TriggerStore {
public:
    explicit TriggerStore(std::shared_ptr<config::ISettingsStore> settings,
                          std::string key = std::string(TRIGGER_SETTINGS_KEY));

    /**
     * @brief The saved trigger, or double Shift when nothing usable is saved.
     */
    [[nodiscard]] auto load() const -> HotkeyTrigger;

    /**
     * @brief Persist @p trigger. Saving the default clears the record.
     */
    auto save(const HotkeyTrigger& trigger) -> error::Result<void>;

    auto clear() -> error::Result<void>;

private:
    std::shared_ptr<config::ISettingsStore> settings_;
    std::string key_;
};

}  // namespace lockclean::hotkey

#endif  // LOCKCLEAN_HOTKEY_TRIGGER_STORE_HPP
