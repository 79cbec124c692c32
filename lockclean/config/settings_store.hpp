/*
 * settings_store.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-14

Description: Key/value persistence for user settings

**************************************************/

#ifndef LOCKCLEAN_CONFIG_SETTINGS_STORE_HPP
#define LOCKCLEAN_CONFIG_SETTINGS_STORE_HPP

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "lockclean/error/result.hpp"

namespace lockclean::config {

using json = nlohmann::json;

/**
 * @brief A flat map from setting keys to JSON values.
 */
class ISettingsStore {
public:
    virtual ~ISettingsStore() = default;

    [[nodiscard]] virtual auto get(std::string_view key) const
        -> std::optional<json> = 0;

    virtual auto set(std::string_view key, json value)
        -> error::Result<void> = 0;

    /**
     * @brief Remove @p key. Removing an absent key succeeds.
     */
    virtual auto remove(std::string_view key) -> error::Result<void> = 0;

    [[nodiscard]] virtual auto contains(std::string_view key) const -> bool {
        return get(key).has_value();
    }
};

class MemorySettingsStore : public ISettingsStore {
public:
    MemorySettingsStore() = default;
    explicit MemorySettingsStore(json initial);

    [[nodiscard]] auto get(std::string_view key) const
        -> std::optional<json> override;
    auto set(std::string_view key, json value) -> error::Result<void> override;
    auto remove(std::string_view key) -> error::Result<void> override;

    [[nodiscard]] auto snapshot() const -> json;

private:
    mutable std::mutex mutex_;
    json values_ = json::object();
};

/**
 * @brief Settings kept as one JSON object in a file.
 *
 * The file is read once on construction; a missing file starts empty and an
 * unreadable one is logged and ignored. Every change rewrites the file
 * through a temporary sibling and a rename.
 */
class JsonFileSettingsStore : public ISettingsStore {
public:
    explicit JsonFileSettingsStore(std::filesystem::path path);

    [[nodiscard]] auto get(std::string_view key) const
        -> std::optional<json> override;
    auto set(std::string_view key, json value) -> error::Result<void> override;
    auto remove(std::string_view key) -> error::Result<void> override;

    [[nodiscard]] auto path() const -> const std::filesystem::path& {
        return path_;
    }

private:
    void load();
    auto flush(const json& values) -> error::Result<void>;

    std::filesystem::path path_;
    mutable std::mutex mutex_;
    json values_ = json::object();
};

}  // namespace lockclean::config

#endif  // LOCKCLEAN_CONFIG_SETTINGS_STORE_HPP
