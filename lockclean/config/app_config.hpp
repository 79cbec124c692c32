/*
 * app_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-14

Description: Application configuration file

**************************************************/

#ifndef LOCKCLEAN_CONFIG_APP_CONFIG_HPP
#define LOCKCLEAN_CONFIG_APP_CONFIG_HPP

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace lockclean::config {

/**
 * @brief Startup options.
 *
 * JSON form, every field optional:
 * {"settingsPath": "...", "doublePressWindowMs": 500, "logLevel": "info",
 *  "logFile": "..."}
 */
struct AppConfig {
    std::filesystem::path settingsPath = "lockclean_settings.json";
    std::chrono::milliseconds doublePressWindow{500};
    std::string logLevel = "info";
    std::optional<std::filesystem::path> logFile;

    /**
     * @throws lockclean::error::InvalidConfigException on wrong types or an
     * out-of-range window.
     */
    [[nodiscard]] static auto fromJson(const nlohmann::json& value)
        -> AppConfig;

    /**
     * @brief Read @p path; a missing file yields the defaults.
     * @throws lockclean::error::InvalidConfigException if the file exists but
     * is not valid.
     */
    [[nodiscard]] static auto load(const std::filesystem::path& path)
        -> AppConfig;

    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

}  // namespace lockclean::config

#endif  // LOCKCLEAN_CONFIG_APP_CONFIG_HPP
