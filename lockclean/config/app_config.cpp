/*
 * app_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-14

Description: Application configuration file

**************************************************/

#include "app_config.hpp"

#include <fstream>

#include <spdlog/spdlog.h>

#include "lockclean/error/exception.hpp"

namespace lockclean::config {

using json = nlohmann::json;

namespace {
constexpr const char* SETTINGS_PATH = "settingsPath";
constexpr const char* WINDOW_MS = "doublePressWindowMs";
constexpr const char* LOG_LEVEL = "logLevel";
constexpr const char* LOG_FILE = "logFile";

auto requireString(const json& value, const char* key) -> std::string {
    const auto& field = value.at(key);
    if (!field.is_string()) {
        THROW_INVALID_CONFIG("'{}' must be a string", key);
    }
    return field.get<std::string>();
}
}  // namespace

auto AppConfig::fromJson(const json& value) -> AppConfig {
    if (!value.is_object()) {
        THROW_INVALID_CONFIG("Configuration root must be a JSON object");
    }

    AppConfig config;
    if (value.contains(SETTINGS_PATH)) {
        config.settingsPath = requireString(value, SETTINGS_PATH);
    }
    if (value.contains(WINDOW_MS)) {
        const auto& window = value.at(WINDOW_MS);
        if (!window.is_number_integer() || window.get<long long>() <= 0) {
            THROW_INVALID_CONFIG("'{}' must be a positive integer, got {}",
                                 WINDOW_MS, window.dump());
        }
        config.doublePressWindow =
            std::chrono::milliseconds(window.get<long long>());
    }
    if (value.contains(LOG_LEVEL)) {
        config.logLevel = requireString(value, LOG_LEVEL);
    }
    if (value.contains(LOG_FILE) && !value.at(LOG_FILE).is_null()) {
        config.logFile = requireString(value, LOG_FILE);
    }
    return config;
}

auto AppConfig::load(const std::filesystem::path& path) -> AppConfig {
    std::ifstream file(path);
    if (!file) {
        spdlog::info("[Config] {} not found, using defaults", path.string());
        return AppConfig{};
    }

    json value;
    try {
        file >> value;
    } catch (const json::parse_error& e) {
        THROW_INVALID_CONFIG("Failed to parse {}: {}", path.string(),
                             e.what());
    }
    auto config = fromJson(value);
    spdlog::info("[Config] Loaded {}", path.string());
    return config;
}

auto AppConfig::toJson() const -> json {
    json value;
    value[SETTINGS_PATH] = settingsPath.string();
    value[WINDOW_MS] = doublePressWindow.count();
    value[LOG_LEVEL] = logLevel;
    if (logFile) {
        value[LOG_FILE] = logFile->string();
    } else {
        value[LOG_FILE] = nullptr;
    }
    return value;
}

}  // namespace lockclean::config
