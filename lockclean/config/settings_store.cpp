/*
 * settings_store.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-14

Description: Key/value persistence for user settings

**************************************************/

#include "settings_store.hpp"

#include <fstream>
#include <system_error>

#include <spdlog/spdlog.h>

namespace lockclean::config {

namespace fs = std::filesystem;

MemorySettingsStore::MemorySettingsStore(json initial) {
    if (initial.is_object()) {
        values_ = std::move(initial);
    }
}

auto MemorySettingsStore::get(std::string_view key) const
    -> std::optional<json> {
    std::lock_guard lock(mutex_);
    auto it = values_.find(std::string(key));
    if (it == values_.end()) {
        return std::nullopt;
    }
    return *it;
}

auto MemorySettingsStore::set(std::string_view key, json value)
    -> error::Result<void> {
    std::lock_guard lock(mutex_);
    values_[std::string(key)] = std::move(value);
    return {};
}

auto MemorySettingsStore::remove(std::string_view key) -> error::Result<void> {
    std::lock_guard lock(mutex_);
    values_.erase(std::string(key));
    return {};
}

auto MemorySettingsStore::snapshot() const -> json {
    std::lock_guard lock(mutex_);
    return values_;
}

JsonFileSettingsStore::JsonFileSettingsStore(fs::path path)
    : path_(std::move(path)) {
    load();
}

void JsonFileSettingsStore::load() {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        spdlog::debug("[Settings] {} not found, starting empty",
                      path_.string());
        return;
    }

    std::ifstream file(path_);
    if (!file) {
        spdlog::error("[Settings] Failed to open {} for reading",
                      path_.string());
        return;
    }

    json parsed = json::parse(file, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        spdlog::warn("[Settings] {} is not a JSON object, ignoring it",
                     path_.string());
        return;
    }
    values_ = std::move(parsed);
    spdlog::info("[Settings] Loaded {} settings from {}", values_.size(),
                 path_.string());
}

auto JsonFileSettingsStore::flush(const json& values) -> error::Result<void> {
    std::error_code ec;
    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path(), ec);
        if (ec) {
            spdlog::error("[Settings] Cannot create {}: {}",
                          path_.parent_path().string(), ec.message());
            return error::InputErrorCode::STORAGE_ERROR;
        }
    }

    auto temp = path_;
    temp += ".tmp";
    {
        std::ofstream file(temp, std::ios::trunc);
        if (!file) {
            spdlog::error("[Settings] Failed to open {} for writing",
                          temp.string());
            return error::InputErrorCode::STORAGE_ERROR;
        }
        file << values.dump(4);
        if (!file.flush()) {
            spdlog::error("[Settings] Failed to write {}", temp.string());
            return error::InputErrorCode::STORAGE_ERROR;
        }
    }

    fs::rename(temp, path_, ec);
    if (ec) {
        spdlog::error("[Settings] Failed to replace {}: {}", path_.string(),
                      ec.message());
        fs::remove(temp, ec);
        return error::InputErrorCode::STORAGE_ERROR;
    }
    return {};
}

auto JsonFileSettingsStore::get(std::string_view key) const
    -> std::optional<json> {
    std::lock_guard lock(mutex_);
    auto it = values_.find(std::string(key));
    if (it == values_.end()) {
        return std::nullopt;
    }
    return *it;
}

auto JsonFileSettingsStore::set(std::string_view key, json value)
    -> error::Result<void> {
    std::lock_guard lock(mutex_);
    json next = values_;
    next[std::string(key)] = std::move(value);
    auto result = flush(next);
    if (result) {
        values_ = std::move(next);
    }
    return result;
}

auto JsonFileSettingsStore::remove(std::string_view key)
    -> error::Result<void> {
    std::lock_guard lock(mutex_);
    if (!values_.contains(std::string(key))) {
        return {};
    }
    json next = values_;
    next.erase(std::string(key));
    auto result = flush(next);
    if (result) {
        values_ = std::move(next);
    }
    return result;
}

}  // namespace lockclean::config
