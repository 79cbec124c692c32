/*
 * log_setup.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-14

Description: Default logger configuration

**************************************************/

#ifndef LOCKCLEAN_LOG_LOG_SETUP_HPP
#define LOCKCLEAN_LOG_LOG_SETUP_HPP

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include <spdlog/logger.h>

namespace lockclean::log {

inline constexpr const char* LOGGER_NAME = "lockclean";

struct LogConfig {
    std::string level = "info";
    std::optional<std::filesystem::path> file;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
};

/**
 * @brief Install the "lockclean" logger as spdlog's default logger.
 *
 * Logs to stdout in color and, when configured, appends to a file. An
 * unknown level name falls back to info; a file that cannot be opened is
 * reported and skipped.
 */
auto initLogging(const LogConfig& config) -> std::shared_ptr<spdlog::logger>;

}  // namespace lockclean::log

#endif  // LOCKCLEAN_LOG_LOG_SETUP_HPP
