/*
 * log_setup.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-14

Description: Default logger configuration

**************************************************/

#include "log_setup.hpp"

#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace lockclean::log {

auto initLogging(const LogConfig& config) -> std::shared_ptr<spdlog::logger> {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    std::optional<std::string> fileError;
    if (config.file) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                config.file->string(), false));
        } catch (const spdlog::spdlog_ex& ex) {
            fileError = ex.what();
        }
    }

    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(),
                                                   sinks.end());
    logger->set_pattern(config.pattern);

    auto level = spdlog::level::from_str(config.level);
    if (level == spdlog::level::off && config.level != "off") {
        logger->warn("[Log] Unknown level '{}', using info", config.level);
        level = spdlog::level::info;
    }
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);

    if (fileError) {
        logger->error("[Log] Failed to add file sink: {}", *fileError);
    }

    spdlog::drop(LOGGER_NAME);
    spdlog::set_default_logger(logger);
    return logger;
}

}  // namespace lockclean::log
