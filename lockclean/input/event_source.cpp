/*
 * event_source.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-12

Description: Raw system-wide input event source interface

**************************************************/

#include "event_source.hpp"

#include <spdlog/spdlog.h>

#if defined(__APPLE__)
#include "event_source_macos.hpp"
#endif

namespace lockclean::input {

auto createPlatformEventSource()
    -> error::Result<std::shared_ptr<IEventSource>> {
#if defined(__APPLE__)
    std::shared_ptr<IEventSource> source = std::make_shared<MacEventSource>();
    spdlog::info("[EventSource] Using {} backend", source->platformName());
    return source;
#else
    spdlog::warn("[EventSource] No native event tap backend on this platform");
    return error::InputErrorCode::NOT_SUPPORTED;
#endif
}

}  // namespace lockclean::input
