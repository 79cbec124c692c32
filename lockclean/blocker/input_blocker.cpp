/*
 * input_blocker.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-15

Description: Swallows keyboard or pointer input while locked

**************************************************/

#include "input_blocker.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "lockclean/error/exception.hpp"

namespace lockclean::blocker {

using input::InputEvent;
using input::TapDecision;

InputBlocker::InputBlocker(std::shared_ptr<input::IEventSource> source)
    : source_(std::move(source)) {
    if (!source_) {
        THROW_INVALID_ARGUMENT("InputBlocker requires an event source");
    }
}

InputBlocker::~InputBlocker() {
    try {
        stop();
    } catch (const std::exception& e) {
        spdlog::error("[InputBlocker] Failed to stop on destruction: {}",
                      e.what());
    }
}

auto InputBlocker::start(LockMode mode) -> error::Result<void> {
    std::lock_guard lifecycle(lifecycleMutex_);
    stopLocked();
    if (mode == LockMode::NONE) {
        return {};
    }

    std::optional<input::Point> frozen;
    if (mode == LockMode::MOUSE) {
        frozen = source_->cursorPosition();
    }
    {
        std::lock_guard lock(stateMutex_);
        mode_ = mode;
        frozenPosition_ = frozen;
        consumed_ = 0;
    }

    auto handle = source_->registerTap(
        blockedMask(mode), input::TapRole::FILTER,
        [this](const InputEvent& event) { return onEvent(event); });
    if (!handle) {
        {
            std::lock_guard lock(stateMutex_);
            mode_ = LockMode::NONE;
            frozenPosition_.reset();
        }
        spdlog::warn("[InputBlocker] Cannot lock {}: {}", toString(mode),
                     handle.error().message());
        return handle.error();
    }

    {
        std::lock_guard lock(stateMutex_);
        handle_ = *handle;
    }
    if (frozen) {
        spdlog::info("[InputBlocker] Mouse locked at ({}, {})", frozen->x,
                     frozen->y);
    } else {
        spdlog::info("[InputBlocker] {} locked", toString(mode));
    }
    return {};
}

void InputBlocker::stop() {
    std::lock_guard lifecycle(lifecycleMutex_);
    stopLocked();
}

void InputBlocker::stopLocked() {
    input::TapHandle handle;
    LockMode previous;
    {
        std::lock_guard lock(stateMutex_);
        if (mode_ == LockMode::NONE &&
            handle_ == input::INVALID_TAP_HANDLE) {
            return;
        }
        previous = std::exchange(mode_, LockMode::NONE);
        handle = std::exchange(handle_, input::INVALID_TAP_HANDLE);
        frozenPosition_.reset();
    }

    // The tap callback takes stateMutex_, so unregister without it.
    if (handle != input::INVALID_TAP_HANDLE) {
        auto result = source_->unregisterTap(handle);
        if (!result) {
            spdlog::warn("[InputBlocker] Failed to remove tap: {}",
                         result.error().message());
        }
    }
    spdlog::info("[InputBlocker] {} unlocked", toString(previous));
}

auto InputBlocker::onEvent(const InputEvent& event) -> TapDecision {
    if (input::isTapDisabled(event.type)) {
        input::TapHandle handle;
        {
            std::lock_guard lock(stateMutex_);
            handle = handle_;
        }
        if (handle != input::INVALID_TAP_HANDLE) {
            spdlog::warn("[InputBlocker] Tap disabled by the system ({}), "
                         "re-enabling",
                         input::toString(event.type));
            auto result = source_->setTapEnabled(handle, true);
            if (!result) {
                spdlog::error("[InputBlocker] Failed to re-enable tap: {}",
                              result.error().message());
            }
        }
        return TapDecision::PASS;
    }

    std::optional<input::Point> warpTo;
    {
        std::lock_guard lock(stateMutex_);
        if (!input::maskContains(blockedMask(mode_), event.type)) {
            return TapDecision::PASS;
        }
        ++consumed_;
        if (mode_ == LockMode::MOUSE && frozenPosition_ &&
            input::isPointerMotion(event.type) &&
            event.location != *frozenPosition_) {
            warpTo = frozenPosition_;
        }
    }

    if (warpTo) {
        auto result = source_->warpCursor(*warpTo);
        if (!result) {
            spdlog::debug("[InputBlocker] Cursor warp failed: {}",
                          result.error().message());
        }
    }
    return TapDecision::CONSUME;
}

auto InputBlocker::isActive() const -> bool {
    std::lock_guard lock(stateMutex_);
    return mode_ != LockMode::NONE && handle_ != input::INVALID_TAP_HANDLE;
}

auto InputBlocker::mode() const -> LockMode {
    std::lock_guard lock(stateMutex_);
    return handle_ != input::INVALID_TAP_HANDLE ? mode_ : LockMode::NONE;
}

auto InputBlocker::frozenPosition() const -> std::optional<input::Point> {
    std::lock_guard lock(stateMutex_);
    return frozenPosition_;
}

auto InputBlocker::consumedCount() const -> std::uint64_t {
    std::lock_guard lock(stateMutex_);
    return consumed_;
}

}  // namespace lockclean::blocker
