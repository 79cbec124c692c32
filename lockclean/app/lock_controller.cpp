/*
 * lock_controller.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-16

Description: Ties the input blocker to the unlock detector

**************************************************/

#include "lock_controller.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include "lockclean/error/exception.hpp"
#include "lockclean/hotkey/conflict.hpp"

namespace lockclean::app {

using blocker::LockMode;

namespace {
auto loadTrigger(const std::shared_ptr<hotkey::TriggerStore>& triggers)
    -> hotkey::HotkeyTrigger {
    if (!triggers) {
        THROW_INVALID_ARGUMENT("LockController requires a trigger store");
    }
    return triggers->load();
}

constexpr const char* PERMISSION_TITLE = "Accessibility Permission Required";
constexpr const char* PERMISSION_MESSAGE =
    "lockclean needs Accessibility permission to monitor and block input. "
    "Please grant permission in System Settings > Privacy & Security > "
    "Accessibility.";
}  // namespace

auto toString(StatusKind kind) -> std::string_view {
    switch (kind) {
        case StatusKind::LOCKED:
            return "Locked";
        case StatusKind::UNLOCKED:
            return "Unlocked";
        case StatusKind::PERMISSION_REQUIRED:
            return "PermissionRequired";
    }
    return "Unknown";
}

LockController::LockController(std::shared_ptr<input::IEventSource> source,
                               asio::io_context& context,
                               std::shared_ptr<hotkey::TriggerStore> triggers,
                               std::chrono::nanoseconds doublePressWindow)
    : triggers_(std::move(triggers)),
      blocker_(source),
      detector_(source, context, loadTrigger(triggers_), doublePressWindow) {
    unlockToken_ = detector_.subscribe(
        [this](const unlock::UnlockRequest& /*request*/) { unlock(); });
}

LockController::~LockController() {
    detector_.unsubscribe(unlockToken_);
    try {
        shutdown();
    } catch (const std::exception& e) {
        spdlog::error("[LockController] Shutdown failed: {}", e.what());
    }
}

auto LockController::start() -> error::Result<void> {
    auto result = detector_.start();
    if (!result) {
        if (result.error() == error::InputErrorCode::ACCESS_DENIED) {
            requestPermission();
        }
        return result;
    }
    spdlog::info("[LockController] Ready, unlock with {}",
                 detector_.description());
    return {};
}

auto LockController::lock(LockMode mode) -> error::Result<void> {
    if (mode == LockMode::NONE) {
        unlock();
        return {};
    }

    error::Result<void> result;
    {
        // Held across the blocker call so an unlock cannot slip in between.
        std::lock_guard guard(mutex_);
        result = blocker_.start(mode);
        mode_ = result ? mode : LockMode::NONE;
    }
    if (!result) {
        if (result.error() == error::InputErrorCode::ACCESS_DENIED) {
            requestPermission();
        }
        return result;
    }

    publish(LockStatus{StatusKind::LOCKED, mode,
                       fmt::format("{} Locked", blocker::toString(mode)),
                       unlockHint()});
    return {};
}

void LockController::unlock() {
    {
        std::lock_guard guard(mutex_);
        if (mode_ == LockMode::NONE) {
            spdlog::debug("[LockController] Unlock ignored, nothing locked");
            return;
        }
        blocker_.stop();
        mode_ = LockMode::NONE;
    }
    publish(LockStatus{StatusKind::UNLOCKED, LockMode::NONE, "Unlocked",
                       "Input is now enabled"});
}

void LockController::shutdown() {
    {
        std::lock_guard guard(mutex_);
        blocker_.stop();
        mode_ = LockMode::NONE;
    }
    detector_.stop();
    spdlog::info("[LockController] Shut down");
}

auto LockController::mode() const -> LockMode {
    std::lock_guard guard(mutex_);
    return mode_;
}

auto LockController::statusText() const -> std::string {
    switch (mode()) {
        case LockMode::KEYBOARD:
            return "Status: Keyboard Locked";
        case LockMode::MOUSE:
            return "Status: Mouse Locked";
        case LockMode::NONE:
            break;
    }
    return "Status: Unlocked";
}

auto LockController::unlockHint() const -> std::string {
    auto trigger = detector_.trigger();
    if (trigger.isDefault()) {
        return "Press Shift twice to unlock";
    }
    return fmt::format("Press {} to unlock", trigger.displayString());
}

auto LockController::unlockTriggerLabel() const -> std::string {
    return fmt::format("Unlock Hotkey: {}", detector_.description());
}

auto LockController::setUnlockTrigger(const hotkey::HotkeyTrigger& trigger)
    -> std::vector<std::string> {
    auto conflicts = hotkey::checkConflicts(trigger);
    if (!conflicts.empty()) {
        spdlog::warn("[LockController] {} conflicts with {}, not applied",
                     trigger.displayString(), fmt::join(conflicts, ", "));
        return conflicts;
    }

    auto saved = triggers_->save(trigger);
    if (!saved) {
        spdlog::warn("[LockController] Trigger applied but not persisted: {}",
                     saved.error().message());
    }
    detector_.setTrigger(trigger);
    return conflicts;
}

auto LockController::subscribeStatus(StatusListener listener) -> Token {
    std::lock_guard guard(listenerMutex_);
    auto token = nextToken_++;
    listeners_.emplace(token, std::move(listener));
    return token;
}

auto LockController::unsubscribeStatus(Token token) -> bool {
    std::lock_guard guard(listenerMutex_);
    return listeners_.erase(token) > 0;
}

void LockController::requestPermission() {
    spdlog::warn("[LockController] Input monitoring permission missing");
    publish(LockStatus{StatusKind::PERMISSION_REQUIRED, mode(),
                       PERMISSION_TITLE, PERMISSION_MESSAGE});
}

void LockController::publish(const LockStatus& status) {
    spdlog::info("[LockController] {}: {}", status.title, status.message);
    std::vector<StatusListener> listeners;
    {
        std::lock_guard guard(listenerMutex_);
        for (const auto& [token, listener] : listeners_) {
            listeners.push_back(listener);
        }
    }
    for (const auto& listener : listeners) {
        try {
            listener(status);
        } catch (const std::exception& e) {
            spdlog::error("[LockController] Status listener threw: {}",
                          e.what());
        }
    }
}

}  // namespace lockclean::app
