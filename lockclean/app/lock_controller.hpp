/*
 * lock_controller.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-16

Description: Ties the input blocker to the unlock detector

**************************************************/

#ifndef LOCKCLEAN_APP_LOCK_CONTROLLER_HPP
#define LOCKCLEAN_APP_LOCK_CONTROLLER_HPP

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "lockclean/blocker/input_blocker.hpp"
#include "lockclean/error/result.hpp"
#include "lockclean/hotkey/trigger_store.hpp"
#include "lockclean/unlock/unlock_detector.hpp"

namespace lockclean::app {

namespace asio = boost::asio;

enum class StatusKind { LOCKED, UNLOCKED, PERMISSION_REQUIRED };

/**
 * @brief A user-facing state change, e.g. for a notification banner.
 */
struct LockStatus {
    StatusKind kind;
    blocker::LockMode mode;
    std::string title;
    std::string message;
};

/**
 * @brief Owns the lock mode and routes unlock requests to the blocker.
 *
 * Unlock requests arrive on the detector's strand; lock() and unlock() may
 * also be called from the host. Status listeners are called after the state
 * change, outside the controller's lock.
 */
class LockController {
public:
    using Token = std::size_t;
    using StatusListener = std::function<void(const LockStatus&)>;

    LockController(std::shared_ptr<input::IEventSource> source,
                   asio::io_context& context,
                   std::shared_ptr<hotkey::TriggerStore> triggers,
                   std::chrono::nanoseconds doublePressWindow =
                       hotkey::DEFAULT_DOUBLE_PRESS_WINDOW);
    ~LockController();

    LockController(const LockController&) = delete;
    auto operator=(const LockController&) -> LockController& = delete;

    /**
     * @brief Start watching for the unlock trigger.
     * @return ACCESS_DENIED (after a PERMISSION_REQUIRED status) when input
     * monitoring is not permitted.
     */
    auto start() -> error::Result<void>;

    /**
     * @brief Lock @p mode, replacing any current lock. NONE unlocks.
     */
    auto lock(blocker::LockMode mode) -> error::Result<void>;

    /**
     * @brief Release the lock. Ignored when nothing is locked.
     */
    void unlock();

    /**
     * @brief Release everything before the host exits.
     */
    void shutdown();

    [[nodiscard]] auto mode() const -> blocker::LockMode;

    /**
     * @brief "Status: Unlocked", "Status: Keyboard Locked" or
     * "Status: Mouse Locked".
     */
    [[nodiscard]] auto statusText() const -> std::string;

    /**
     * @brief How to unlock with the current trigger, e.g. "Press Shift twice
     * to unlock".
     */
    [[nodiscard]] auto unlockHint() const -> std::string;

    /**
     * @brief "Unlock Hotkey: Double Shift" or the custom trigger.
     */
    [[nodiscard]] auto unlockTriggerLabel() const -> std::string;

    /**
     * @brief Persist and apply a new unlock trigger.
     * @return The system shortcuts it collides with. A colliding trigger is
     * not applied.
     */
    auto setUnlockTrigger(const hotkey::HotkeyTrigger& trigger)
        -> std::vector<std::string>;

    [[nodiscard]] auto subscribeStatus(StatusListener listener) -> Token;
    auto unsubscribeStatus(Token token) -> bool;

    [[nodiscard]] auto inputBlocker() -> blocker::InputBlocker& {
        return blocker_;
    }
    [[nodiscard]] auto unlockDetector() -> unlock::UnlockDetector& {
        return detector_;
    }

private:
    void publish(const LockStatus& status);
    void requestPermission();

    std::shared_ptr<hotkey::TriggerStore> triggers_;
    blocker::InputBlocker blocker_;
    unlock::UnlockDetector detector_;
    unlock::UnlockDetector::Token unlockToken_ = 0;

    mutable std::mutex mutex_;
    blocker::LockMode mode_ = blocker::LockMode::NONE;

    std::mutex listenerMutex_;
    std::map<Token, StatusListener> listeners_;
    Token nextToken_ = 1;
};

[[nodiscard]] auto toString(StatusKind kind) -> std::string_view;

}  // namespace lockclean::app

#endif  // LOCKCLEAN_APP_LOCK_CONTROLLER_HPP
