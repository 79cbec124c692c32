/*
 * unlock_detector.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-15

Description: Recognizes the unlock gesture in the system-wide key stream

**************************************************/

#ifndef LOCKCLEAN_UNLOCK_UNLOCK_DETECTOR_HPP
#define LOCKCLEAN_UNLOCK_UNLOCK_DETECTOR_HPP

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>

#include "lockclean/error/result.hpp"
#include "lockclean/hotkey/double_press.hpp"
#include "lockclean/hotkey/trigger.hpp"
#include "lockclean/input/event_source.hpp"

namespace lockclean::unlock {

namespace asio = boost::asio;

/**
 * @brief Raised once per recognized gesture.
 */
struct UnlockRequest {
    hotkey::HotkeyTrigger trigger;
    input::Timestamp timestamp;
};

/**
 * @brief Watches key-down and modifier events through an observer tap and
 * notifies subscribers when the configured trigger is performed.
 *
 * The tap callback only forwards events; matching, timing state and
 * notification all run on a strand of the supplied io_context, so handlers
 * are called on whichever thread runs that context. The detector never
 * consumes events and does not depend on whether input is locked.
 */
class UnlockDetector {
public:
    using Token = std::size_t;
    using Handler = std::function<void(const UnlockRequest&)>;

    UnlockDetector(std::shared_ptr<input::IEventSource> source,
                   asio::io_context& context,
                   hotkey::HotkeyTrigger trigger =
                       hotkey::HotkeyTrigger::doubleShift(),
                   std::chrono::nanoseconds window =
                       hotkey::DEFAULT_DOUBLE_PRESS_WINDOW);
    ~UnlockDetector();

    UnlockDetector(const UnlockDetector&) = delete;
    auto operator=(const UnlockDetector&) -> UnlockDetector& = delete;

    /**
     * @brief Install the observer tap. Starting twice is a no-op.
     * @return ACCESS_DENIED when input monitoring is not permitted.
     */
    auto start() -> error::Result<void>;

    /**
     * @brief Remove the tap and drop any partial gesture. Idempotent.
     */
    void stop();

    [[nodiscard]] auto isRunning() const -> bool;

    /**
     * @brief Register @p handler for unlock requests.
     * @return Token for unsubscribe().
     */
    [[nodiscard]] auto subscribe(Handler handler) -> Token;

    auto unsubscribe(Token token) -> bool;

    /**
     * @brief Replace the trigger and reset the timing state.
     *
     * Takes effect for every event observed after this call.
     */
    void setTrigger(hotkey::HotkeyTrigger trigger);

    [[nodiscard]] auto trigger() const -> hotkey::HotkeyTrigger;

    /**
     * @brief "Double Shift" for the default trigger, otherwise its symbols.
     */
    [[nodiscard]] auto description() const -> std::string;

    [[nodiscard]] auto window() const noexcept -> std::chrono::nanoseconds {
        return window_;
    }

private:
    struct Core;

    std::shared_ptr<Core> core_;
    std::chrono::nanoseconds window_;
};

}  // namespace lockclean::unlock

#endif  // LOCKCLEAN_UNLOCK_UNLOCK_DETECTOR_HPP
