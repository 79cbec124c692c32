/*
 * input_blocker.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-15

Description: Swallows keyboard or pointer input while locked

**************************************************/

#ifndef LOCKCLEAN_BLOCKER_INPUT_BLOCKER_HPP
#define LOCKCLEAN_BLOCKER_INPUT_BLOCKER_HPP

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>

#include "lock_mode.hpp"
#include "lockclean/error/result.hpp"
#include "lockclean/input/event_source.hpp"

namespace lockclean::blocker {

/**
 * @brief Installs a filtering tap that consumes every event of the locked
 * class.
 *
 * In mouse mode the cursor position at activation is frozen and every
 * pointer motion warps the cursor back to it. If the system disables the
 * tap, the blocker re-enables it from the tap callback. Only one mode is
 * active at a time; starting a new mode replaces the old one.
 */
class InputBlocker {
public:
    explicit InputBlocker(std::shared_ptr<input::IEventSource> source);
    ~InputBlocker();

    InputBlocker(const InputBlocker&) = delete;
    auto operator=(const InputBlocker&) -> InputBlocker& = delete;

    /**
     * @brief Stop any current lock, then lock @p mode.
     *
     * Never throws for a refused tap: the blocker stays inactive, a warning
     * is logged and the error is returned. LockMode::NONE only stops.
     */
    auto start(LockMode mode) -> error::Result<void>;

    /**
     * @brief Remove the tap and forget the frozen position. Idempotent.
     */
    void stop();

    [[nodiscard]] auto isActive() const -> bool;
    [[nodiscard]] auto mode() const -> LockMode;
    [[nodiscard]] auto frozenPosition() const -> std::optional<input::Point>;

    /**
     * @brief Events swallowed since the last start().
     */
    [[nodiscard]] auto consumedCount() const -> std::uint64_t;

private:
    auto onEvent(const input::InputEvent& event) -> input::TapDecision;
    void stopLocked();

    std::shared_ptr<input::IEventSource> source_;

    std::mutex lifecycleMutex_;

    mutable std::mutex stateMutex_;
    LockMode mode_ = LockMode::NONE;
    input::TapHandle handle_ = input::INVALID_TAP_HANDLE;
    std::optional<input::Point> frozenPosition_;
    std::uint64_t consumed_ = 0;
};

}  // namespace lockclean::blocker

#endif  // LOCKCLEAN_BLOCKER_INPUT_BLOCKER_HPP
