/*
 * event_source.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-12

Description: Raw system-wide input event source interface

**************************************************/

#ifndef LOCKCLEAN_INPUT_EVENT_SOURCE_HPP
#define LOCKCLEAN_INPUT_EVENT_SOURCE_HPP

#include <cstdint>
#include <functional>
#include <memory>

#include "event.hpp"
#include "lockclean/error/result.hpp"

namespace lockclean::input {

/**
 * @brief How a registration takes part in the event pipeline.
 *
 * Observers run before any filter and their decision is ignored, so an
 * observer sees every event even when a filter swallows it afterwards.
 */
enum class TapRole { OBSERVER, FILTER };

enum class TapDecision { PASS, CONSUME };

using TapHandle = std::uint64_t;
inline constexpr TapHandle INVALID_TAP_HANDLE = 0;

/**
 * @brief Callback invoked on the source's monitoring thread. Must return
 * promptly; the OS disables taps whose callbacks stall.
 */
using TapCallback = std::function<TapDecision(const InputEvent&)>;

/**
 * @brief A system-wide source of raw input events.
 *
 * Implementations own the OS hook and multiplex it across registrations.
 */
class IEventSource {
public:
    virtual ~IEventSource() = default;

    /**
     * @brief Register a callback for the event classes in @p mask.
     * @return The handle, or ACCESS_DENIED / TAP_CREATION_FAILED when the OS
     * refuses the hook.
     */
    [[nodiscard]] virtual auto registerTap(EventMask mask, TapRole role,
                                           TapCallback callback)
        -> error::Result<TapHandle> = 0;

    /**
     * @brief Drop a registration. Once this returns the callback is not
     * running on any other thread and will not be called again.
     */
    virtual auto unregisterTap(TapHandle handle) -> error::Result<void> = 0;

    /**
     * @brief Enable or disable a registration. Enabling also re-arms an OS
     * hook that was disabled by timeout or user-input heuristics.
     */
    virtual auto setTapEnabled(TapHandle handle, bool enabled)
        -> error::Result<void> = 0;

    [[nodiscard]] virtual auto cursorPosition() const -> Point = 0;

    virtual auto warpCursor(Point position) -> error::Result<void> = 0;

    [[nodiscard]] virtual auto platformName() const noexcept -> const char* = 0;
};

/**
 * @brief Create the event source for the running platform.
 * @return NOT_SUPPORTED where no native backend exists.
 */
[[nodiscard]] auto createPlatformEventSource()
    -> error::Result<std::shared_ptr<IEventSource>>;

}  // namespace lockclean::input

#endif  // LOCKCLEAN_INPUT_EVENT_SOURCE_HPP
