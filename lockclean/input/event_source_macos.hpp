/*
 * event_source_macos.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-13

Description: Quartz event tap backed event source

**************************************************/

#ifndef LOCKCLEAN_INPUT_EVENT_SOURCE_MACOS_HPP
#define LOCKCLEAN_INPUT_EVENT_SOURCE_MACOS_HPP

#if defined(__APPLE__)

#include <atomic>
#include <future>
#include <mutex>
#include <thread>

#include <ApplicationServices/ApplicationServices.h>
#include <CoreFoundation/CoreFoundation.h>

#include "event_dispatcher.hpp"
#include "event_source.hpp"

namespace lockclean::input {

/**
 * @brief Event source built on one Quartz event tap at the HID level.
 *
 * All registrations share a single tap whose mask is the union of theirs.
 * The tap is recreated whenever that union changes and is installed as a
 * listen-only tap while no filter is registered, which only needs the input
 * monitoring permission. The tap's run loop lives on a dedicated thread.
 *
 * REQUIRES: Accessibility permission in System Settings
 *           Privacy & Security → Accessibility
 */
class MacEventSource : public IEventSource {
public:
    MacEventSource() = default;
    ~MacEventSource() override;

    MacEventSource(const MacEventSource&) = delete;
    MacEventSource& operator=(const MacEventSource&) = delete;

    [[nodiscard]] auto registerTap(EventMask mask, TapRole role,
                                   TapCallback callback)
        -> error::Result<TapHandle> override;
    auto unregisterTap(TapHandle handle) -> error::Result<void> override;
    auto setTapEnabled(TapHandle handle, bool enabled)
        -> error::Result<void> override;
    [[nodiscard]] auto cursorPosition() const -> Point override;
    auto warpCursor(Point position) -> error::Result<void> override;
    [[nodiscard]] auto platformName() const noexcept -> const char* override {
        return "macOS";
    }

private:
    auto reinstall() -> error::Result<void>;
    auto installTap(EventMask mask, bool listenOnly) -> error::Result<void>;
    void removeTap();
    void ensureNotOnTapThread(const char* operation) const;
    void runLoopThread(CFMachPortRef tap, std::promise<CFRunLoopRef> ready);

    static auto eventCallback(CGEventTapProxy proxy, CGEventType type,
                              CGEventRef event, void* userInfo) -> CGEventRef;

    EventDispatcher dispatcher_;

    std::mutex reconfigMutex_;  ///< Serializes tap recreation.
    std::mutex tapMutex_;       ///< Guards tap_ and runLoop_.
    CFMachPortRef tap_ = nullptr;
    CFRunLoopRef runLoop_ = nullptr;
    std::thread thread_;
    std::atomic<bool> loopRunning_{false};

    EventMask installedMask_ = 0;
    bool installedListenOnly_ = true;
};

}  // namespace lockclean::input

#endif  // __APPLE__

#endif  // LOCKCLEAN_INPUT_EVENT_SOURCE_MACOS_HPP
