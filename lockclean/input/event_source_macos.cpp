/*
 * event_source_macos.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-13

Description: Quartz event tap backed event source

**************************************************/

#if defined(__APPLE__)

#include "event_source_macos.hpp"

#include <optional>
#include <utility>

#include <mach/mach_time.h>

#include <spdlog/spdlog.h>

#include "lockclean/error/exception.hpp"
#include "permission.hpp"

namespace lockclean::input {

namespace {
// Owns one Core Foundation reference
template <typename Ref>
class CFRefWrapper {
public:
    explicit CFRefWrapper(Ref ref) : m_ref(ref) {}

    ~CFRefWrapper() {
        if (m_ref) {
            CFRelease(m_ref);
        }
    }

    CFRefWrapper(const CFRefWrapper&) = delete;
    CFRefWrapper& operator=(const CFRefWrapper&) = delete;

    Ref get() const noexcept { return m_ref; }
    operator bool() const noexcept { return m_ref != nullptr; }

private:
    Ref m_ref;
};

// Quartz types below 30 share their numbering with EventType
constexpr EventMask NATIVE_MASK = (EventMask{1} << 30) - 1;

// NX_SYSDEFINED, not exported as a CGEventType constant
constexpr CGEventType SYSTEM_DEFINED_TYPE = static_cast<CGEventType>(14);

auto toEventType(CGEventType type) -> std::optional<EventType> {
    switch (type) {
        case kCGEventLeftMouseDown:
            return EventType::LEFT_MOUSE_DOWN;
        case kCGEventLeftMouseUp:
            return EventType::LEFT_MOUSE_UP;
        case kCGEventRightMouseDown:
            return EventType::RIGHT_MOUSE_DOWN;
        case kCGEventRightMouseUp:
            return EventType::RIGHT_MOUSE_UP;
        case kCGEventMouseMoved:
            return EventType::MOUSE_MOVED;
        case kCGEventLeftMouseDragged:
            return EventType::LEFT_MOUSE_DRAGGED;
        case kCGEventRightMouseDragged:
            return EventType::RIGHT_MOUSE_DRAGGED;
        case kCGEventKeyDown:
            return EventType::KEY_DOWN;
        case kCGEventKeyUp:
            return EventType::KEY_UP;
        case kCGEventFlagsChanged:
            return EventType::FLAGS_CHANGED;
        case kCGEventScrollWheel:
            return EventType::SCROLL_WHEEL;
        case kCGEventOtherMouseDown:
            return EventType::OTHER_MOUSE_DOWN;
        case kCGEventOtherMouseUp:
            return EventType::OTHER_MOUSE_UP;
        case kCGEventOtherMouseDragged:
            return EventType::OTHER_MOUSE_DRAGGED;
        case kCGEventTapDisabledByTimeout:
            return EventType::TAP_DISABLED_BY_TIMEOUT;
        case kCGEventTapDisabledByUserInput:
            return EventType::TAP_DISABLED_BY_USER_INPUT;
        default:
            if (type == SYSTEM_DEFINED_TYPE) {
                return EventType::SYSTEM_DEFINED;
            }
            return std::nullopt;
    }
}

auto hostTimebase() -> const mach_timebase_info_data_t& {
    static const mach_timebase_info_data_t timebase = [] {
        mach_timebase_info_data_t info{1, 1};
        if (mach_timebase_info(&info) != KERN_SUCCESS) {
            spdlog::warn(
                "[MacEventSource] mach_timebase_info failed, assuming "
                "nanosecond ticks");
            info = {1, 1};
        }
        return info;
    }();
    return timebase;
}

auto translate(EventType type, CGEventRef event) -> InputEvent {
    InputEvent result;
    result.type = type;
    if (event == nullptr || isTapDisabled(type)) {
        return result;
    }
    result.keyCode = static_cast<KeyCode>(
        CGEventGetIntegerValueField(event, kCGKeyboardEventKeycode));
    result.modifiers =
        ModifierSet(static_cast<std::uint64_t>(CGEventGetFlags(event)));
    const auto& timebase = hostTimebase();
    result.timestamp = ticksToTimestamp(CGEventGetTimestamp(event),
                                        timebase.numer, timebase.denom);
    CGPoint location = CGEventGetLocation(event);
    result.location = Point{location.x, location.y};
    return result;
}
}  // namespace

MacEventSource::~MacEventSource() {
    std::lock_guard lock(reconfigMutex_);
    removeTap();
}

auto MacEventSource::registerTap(EventMask mask, TapRole role,
                                 TapCallback callback)
    -> error::Result<TapHandle> {
    ensureNotOnTapThread("registerTap");
    if ((mask & NATIVE_MASK) == 0 || !callback) {
        return error::InputErrorCode::INVALID_MASK;
    }

    std::lock_guard lock(reconfigMutex_);
    TapHandle handle = dispatcher_.add(mask, role, std::move(callback));
    if (auto installed = reinstall(); !installed) {
        dispatcher_.remove(handle);
        if (auto restored = reinstall(); !restored) {
            spdlog::error(
                "[MacEventSource] Failed to restore previous tap: {}",
                restored.error().message());
        }
        return installed.error();
    }
    return handle;
}

auto MacEventSource::unregisterTap(TapHandle handle) -> error::Result<void> {
    ensureNotOnTapThread("unregisterTap");
    std::lock_guard lock(reconfigMutex_);
    if (!dispatcher_.remove(handle)) {
        return error::InputErrorCode::INVALID_HANDLE;
    }
    return reinstall();
}

auto MacEventSource::setTapEnabled(TapHandle handle, bool enabled)
    -> error::Result<void> {
    if (!dispatcher_.setEnabled(handle, enabled)) {
        return error::InputErrorCode::INVALID_HANDLE;
    }
    std::lock_guard lock(tapMutex_);
    if (tap_ != nullptr) {
        bool wanted = dispatcher_.combinedMask() != 0;
        if (wanted && !CGEventTapIsEnabled(tap_)) {
            spdlog::info("[MacEventSource] Re-enabling event tap");
        }
        CGEventTapEnable(tap_, wanted);
    }
    return {};
}

auto MacEventSource::cursorPosition() const -> Point {
    CFRefWrapper<CGEventRef> event(CGEventCreate(nullptr));
    if (!event) {
        spdlog::warn("[MacEventSource] Unable to query cursor position");
        return {};
    }
    CGPoint location = CGEventGetLocation(event.get());
    return Point{location.x, location.y};
}

auto MacEventSource::warpCursor(Point position) -> error::Result<void> {
    CGError err = CGWarpMouseCursorPosition(CGPointMake(position.x, position.y));
    if (err != kCGErrorSuccess) {
        spdlog::warn("[MacEventSource] CGWarpMouseCursorPosition failed: {}",
                     static_cast<int>(err));
        return error::InputErrorCode::PLATFORM_SPECIFIC;
    }
    return {};
}

auto MacEventSource::reinstall() -> error::Result<void> {
    EventMask mask = dispatcher_.combinedMask() & NATIVE_MASK;
    bool listenOnly = !dispatcher_.hasFilters();
    if (tap_ != nullptr && mask == installedMask_ &&
        listenOnly == installedListenOnly_) {
        return {};
    }
    removeTap();
    if (mask == 0) {
        return {};
    }
    return installTap(mask, listenOnly);
}

auto MacEventSource::installTap(EventMask mask, bool listenOnly)
    -> error::Result<void> {
    CFMachPortRef tap = CGEventTapCreate(
        kCGHIDEventTap, kCGHeadInsertEventTap,
        listenOnly ? kCGEventTapOptionListenOnly : kCGEventTapOptionDefault,
        static_cast<CGEventMask>(mask), &MacEventSource::eventCallback, this);
    if (tap == nullptr) {
        bool trusted = isProcessTrusted(false);
        spdlog::warn("[MacEventSource] CGEventTapCreate failed (trusted: {})",
                     trusted);
        return trusted ? error::InputErrorCode::TAP_CREATION_FAILED
                       : error::InputErrorCode::ACCESS_DENIED;
    }

    std::promise<CFRunLoopRef> ready;
    auto readyFuture = ready.get_future();
    loopRunning_.store(true);
    thread_ = std::thread(&MacEventSource::runLoopThread, this, tap,
                          std::move(ready));
    CFRunLoopRef loop = readyFuture.get();

    {
        std::lock_guard lock(tapMutex_);
        tap_ = tap;
        runLoop_ = loop;
    }
    installedMask_ = mask;
    installedListenOnly_ = listenOnly;
    spdlog::info("[MacEventSource] Installed {} tap with mask {:#x}",
                 listenOnly ? "listen-only" : "filtering", mask);
    return {};
}

void MacEventSource::removeTap() {
    CFMachPortRef tap = nullptr;
    CFRunLoopRef loop = nullptr;
    {
        std::lock_guard lock(tapMutex_);
        tap = std::exchange(tap_, nullptr);
        loop = std::exchange(runLoop_, nullptr);
    }
    if (tap != nullptr) {
        CGEventTapEnable(tap, false);
    }
    loopRunning_.store(false);
    if (loop != nullptr) {
        CFRunLoopStop(loop);
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    if (loop != nullptr) {
        CFRelease(loop);
    }
    if (tap != nullptr) {
        CFMachPortInvalidate(tap);
        CFRelease(tap);
        spdlog::info("[MacEventSource] Removed event tap");
    }
    installedMask_ = 0;
}

void MacEventSource::ensureNotOnTapThread(const char* operation) const {
    if (thread_.joinable() && std::this_thread::get_id() == thread_.get_id()) {
        THROW_RUNTIME_ERROR("{} called from within a tap callback", operation);
    }
}

void MacEventSource::runLoopThread(CFMachPortRef tap,
                                   std::promise<CFRunLoopRef> ready) {
    CFRefWrapper<CFRunLoopSourceRef> source(
        CFMachPortCreateRunLoopSource(kCFAllocatorDefault, tap, 0));
    CFRunLoopRef loop = CFRunLoopGetCurrent();
    CFRetain(loop);
    CFRunLoopAddSource(loop, source.get(), kCFRunLoopCommonModes);
    CGEventTapEnable(tap, true);
    ready.set_value(loop);

    // A stop request that lands before the loop starts is caught on the
    // next timeout.
    while (loopRunning_.load()) {
        CFRunLoopRunInMode(kCFRunLoopDefaultMode, 0.25, false);
    }
    CFRunLoopRemoveSource(loop, source.get(), kCFRunLoopCommonModes);
}

auto MacEventSource::eventCallback(CGEventTapProxy /*proxy*/,
                                   CGEventType type, CGEventRef event,
                                   void* userInfo) -> CGEventRef {
    auto* self = static_cast<MacEventSource*>(userInfo);
    auto mapped = toEventType(type);
    if (!mapped) {
        return event;
    }
    if (isTapDisabled(*mapped)) {
        spdlog::warn("[MacEventSource] Event tap disabled: {}",
                     toString(*mapped));
    }
    auto decision = self->dispatcher_.dispatch(translate(*mapped, event));
    return decision == TapDecision::CONSUME ? nullptr : event;
}

}  // namespace lockclean::input

#endif  // __APPLE__
