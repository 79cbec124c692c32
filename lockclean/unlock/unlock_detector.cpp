/*
 * unlock_detector.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-15

Description: Recognizes the unlock gesture in the system-wide key stream

**************************************************/

#include "unlock_detector.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <utility>
#include <vector>

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <spdlog/spdlog.h>

#include "lockclean/error/exception.hpp"
#include "lockclean/hotkey/matcher.hpp"

namespace lockclean::unlock {

using input::EventType;
using input::InputEvent;
using input::TapDecision;
using input::TapHandle;

namespace {
constexpr input::EventMask OBSERVED_MASK =
    input::makeMask({EventType::KEY_DOWN, EventType::FLAGS_CHANGED});
}  // namespace

struct UnlockDetector::Core : std::enable_shared_from_this<Core> {
    Core(std::shared_ptr<input::IEventSource> eventSource,
         asio::io_context& context, hotkey::HotkeyTrigger trigger,
         std::chrono::nanoseconds window)
        : source(std::move(eventSource)),
          strand(asio::make_strand(context)),
          tracker(input::Modifier::SHIFT, window),
          active(trigger),
          published(std::move(trigger)) {}

    void onRawEvent(const InputEvent& event);
    void process(const InputEvent& event);
    void notify(const UnlockRequest& request);

    std::shared_ptr<input::IEventSource> source;
    asio::strand<asio::io_context::executor_type> strand;

    // Owned by the strand.
    hotkey::DoublePressTracker tracker;
    hotkey::HotkeyTrigger active;

    mutable std::mutex mutex;
    hotkey::HotkeyTrigger published;
    std::map<Token, Handler> subscribers;
    Token nextToken = 1;

    std::mutex lifecycleMutex;
    std::atomic<bool> running{false};
    std::atomic<TapHandle> tapHandle{input::INVALID_TAP_HANDLE};
};

void UnlockDetector::Core::onRawEvent(const InputEvent& event) {
    if (!running.load()) {
        return;
    }
    if (input::isTapDisabled(event.type)) {
        auto handle = tapHandle.load();
        spdlog::warn("[UnlockDetector] Tap disabled by the system ({})",
                     input::toString(event.type));
        if (handle != input::INVALID_TAP_HANDLE) {
            auto result = source->setTapEnabled(handle, true);
            if (!result) {
                spdlog::error("[UnlockDetector] Failed to re-enable tap: {}",
                              result.error().message());
            }
        }
        return;
    }
    asio::post(strand, [weak = weak_from_this(), event] {
        if (auto core = weak.lock()) {
            core->process(event);
        }
    });
}

void UnlockDetector::Core::process(const InputEvent& event) {
    if (!running.load()) {
        return;
    }
    bool fired = active.kind() == hotkey::TriggerKind::DOUBLE_PRESS
                     ? tracker.observe(event)
                     : hotkey::matches(active, event);
    if (!fired) {
        return;
    }
    spdlog::info("[UnlockDetector] Unlock trigger {} recognized",
                 active.description());
    notify(UnlockRequest{active, event.timestamp});
}

void UnlockDetector::Core::notify(const UnlockRequest& request) {
    std::vector<Handler> handlers;
    {
        std::lock_guard lock(mutex);
        handlers.reserve(subscribers.size());
        for (const auto& [token, handler] : subscribers) {
            handlers.push_back(handler);
        }
    }
    for (const auto& handler : handlers) {
        try {
            handler(request);
        } catch (const std::exception& e) {
            spdlog::error("[UnlockDetector] Unlock handler threw: {}",
                          e.what());
        }
    }
}

UnlockDetector::UnlockDetector(std::shared_ptr<input::IEventSource> source,
                               asio::io_context& context,
                               hotkey::HotkeyTrigger trigger,
                               std::chrono::nanoseconds window)
    : core_(std::make_shared<Core>(std::move(source), context,
                                   std::move(trigger), window)),
      window_(window) {
    if (!core_->source) {
        THROW_INVALID_ARGUMENT("UnlockDetector requires an event source");
    }
}

UnlockDetector::~UnlockDetector() {
    try {
        stop();
    } catch (const std::exception& e) {
        spdlog::error("[UnlockDetector] Failed to stop on destruction: {}",
                      e.what());
    }
}

auto UnlockDetector::start() -> error::Result<void> {
    std::lock_guard lock(core_->lifecycleMutex);
    if (core_->running.load()) {
        return {};
    }

    core_->running.store(true);
    std::weak_ptr<Core> weak = core_;
    auto handle = core_->source->registerTap(
        OBSERVED_MASK, input::TapRole::OBSERVER,
        [weak](const InputEvent& event) {
            if (auto core = weak.lock()) {
                core->onRawEvent(event);
            }
            return TapDecision::PASS;
        });
    if (!handle) {
        core_->running.store(false);
        spdlog::warn("[UnlockDetector] Cannot observe key events: {}",
                     handle.error().message());
        return handle.error();
    }
    core_->tapHandle.store(*handle);
    spdlog::info("[UnlockDetector] Watching for {}", description());
    return {};
}

void UnlockDetector::stop() {
    std::lock_guard lock(core_->lifecycleMutex);
    if (!core_->running.exchange(false)) {
        return;
    }

    auto handle = core_->tapHandle.exchange(input::INVALID_TAP_HANDLE);
    if (handle != input::INVALID_TAP_HANDLE) {
        auto result = core_->source->unregisterTap(handle);
        if (!result) {
            spdlog::warn("[UnlockDetector] Failed to remove tap: {}",
                         result.error().message());
        }
    }
    asio::post(core_->strand,
               [weak = std::weak_ptr<Core>(core_)] {
                   if (auto core = weak.lock()) {
                       core->tracker.reset();
                   }
               });
    spdlog::info("[UnlockDetector] Stopped");
}

auto UnlockDetector::isRunning() const -> bool {
    return core_->running.load();
}

auto UnlockDetector::subscribe(Handler handler) -> Token {
    std::lock_guard lock(core_->mutex);
    auto token = core_->nextToken++;
    core_->subscribers.emplace(token, std::move(handler));
    return token;
}

auto UnlockDetector::unsubscribe(Token token) -> bool {
    std::lock_guard lock(core_->mutex);
    return core_->subscribers.erase(token) > 0;
}

void UnlockDetector::setTrigger(hotkey::HotkeyTrigger trigger) {
    {
        std::lock_guard lock(core_->mutex);
        core_->published = trigger;
    }
    spdlog::info("[UnlockDetector] Unlock trigger set to {}",
                 trigger.description());
    asio::post(core_->strand,
               [weak = std::weak_ptr<Core>(core_),
                trigger = std::move(trigger)] {
                   if (auto core = weak.lock()) {
                       core->active = trigger;
                       core->tracker.reset();
                   }
               });
}

auto UnlockDetector::trigger() const -> hotkey::HotkeyTrigger {
    std::lock_guard lock(core_->mutex);
    return core_->published;
}

auto UnlockDetector::description() const -> std::string {
    return trigger().description();
}

}  // namespace lockclean::unlock
