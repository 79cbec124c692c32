/*
 * event_dispatcher.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-12

Description: Registration table shared by event source backends

**************************************************/

#include "event_dispatcher.hpp"

#include <algorithm>
#include <mutex>

#include <spdlog/spdlog.h>

namespace lockclean::input {

auto EventDispatcher::add(EventMask mask, TapRole role, TapCallback callback)
    -> TapHandle {
    std::unique_lock lock(mutex_);
    TapHandle handle = nextHandle_++;
    registrations_.push_back(
        Registration{handle, mask, role, true, std::move(callback)});
    spdlog::debug("[EventDispatcher] Added {} {} with mask {:#x}",
                  role == TapRole::OBSERVER ? "observer" : "filter", handle,
                  mask);
    return handle;
}

auto EventDispatcher::remove(TapHandle handle) -> bool {
    {
        std::unique_lock lock(mutex_);
        auto iter = std::find_if(
            registrations_.begin(), registrations_.end(),
            [handle](const Registration& reg) { return reg.handle == handle; });
        if (iter == registrations_.end()) {
            return false;
        }
        registrations_.erase(iter);
    }

    std::uint64_t cutoff;
    {
        std::lock_guard lock(flightMutex_);
        cutoff = nextTicket_;
    }
    waitForDispatchesBefore(cutoff);
    spdlog::debug("[EventDispatcher] Removed registration {}", handle);
    return true;
}

void EventDispatcher::waitForDispatchesBefore(std::uint64_t cutoff) {
    const auto self = std::this_thread::get_id();
    std::unique_lock lock(flightMutex_);
    flightDone_.wait(lock, [&] {
        return std::none_of(inFlight_.begin(), inFlight_.end(),
                            [&](const auto& entry) {
                                return entry.first < cutoff &&
                                       entry.second != self;
                            });
    });
}

auto EventDispatcher::setEnabled(TapHandle handle, bool enabled) -> bool {
    std::unique_lock lock(mutex_);
    for (auto& reg : registrations_) {
        if (reg.handle == handle) {
            reg.enabled = enabled;
            return true;
        }
    }
    return false;
}

auto EventDispatcher::contains(TapHandle handle) const -> bool {
    std::shared_lock lock(mutex_);
    return std::any_of(
        registrations_.begin(), registrations_.end(),
        [handle](const Registration& reg) { return reg.handle == handle; });
}

auto EventDispatcher::isEnabled(TapHandle handle) const -> bool {
    std::shared_lock lock(mutex_);
    for (const auto& reg : registrations_) {
        if (reg.handle == handle) {
            return reg.enabled;
        }
    }
    return false;
}

auto EventDispatcher::combinedMask() const -> EventMask {
    std::shared_lock lock(mutex_);
    EventMask mask = 0;
    for (const auto& reg : registrations_) {
        if (reg.enabled) {
            mask |= reg.mask;
        }
    }
    return mask;
}

auto EventDispatcher::hasFilters() const -> bool {
    std::shared_lock lock(mutex_);
    return std::any_of(registrations_.begin(), registrations_.end(),
                       [](const Registration& reg) {
                           return reg.enabled && reg.role == TapRole::FILTER;
                       });
}

auto EventDispatcher::size() const -> std::size_t {
    std::shared_lock lock(mutex_);
    return registrations_.size();
}

auto EventDispatcher::dispatch(const InputEvent& event) -> TapDecision {
    // The ticket is taken before the table snapshot, so remove() can tell
    // which dispatches might still hold a copy of a dropped callback.
    std::uint64_t ticket;
    {
        std::lock_guard lock(flightMutex_);
        ticket = nextTicket_++;
        inFlight_.emplace(ticket, std::this_thread::get_id());
    }
    struct FlightGuard {
        EventDispatcher& owner;
        std::uint64_t ticket;
        ~FlightGuard() {
            {
                std::lock_guard lock(owner.flightMutex_);
                owner.inFlight_.erase(ticket);
            }
            owner.flightDone_.notify_all();
        }
    } guard{*this, ticket};

    std::vector<TapCallback> observers;
    std::vector<TapCallback> filters;
    {
        std::shared_lock lock(mutex_);
        for (const auto& reg : registrations_) {
            if (!reg.enabled) {
                continue;
            }
            if (!maskContains(reg.mask | TAP_CONTROL_MASK, event.type)) {
                continue;
            }
            if (reg.role == TapRole::OBSERVER) {
                observers.push_back(reg.callback);
            } else {
                filters.push_back(reg.callback);
            }
        }
    }

    for (const auto& observer : observers) {
        try {
            observer(event);
        } catch (const std::exception& e) {
            spdlog::error("[EventDispatcher] Observer threw on {}: {}",
                          toString(event.type), e.what());
        }
    }

    for (const auto& filter : filters) {
        try {
            if (filter(event) == TapDecision::CONSUME) {
                return TapDecision::CONSUME;
            }
        } catch (const std::exception& e) {
            spdlog::error("[EventDispatcher] Filter threw on {}: {}",
                          toString(event.type), e.what());
        }
    }
    return TapDecision::PASS;
}

}  // namespace lockclean::input
