/*
 * event_dispatcher.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-12

Description: Registration table shared by event source backends

**************************************************/

#ifndef LOCKCLEAN_INPUT_EVENT_DISPATCHER_HPP
#define LOCKCLEAN_INPUT_EVENT_DISPATCHER_HPP

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <thread>
#include <vector>

#include "event_source.hpp"

namespace lockclean::input {

/**
 * @brief Routes one native event stream to many registrations.
 *
 * Observers are called first, in registration order; filters follow and the
 * first filter that consumes ends the dispatch. Callbacks run without the
 * table lock held, so a callback may add, remove or toggle registrations.
 */
class EventDispatcher {
public:
    [[nodiscard]] auto add(EventMask mask, TapRole role, TapCallback callback)
        -> TapHandle;

    /**
     * @brief Drop a registration.
     *
     * Returns only once no other thread can still be running its callback,
     * so the callback's captures may be destroyed right after. A callback
     * removing itself does not wait on its own dispatch.
     */
    auto remove(TapHandle handle) -> bool;

    auto setEnabled(TapHandle handle, bool enabled) -> bool;

    [[nodiscard]] auto contains(TapHandle handle) const -> bool;

    [[nodiscard]] auto isEnabled(TapHandle handle) const -> bool;

    /**
     * @brief Union of the masks of all enabled registrations.
     */
    [[nodiscard]] auto combinedMask() const -> EventMask;

    /**
     * @brief Whether any enabled registration may consume events.
     */
    [[nodiscard]] auto hasFilters() const -> bool;

    [[nodiscard]] auto size() const -> std::size_t;

    auto dispatch(const InputEvent& event) -> TapDecision;

private:
    struct Registration {
        TapHandle handle;
        EventMask mask;
        TapRole role;
        bool enabled;
        TapCallback callback;
    };

    void waitForDispatchesBefore(std::uint64_t cutoff);

    mutable std::shared_mutex mutex_;
    std::vector<Registration> registrations_;
    TapHandle nextHandle_ = 1;

    std::mutex flightMutex_;
    std::condition_variable flightDone_;
    // Running dispatches by ticket
    std::map<std::uint64_t, std::thread::id> inFlight_;
    std::uint64_t nextTicket_ = 0;
};

}  // namespace lockclean::input

#endif  // LOCKCLEAN_INPUT_EVENT_DISPATCHER_HPP
