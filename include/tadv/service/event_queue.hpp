#pragma once

/// @file event_queue.hpp
/// @brief Single-threaded timer queue delivering typed host events.
///
/// Events carry a due time on the queue's own clock. advance() moves the
/// clock forward and dispatches every due event in (due time, scheduling
/// order). An event scheduled from inside a handler is timed from the due
/// time of the event being handled, so periodic events keep their cadence
/// when one advance() spans several periods.

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <utility>

#include "tadv/foundation/game_result.hpp"
#include "tadv/foundation/types.hpp"

namespace tadv::service {

template <typename Event>
class EventQueue {
public:
    using Duration = std::chrono::microseconds;
    using EventId = tadv::foundation::EventId;

    /// Schedule @p event to fire as soon as possible.
    EventId post(Event event) { return scheduleAfter(Duration::zero(), std::move(event)); }

    /// Schedule @p event to fire @p delay after the current time.
    /// Negative delays are treated as zero.
    EventId scheduleAfter(Duration delay, Event event) {
        if (delay < Duration::zero()) {
            delay = Duration::zero();
        }
        const Duration base = dispatching_ ? currentDue_ : now_;
        EventId id(nextId_++);
        entries_.emplace(Key{base + delay, id.value()}, Entry{id, std::move(event)});
        return id;
    }

    /// Remove a pending event.
    /// @return EventNotFound if the event already fired or was cancelled.
    tadv::foundation::GameResult<void> cancel(EventId id) {
        for (auto it = entries_.begin(); it != entries_.end(); ++it) {
            if (it->second.id == id) {
                entries_.erase(it);
                return tadv::foundation::GameResult<void>::ok();
            }
        }
        return tadv::foundation::GameResult<void>::err(tadv::foundation::GameError(
            tadv::foundation::ErrorCode::EventNotFound,
            "no pending event " + std::to_string(id.value())));
    }

    /// Remove every pending event.
    /// @return The number of events removed.
    std::size_t cancelAll() {
        auto count = entries_.size();
        entries_.clear();
        return count;
    }

    /// Advance the clock by @p elapsed and dispatch due events to
    /// @p handler, called as `handler(const Event&)`.
    /// @return The number of events dispatched.
    template <typename Handler>
    std::size_t advance(Duration elapsed, Handler&& handler) {
        if (elapsed > Duration::zero()) {
            now_ += elapsed;
        }

        std::size_t dispatched = 0;
        while (!entries_.empty()) {
            auto it = entries_.begin();
            if (it->first.due > now_) {
                break;
            }
            currentDue_ = it->first.due;
            Event event = std::move(it->second.event);
            entries_.erase(it);

            dispatching_ = true;
            handler(static_cast<const Event&>(event));
            dispatching_ = false;
            ++dispatched;
        }
        return dispatched;
    }

    [[nodiscard]] Duration now() const noexcept { return now_; }

    [[nodiscard]] std::size_t pending() const noexcept { return entries_.size(); }

    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    /// Due time of the earliest pending event, or now() when empty.
    [[nodiscard]] Duration nextDue() const noexcept {
        return entries_.empty() ? now_ : entries_.begin()->first.due;
    }

private:
    struct Key {
        Duration due;
        uint64_t sequence;

        bool operator<(const Key& rhs) const noexcept {
            return due != rhs.due ? due < rhs.due : sequence < rhs.sequence;
        }
    };

    struct Entry {
        EventId id;
        Event event;
    };

    std::map<Key, Entry> entries_;
    Duration now_{0};
    Duration currentDue_{0};
    bool dispatching_ = false;
    uint64_t nextId_ = 1;
};

}  // namespace tadv::service
