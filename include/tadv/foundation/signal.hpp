#pragma once

/// @file signal.hpp
/// @brief Signal<Args...> for notifying the rendering boundary.
///
/// Slots are registered with connect() and invoked in registration order
/// by emit(). The host is single-threaded, so there is no locking; emit()
/// iterates over a snapshot so a slot may connect or disconnect while the
/// signal is firing.

#include <cstdint>
#include <functional>
#include <map>
#include <vector>

namespace tadv::foundation {

/// Publish/subscribe signal dispatching to registered callbacks.
///
/// @tparam Args The argument types passed to each slot when the signal fires.
///
/// Example:
/// @code
///   Signal<GameOutcome, uint32_t> onGameOver;
///   auto id = onGameOver.connect([](GameOutcome outcome, uint32_t level) {
///       banner.show(outcomeName(outcome), level);
///   });
///   onGameOver.emit(GameOutcome::Won, 1);
///   onGameOver.disconnect(id);
/// @endcode
template <typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;
    using SlotId = uint64_t;

    Signal() = default;

    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;
    Signal(Signal&&) noexcept = default;
    Signal& operator=(Signal&&) noexcept = default;

    /// Register a callback. Returns a SlotId for later disconnect().
    SlotId connect(Slot slot) {
        auto id = nextId_++;
        slots_.emplace(id, std::move(slot));
        return id;
    }

    void disconnect(SlotId id) { slots_.erase(id); }

    /// Invoke every registered slot with the given args.
    void emit(Args... args) const {
        std::vector<Slot> snapshot;
        snapshot.reserve(slots_.size());
        for (const auto& [id, slot] : slots_) {
            snapshot.push_back(slot);
        }
        for (const auto& slot : snapshot) {
            slot(args...);
        }
    }

    [[nodiscard]] std::size_t slotCount() const noexcept { return slots_.size(); }

private:
    // Ordered by id so slots fire in registration order.
    std::map<SlotId, Slot> slots_;
    SlotId nextId_ = 1;
};

} // namespace tadv::foundation
