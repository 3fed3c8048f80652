#pragma once

/// @file types.hpp
/// @brief Strong ID types shared by the simulation and the host.

#include <cstdint>
#include <functional>

namespace tadv::foundation {

/// Tag-based strong typedef for type-safe ID values.
///
/// @tparam Tag A unique tag type to distinguish different ID types.
/// @tparam T The underlying integral type.
template <typename Tag, typename T = uint64_t>
class StrongId {
public:
    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

struct EntityIdTag {};
struct EventIdTag {};

/// Identity of a simulated entity. 0 is reserved as "no entity".
using EntityId = StrongId<EntityIdTag, uint32_t>;

/// Handle of an entry in the host event queue.
using EventId = StrongId<EventIdTag>;

} // namespace tadv::foundation

template <typename Tag, typename T>
struct std::hash<tadv::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const tadv::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
