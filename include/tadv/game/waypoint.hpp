#pragma once

/// @file waypoint.hpp
/// @brief Waypoint: the player's navigation target, set by clicks.

#include <optional>

#include "tadv/game/entity.hpp"
#include "tadv/game/game_types.hpp"

namespace tadv::game {

/// Navigation target. Starts inactive; its coordinates are meaningful only
/// while active.
class Waypoint final : public Entity {
public:
    Waypoint() : Entity({}) {}

    /// Point the waypoint at (x, y) and mark it active. Reactivating while
    /// active overwrites the previous target.
    void Activate(double x, double y) noexcept;

    /// Mark inactive. The stored coordinates are kept.
    void Deactivate() noexcept { active_ = false; }

    [[nodiscard]] bool IsActive() const noexcept { return active_; }

    /// The current target, or std::nullopt while inactive.
    [[nodiscard]] std::optional<Vector2> Target() const noexcept;

    /// Cross marker, hidden while inactive.
    [[nodiscard]] EntitySnapshot Snapshot() const;

private:
    bool active_ = false;
};

}  // namespace tadv::game
