/// @file waypoint.cpp
/// @brief Waypoint implementation.

#include "tadv/game/waypoint.hpp"

namespace tadv::game {

void Waypoint::Activate(double x, double y) noexcept {
    position_ = {x, y};
    active_ = true;
}

std::optional<Vector2> Waypoint::Target() const noexcept {
    if (!active_) {
        return std::nullopt;
    }
    return position_;
}

EntitySnapshot Waypoint::Snapshot() const {
    EntitySnapshot snapshot;
    snapshot.id = id_;
    snapshot.shape = ShapeKind::Cross;
    snapshot.position = position_;
    snapshot.size = 2.0 * kWaypointCrossHalfExtent;
    snapshot.color = "green";
    snapshot.visible = active_;
    return snapshot;
}

}  // namespace tadv::game
