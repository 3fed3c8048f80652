#pragma once

/// @file player.hpp
/// @brief Player: walks toward the active waypoint at constant speed.

#include <optional>

#include "tadv/foundation/game_result.hpp"
#include "tadv/game/entity.hpp"
#include "tadv/game/game_types.hpp"
#include "tadv/game/home.hpp"
#include "tadv/game/waypoint.hpp"

namespace tadv::game {

/// The single player token of a session.
///
/// Each tick:
///   1. If Home contains the player, emit Won and do not move.
///   2. Otherwise, if the waypoint is active, step exactly `speed` units
///      toward it. The step is not clamped, so the player may overshoot.
///   3. If the distance to the waypoint measured before the step was less
///      than `speed`, deactivate the waypoint.
class Player final : public Entity {
public:
    /// @return InvalidConfiguration unless speed is finite and positive.
    [[nodiscard]] static tadv::foundation::GameResult<Player> Create(
        Vector2 start, double speed = kDefaultPlayerSpeed);

    [[nodiscard]] double Speed() const noexcept { return speed_; }

    std::optional<GameOutcome> Update(const TickContext& context, const Home& home,
                                      Waypoint& waypoint);

    [[nodiscard]] EntitySnapshot Snapshot() const;

private:
    Player(Vector2 start, double speed) : Entity(start), speed_(speed) {}

    double speed_;
};

}  // namespace tadv::game
