/// @file player.cpp
/// @brief Player navigation and arrival detection.

#include "tadv/game/player.hpp"

#include <cmath>
#include <string>

#include "tadv/foundation/game_logger.hpp"

namespace tadv::game {

using tadv::foundation::ErrorCode;
using tadv::foundation::GameError;
using tadv::foundation::GameResult;
using tadv::foundation::LogCategory;

GameResult<Player> Player::Create(Vector2 start, double speed) {
    if (!std::isfinite(speed) || speed <= 0.0) {
        return GameResult<Player>::err(
            GameError(ErrorCode::InvalidConfiguration,
                      "player speed must be positive, got " + std::to_string(speed), speed));
    }
    return GameResult<Player>::ok(Player(start, speed));
}

std::optional<GameOutcome> Player::Update(const TickContext& /*context*/, const Home& home,
                                          Waypoint& waypoint) {
    if (home.Contains(position_)) {
        return GameOutcome::Won;
    }

    auto target = waypoint.Target();
    if (!target) {
        return std::nullopt;
    }

    const double remaining = Distance(position_, *target);
    const double heading = AngleTo(position_, *target);
    position_ += Vector2::FromAngle(heading) * speed_;

    if (remaining < speed_) {
        waypoint.Deactivate();
        TADV_LOG_DEBUG(LogCategory::Player, "waypoint reached");
    }
    return std::nullopt;
}

EntitySnapshot Player::Snapshot() const {
    EntitySnapshot snapshot;
    snapshot.id = id_;
    snapshot.shape = ShapeKind::Turtle;
    snapshot.position = position_;
    snapshot.color = "green";
    return snapshot;
}

}  // namespace tadv::game
