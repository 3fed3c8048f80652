/// @file home.cpp
/// @brief Home implementation.

#include "tadv/game/home.hpp"

#include <cmath>
#include <string>

namespace tadv::game {

using tadv::foundation::ErrorCode;
using tadv::foundation::GameError;
using tadv::foundation::GameResult;

GameResult<Home> Home::Create(Vector2 center, double size) {
    if (!std::isfinite(size) || size <= 0.0) {
        return GameResult<Home>::err(
            GameError(ErrorCode::InvalidConfiguration,
                      "home size must be positive, got " + std::to_string(size), size));
    }
    return GameResult<Home>::ok(Home(center, size));
}

bool Home::Contains(Vector2 point) const noexcept {
    return SquareContains(position_, size_, point);
}

std::optional<GameOutcome> Home::Update(const TickContext& /*context*/) {
    return std::nullopt;
}

EntitySnapshot Home::Snapshot() const {
    EntitySnapshot snapshot;
    snapshot.id = id_;
    snapshot.shape = ShapeKind::Rectangle;
    snapshot.position = position_;
    snapshot.size = size_;
    snapshot.color = "brown";
    return snapshot;
}

}  // namespace tadv::game
