/// @file enemy.cpp
/// @brief Enemy construction, hit tests and the four motion rules.
///
/// Motion rules:
///   - Chasing:    caught when closer than Size(); otherwise step toward the
///                 player, heading recomputed every tick.
///   - Fencing:    walk the patrol square one edge per phase.
///   - RandomWalk: step along the heading, then reflect off the arena edges.
///   - GateGuard:  same, reflecting off the gate region in front of Home.

#include "tadv/game/enemy.hpp"

#include <cmath>
#include <numbers>
#include <string>
#include <utility>

#include "tadv/foundation/game_logger.hpp"

namespace tadv::game {

using tadv::foundation::ErrorCode;
using tadv::foundation::GameError;
using tadv::foundation::GameLogger;
using tadv::foundation::GameResult;
using tadv::foundation::LogCategory;
using tadv::foundation::LogContext;
using tadv::foundation::LogLevel;

namespace {

GameResult<Enemy> rejectSize(EnemyKind kind, double size) {
    return GameResult<Enemy>::err(
        GameError(ErrorCode::InvalidConfiguration,
                  std::string(enemyKindName(kind)) + " enemy size must be positive, got " +
                      std::to_string(size),
                  size));
}

bool validSize(double size) {
    return std::isfinite(size) && size > 0.0;
}

void logCatch(const Enemy& enemy, const TickContext& context) {
    auto& logger = GameLogger::instance();
    if (!logger.isEnabled(LogLevel::Info, LogCategory::Enemy)) {
        return;
    }
    LogContext ctx;
    ctx.entityId = enemy.Id();
    ctx.tick = context.tick;
    ctx.extra["kind"] = std::string(enemyKindName(enemy.Kind()));
    logger.logWithContext(LogLevel::Info, LogCategory::Enemy, "player caught", ctx);
}

/// Reflect a wander heading. Both reflections may apply in the same tick.
double reflect(double angle, bool outsideX, bool outsideY) {
    if (outsideX) {
        angle = std::numbers::pi_v<double> - angle;
    }
    if (outsideY) {
        angle = -angle;
    }
    return angle;
}

}  // namespace

// ── Construction ────────────────────────────────────────────────────

Enemy::Enemy(Vector2 position, double size, std::string color, EnemyBehavior behavior)
    : Entity(position), size_(size), color_(std::move(color)), behavior_(std::move(behavior)) {}

GameResult<Enemy> Enemy::CreateChasing(Vector2 position, double size, std::string color) {
    if (!validSize(size)) {
        return rejectSize(EnemyKind::Chasing, size);
    }
    return GameResult<Enemy>::ok(Enemy(position, size, std::move(color), ChasingState{}));
}

GameResult<Enemy> Enemy::CreateFencing(Vector2 position, double size, std::string color,
                                       Vector2 homeCenter) {
    if (!validSize(size)) {
        return rejectSize(EnemyKind::Fencing, size);
    }
    const double e = kFencingHalfExtent;
    FencingState state;
    state.corners = {Vector2{homeCenter.x - e, homeCenter.y - e},
                     Vector2{homeCenter.x + e, homeCenter.y - e},
                     Vector2{homeCenter.x + e, homeCenter.y + e},
                     Vector2{homeCenter.x - e, homeCenter.y + e}};
    return GameResult<Enemy>::ok(Enemy(position, size, std::move(color), state));
}

GameResult<Enemy> Enemy::CreateRandomWalk(Vector2 position, double size, std::string color,
                                          double initialAngle) {
    if (!validSize(size)) {
        return rejectSize(EnemyKind::RandomWalk, size);
    }
    return GameResult<Enemy>::ok(
        Enemy(position, size, std::move(color), RandomWalkState{initialAngle}));
}

GameResult<Enemy> Enemy::CreateGateGuard(Vector2 position, double size, std::string color,
                                         double initialAngle) {
    if (!validSize(size)) {
        return rejectSize(EnemyKind::GateGuard, size);
    }
    return GameResult<Enemy>::ok(
        Enemy(position, size, std::move(color), GateGuardState{initialAngle}));
}

// ── Shared contract ─────────────────────────────────────────────────

bool Enemy::HitsPlayer(Vector2 playerPosition) const noexcept {
    return SquareOverlapsStrict(position_, size_, playerPosition);
}

std::optional<GameOutcome> Enemy::Update(const TickContext& context) {
    auto outcome = std::visit(
        [this, &context](auto& state) { return UpdateBehavior(state, context); }, behavior_);
    if (outcome) {
        logCatch(*this, context);
    }
    return outcome;
}

EntitySnapshot Enemy::Snapshot() const {
    EntitySnapshot snapshot;
    snapshot.id = id_;
    snapshot.shape = ShapeKind::Circle;
    snapshot.position = position_;
    snapshot.size = size_;
    snapshot.color = color_;
    return snapshot;
}

// ── Motion rules ────────────────────────────────────────────────────

std::optional<GameOutcome> Enemy::UpdateBehavior(ChasingState& /*state*/,
                                                 const TickContext& context) {
    const auto& player = context.playerPosition;
    if (Distance(position_, player) < size_) {
        return GameOutcome::Lost;
    }
    position_ += Vector2::FromAngle(AngleTo(position_, player)) * kChasingSpeed;
    return std::nullopt;
}

std::optional<GameOutcome> Enemy::UpdateBehavior(FencingState& state,
                                                 const TickContext& context) {
    if (HitsPlayer(context.playerPosition)) {
        return GameOutcome::Lost;
    }

    switch (state.phase) {
        case 0:
            position_.x += kFencingSpeed;
            if (position_.x >= state.corners[1].x) {
                state.phase = 1;
            }
            break;
        case 1:
            position_.y += kFencingSpeed;
            if (position_.y >= state.corners[2].y) {
                state.phase = 2;
            }
            break;
        case 2:
            position_.x -= kFencingSpeed;
            if (position_.x <= state.corners[3].x) {
                state.phase = 3;
            }
            break;
        case 3:
            position_.y -= kFencingSpeed;
            if (position_.y <= state.corners[0].y) {
                state.phase = 0;
            }
            break;
    }
    return std::nullopt;
}

std::optional<GameOutcome> Enemy::UpdateBehavior(RandomWalkState& state,
                                                 const TickContext& context) {
    if (HitsPlayer(context.playerPosition)) {
        return GameOutcome::Lost;
    }

    position_ += Vector2::FromAngle(state.angle) * kWanderSpeed;

    const auto width = static_cast<double>(context.arena.width);
    const auto height = static_cast<double>(context.arena.height);
    state.angle = reflect(state.angle,
                          position_.x < 0.0 || position_.x > width,
                          position_.y < 0.0 || position_.y > height);
    return std::nullopt;
}

std::optional<GameOutcome> Enemy::UpdateBehavior(GateGuardState& state,
                                                 const TickContext& context) {
    if (HitsPlayer(context.playerPosition)) {
        return GameOutcome::Lost;
    }

    position_ += Vector2::FromAngle(state.angle) * kWanderSpeed;

    // Gate region bounds use integer division of the arena size.
    const int32_t w = context.arena.width;
    const int32_t h = context.arena.height;
    const auto left = static_cast<double>(w - w / 4);
    const auto right = static_cast<double>(w);
    const auto top = static_cast<double>(h / 3);
    const auto bottom = static_cast<double>(h - h / 3);

    state.angle = reflect(state.angle,
                          position_.x < left || position_.x > right,
                          position_.y < top || position_.y > bottom);
    return std::nullopt;
}

}  // namespace tadv::game
