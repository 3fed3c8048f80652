/// @file game_session.cpp
/// @brief GameSession construction and terminal-state protocol.

#include "tadv/game/game_session.hpp"

#include <string>
#include <utility>

#include "tadv/foundation/game_logger.hpp"

namespace tadv::game {

using tadv::foundation::EntityId;
using tadv::foundation::ErrorCode;
using tadv::foundation::GameError;
using tadv::foundation::GameLogger;
using tadv::foundation::GameResult;
using tadv::foundation::LogCategory;
using tadv::foundation::LogContext;
using tadv::foundation::LogLevel;

GameResult<GameSession> GameSession::Create(const SessionConfig& config) {
    if (config.arena.width <= 0 || config.arena.height <= 0) {
        return GameResult<GameSession>::err(
            GameError(ErrorCode::InvalidConfiguration,
                      "arena must be positive, got " + std::to_string(config.arena.width) +
                          "x" + std::to_string(config.arena.height)));
    }

    const auto width = static_cast<double>(config.arena.width);
    const auto midY = static_cast<double>(config.arena.height / 2);

    auto home = Home::Create(config.homePosition.value_or(Vector2{width - kHomeInsetX, midY}),
                             config.homeSize);
    if (!home) {
        return GameResult<GameSession>::err(home.error());
    }

    auto player = Player::Create(config.playerStart.value_or(Vector2{kPlayerStartX, midY}),
                                 config.playerSpeed);
    if (!player) {
        return GameResult<GameSession>::err(player.error());
    }

    return GameResult<GameSession>::ok(GameSession(config.arena, config.level,
                                                   std::move(home).value(),
                                                   std::move(player).value()));
}

GameSession::GameSession(ArenaBounds arena, uint32_t level, Home home, Player player)
    : arena_(arena),
      level_(level),
      home_(std::move(home)),
      player_(std::move(player)) {
    waypoint_.AssignId(nextEntityId());
    home_.AssignId(nextEntityId());
    player_.AssignId(nextEntityId());
}

SessionState GameSession::AdvanceTick() {
    if (IsFinished()) {
        return state_;
    }

    ++tickCount_;
    TickContext context{player_.Position(), arena_, tickCount_};

    if (auto outcome = player_.Update(context, home_, waypoint_)) {
        return finish(*outcome);
    }

    // Enemies see the player's post-update position.
    context.playerPosition = player_.Position();

    if (auto outcome = home_.Update(context)) {
        return finish(*outcome);
    }

    for (auto& enemy : enemies_) {
        if (auto outcome = enemy.Update(context)) {
            return finish(*outcome);
        }
    }
    return state_;
}

std::optional<GameOutcome> GameSession::GetOutcome() const noexcept {
    switch (state_) {
        case SessionState::Won:  return GameOutcome::Won;
        case SessionState::Lost: return GameOutcome::Lost;
        case SessionState::Running: break;
    }
    return std::nullopt;
}

void GameSession::ActivateWaypoint(double x, double y) {
    if (IsFinished()) {
        TADV_LOG_DEBUG(LogCategory::Player, "click ignored after session end");
        return;
    }
    waypoint_.Activate(x, y);

    auto& logger = GameLogger::instance();
    if (logger.isEnabled(LogLevel::Debug, LogCategory::Player)) {
        LogContext ctx;
        ctx.entityId = waypoint_.Id();
        ctx.tick = tickCount_;
        ctx.extra["x"] = std::to_string(x);
        ctx.extra["y"] = std::to_string(y);
        logger.logWithContext(LogLevel::Debug, LogCategory::Player, "waypoint set", ctx);
    }
}

GameResult<EntityId> GameSession::AddEnemy(Enemy enemy) {
    if (IsFinished()) {
        return GameResult<EntityId>::err(
            GameError(ErrorCode::SessionFinished, "cannot add enemy after session end"));
    }
    auto id = nextEntityId();
    enemy.AssignId(id);
    enemies_.push_back(std::move(enemy));
    return GameResult<EntityId>::ok(id);
}

std::vector<EntitySnapshot> GameSession::Snapshot() const {
    std::vector<EntitySnapshot> snapshots;
    snapshots.reserve(3 + enemies_.size());
    snapshots.push_back(waypoint_.Snapshot());
    snapshots.push_back(home_.Snapshot());
    snapshots.push_back(player_.Snapshot());
    for (const auto& enemy : enemies_) {
        snapshots.push_back(enemy.Snapshot());
    }
    return snapshots;
}

EntityId GameSession::nextEntityId() noexcept {
    return EntityId(++lastEntityId_);
}

SessionState GameSession::finish(GameOutcome outcome) {
    state_ = outcome == GameOutcome::Won ? SessionState::Won : SessionState::Lost;

    LogContext ctx;
    ctx.tick = tickCount_;
    ctx.level = level_;
    ctx.extra["outcome"] = std::string(outcomeName(outcome));
    GameLogger::instance().logWithContext(LogLevel::Info, LogCategory::Session,
                                          "session finished", ctx);
    return state_;
}

}  // namespace tadv::game
