/// @file enemy_generator.cpp
/// @brief EnemyGenerator spawn table.

#include "tadv/game/enemy_generator.hpp"

#include <array>
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

EnemyGenerator::EnemyGenerator(GameSession& session, uint32_t level, ArenaBounds arena,
                               double enemySize)
    : session_(session), level_(level), arena_(arena), enemySize_(enemySize) {}

GameResult<std::size_t> EnemyGenerator::CreateEnemy() {
    if (session_.IsFinished()) {
        return GameResult<std::size_t>::err(
            GameError(ErrorCode::SessionFinished, "spawn after session end"));
    }

    const auto width = static_cast<double>(arena_.width);
    const auto midY = static_cast<double>(arena_.height / 2);
    const Vector2 homeCenter = session_.GetHome().Position();

    std::array<GameResult<Enemy>, 4> spawns = {
        Enemy::CreateRandomWalk({100.0, 100.0}, enemySize_, "red"),
        Enemy::CreateChasing({200.0, 200.0}, enemySize_, "blue"),
        Enemy::CreateFencing({width - 150.0, midY - 50.0}, enemySize_, "orange", homeCenter),
        Enemy::CreateGateGuard({width - 100.0, midY}, enemySize_, "pink"),
    };

    for (const auto& spawn : spawns) {
        if (!spawn) {
            return GameResult<std::size_t>::err(spawn.error());
        }
    }

    auto& logger = GameLogger::instance();
    std::size_t added = 0;
    for (auto& spawn : spawns) {
        auto kind = spawn.value().Kind();
        auto id = session_.AddEnemy(std::move(spawn).value());
        if (!id) {
            return GameResult<std::size_t>::err(id.error());
        }
        ++added;

        if (logger.isEnabled(LogLevel::Debug, LogCategory::Spawn)) {
            LogContext ctx;
            ctx.entityId = id.value();
            ctx.level = level_;
            ctx.extra["kind"] = std::string(enemyKindName(kind));
            logger.logWithContext(LogLevel::Debug, LogCategory::Spawn, "enemy spawned", ctx);
        }
    }
    return GameResult<std::size_t>::ok(added);
}

}  // namespace tadv::game
