#pragma once

/// @file enemy_generator.hpp
/// @brief EnemyGenerator: populates a session with one enemy of each kind.
///
/// The host fires CreateEnemy() once, after the configured spawn delay.
/// The level is recorded but does not change what is spawned.

#include <cstddef>
#include <cstdint>

#include "tadv/foundation/game_result.hpp"
#include "tadv/game/game_session.hpp"
#include "tadv/game/game_types.hpp"

namespace tadv::game {

class EnemyGenerator {
public:
    EnemyGenerator(GameSession& session, uint32_t level, ArenaBounds arena,
                   double enemySize = kDefaultEnemySize);

    /// Spawn, in order: RandomWalk (100, 100) red, Chasing (200, 200) blue,
    /// Fencing (width - 150, height/2 - 50) orange, GateGuard
    /// (width - 100, height/2) pink.
    /// Nothing is added unless all four enemies can be built.
    /// @return Number of enemies added, the first construction error, or
    ///         SessionFinished once the session has ended.
    tadv::foundation::GameResult<std::size_t> CreateEnemy();

    [[nodiscard]] uint32_t GetLevel() const noexcept { return level_; }

    [[nodiscard]] double GetEnemySize() const noexcept { return enemySize_; }

private:
    GameSession& session_;
    uint32_t level_;
    ArenaBounds arena_;
    double enemySize_;
};

}  // namespace tadv::game
