#pragma once

/// @file game_session.hpp
/// @brief GameSession: owns every entity and runs the per-tick protocol.
///
/// Tick order is fixed:
///   1. Player (may emit Won)
///   2. Home (static)
///   3. Enemies in insertion order (may emit Lost)
///
/// The first terminal signal ends the session; the remaining entities are
/// not updated that tick and AdvanceTick() is a no-op afterwards.

#include <cstdint>
#include <optional>
#include <vector>

#include "tadv/foundation/game_result.hpp"
#include "tadv/foundation/types.hpp"
#include "tadv/game/enemy.hpp"
#include "tadv/game/game_types.hpp"
#include "tadv/game/home.hpp"
#include "tadv/game/player.hpp"
#include "tadv/game/waypoint.hpp"

namespace tadv::game {

/// Parameters of a new session.
struct SessionConfig {
    ArenaBounds arena;

    /// Level number reported with the banner and the outcome.
    uint32_t level = 1;

    double playerSpeed = kDefaultPlayerSpeed;
    double homeSize = kDefaultHomeSize;

    /// Defaults to (width - 100, height / 2).
    std::optional<Vector2> homePosition;

    /// Defaults to (50, height / 2).
    std::optional<Vector2> playerStart;
};

class GameSession {
public:
    /// Build a Running session with Home, Player and an inactive Waypoint.
    /// @return InvalidConfiguration for a non-positive arena, speed or size.
    [[nodiscard]] static tadv::foundation::GameResult<GameSession> Create(
        const SessionConfig& config);

    // ── Tick protocol ────────────────────────────────────────────────

    /// Advance every entity by one tick.
    /// @return The state after the tick.
    SessionState AdvanceTick();

    [[nodiscard]] SessionState GetState() const noexcept { return state_; }

    [[nodiscard]] bool IsFinished() const noexcept { return state_ != SessionState::Running; }

    /// The terminal outcome, or std::nullopt while running.
    [[nodiscard]] std::optional<GameOutcome> GetOutcome() const noexcept;

    /// Number of ticks that ran entity updates.
    [[nodiscard]] uint64_t GetTickCount() const noexcept { return tickCount_; }

    // ── Input ────────────────────────────────────────────────────────

    /// Forward a click to the waypoint. Ignored once the session finished.
    void ActivateWaypoint(double x, double y);

    /// Append an enemy; it updates from the next tick on.
    /// @return The enemy's new id, or SessionFinished after termination.
    tadv::foundation::GameResult<tadv::foundation::EntityId> AddEnemy(Enemy enemy);

    // ── Queries ──────────────────────────────────────────────────────

    [[nodiscard]] const Home& GetHome() const noexcept { return home_; }
    [[nodiscard]] const Player& GetPlayer() const noexcept { return player_; }
    [[nodiscard]] const Waypoint& GetWaypoint() const noexcept { return waypoint_; }
    [[nodiscard]] const std::vector<Enemy>& GetEnemies() const noexcept { return enemies_; }
    [[nodiscard]] const ArenaBounds& GetArena() const noexcept { return arena_; }
    [[nodiscard]] uint32_t GetLevel() const noexcept { return level_; }

    /// Render description of every entity: waypoint, home, player, then
    /// enemies in insertion order.
    [[nodiscard]] std::vector<EntitySnapshot> Snapshot() const;

private:
    GameSession(ArenaBounds arena, uint32_t level, Home home, Player player);

    tadv::foundation::EntityId nextEntityId() noexcept;

    SessionState finish(GameOutcome outcome);

    ArenaBounds arena_;
    uint32_t level_;
    Home home_;
    Player player_;
    Waypoint waypoint_;
    std::vector<Enemy> enemies_;

    SessionState state_ = SessionState::Running;
    uint64_t tickCount_ = 0;
    uint32_t lastEntityId_ = 0;
};

}  // namespace tadv::game
