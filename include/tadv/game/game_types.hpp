#pragma once

/// @file game_types.hpp
/// @brief Enumerations, constants and plain records shared by the
///        simulation and the rendering boundary.

#include <cstdint>
#include <string>
#include <string_view>

#include "tadv/foundation/types.hpp"
#include "tadv/game/math_types.hpp"

namespace tadv::game {

// ── Tuning constants ────────────────────────────────────────────────

/// Default player speed (world units per tick).
constexpr double kDefaultPlayerSpeed = 5.0;

/// Default side length of the Home square.
constexpr double kDefaultHomeSize = 20.0;

/// Side length of every spawned enemy's collision box.
constexpr double kDefaultEnemySize = 20.0;

/// Per-tick step of Chasing, RandomWalk and GateGuard enemies.
constexpr double kChasingSpeed = 3.0;
constexpr double kWanderSpeed = 3.0;

/// Per-tick step of the Fencing enemy.
constexpr double kFencingSpeed = 2.0;

/// Half side length of the Fencing patrol square around Home.
constexpr double kFencingHalfExtent = 50.0;

/// Initial wander heading. Used directly as radians (about 2578 degrees).
constexpr double kDefaultWanderAngle = 45.0;

/// Half extent of the waypoint cross marker.
constexpr double kWaypointCrossHalfExtent = 10.0;

/// Player start x; the player starts vertically centered.
constexpr double kPlayerStartX = 50.0;

/// Home distance from the arena's right edge; Home is vertically centered.
constexpr double kHomeInsetX = 100.0;

// ── Enumerations ────────────────────────────────────────────────────

/// Terminal signal emitted by an entity update.
enum class GameOutcome : uint8_t {
    Won,   ///< Player reached Home.
    Lost   ///< An enemy caught the player.
};

/// Session lifecycle: Running until the first terminal signal.
enum class SessionState : uint8_t {
    Running,
    Won,
    Lost
};

/// Enemy behavior tag. Order matches the EnemyBehavior variant.
enum class EnemyKind : uint8_t {
    Chasing,     ///< Pure pursuit.
    Fencing,     ///< Square patrol around Home.
    RandomWalk,  ///< Reflecting walk within the arena.
    GateGuard    ///< Reflecting walk within the gate region.
};

/// Visual shape the rendering boundary should draw.
enum class ShapeKind : uint8_t {
    Cross,      ///< Waypoint marker.
    Rectangle,  ///< Home.
    Turtle,     ///< Player.
    Circle      ///< Enemies.
};

constexpr std::string_view outcomeName(GameOutcome outcome) {
    switch (outcome) {
        case GameOutcome::Won:  return "Win";
        case GameOutcome::Lost: return "Lose";
    }
    return "Unknown";
}

constexpr std::string_view sessionStateName(SessionState state) {
    switch (state) {
        case SessionState::Running: return "Running";
        case SessionState::Won:     return "Won";
        case SessionState::Lost:    return "Lost";
    }
    return "Unknown";
}

constexpr std::string_view enemyKindName(EnemyKind kind) {
    switch (kind) {
        case EnemyKind::Chasing:    return "chasing";
        case EnemyKind::Fencing:    return "fencing";
        case EnemyKind::RandomWalk: return "random_walk";
        case EnemyKind::GateGuard:  return "gate_guard";
    }
    return "unknown";
}

// ── Records ─────────────────────────────────────────────────────────

/// Arena dimensions in world units.
struct ArenaBounds {
    int32_t width = 800;
    int32_t height = 600;
};

/// Read-only view of the session handed to each entity update.
///
/// `playerPosition` is the player's position after the player's own update
/// for the current tick.
struct TickContext {
    Vector2 playerPosition;
    ArenaBounds arena;
    uint64_t tick = 0;
};

/// What the rendering boundary needs to draw one entity.
struct EntitySnapshot {
    tadv::foundation::EntityId id;
    ShapeKind shape = ShapeKind::Circle;
    Vector2 position;
    double size = 0.0;
    std::string color;
    bool visible = true;
};

}  // namespace tadv::game
