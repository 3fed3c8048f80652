#pragma once

/// @file enemy.hpp
/// @brief Enemy record with a closed set of motion behaviors.
///
/// Every enemy shares position, size and color; its behavior is one
/// alternative of EnemyBehavior. Update() dispatches on the alternative
/// with std::visit, so adding a behavior without a motion rule fails to
/// compile.

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include "tadv/foundation/game_result.hpp"
#include "tadv/game/entity.hpp"
#include "tadv/game/game_types.hpp"

namespace tadv::game {

// ── Behavior state ──────────────────────────────────────────────────

/// Pure pursuit; no state beyond the shared record.
struct ChasingState {};

/// Square patrol around Home.
///
/// Corners are fixed at construction, in order top-left, top-right,
/// bottom-right, bottom-left. Phase 0 walks +x, 1 walks +y, 2 walks -x,
/// 3 walks -y.
struct FencingState {
    uint8_t phase = 0;
    std::array<Vector2, 4> corners{};
};

/// Walk along `angle`, reflecting off the arena edges.
struct RandomWalkState {
    double angle = kDefaultWanderAngle;
};

/// Walk along `angle`, reflecting off the gate region in front of Home.
struct GateGuardState {
    double angle = kDefaultWanderAngle;
};

/// Alternative order matches EnemyKind.
using EnemyBehavior = std::variant<ChasingState, FencingState, RandomWalkState, GateGuardState>;

static_assert(std::variant_size_v<EnemyBehavior> == 4,
              "EnemyKind and EnemyBehavior must list the same behaviors");

// ── Enemy ───────────────────────────────────────────────────────────

class Enemy final : public Entity {
public:
    [[nodiscard]] static tadv::foundation::GameResult<Enemy> CreateChasing(
        Vector2 position, double size, std::string color);

    /// @param homeCenter  Center of the patrol square, read once here.
    [[nodiscard]] static tadv::foundation::GameResult<Enemy> CreateFencing(
        Vector2 position, double size, std::string color, Vector2 homeCenter);

    [[nodiscard]] static tadv::foundation::GameResult<Enemy> CreateRandomWalk(
        Vector2 position, double size, std::string color,
        double initialAngle = kDefaultWanderAngle);

    [[nodiscard]] static tadv::foundation::GameResult<Enemy> CreateGateGuard(
        Vector2 position, double size, std::string color,
        double initialAngle = kDefaultWanderAngle);

    [[nodiscard]] EnemyKind Kind() const noexcept {
        return static_cast<EnemyKind>(behavior_.index());
    }

    [[nodiscard]] double Size() const noexcept { return size_; }

    [[nodiscard]] const std::string& Color() const noexcept { return color_; }

    [[nodiscard]] const EnemyBehavior& Behavior() const noexcept { return behavior_; }

    /// Strict box test: the player point lies inside the open square of
    /// side Size() centered on the enemy.
    [[nodiscard]] bool HitsPlayer(Vector2 playerPosition) const noexcept;

    /// Run this enemy's collision test and motion rule for one tick.
    /// @return GameOutcome::Lost when the player is caught (no motion then).
    std::optional<GameOutcome> Update(const TickContext& context);

    [[nodiscard]] EntitySnapshot Snapshot() const;

private:
    Enemy(Vector2 position, double size, std::string color, EnemyBehavior behavior);

    std::optional<GameOutcome> UpdateBehavior(ChasingState& state, const TickContext& context);
    std::optional<GameOutcome> UpdateBehavior(FencingState& state, const TickContext& context);
    std::optional<GameOutcome> UpdateBehavior(RandomWalkState& state, const TickContext& context);
    std::optional<GameOutcome> UpdateBehavior(GateGuardState& state, const TickContext& context);

    double size_;
    std::string color_;
    EnemyBehavior behavior_;
};

}  // namespace tadv::game
