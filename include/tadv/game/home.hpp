#pragma once

/// @file home.hpp
/// @brief Home: the static goal square the player must reach.

#include <optional>

#include "tadv/foundation/game_result.hpp"
#include "tadv/game/entity.hpp"
#include "tadv/game/game_types.hpp"

namespace tadv::game {

class Home final : public Entity {
public:
    /// Create a Home centered on @p center with side length @p size.
    /// @return InvalidConfiguration unless size is finite and positive.
    [[nodiscard]] static tadv::foundation::GameResult<Home> Create(Vector2 center, double size);

    [[nodiscard]] double Size() const noexcept { return size_; }

    /// Inclusive containment test against the Home square.
    [[nodiscard]] bool Contains(Vector2 point) const noexcept;
    [[nodiscard]] bool Contains(double x, double y) const noexcept { return Contains({x, y}); }

    /// Home never moves; always returns no signal.
    std::optional<GameOutcome> Update(const TickContext& context);

    [[nodiscard]] EntitySnapshot Snapshot() const;

private:
    Home(Vector2 center, double size) : Entity(center), size_(size) {}

    double size_;
};

}  // namespace tadv::game
