#pragma once

/// @file entity.hpp
/// @brief Entity: owned position and identity shared by every simulated
///        object.
///
/// Each concrete entity exposes `Update(const TickContext&, ...)` returning
/// an optional terminal signal, and `Snapshot()` for the rendering boundary.
/// The session calls them on concrete types; there is no virtual dispatch.

#include "tadv/foundation/types.hpp"
#include "tadv/game/math_types.hpp"

namespace tadv::game {

class Entity {
public:
    [[nodiscard]] tadv::foundation::EntityId Id() const noexcept { return id_; }

    [[nodiscard]] Vector2 Position() const noexcept { return position_; }

    void SetPosition(Vector2 position) noexcept { position_ = position; }

    /// Set by the owning session when the entity joins it.
    void AssignId(tadv::foundation::EntityId id) noexcept { id_ = id; }

protected:
    explicit Entity(Vector2 position) : position_(position) {}
    ~Entity() = default;

    Entity(const Entity&) = default;
    Entity& operator=(const Entity&) = default;
    Entity(Entity&&) noexcept = default;
    Entity& operator=(Entity&&) noexcept = default;

    tadv::foundation::EntityId id_;
    Vector2 position_;
};

}  // namespace tadv::game
