#pragma once

/// @file math_types.hpp
/// @brief 2D vector and box helpers for the arena.
///
/// World coordinates have their origin at the top-left corner of the arena
/// with y increasing downward. Angles are radians measured with atan2 in
/// that frame, so a positive angle turns toward +y.

#include <cmath>

namespace tadv::game {

/// Two-component floating-point vector used for positions.
struct Vector2 {
    double x = 0.0;
    double y = 0.0;

    constexpr Vector2() = default;
    constexpr Vector2(double x, double y) : x(x), y(y) {}

    constexpr Vector2 operator+(const Vector2& rhs) const noexcept {
        return {x + rhs.x, y + rhs.y};
    }
    constexpr Vector2 operator-(const Vector2& rhs) const noexcept {
        return {x - rhs.x, y - rhs.y};
    }
    constexpr Vector2 operator*(double scalar) const noexcept {
        return {x * scalar, y * scalar};
    }

    constexpr Vector2& operator+=(const Vector2& rhs) noexcept {
        x += rhs.x;
        y += rhs.y;
        return *this;
    }

    [[nodiscard]] constexpr double LengthSquared() const noexcept { return x * x + y * y; }

    [[nodiscard]] double Length() const noexcept { return std::sqrt(LengthSquared()); }

    /// Unit vector pointing along @p angle.
    [[nodiscard]] static Vector2 FromAngle(double angle) noexcept {
        return {std::cos(angle), std::sin(angle)};
    }

    constexpr bool operator==(const Vector2&) const = default;
};

constexpr Vector2 operator*(double scalar, const Vector2& v) noexcept {
    return v * scalar;
}

/// Euclidean distance between two points.
[[nodiscard]] inline double Distance(const Vector2& a, const Vector2& b) noexcept {
    return (b - a).Length();
}

/// Heading from @p from toward @p to. atan2(0, 0) is 0, so coincident
/// points yield heading 0 rather than an error.
[[nodiscard]] inline double AngleTo(const Vector2& from, const Vector2& to) noexcept {
    return std::atan2(to.y - from.y, to.x - from.x);
}

/// Inclusive test: is @p point inside the square of side @p size
/// centered on @p center (boundary counts).
[[nodiscard]] constexpr bool SquareContains(const Vector2& center, double size,
                                            const Vector2& point) noexcept {
    const double half = size / 2.0;
    return center.x - half <= point.x && point.x <= center.x + half &&
           center.y - half <= point.y && point.y <= center.y + half;
}

/// Strict test: is @p point inside the open square of side @p size
/// centered on @p center (boundary does not count).
[[nodiscard]] constexpr bool SquareOverlapsStrict(const Vector2& center, double size,
                                                  const Vector2& point) noexcept {
    const double half = size / 2.0;
    return center.x - half < point.x && point.x < center.x + half &&
           center.y - half < point.y && point.y < center.y + half;
}

}  // namespace tadv::game
