#pragma once

/// @file math_types.hpp
/// @brief Lightweight 2D math for the arena simulation.
///
/// The arena is a flat plane in screen-aligned world units: +x to the
/// right, +y downward.  Vector2 is a plain value type so components that
/// embed it stay trivially copyable.

#include <cmath>

namespace arena::game {

/// Two-component floating-point vector.
struct Vector2 {
    float x = 0.0f;
    float y = 0.0f;

    constexpr Vector2() = default;
    constexpr Vector2(float x, float y) : x(x), y(y) {}

    constexpr Vector2 operator+(const Vector2& rhs) const noexcept {
        return {x + rhs.x, y + rhs.y};
    }
    constexpr Vector2 operator-(const Vector2& rhs) const noexcept {
        return {x - rhs.x, y - rhs.y};
    }
    constexpr Vector2 operator*(float scalar) const noexcept {
        return {x * scalar, y * scalar};
    }

    constexpr Vector2& operator+=(const Vector2& rhs) noexcept {
        x += rhs.x;
        y += rhs.y;
        return *this;
    }

    [[nodiscard]] constexpr float Dot(const Vector2& rhs) const noexcept {
        return x * rhs.x + y * rhs.y;
    }

    /// Squared magnitude (avoids sqrt).
    [[nodiscard]] constexpr float LengthSquared() const noexcept { return Dot(*this); }

    [[nodiscard]] float Length() const noexcept { return std::sqrt(LengthSquared()); }

    /// Return a normalized copy, or the zero vector if length is near zero.
    [[nodiscard]] Vector2 Normalized() const noexcept {
        const float len = Length();
        if (len < 1e-6f) {
            return {};
        }
        return {x / len, y / len};
    }

    [[nodiscard]] static constexpr Vector2 Zero() noexcept { return {}; }

    constexpr bool operator==(const Vector2&) const = default;
};

constexpr Vector2 operator*(float scalar, const Vector2& v) noexcept {
    return v * scalar;
}

[[nodiscard]] inline float Distance(const Vector2& a, const Vector2& b) noexcept {
    return (a - b).Length();
}

/// Shortest distance from @p point to the segment [@p a, @p b].
[[nodiscard]] inline float DistanceToSegment(const Vector2& point, const Vector2& a,
                                             const Vector2& b) noexcept {
    const Vector2 ab = b - a;
    const float lenSq = ab.LengthSquared();
    if (lenSq <= 0.0f) {
        return Distance(point, a);
    }
    float t = (point - a).Dot(ab) / lenSq;
    t = t < 0.0f ? 0.0f : (t > 1.0f ? 1.0f : t);
    return Distance(point, a + ab * t);
}

}  // namespace arena::game
