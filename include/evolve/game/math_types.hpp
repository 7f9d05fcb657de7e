#pragma once

/// @file math_types.hpp
/// @brief Vector3 and the distance tests used for skill range and area
///        targeting.

#include <cmath>

namespace evolve::game {

/// Tolerance for range comparisons, in world units.
inline constexpr float kDistanceEpsilon = 1e-4f;

/// World-space position.
struct Vector3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    constexpr Vector3() = default;
    constexpr Vector3(float x, float y, float z) : x(x), y(y), z(z) {}

    constexpr Vector3 operator+(const Vector3& rhs) const noexcept {
        return {x + rhs.x, y + rhs.y, z + rhs.z};
    }
    constexpr Vector3 operator-(const Vector3& rhs) const noexcept {
        return {x - rhs.x, y - rhs.y, z - rhs.z};
    }

    [[nodiscard]] constexpr float LengthSquared() const noexcept {
        return x * x + y * y + z * z;
    }

    [[nodiscard]] float DistanceTo(const Vector3& other) const noexcept {
        return std::sqrt((*this - other).LengthSquared());
    }

    constexpr auto operator<=>(const Vector3&) const = default;
};

/// True when @p point lies within @p radius of @p center (inclusive).
[[nodiscard]] constexpr bool WithinRadius(const Vector3& center, const Vector3& point,
                                          float radius) noexcept {
    const float reach = radius + kDistanceEpsilon;
    return (point - center).LengthSquared() <= reach * reach;
}

/// True when the distance from @p from to @p to is inside [minRange, maxRange].
/// A maxRange of 0 means unbounded.
[[nodiscard]] inline bool WithinBand(const Vector3& from, const Vector3& to, float minRange,
                                     float maxRange) noexcept {
    const float distance = from.DistanceTo(to);
    if (maxRange > 0.0f && distance > maxRange + kDistanceEpsilon) {
        return false;
    }
    return distance + kDistanceEpsilon >= minRange;
}

} // namespace evolve::game
