#pragma once

/// @file math_types.hpp
/// @brief Vector3 value type used for world positions.
///
/// Components are stored in logical x/y/z order.  The host client keeps
/// positions as (y, x, z) in memory; reordering is the job of whichever
/// IWorldAccessor reads them.

#include <cmath>

namespace interact::game {

/// Three-component floating-point vector.
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
    constexpr Vector3 operator*(float scalar) const noexcept {
        return {x * scalar, y * scalar, z * scalar};
    }

    [[nodiscard]] constexpr float Dot(const Vector3& rhs) const noexcept {
        return x * rhs.x + y * rhs.y + z * rhs.z;
    }

    /// Squared magnitude (avoids sqrt).
    [[nodiscard]] constexpr float LengthSquared() const noexcept { return Dot(*this); }

    [[nodiscard]] float Length() const noexcept { return std::sqrt(LengthSquared()); }

    /// Euclidean distance to @p other.
    ///
    /// Symmetric, and exactly zero for coincident points.
    [[nodiscard]] float DistanceTo(const Vector3& other) const noexcept {
        return (other - *this).Length();
    }

    [[nodiscard]] static constexpr Vector3 Zero() noexcept { return {}; }

    constexpr auto operator<=>(const Vector3&) const = default;
};

constexpr Vector3 operator*(float scalar, const Vector3& v) noexcept {
    return v * scalar;
}

}  // namespace interact::game
