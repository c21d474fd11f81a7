#pragma once

/// @file math_types.hpp
/// @brief Lightweight math types for the simulation layer.
///
/// The maze lives on the xz plane with y pointing up; most gameplay
/// distance checks ignore y, hence the Horizontal* helpers.

#include <cmath>
#include <cstdint>

namespace nexus::game {

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

    constexpr Vector3& operator+=(const Vector3& rhs) noexcept {
        x += rhs.x;
        y += rhs.y;
        z += rhs.z;
        return *this;
    }

    constexpr Vector3& operator-=(const Vector3& rhs) noexcept {
        x -= rhs.x;
        y -= rhs.y;
        z -= rhs.z;
        return *this;
    }

    [[nodiscard]] constexpr float Dot(const Vector3& rhs) const noexcept {
        return x * rhs.x + y * rhs.y + z * rhs.z;
    }

    [[nodiscard]] constexpr Vector3 Cross(const Vector3& rhs) const noexcept {
        return {y * rhs.z - z * rhs.y, z * rhs.x - x * rhs.z, x * rhs.y - y * rhs.x};
    }

    [[nodiscard]] constexpr float LengthSquared() const noexcept { return Dot(*this); }

    [[nodiscard]] float Length() const noexcept { return std::sqrt(LengthSquared()); }

    /// Normalized copy, or the zero vector if length is near zero.
    [[nodiscard]] Vector3 Normalized() const noexcept {
        const float len = Length();
        if (len < 1e-6f) {
            return {};
        }
        return {x / len, y / len, z / len};
    }

    /// Copy with y dropped.
    [[nodiscard]] constexpr Vector3 Horizontal() const noexcept { return {x, 0.0f, z}; }

    [[nodiscard]] float HorizontalLength() const noexcept { return std::hypot(x, z); }

    [[nodiscard]] static constexpr Vector3 Zero() noexcept { return {}; }
    [[nodiscard]] static constexpr Vector3 Up() noexcept { return {0.0f, 1.0f, 0.0f}; }

    constexpr auto operator<=>(const Vector3&) const = default;
};

constexpr Vector3 operator*(float scalar, const Vector3& v) noexcept {
    return v * scalar;
}

/// Distance between two points on the xz plane.
inline float HorizontalDistance(const Vector3& a, const Vector3& b) noexcept {
    return std::hypot(a.x - b.x, a.z - b.z);
}

}  // namespace nexus::game
