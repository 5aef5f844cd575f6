#pragma once

/// @file vec.hpp
/// @brief Vector utility functions for impulse_math
///
/// Thin wrappers over GLM plus the handful of helpers the simulation needs.
/// All operations are pure and return new values.

#include "types.hpp"

#include <array>
#include <cmath>

namespace impulse_math {

// =============================================================================
// Core Vector Operations (GLM wrappers)
// =============================================================================

/// Dot product of two vectors
[[nodiscard]] inline float dot(const Vec3& a, const Vec3& b) noexcept {
    return glm::dot(a, b);
}

/// Length of a vector
[[nodiscard]] inline float length(const Vec3& v) noexcept {
    return glm::length(v);
}

/// Squared length of a vector
[[nodiscard]] inline float length_squared(const Vec3& v) noexcept {
    return glm::length2(v);
}

/// Normalize vector, returning zero if length is too small
[[nodiscard]] inline Vec3 normalize_or_zero(const Vec3& v) noexcept {
    const float len_sq = glm::length2(v);
    if (!(len_sq >= consts::EPSILON * consts::EPSILON)) {
        return vec3::ZERO;
    }
    return v * (1.0f / std::sqrt(len_sq));
}

/// Distance between two points projected onto the XZ plane
[[nodiscard]] inline float horizontal_distance(const Vec3& a, const Vec3& b) noexcept {
    const float dx = a.x - b.x;
    const float dz = a.z - b.z;
    return std::sqrt(dx * dx + dz * dz);
}

/// Check if vector has any NaN or infinite components
[[nodiscard]] inline bool is_finite(const Vec3& v) noexcept {
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

/// Convert Vec3 to array
[[nodiscard]] inline std::array<float, 3> to_array(const Vec3& v) noexcept {
    return {v.x, v.y, v.z};
}

/// Build Vec3 from array
[[nodiscard]] inline Vec3 from_array(const std::array<float, 3>& a) noexcept {
    return Vec3(a[0], a[1], a[2]);
}

} // namespace impulse_math
