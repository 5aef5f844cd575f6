#pragma once

/// @file quat.hpp
/// @brief Quaternion helpers for impulse_math

#include "types.hpp"

namespace impulse_math {

/// Rotation about the X axis
/// @param angle Angle in radians
[[nodiscard]] inline Quat quat_rotation_x(float angle) noexcept {
    return glm::angleAxis(angle, vec3::X);
}

/// Rotation about the Y axis
/// @param angle Angle in radians
[[nodiscard]] inline Quat quat_rotation_y(float angle) noexcept {
    return glm::angleAxis(angle, vec3::Y);
}

/// Rotation about the Z axis
/// @param angle Angle in radians
[[nodiscard]] inline Quat quat_rotation_z(float angle) noexcept {
    return glm::angleAxis(angle, vec3::Z);
}

/// Apply successive rotations about the local X, Y and Z axes of @p q
[[nodiscard]] inline Quat rotate_local_xyz(const Quat& q, const Vec3& angles) noexcept {
    return glm::normalize(q * quat_rotation_x(angles.x) * quat_rotation_y(angles.y) * quat_rotation_z(angles.z));
}

/// Rotate a vector by a quaternion
[[nodiscard]] inline Vec3 rotate(const Quat& q, const Vec3& v) noexcept {
    return q * v;
}

} // namespace impulse_math
