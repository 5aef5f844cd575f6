#pragma once

/// @file types.hpp
/// @brief Core type definitions and constants for impulse_math

#define GLM_FORCE_RADIANS
#define GLM_ENABLE_EXPERIMENTAL

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <glm/gtx/norm.hpp>

#include "fwd.hpp"

namespace impulse_math {

/// Mathematical constants
namespace consts {

/// Small epsilon for floating point comparisons
inline constexpr float EPSILON = 1e-6f;

} // namespace consts

// =============================================================================
// Vector Constants
// =============================================================================

namespace vec3 {
    inline constexpr Vec3 ZERO  = Vec3(0.0f, 0.0f, 0.0f);
    inline constexpr Vec3 ONE   = Vec3(1.0f, 1.0f, 1.0f);
    inline constexpr Vec3 X     = Vec3(1.0f, 0.0f, 0.0f);
    inline constexpr Vec3 Y     = Vec3(0.0f, 1.0f, 0.0f);
    inline constexpr Vec3 Z     = Vec3(0.0f, 0.0f, 1.0f);
    inline constexpr Vec3 UP    = Y;
    inline constexpr Vec3 DOWN  = Vec3(0.0f, -1.0f, 0.0f);
}

// =============================================================================
// Quaternion Constants
// =============================================================================

namespace quat {
    inline const Quat IDENTITY = Quat(1.0f, 0.0f, 0.0f, 0.0f); // w, x, y, z
}

} // namespace impulse_math
