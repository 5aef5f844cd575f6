#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for impulse_math types

#include <glm/fwd.hpp>

namespace impulse_math {

// =============================================================================
// GLM aliases
// =============================================================================
using Vec3 = glm::vec3;
using Quat = glm::quat;

} // namespace impulse_math
