/// @file types.hpp
/// @brief Core types for impulse_physics

#pragma once

#include "fwd.hpp"

#include <impulse/math/types.hpp>

#include <cstdint>
#include <functional>

namespace impulse_physics {

// =============================================================================
// Constants
// =============================================================================

/// Default material restitution for newly created bodies
inline constexpr float k_default_restitution = 0.35f;

/// Default material friction for newly created bodies
inline constexpr float k_default_friction = 0.3f;

/// Angular speed below which the orientation proxy is left untouched
inline constexpr float k_rotation_threshold = 0.0001f;

/// Fixed positional correction applied to box and cylinder contacts
inline constexpr float k_fixed_correction = 0.05f;

/// Broadphase cell edge length
inline constexpr float k_cell_size = 1.0f;

// =============================================================================
// Shape Kind
// =============================================================================

/// Shape tag, values match the persisted scene record encoding
enum class ShapeKind : std::uint8_t {
    Sphere = 0,
    Box = 1,
    Cylinder = 2,
    Compound = 3,
};

/// Get shape kind name
[[nodiscard]] inline const char* shape_kind_name(ShapeKind kind) {
    switch (kind) {
        case ShapeKind::Sphere: return "Sphere";
        case ShapeKind::Box: return "Box";
        case ShapeKind::Cylinder: return "Cylinder";
        case ShapeKind::Compound: return "Compound";
        default: return "Unknown";
    }
}

// =============================================================================
// Identifiers
// =============================================================================

/// Body identifier, assigned by the world
struct BodyId {
    std::uint64_t value = 0;

    [[nodiscard]] bool is_valid() const noexcept { return value != 0; }
    [[nodiscard]] static BodyId invalid() { return BodyId{0}; }

    bool operator==(const BodyId& other) const noexcept { return value == other.value; }
    bool operator!=(const BodyId& other) const noexcept { return value != other.value; }
    bool operator<(const BodyId& other) const noexcept { return value < other.value; }
};

// =============================================================================
// Configuration
// =============================================================================

/// World configuration
struct PhysicsConfig {
    /// Gravity acceleration, applied as gravity * mass each step
    impulse_math::Vec3 gravity{0.0f, -10.0f, 0.0f};

    /// World extents: x and z span [-b/2, b/2], y spans [0, b]
    impulse_math::Vec3 bounds{20.0f, 20.0f, 20.0f};

    [[nodiscard]] static PhysicsConfig defaults() { return PhysicsConfig{}; }
};

// =============================================================================
// Statistics
// =============================================================================

/// Per-step statistics, overwritten by every update
struct PhysicsStats {
    std::uint32_t body_count = 0;
    std::uint32_t static_bodies = 0;

    std::uint32_t occupied_cells = 0;
    std::uint32_t candidate_pairs = 0;  ///< Same-cell pairs examined
    std::uint32_t skipped_pairs = 0;    ///< Mixed-kind or compound pairs
    std::uint32_t collisions = 0;       ///< Pairs resolved
    std::uint32_t boundary_contacts = 0;

    float step_time_ms = 0.0f;
};

} // namespace impulse_physics

template<>
struct std::hash<impulse_physics::BodyId> {
    std::size_t operator()(const impulse_physics::BodyId& id) const noexcept {
        return std::hash<std::uint64_t>{}(id.value);
    }
};
