/// @file scene.hpp
/// @brief Body records exchanged with save/load collaborators
///
/// A record carries exactly the fields needed to rebuild a body. No file
/// format lives here; callers encode records however they like.

#pragma once

#include "fwd.hpp"
#include "types.hpp"

#include <impulse/core/error.hpp>
#include <impulse/math/types.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

namespace impulse_physics {

/// Cylinder height used when a record omits it
inline constexpr float k_default_cylinder_height = 2.0f;

/// Persistable description of one body
struct BodyRecord {
    ShapeKind kind = ShapeKind::Sphere;

    /// Sphere radius, box edge length or cylinder radius
    float size = 0.5f;

    /// Cylinder height; absent for other kinds
    std::optional<float> height;

    impulse_math::Vec3 position{0.0f};
    impulse_math::Vec3 velocity{0.0f};
    impulse_math::Vec3 angular_velocity{0.0f};

    float mass = 1.0f;
    float friction = k_default_friction;
    float restitution = k_default_restitution;
};

/// Describe a body; compound bodies have no record form
[[nodiscard]] impulse_core::Result<BodyRecord> to_record(const RigidBody& body);

/// Build a new body from a record
[[nodiscard]] impulse_core::Result<std::unique_ptr<RigidBody>> from_record(const BodyRecord& record);

/// Records for every representable body, in world order
[[nodiscard]] std::vector<BodyRecord> capture_scene(const PhysicsWorld& world);

/// Replace the world's bodies with those rebuilt from @p records
/// @return Number of bodies restored; invalid records are logged and skipped
std::size_t restore_scene(PhysicsWorld& world, const std::vector<BodyRecord>& records);

} // namespace impulse_physics
