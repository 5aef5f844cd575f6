/// @file body.hpp
/// @brief Rigid body for impulse_physics

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "shape.hpp"

#include <impulse/math/types.hpp>

namespace impulse_physics {

// =============================================================================
// RigidBody
// =============================================================================

/// Simulated rigid body
///
/// Mass 0 (or negative) encodes an immovable body: inverse mass is 0 and
/// integration leaves it in place. Inverse mass and inverse inertia are
/// derived once from mass and shape and never change independently.
///
/// Angular state is three per-axis rotation rates. Each step the
/// orientation proxy is rotated about its local X, then Y, then Z axis by
/// rate * dt; this is a presentation approximation, not a physical
/// integration of angular velocity.
class RigidBody {
public:
    RigidBody(Shape shape, float mass, const impulse_math::Vec3& position = impulse_math::vec3::ZERO);

    // =========================================================================
    // Identity
    // =========================================================================

    /// Id assigned by the owning world (invalid until added)
    [[nodiscard]] BodyId id() const noexcept { return m_id; }

    [[nodiscard]] const Shape& shape() const noexcept { return m_shape; }
    [[nodiscard]] ShapeKind shape_kind() const noexcept { return m_shape.kind(); }

    // =========================================================================
    // Transform
    // =========================================================================

    [[nodiscard]] const impulse_math::Vec3& position() const noexcept { return m_position; }
    void set_position(const impulse_math::Vec3& position) noexcept { m_position = position; }

    /// Orientation proxy read by presentation code
    [[nodiscard]] const impulse_math::Quat& orientation() const noexcept { return m_orientation; }
    void set_orientation(const impulse_math::Quat& orientation) noexcept { m_orientation = orientation; }

    // =========================================================================
    // Velocity
    // =========================================================================

    [[nodiscard]] const impulse_math::Vec3& velocity() const noexcept { return m_velocity; }
    void set_velocity(const impulse_math::Vec3& velocity) noexcept { m_velocity = velocity; }

    [[nodiscard]] const impulse_math::Vec3& angular_velocity() const noexcept { return m_angular_velocity; }
    void set_angular_velocity(const impulse_math::Vec3& velocity) noexcept { m_angular_velocity = velocity; }

    // =========================================================================
    // Forces
    // =========================================================================

    /// Accumulate a force, consumed by the next integrate()
    void apply_force(const impulse_math::Vec3& force) noexcept { m_force += force; }

    /// Accumulate a torque, consumed by the next integrate()
    void apply_torque(const impulse_math::Vec3& torque) noexcept { m_torque += torque; }

    [[nodiscard]] const impulse_math::Vec3& accumulated_force() const noexcept { return m_force; }
    [[nodiscard]] const impulse_math::Vec3& accumulated_torque() const noexcept { return m_torque; }

    void clear_forces() noexcept;

    // =========================================================================
    // Mass
    // =========================================================================

    [[nodiscard]] float mass() const noexcept { return m_mass; }
    [[nodiscard]] float inverse_mass() const noexcept { return m_inv_mass; }
    [[nodiscard]] float inertia() const noexcept { return m_inertia; }
    [[nodiscard]] float inverse_inertia() const noexcept { return m_inv_inertia; }

    [[nodiscard]] bool is_static() const noexcept { return m_inv_mass == 0.0f; }

    // =========================================================================
    // Material
    // =========================================================================

    [[nodiscard]] float restitution() const noexcept { return m_restitution; }

    /// Clamped to [0, 1]
    void set_restitution(float restitution) noexcept;

    [[nodiscard]] float friction() const noexcept { return m_friction; }

    /// Clamped to [0, 1]
    void set_friction(float friction) noexcept;

    // =========================================================================
    // Simulation
    // =========================================================================

    /// Semi-implicit Euler step. Immovable bodies only drop their accumulators.
    void integrate(float dt) noexcept;

private:
    friend class PhysicsWorld;

    BodyId m_id;
    Shape m_shape;

    impulse_math::Vec3 m_position;
    impulse_math::Quat m_orientation;
    impulse_math::Vec3 m_velocity{0.0f};
    impulse_math::Vec3 m_angular_velocity{0.0f};

    impulse_math::Vec3 m_force{0.0f};
    impulse_math::Vec3 m_torque{0.0f};

    float m_mass;
    float m_inv_mass;
    float m_inertia;
    float m_inv_inertia;

    float m_restitution = k_default_restitution;
    float m_friction = k_default_friction;
};

} // namespace impulse_physics
