/// @file body.cpp
/// @brief Rigid body implementation for impulse_physics

#include <impulse/physics/body.hpp>
#include <impulse/math/quat.hpp>
#include <impulse/math/vec.hpp>

#include <algorithm>

namespace impulse_physics {

RigidBody::RigidBody(Shape shape, float mass, const impulse_math::Vec3& position)
    : m_shape(std::move(shape))
    , m_position(position)
    , m_orientation(impulse_math::quat::IDENTITY)
    , m_mass(mass)
    , m_inv_mass(mass > 0.0f ? 1.0f / mass : 0.0f)
    , m_inertia(m_shape.moment_of_inertia(mass))
    , m_inv_inertia(m_inertia > 0.0f ? 1.0f / m_inertia : 0.0f)
{
}

void RigidBody::clear_forces() noexcept {
    m_force = impulse_math::vec3::ZERO;
    m_torque = impulse_math::vec3::ZERO;
}

void RigidBody::set_restitution(float restitution) noexcept {
    m_restitution = std::clamp(restitution, 0.0f, 1.0f);
}

void RigidBody::set_friction(float friction) noexcept {
    m_friction = std::clamp(friction, 0.0f, 1.0f);
}

void RigidBody::integrate(float dt) noexcept {
    if (m_inv_mass == 0.0f) {
        clear_forces();
        return;
    }

    m_velocity += m_force * (dt * m_inv_mass);
    m_position += m_velocity * dt;
    m_angular_velocity += m_torque * (dt * m_inv_inertia);

    clear_forces();

    if (impulse_math::length(m_angular_velocity) > k_rotation_threshold) {
        m_orientation = impulse_math::rotate_local_xyz(m_orientation, m_angular_velocity * dt);
    }
}

} // namespace impulse_physics
