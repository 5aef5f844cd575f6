/// @file sandbox.cpp
/// @brief Headless sandbox driver

#include <impulse/sandbox/sandbox.hpp>
#include <impulse/core/log.hpp>
#include <impulse/math/types.hpp>

#include <spdlog/fmt/fmt.h>

namespace impulse_sandbox {

Sandbox::Sandbox(const SandboxConfig& config)
    : m_config(config)
    , m_world(config.physics)
    , m_clock(config.driver.max_step, config.driver.time_scale)
    , m_spawner(config.spawn, config.driver.seed)
{
}

float Sandbox::advance(float frame_seconds) {
    if (m_clock.is_paused()) {
        return 0.0f;
    }

    const float dt = m_clock.step_delta(frame_seconds);
    m_world.update(dt);
    m_clock.advance(dt);
    return dt;
}

void Sandbox::set_gravity_strength(float g) {
    m_world.set_gravity(impulse_math::Vec3(0.0f, -g, 0.0f));
    impulse_core::sandbox_logger()->debug("Gravity set to {}", g);
}

void Sandbox::reset_scene() {
    m_world.clear();
    m_clock.reset();
    impulse_core::sandbox_logger()->info("Scene reset");
}

impulse_core::Result<void> Sandbox::reset_body(impulse_physics::BodyId id) {
    impulse_physics::RigidBody* body = m_world.get_body(id);
    if (!body) {
        return impulse_core::Err(impulse_core::BodyError::not_found(id.value));
    }

    body->set_position(m_config.spawn.spawn_point);
    body->set_velocity(impulse_math::vec3::ZERO);
    body->set_angular_velocity(impulse_math::vec3::ZERO);
    body->set_orientation(impulse_math::quat::IDENTITY);
    return impulse_core::Ok();
}

impulse_core::Result<void> Sandbox::drag_body(impulse_physics::BodyId id, float x, float z) {
    impulse_physics::RigidBody* body = m_world.get_body(id);
    if (!body) {
        return impulse_core::Err(impulse_core::BodyError::not_found(id.value));
    }

    impulse_math::Vec3 position = body->position();
    position.x = x;
    position.z = z;
    body->set_position(position);
    body->set_velocity(impulse_math::vec3::ZERO);
    return impulse_core::Ok();
}

std::string Sandbox::stats_line() const {
    return fmt::format("Bodies: {} | Collisions: {} | Gravity: {:.1f} | Time scale: {:.1f}",
        m_world.body_count(), m_world.collision_count(), gravity_strength(), time_scale());
}

} // namespace impulse_sandbox
