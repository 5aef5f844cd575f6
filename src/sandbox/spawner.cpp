/// @file spawner.cpp
/// @brief Randomised body creation for the sandbox

#include <impulse/sandbox/spawner.hpp>
#include <impulse/physics/shape.hpp>
#include <impulse/physics/world.hpp>
#include <impulse/core/log.hpp>

namespace impulse_sandbox {

using impulse_physics::BodyId;
using impulse_physics::RigidBody;
using impulse_physics::Shape;
using impulse_physics::ShapeKind;

BodySpawner::BodySpawner(const SpawnConfig& config, std::uint32_t seed)
    : m_config(config)
    , m_rng(seed)
{
}

float BodySpawner::uniform(float lo, float hi) {
    std::uniform_real_distribution<float> dist(lo, hi);
    return dist(m_rng);
}

impulse_core::Result<std::unique_ptr<RigidBody>> BodySpawner::make_body(
    ShapeKind kind, const impulse_math::Vec3& position)
{
    float mass = 1.0f;
    impulse_core::Result<Shape> shape = impulse_core::Err<Shape>(
        impulse_core::GeometryError::unsupported_shape(impulse_physics::shape_kind_name(kind), "spawning"));

    switch (kind) {
        case ShapeKind::Sphere:
            shape = Shape::sphere(uniform(0.4f, 0.7f));
            mass = 1.0f;
            break;
        case ShapeKind::Box:
            shape = Shape::box(uniform(0.4f, 0.8f));
            mass = 1.5f;
            break;
        case ShapeKind::Cylinder: {
            const float radius = uniform(0.3f, 0.6f);
            const float height = uniform(0.8f, 1.6f);
            shape = Shape::cylinder(radius, height);
            mass = 2.0f;
            break;
        }
        case ShapeKind::Compound:
            break;
    }

    if (!shape) {
        return impulse_core::Err<std::unique_ptr<RigidBody>>(std::move(shape.error()));
    }

    auto body = std::make_unique<RigidBody>(std::move(*shape), mass, position);
    body->set_restitution(m_config.restitution);
    body->set_friction(m_config.friction);

    const float wx = uniform(-1.0f, 1.0f);
    const float wy = uniform(-1.0f, 1.0f);
    const float wz = uniform(-1.0f, 1.0f);
    body->set_angular_velocity(impulse_math::Vec3(wx, wy, wz));

    return impulse_core::Ok(std::move(body));
}

impulse_core::Result<BodyId> BodySpawner::spawn(impulse_physics::PhysicsWorld& world, ShapeKind kind) {
    return spawn_at(world, kind, m_config.spawn_point);
}

impulse_core::Result<BodyId> BodySpawner::spawn_at(
    impulse_physics::PhysicsWorld& world, ShapeKind kind, const impulse_math::Vec3& position)
{
    auto body = make_body(kind, position);
    if (!body) {
        impulse_core::sandbox_logger()->warn("Spawn failed: {}", body.error().message());
        return impulse_core::Err<BodyId>(std::move(body.error()));
    }
    return world.add_body(std::move(*body));
}

impulse_core::Result<BodyId> BodySpawner::shoot(impulse_physics::PhysicsWorld& world, ShapeKind kind) {
    auto body = make_body(kind, m_config.spawn_point);
    if (!body) {
        impulse_core::sandbox_logger()->warn("Shoot failed: {}", body.error().message());
        return impulse_core::Err<BodyId>(std::move(body.error()));
    }
    (*body)->set_velocity(m_config.shoot_velocity);
    return world.add_body(std::move(*body));
}

impulse_core::Result<BodyId> BodySpawner::spawn_random(impulse_physics::PhysicsWorld& world) {
    std::uniform_int_distribution<int> pick(0, 2);
    return spawn(world, static_cast<ShapeKind>(pick(m_rng)));
}

} // namespace impulse_sandbox
