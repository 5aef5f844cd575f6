#pragma once

/// @file spawner.hpp
/// @brief Randomised body creation for the sandbox

#include "config.hpp"

#include <impulse/core/error.hpp>
#include <impulse/physics/body.hpp>
#include <impulse/physics/fwd.hpp>
#include <impulse/physics/types.hpp>

#include <cstdint>
#include <memory>
#include <random>

namespace impulse_sandbox {

/// Creates sandbox bodies with randomised dimensions and spin
///
/// Sphere: radius in [0.4, 0.7), mass 1. Box: edge in [0.4, 0.8), mass 1.5.
/// Cylinder: radius in [0.3, 0.6), height in [0.8, 1.6), mass 2.
/// Every body starts with a random angular rate in [-1, 1) per axis.
class BodySpawner {
public:
    explicit BodySpawner(const SpawnConfig& config = SpawnConfig{}, std::uint32_t seed = 1);

    /// Build a body of @p kind at @p position without adding it anywhere
    [[nodiscard]] impulse_core::Result<std::unique_ptr<impulse_physics::RigidBody>> make_body(
        impulse_physics::ShapeKind kind, const impulse_math::Vec3& position);

    /// Add a body at the spawn point
    impulse_core::Result<impulse_physics::BodyId> spawn(
        impulse_physics::PhysicsWorld& world, impulse_physics::ShapeKind kind);

    /// Add a body at @p position
    impulse_core::Result<impulse_physics::BodyId> spawn_at(
        impulse_physics::PhysicsWorld& world, impulse_physics::ShapeKind kind, const impulse_math::Vec3& position);

    /// Add a body at the spawn point moving with the shoot velocity
    impulse_core::Result<impulse_physics::BodyId> shoot(
        impulse_physics::PhysicsWorld& world, impulse_physics::ShapeKind kind);

    /// Add a body of a uniformly chosen primitive kind at the spawn point
    impulse_core::Result<impulse_physics::BodyId> spawn_random(impulse_physics::PhysicsWorld& world);

    [[nodiscard]] const SpawnConfig& config() const noexcept { return m_config; }

    void reseed(std::uint32_t seed) { m_rng.seed(seed); }

private:
    [[nodiscard]] float uniform(float lo, float hi);

    SpawnConfig m_config;
    std::mt19937 m_rng;
};

} // namespace impulse_sandbox
