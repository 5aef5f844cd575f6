#pragma once

/// @file sandbox.hpp
/// @brief Headless sandbox driver around a PhysicsWorld
///
/// Mirrors the interactive controls (spawn, shoot, pause, time scale,
/// gravity, drag, reset) as plain calls on the world's public surface.

#include "clock.hpp"
#include "config.hpp"
#include "spawner.hpp"

#include <impulse/core/error.hpp>
#include <impulse/physics/world.hpp>

#include <string>

namespace impulse_sandbox {

class Sandbox {
public:
    explicit Sandbox(const SandboxConfig& config = SandboxConfig::defaults());

    // =========================================================================
    // Simulation
    // =========================================================================

    /// Step the world for one rendered frame
    /// @return Simulated dt (0 when paused)
    float advance(float frame_seconds);

    void pause() noexcept { m_clock.pause(); }
    void resume() noexcept { m_clock.resume(); }
    void toggle_pause() noexcept { m_clock.toggle_pause(); }
    [[nodiscard]] bool is_paused() const noexcept { return m_clock.is_paused(); }

    void set_time_scale(float scale) noexcept { m_clock.set_time_scale(scale); }
    [[nodiscard]] float time_scale() const noexcept { return m_clock.time_scale(); }

    /// Gravity becomes (0, -g, 0)
    void set_gravity_strength(float g);
    [[nodiscard]] float gravity_strength() const noexcept { return 0.0f - m_world.gravity().y; }  // never -0

    // =========================================================================
    // Bodies
    // =========================================================================

    impulse_core::Result<impulse_physics::BodyId> spawn(impulse_physics::ShapeKind kind) {
        return m_spawner.spawn(m_world, kind);
    }

    impulse_core::Result<impulse_physics::BodyId> shoot(impulse_physics::ShapeKind kind) {
        return m_spawner.shoot(m_world, kind);
    }

    impulse_core::Result<impulse_physics::BodyId> spawn_random() {
        return m_spawner.spawn_random(m_world);
    }

    /// Remove every body
    void reset_scene();

    /// Put a body back at the spawn point at rest with identity orientation
    impulse_core::Result<void> reset_body(impulse_physics::BodyId id);

    /// Move a body horizontally to (x, z), keeping its height, and stop it
    impulse_core::Result<void> drag_body(impulse_physics::BodyId id, float x, float z);

    // =========================================================================
    // Access
    // =========================================================================

    [[nodiscard]] impulse_physics::PhysicsWorld& world() noexcept { return m_world; }
    [[nodiscard]] const impulse_physics::PhysicsWorld& world() const noexcept { return m_world; }

    [[nodiscard]] SimulationClock& clock() noexcept { return m_clock; }
    [[nodiscard]] const SimulationClock& clock() const noexcept { return m_clock; }

    [[nodiscard]] BodySpawner& spawner() noexcept { return m_spawner; }

    [[nodiscard]] const SandboxConfig& config() const noexcept { return m_config; }

    /// One-line status: body count, last step's collisions, gravity, time scale
    [[nodiscard]] std::string stats_line() const;

private:
    SandboxConfig m_config;
    impulse_physics::PhysicsWorld m_world;
    SimulationClock m_clock;
    BodySpawner m_spawner;
};

} // namespace impulse_sandbox
