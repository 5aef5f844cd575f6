/// @file world.hpp
/// @brief Physics world for impulse_physics

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "body.hpp"
#include "broadphase.hpp"

#include <impulse/math/types.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <unordered_map>
#include <vector>

namespace impulse_physics {

// =============================================================================
// PhysicsWorld
// =============================================================================

/// Owns the bodies and advances them one step per update() call
///
/// Single-threaded: bodies may be edited between updates (dragging, reset)
/// but never while an update is running.
class PhysicsWorld {
public:
    explicit PhysicsWorld(const PhysicsConfig& config = PhysicsConfig::defaults());

    // =========================================================================
    // Bodies
    // =========================================================================

    /// Take ownership of a body
    /// @return Assigned id, or an invalid id if @p body is null
    BodyId add_body(std::unique_ptr<RigidBody> body);

    /// Remove a body by id
    /// @return true if a body was removed
    bool remove_body(BodyId id);

    /// Remove a body by address
    bool remove_body(const RigidBody* body);

    /// Remove every body
    void clear();

    [[nodiscard]] RigidBody* get_body(BodyId id);
    [[nodiscard]] const RigidBody* get_body(BodyId id) const;

    /// Bodies in insertion order
    [[nodiscard]] const std::vector<std::unique_ptr<RigidBody>>& bodies() const noexcept { return m_bodies; }

    [[nodiscard]] std::size_t body_count() const noexcept { return m_bodies.size(); }

    // =========================================================================
    // Environment
    // =========================================================================

    [[nodiscard]] const impulse_math::Vec3& gravity() const noexcept { return m_config.gravity; }
    void set_gravity(const impulse_math::Vec3& gravity) noexcept { m_config.gravity = gravity; }

    [[nodiscard]] const impulse_math::Vec3& bounds() const noexcept { return m_config.bounds; }
    void set_bounds(const impulse_math::Vec3& bounds) noexcept { m_config.bounds = bounds; }

    [[nodiscard]] const PhysicsConfig& config() const noexcept { return m_config; }

    // =========================================================================
    // Simulation
    // =========================================================================

    /// Advance every body by @p dt
    ///
    /// Order: reset counter, gravity and integration, ground and wall
    /// clamping, grid build from the integrated positions, same-cell narrow
    /// phase. A negative or non-finite dt only resets the counter.
    void update(float dt);

    /// Clamp one body against the ground, walls and ceiling
    /// @return true if any face was hit
    bool resolve_bounds(RigidBody& body) const noexcept;

    /// Pairs resolved during the most recent update
    [[nodiscard]] std::uint32_t collision_count() const noexcept { return m_collision_count; }

    /// Statistics of the most recent update
    [[nodiscard]] const PhysicsStats& stats() const noexcept { return m_stats; }

    /// Grid built during the most recent update
    [[nodiscard]] const SpatialHashGrid& grid() const noexcept { return m_grid; }

private:
    void resolve_pairs();

    PhysicsConfig m_config;
    std::vector<std::unique_ptr<RigidBody>> m_bodies;
    std::unordered_map<BodyId, RigidBody*> m_index;
    std::uint64_t m_next_id = 1;

    SpatialHashGrid m_grid;
    std::uint32_t m_collision_count = 0;
    PhysicsStats m_stats;
};

// =============================================================================
// PhysicsWorldBuilder
// =============================================================================

/// Fluent builder for PhysicsWorld
class PhysicsWorldBuilder {
public:
    PhysicsWorldBuilder() = default;

    PhysicsWorldBuilder& gravity(const impulse_math::Vec3& g) {
        m_config.gravity = g;
        return *this;
    }

    PhysicsWorldBuilder& gravity(float x, float y, float z) {
        m_config.gravity = impulse_math::Vec3(x, y, z);
        return *this;
    }

    PhysicsWorldBuilder& bounds(const impulse_math::Vec3& b) {
        m_config.bounds = b;
        return *this;
    }

    PhysicsWorldBuilder& bounds(float x, float y, float z) {
        m_config.bounds = impulse_math::Vec3(x, y, z);
        return *this;
    }

    PhysicsWorldBuilder& config(const PhysicsConfig& config) {
        m_config = config;
        return *this;
    }

    [[nodiscard]] std::unique_ptr<PhysicsWorld> build() const {
        return std::make_unique<PhysicsWorld>(m_config);
    }

private:
    PhysicsConfig m_config;
};

} // namespace impulse_physics
