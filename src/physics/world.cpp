/// @file world.cpp
/// @brief Physics world implementation for impulse_physics

#include <impulse/physics/world.hpp>
#include <impulse/physics/collision.hpp>
#include <impulse/core/log.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>

namespace impulse_physics {

// =============================================================================
// PhysicsWorld
// =============================================================================

PhysicsWorld::PhysicsWorld(const PhysicsConfig& config)
    : m_config(config)
{
    impulse_core::physics_logger()->debug("PhysicsWorld created: gravity ({}, {}, {}), bounds ({}, {}, {})",
        config.gravity.x, config.gravity.y, config.gravity.z,
        config.bounds.x, config.bounds.y, config.bounds.z);
}

BodyId PhysicsWorld::add_body(std::unique_ptr<RigidBody> body) {
    if (!body) {
        impulse_core::physics_logger()->warn("add_body: {}", impulse_core::BodyError::null_body().message);
        return BodyId::invalid();
    }

    BodyId id{m_next_id++};
    body->m_id = id;

    impulse_core::physics_logger()->debug("Added body {} ({}, mass {})",
        id.value, body->shape().name(), body->mass());

    m_index[id] = body.get();
    m_bodies.push_back(std::move(body));
    return id;
}

bool PhysicsWorld::remove_body(BodyId id) {
    auto it = m_index.find(id);
    if (it == m_index.end()) {
        return false;
    }
    return remove_body(it->second);
}

bool PhysicsWorld::remove_body(const RigidBody* body) {
    if (!body) {
        return false;
    }

    auto it = std::find_if(m_bodies.begin(), m_bodies.end(),
        [body](const std::unique_ptr<RigidBody>& b) { return b.get() == body; });
    if (it == m_bodies.end()) {
        return false;
    }

    const BodyId id = (*it)->id();
    m_index.erase(id);
    m_bodies.erase(it);

    // The grid must not keep a dangling pointer until the next update
    m_grid.clear();

    impulse_core::physics_logger()->debug("Removed body {}", id.value);
    return true;
}

void PhysicsWorld::clear() {
    const std::size_t count = m_bodies.size();
    m_bodies.clear();
    m_index.clear();
    m_grid.clear();
    m_collision_count = 0;
    m_stats = PhysicsStats{};

    impulse_core::physics_logger()->info("Cleared {} bodies", count);
}

RigidBody* PhysicsWorld::get_body(BodyId id) {
    auto it = m_index.find(id);
    return it != m_index.end() ? it->second : nullptr;
}

const RigidBody* PhysicsWorld::get_body(BodyId id) const {
    auto it = m_index.find(id);
    return it != m_index.end() ? it->second : nullptr;
}

// =============================================================================
// Simulation
// =============================================================================

void PhysicsWorld::update(float dt) {
    const auto start = std::chrono::steady_clock::now();

    m_collision_count = 0;
    m_stats = PhysicsStats{};
    m_stats.body_count = static_cast<std::uint32_t>(m_bodies.size());

    if (!std::isfinite(dt) || dt < 0.0f) {
        impulse_core::physics_logger()->warn("update: rejecting time step {}", dt);
        m_grid.clear();
        return;
    }

    // Forces and integration
    for (auto& body : m_bodies) {
        if (body->is_static()) {
            ++m_stats.static_bodies;
        }
        body->apply_force(m_config.gravity * body->mass());
        body->integrate(dt);
    }

    // Ground, walls and ceiling
    for (auto& body : m_bodies) {
        if (resolve_bounds(*body)) {
            ++m_stats.boundary_contacts;
        }
    }

    // Broad phase on the integrated positions
    m_grid.clear();
    for (auto& body : m_bodies) {
        if (!m_grid.insert(body.get())) {
            impulse_core::physics_logger()->debug("Body {} has a non-finite position, skipped by broadphase",
                body->id().value);
        }
    }
    m_stats.occupied_cells = static_cast<std::uint32_t>(m_grid.cell_count());

    resolve_pairs();

    m_stats.collisions = m_collision_count;
    m_stats.step_time_ms = std::chrono::duration<float, std::milli>(
        std::chrono::steady_clock::now() - start).count();
}

bool PhysicsWorld::resolve_bounds(RigidBody& body) const noexcept {
    const float half = body.shape().half_size();
    const float e = body.restitution();
    impulse_math::Vec3 p = body.position();
    impulse_math::Vec3 v = body.velocity();
    bool hit = false;

    // Ground: friction only applies here
    if (p.y < half) {
        p.y = half;
        v.y = -v.y * e;
        v.x *= (1.0f - body.friction());
        v.z *= (1.0f - body.friction());
        hit = true;
    }

    // Side walls on x and z
    for (int axis : {0, 2}) {
        const float lo = -m_config.bounds[axis] * 0.5f + half;
        const float hi = m_config.bounds[axis] * 0.5f - half;
        if (p[axis] < lo) {
            p[axis] = lo;
            v[axis] = -v[axis] * e;
            hit = true;
        }
        if (p[axis] > hi) {
            p[axis] = hi;
            v[axis] = -v[axis] * e;
            hit = true;
        }
    }

    // Ceiling
    const float ceiling = m_config.bounds.y - half;
    if (p.y > ceiling) {
        p.y = ceiling;
        v.y = -v.y * e;
        hit = true;
    }

    body.set_position(p);
    body.set_velocity(v);
    return hit;
}

void PhysicsWorld::resolve_pairs() {
    m_grid.for_each_pair([this](RigidBody& a, RigidBody& b) {
        ++m_stats.candidate_pairs;

        switch (CollisionResolver::resolve(a, b)) {
            case PairOutcome::Resolved:
                ++m_collision_count;
                break;
            case PairOutcome::Unsupported:
                ++m_stats.skipped_pairs;
                break;
            case PairOutcome::Separated:
            case PairOutcome::Immovable:
                break;
        }
    });
}

} // namespace impulse_physics
