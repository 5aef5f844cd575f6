/// @file broadphase.cpp
/// @brief Uniform grid broad phase implementation

#include <impulse/physics/broadphase.hpp>
#include <impulse/physics/body.hpp>
#include <impulse/math/vec.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

namespace impulse_physics {

namespace {

[[nodiscard]] std::int32_t cell_coordinate(float value) noexcept {
    constexpr double lo = static_cast<double>(std::numeric_limits<std::int32_t>::min());
    constexpr double hi = static_cast<double>(std::numeric_limits<std::int32_t>::max());
    const double cell = std::floor(static_cast<double>(value) / static_cast<double>(k_cell_size));
    return static_cast<std::int32_t>(std::clamp(cell, lo, hi));
}

const std::vector<RigidBody*> k_empty_cell;

} // anonymous namespace

CellKey CellKey::from_position(const impulse_math::Vec3& position) noexcept {
    return CellKey{cell_coordinate(position.x), cell_coordinate(position.y), cell_coordinate(position.z)};
}

void SpatialHashGrid::clear() {
    m_cells.clear();
    m_lookup.clear();
    m_body_count = 0;
}

bool SpatialHashGrid::insert(RigidBody* body) {
    if (!body || !impulse_math::is_finite(body->position())) {
        return false;
    }

    const CellKey key = CellKey::from_position(body->position());
    auto it = m_lookup.find(key);
    if (it == m_lookup.end()) {
        m_lookup.emplace(key, m_cells.size());
        m_cells.push_back(Cell{key, {body}});
    } else {
        m_cells[it->second].bodies.push_back(body);
    }

    ++m_body_count;
    return true;
}

void SpatialHashGrid::build(const std::vector<std::unique_ptr<RigidBody>>& bodies) {
    clear();
    for (const auto& body : bodies) {
        insert(body.get());
    }
}

const std::vector<RigidBody*>& SpatialHashGrid::bodies_in(const CellKey& key) const {
    auto it = m_lookup.find(key);
    if (it == m_lookup.end()) {
        return k_empty_cell;
    }
    return m_cells[it->second].bodies;
}

std::size_t SpatialHashGrid::pair_count() const noexcept {
    std::size_t pairs = 0;
    for (const auto& cell : m_cells) {
        const std::size_t n = cell.bodies.size();
        pairs += n * (n - 1) / 2;
    }
    return pairs;
}

} // namespace impulse_physics
