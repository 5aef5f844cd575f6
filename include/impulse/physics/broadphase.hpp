/// @file broadphase.hpp
/// @brief Uniform grid broad phase for impulse_physics
///
/// Bodies are bucketed into unit cells keyed by the floor of their position.
/// Only bodies sharing a cell become candidate pairs, so contacts across a
/// cell boundary are missed by design.

#pragma once

#include "fwd.hpp"
#include "types.hpp"

#include <impulse/math/types.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <unordered_map>
#include <vector>

namespace impulse_physics {

// =============================================================================
// Cell Key
// =============================================================================

/// Integer cell coordinate
struct CellKey {
    std::int32_t x = 0;
    std::int32_t y = 0;
    std::int32_t z = 0;

    /// Cell containing @p position (floor of each component)
    [[nodiscard]] static CellKey from_position(const impulse_math::Vec3& position) noexcept;

    bool operator==(const CellKey& other) const noexcept {
        return x == other.x && y == other.y && z == other.z;
    }
    bool operator!=(const CellKey& other) const noexcept { return !(*this == other); }
};

/// Hash for CellKey
struct CellKeyHash {
    std::size_t operator()(const CellKey& key) const noexcept {
        // Large primes spread neighbouring cells
        const auto h = (static_cast<std::uint64_t>(static_cast<std::uint32_t>(key.x)) * 73856093ull)
                     ^ (static_cast<std::uint64_t>(static_cast<std::uint32_t>(key.y)) * 19349663ull)
                     ^ (static_cast<std::uint64_t>(static_cast<std::uint32_t>(key.z)) * 83492791ull);
        return static_cast<std::size_t>(h);
    }
};

// =============================================================================
// Spatial Hash Grid
// =============================================================================

/// Rebuilt every step; holds non-owning body pointers
class SpatialHashGrid {
public:
    SpatialHashGrid() = default;

    /// Remove every body and cell
    void clear();

    /// Insert a body into the cell of its current position
    /// @return false if the position is not finite (body is left out)
    bool insert(RigidBody* body);

    /// Clear and insert every body in order
    void build(const std::vector<std::unique_ptr<RigidBody>>& bodies);

    /// Number of occupied cells
    [[nodiscard]] std::size_t cell_count() const noexcept { return m_cells.size(); }

    /// Number of bodies inserted since the last clear
    [[nodiscard]] std::size_t body_count() const noexcept { return m_body_count; }

    /// Bodies in a cell (empty if unoccupied)
    [[nodiscard]] const std::vector<RigidBody*>& bodies_in(const CellKey& key) const;

    /// Number of unordered same-cell pairs
    [[nodiscard]] std::size_t pair_count() const noexcept;

    /// Visit every unordered same-cell pair
    ///
    /// Cells are visited in order of first occupation and bodies in
    /// insertion order, so the sequence is deterministic.
    template<typename F>
    void for_each_pair(F&& fn) const {
        for (const auto& cell : m_cells) {
            const auto& bodies = cell.bodies;
            for (std::size_t i = 0; i < bodies.size(); ++i) {
                for (std::size_t j = i + 1; j < bodies.size(); ++j) {
                    fn(*bodies[i], *bodies[j]);
                }
            }
        }
    }

private:
    struct Cell {
        CellKey key;
        std::vector<RigidBody*> bodies;
    };

    std::vector<Cell> m_cells;
    std::unordered_map<CellKey, std::size_t, CellKeyHash> m_lookup;
    std::size_t m_body_count = 0;
};

} // namespace impulse_physics
