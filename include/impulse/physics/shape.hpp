/// @file shape.hpp
/// @brief Collision shapes for impulse_physics
///
/// Shapes form a closed set: sphere, cube box, cylinder and a compound of
/// offset children. Dispatch over them goes through std::visit so a new
/// alternative fails to compile until every visitor handles it.

#pragma once

#include "fwd.hpp"
#include "types.hpp"

#include <impulse/core/error.hpp>
#include <impulse/math/types.hpp>

#include <variant>
#include <vector>

namespace impulse_physics {

// =============================================================================
// Shape Alternatives
// =============================================================================

/// Sphere centred on the body position
struct SphereShape {
    float radius = 0.5f;
};

/// Cube with a uniform edge length
struct BoxShape {
    float edge_length = 1.0f;

    [[nodiscard]] float half_extent() const noexcept { return edge_length * 0.5f; }
};

/// Upright cylinder (axis along world Y)
struct CylinderShape {
    float radius = 0.5f;
    float height = 1.0f;
};

/// Ordered list of child shapes placed at local offsets
struct CompoundShape {
    std::vector<CompoundChild> children;
};

// =============================================================================
// Shape
// =============================================================================

/// Validated collision geometry
///
/// Only constructible through the factories, which reject non-positive or
/// non-finite dimensions with GeometryError::InvalidGeometry.
class Shape {
public:
    using Variant = std::variant<SphereShape, BoxShape, CylinderShape, CompoundShape>;

    // =========================================================================
    // Factories
    // =========================================================================

    [[nodiscard]] static impulse_core::Result<Shape> sphere(float radius);
    [[nodiscard]] static impulse_core::Result<Shape> box(float edge_length);
    [[nodiscard]] static impulse_core::Result<Shape> cylinder(float radius, float height);

    /// Children are already validated shapes; offsets must be finite
    [[nodiscard]] static impulse_core::Result<Shape> compound(std::vector<CompoundChild> children);

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] ShapeKind kind() const noexcept;

    [[nodiscard]] const char* name() const noexcept { return shape_kind_name(kind()); }

    /// Scalar extent used for ground and wall clamping
    ///
    /// Sphere: radius. Box: half the edge. Cylinder: half the height on every
    /// axis. Compound: zero.
    [[nodiscard]] float half_size() const noexcept;

    /// Scalar moment of inertia approximation for a body of @p mass
    [[nodiscard]] float moment_of_inertia(float mass) const noexcept;

    template<typename T>
    [[nodiscard]] const T* as() const noexcept {
        return std::get_if<T>(&m_shape);
    }

    template<typename T>
    [[nodiscard]] bool is() const noexcept {
        return std::holds_alternative<T>(m_shape);
    }

    template<typename Visitor>
    decltype(auto) visit(Visitor&& visitor) const {
        return std::visit(std::forward<Visitor>(visitor), m_shape);
    }

    [[nodiscard]] const Variant& variant() const noexcept { return m_shape; }

private:
    explicit Shape(Variant shape);

    Variant m_shape;
};

/// Child of a compound shape
struct CompoundChild {
    Shape shape;
    impulse_math::Vec3 offset{0.0f};
};

} // namespace impulse_physics
