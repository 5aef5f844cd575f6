/// @file shape.cpp
/// @brief Shape factories and queries for impulse_physics

#include <impulse/physics/shape.hpp>
#include <impulse/math/vec.hpp>

#include <cmath>

namespace impulse_physics {

namespace {

[[nodiscard]] bool is_valid_dimension(float value) noexcept {
    return std::isfinite(value) && value > 0.0f;
}

} // anonymous namespace

// =============================================================================
// Factories
// =============================================================================

Shape::Shape(Variant shape)
    : m_shape(std::move(shape))
{
}

impulse_core::Result<Shape> Shape::sphere(float radius) {
    if (!is_valid_dimension(radius)) {
        return impulse_core::Err<Shape>(impulse_core::GeometryError::invalid_geometry("sphere", "radius", radius));
    }
    return Shape(SphereShape{radius});
}

impulse_core::Result<Shape> Shape::box(float edge_length) {
    if (!is_valid_dimension(edge_length)) {
        return impulse_core::Err<Shape>(
            impulse_core::GeometryError::invalid_geometry("box", "edge_length", edge_length));
    }
    return Shape(BoxShape{edge_length});
}

impulse_core::Result<Shape> Shape::cylinder(float radius, float height) {
    if (!is_valid_dimension(radius)) {
        return impulse_core::Err<Shape>(impulse_core::GeometryError::invalid_geometry("cylinder", "radius", radius));
    }
    if (!is_valid_dimension(height)) {
        return impulse_core::Err<Shape>(impulse_core::GeometryError::invalid_geometry("cylinder", "height", height));
    }
    return Shape(CylinderShape{radius, height});
}

impulse_core::Result<Shape> Shape::compound(std::vector<CompoundChild> children) {
    for (const auto& child : children) {
        if (!impulse_math::is_finite(child.offset)) {
            return impulse_core::Err<Shape>(
                impulse_core::GeometryError::invalid_geometry("compound", "child offset", child.offset.x));
        }
    }
    return Shape(CompoundShape{std::move(children)});
}

// =============================================================================
// Queries
// =============================================================================

ShapeKind Shape::kind() const noexcept {
    switch (m_shape.index()) {
        case 0: return ShapeKind::Sphere;
        case 1: return ShapeKind::Box;
        case 2: return ShapeKind::Cylinder;
        default: return ShapeKind::Compound;
    }
}

float Shape::half_size() const noexcept {
    if (const auto* s = as<SphereShape>()) {
        return s->radius;
    }
    if (const auto* b = as<BoxShape>()) {
        return b->half_extent();
    }
    if (const auto* c = as<CylinderShape>()) {
        return c->height * 0.5f;
    }
    return 0.0f;
}

float Shape::moment_of_inertia(float mass) const noexcept {
    if (const auto* s = as<SphereShape>()) {
        return 0.4f * mass * s->radius * s->radius;
    }
    if (const auto* c = as<CylinderShape>()) {
        return 0.5f * mass * c->radius * c->radius;
    }
    // Boxes and compounds use a unit placeholder
    return 1.0f;
}

} // namespace impulse_physics
