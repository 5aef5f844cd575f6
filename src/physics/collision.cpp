/// @file collision.cpp
/// @brief Narrow phase detection and impulse response

#include <impulse/physics/collision.hpp>
#include <impulse/physics/body.hpp>
#include <impulse/physics/shape.hpp>
#include <impulse/math/vec.hpp>

#include <algorithm>
#include <cmath>
#include <type_traits>
#include <variant>

namespace impulse_physics {

namespace {

template<typename>
inline constexpr bool always_false_v = false;

// =============================================================================
// Pair Tests
// =============================================================================

std::optional<Contact> sphere_sphere(
    const RigidBody& a, const SphereShape& sa,
    const RigidBody& b, const SphereShape& sb) noexcept
{
    const impulse_math::Vec3 d = a.position() - b.position();
    const float dist = impulse_math::length(d);
    const float min_dist = sa.radius + sb.radius;

    // Coincident centres have no direction to push along
    if (!(dist > 0.0f) || !(dist < min_dist)) {
        return std::nullopt;
    }

    return Contact{d / dist, min_dist - dist, CorrectionMode::Penetration};
}

std::optional<Contact> box_box(
    const RigidBody& a, const BoxShape& sa,
    const RigidBody& b, const BoxShape& sb) noexcept
{
    const impulse_math::Vec3 d = a.position() - b.position();
    const float limit = (sa.edge_length + sb.edge_length) * 0.5f;

    if (!(std::abs(d.x) < limit) || !(std::abs(d.y) < limit) || !(std::abs(d.z) < limit)) {
        return std::nullopt;
    }

    return Contact{impulse_math::normalize_or_zero(d), k_fixed_correction, CorrectionMode::Fixed};
}

std::optional<Contact> cylinder_cylinder(
    const RigidBody& a, const CylinderShape& sa,
    const RigidBody& b, const CylinderShape& sb) noexcept
{
    const float horizontal = impulse_math::horizontal_distance(a.position(), b.position());
    if (!(horizontal < sa.radius + sb.radius)) {
        return std::nullopt;
    }

    const float dy = std::abs(a.position().y - b.position().y);
    if (!(dy < (sa.height + sb.height) * 0.5f)) {
        return std::nullopt;
    }

    return Contact{
        impulse_math::normalize_or_zero(a.position() - b.position()),
        k_fixed_correction,
        CorrectionMode::Fixed};
}

/// Result of dispatching a pair: whether a routine exists, and its contact
struct PairTest {
    bool supported = false;
    std::optional<Contact> contact;
};

PairTest test_pair(const RigidBody& a, const RigidBody& b) noexcept {
    return std::visit([&](const auto& sa, const auto& sb) -> PairTest {
        using A = std::decay_t<decltype(sa)>;
        using B = std::decay_t<decltype(sb)>;

        if constexpr (!std::is_same_v<A, B>) {
            return PairTest{};
        } else if constexpr (std::is_same_v<A, SphereShape>) {
            return PairTest{true, sphere_sphere(a, sa, b, sb)};
        } else if constexpr (std::is_same_v<A, BoxShape>) {
            return PairTest{true, box_box(a, sa, b, sb)};
        } else if constexpr (std::is_same_v<A, CylinderShape>) {
            return PairTest{true, cylinder_cylinder(a, sa, b, sb)};
        } else if constexpr (std::is_same_v<A, CompoundShape>) {
            return PairTest{};
        } else {
            static_assert(always_false_v<A>, "shape pair has no detection routine");
        }
    }, a.shape().variant(), b.shape().variant());
}

} // anonymous namespace

// =============================================================================
// CollisionResolver
// =============================================================================

bool CollisionResolver::supports(ShapeKind a, ShapeKind b) noexcept {
    return a == b && a != ShapeKind::Compound;
}

std::optional<Contact> CollisionResolver::detect(const RigidBody& a, const RigidBody& b) noexcept {
    return test_pair(a, b).contact;
}

void CollisionResolver::apply(RigidBody& a, RigidBody& b, const Contact& contact) noexcept {
    const float inv_mass_sum = a.inverse_mass() + b.inverse_mass();
    if (inv_mass_sum <= 0.0f) {
        return;
    }

    const impulse_math::Vec3& n = contact.normal;
    const float rel_vel = impulse_math::dot(a.velocity() - b.velocity(), n);

    const float restitution = std::min(a.restitution(), b.restitution());
    const float impulse = -(1.0f + restitution) * rel_vel / inv_mass_sum;
    const impulse_math::Vec3 impulse_vec = n * impulse;

    a.set_velocity(a.velocity() + impulse_vec * a.inverse_mass());
    b.set_velocity(b.velocity() - impulse_vec * b.inverse_mass());

    // Heavier body moves less
    const float correction = contact.mode == CorrectionMode::Fixed ? k_fixed_correction : contact.correction;
    a.set_position(a.position() + n * (correction * a.inverse_mass() / inv_mass_sum));
    b.set_position(b.position() - n * (correction * b.inverse_mass() / inv_mass_sum));
}

PairOutcome CollisionResolver::resolve(RigidBody& a, RigidBody& b) noexcept {
    const PairTest test = test_pair(a, b);
    if (!test.supported) {
        return PairOutcome::Unsupported;
    }
    if (!test.contact) {
        return PairOutcome::Separated;
    }
    if (a.inverse_mass() + b.inverse_mass() <= 0.0f) {
        return PairOutcome::Immovable;
    }

    apply(a, b, *test.contact);
    return PairOutcome::Resolved;
}

} // namespace impulse_physics
