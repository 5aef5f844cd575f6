// impulse_physics RigidBody tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <impulse/physics/body.hpp>
#include <impulse/math/vec.hpp>

#include <cmath>

using namespace impulse_physics;
using impulse_math::Vec3;
using Catch::Matchers::WithinAbs;

namespace {

RigidBody make_sphere(float mass, const Vec3& position = Vec3(0.0f)) {
    return RigidBody(Shape::sphere(0.5f).value(), mass, position);
}

} // anonymous namespace

TEST_CASE("RigidBody defaults", "[physics][body]") {
    RigidBody body = make_sphere(1.0f, Vec3(1.0f, 2.0f, 3.0f));

    REQUIRE_FALSE(body.id().is_valid());
    REQUIRE(body.shape_kind() == ShapeKind::Sphere);
    REQUIRE(body.position() == Vec3(1.0f, 2.0f, 3.0f));
    REQUIRE(body.velocity() == impulse_math::vec3::ZERO);
    REQUIRE(body.angular_velocity() == impulse_math::vec3::ZERO);
    REQUIRE_THAT(body.restitution(), WithinAbs(k_default_restitution, 1e-6f));
    REQUIRE_THAT(body.friction(), WithinAbs(k_default_friction, 1e-6f));
    REQUIRE(body.orientation() == impulse_math::quat::IDENTITY);
}

TEST_CASE("RigidBody mass properties", "[physics][body]") {
    SECTION("positive mass") {
        RigidBody body = make_sphere(4.0f);
        REQUIRE_THAT(body.inverse_mass(), WithinAbs(0.25f, 1e-6f));
        REQUIRE_THAT(body.inertia(), WithinAbs(0.4f, 1e-6f));
        REQUIRE_THAT(body.inverse_inertia(), WithinAbs(2.5f, 1e-5f));
        REQUIRE_FALSE(body.is_static());
    }

    SECTION("zero mass is immovable") {
        RigidBody body = make_sphere(0.0f);
        REQUIRE(body.inverse_mass() == 0.0f);
        REQUIRE(body.inverse_inertia() == 0.0f);
        REQUIRE(body.is_static());
    }

    SECTION("negative mass is immovable") {
        RigidBody body = make_sphere(-1.0f);
        REQUIRE(body.inverse_mass() == 0.0f);
        REQUIRE(body.is_static());
    }
}

TEST_CASE("RigidBody material clamping", "[physics][body]") {
    RigidBody body = make_sphere(1.0f);

    body.set_restitution(1.5f);
    REQUIRE(body.restitution() == 1.0f);
    body.set_restitution(-0.5f);
    REQUIRE(body.restitution() == 0.0f);

    body.set_friction(-0.2f);
    REQUIRE(body.friction() == 0.0f);
    body.set_friction(0.6f);
    REQUIRE_THAT(body.friction(), WithinAbs(0.6f, 1e-6f));
}

TEST_CASE("RigidBody integration", "[physics][body]") {
    SECTION("semi-implicit Euler step") {
        RigidBody body = make_sphere(2.0f);
        body.apply_force(Vec3(0.0f, -20.0f, 0.0f));
        body.integrate(0.5f);

        // v = F/m * dt, then p = v * dt with the updated velocity
        REQUIRE_THAT(body.velocity().y, WithinAbs(-5.0f, 1e-6f));
        REQUIRE_THAT(body.position().y, WithinAbs(-2.5f, 1e-6f));
    }

    SECTION("forces are consumed by the step") {
        RigidBody body = make_sphere(1.0f);
        body.apply_force(Vec3(1.0f, 0.0f, 0.0f));
        body.apply_force(Vec3(1.0f, 0.0f, 0.0f));
        REQUIRE(body.accumulated_force() == Vec3(2.0f, 0.0f, 0.0f));

        body.integrate(1.0f);
        REQUIRE(body.accumulated_force() == impulse_math::vec3::ZERO);
        REQUIRE(body.accumulated_torque() == impulse_math::vec3::ZERO);
        REQUIRE_THAT(body.velocity().x, WithinAbs(2.0f, 1e-6f));

        body.integrate(1.0f);
        REQUIRE_THAT(body.velocity().x, WithinAbs(2.0f, 1e-6f));
    }

    SECTION("torque changes angular velocity through inverse inertia") {
        // Sphere r = 0.5, m = 1: I = 0.1
        RigidBody body = make_sphere(1.0f);
        body.apply_torque(Vec3(1.0f, 0.0f, 0.0f));
        body.integrate(0.1f);
        REQUIRE_THAT(body.angular_velocity().x, WithinAbs(1.0f, 1e-5f));
    }

    SECTION("immovable bodies stay put") {
        RigidBody body = make_sphere(0.0f, Vec3(1.0f, 1.0f, 1.0f));
        body.set_velocity(Vec3(3.0f, 0.0f, 0.0f));
        body.set_angular_velocity(Vec3(0.0f, 2.0f, 0.0f));
        body.apply_force(Vec3(0.0f, -100.0f, 0.0f));
        body.integrate(1.0f / 60.0f);

        REQUIRE(body.position() == Vec3(1.0f, 1.0f, 1.0f));
        REQUIRE(body.velocity() == Vec3(3.0f, 0.0f, 0.0f));
        REQUIRE(body.orientation() == impulse_math::quat::IDENTITY);
        REQUIRE(body.accumulated_force() == impulse_math::vec3::ZERO);
    }
}

TEST_CASE("RigidBody orientation proxy", "[physics][body]") {
    SECTION("slow spin below the threshold is ignored") {
        RigidBody body = make_sphere(1.0f);
        body.set_angular_velocity(Vec3(0.00005f, 0.0f, 0.0f));
        body.integrate(1.0f);
        REQUIRE(body.orientation() == impulse_math::quat::IDENTITY);
    }

    SECTION("spin rotates about the local axes") {
        RigidBody body = make_sphere(1.0f);
        body.set_angular_velocity(Vec3(0.0f, 1.0f, 0.0f));
        body.integrate(0.1f);

        const auto& q = body.orientation();
        REQUIRE_THAT(q.w, WithinAbs(std::cos(0.05f), 1e-5f));
        REQUIRE_THAT(q.y, WithinAbs(std::sin(0.05f), 1e-5f));
        REQUIRE_THAT(q.x, WithinAbs(0.0f, 1e-6f));
        REQUIRE_THAT(q.z, WithinAbs(0.0f, 1e-6f));
    }
}
