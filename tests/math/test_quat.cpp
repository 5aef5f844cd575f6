// impulse_math quaternion tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <impulse/math/math.hpp>

using namespace impulse_math;
using Catch::Matchers::WithinAbs;

namespace {
constexpr float k_half_pi = 1.57079632679f;
}

TEST_CASE("Axis rotations", "[math][quat]") {
    SECTION("rotation about X maps Y to Z") {
        Vec3 v = rotate(quat_rotation_x(k_half_pi), vec3::Y);
        REQUIRE_THAT(v.x, WithinAbs(0.0f, 1e-5f));
        REQUIRE_THAT(v.y, WithinAbs(0.0f, 1e-5f));
        REQUIRE_THAT(v.z, WithinAbs(1.0f, 1e-5f));
    }

    SECTION("rotation about Y maps Z to X") {
        Vec3 v = rotate(quat_rotation_y(k_half_pi), vec3::Z);
        REQUIRE_THAT(v.x, WithinAbs(1.0f, 1e-5f));
        REQUIRE_THAT(v.z, WithinAbs(0.0f, 1e-5f));
    }

    SECTION("rotation about Z maps X to Y") {
        Vec3 v = rotate(quat_rotation_z(k_half_pi), vec3::X);
        REQUIRE_THAT(v.x, WithinAbs(0.0f, 1e-5f));
        REQUIRE_THAT(v.y, WithinAbs(1.0f, 1e-5f));
    }
}

TEST_CASE("Local XYZ rotation", "[math][quat]") {
    SECTION("zero angles leave orientation unchanged") {
        Quat q = rotate_local_xyz(quat::IDENTITY, vec3::ZERO);
        REQUIRE_THAT(q.w, WithinAbs(1.0f, 1e-6f));
        REQUIRE_THAT(q.x, WithinAbs(0.0f, 1e-6f));
    }

    SECTION("rotations are applied about local axes in X, Y, Z order") {
        // Local composition: q * Rx * Ry, so world X ends up along world +Y
        Quat q = rotate_local_xyz(quat::IDENTITY, Vec3(k_half_pi, k_half_pi, 0.0f));
        Quat expected = quat_rotation_x(k_half_pi) * quat_rotation_y(k_half_pi);

        Vec3 a = rotate(q, vec3::X);
        Vec3 b = rotate(expected, vec3::X);
        REQUIRE_THAT(a.x, WithinAbs(b.x, 1e-5f));
        REQUIRE_THAT(a.y, WithinAbs(b.y, 1e-5f));
        REQUIRE_THAT(a.z, WithinAbs(b.z, 1e-5f));
        REQUIRE_THAT(a.y, WithinAbs(1.0f, 1e-5f));
    }

    SECTION("result stays normalized") {
        Quat q = quat::IDENTITY;
        for (int i = 0; i < 1000; ++i) {
            q = rotate_local_xyz(q, Vec3(0.01f, 0.02f, -0.03f));
        }
        REQUIRE_THAT(glm::length(q), WithinAbs(1.0f, 1e-4f));
    }
}
