// impulse_physics PhysicsWorld tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <impulse/physics/world.hpp>

#include <cmath>
#include <limits>
#include <memory>
#include <vector>

using namespace impulse_physics;
using impulse_math::Vec3;
using Catch::Matchers::WithinAbs;

namespace {

constexpr float k_dt = 1.0f / 60.0f;

std::unique_ptr<RigidBody> make_sphere(float radius, float mass, const Vec3& position) {
    return std::make_unique<RigidBody>(Shape::sphere(radius).value(), mass, position);
}

} // anonymous namespace

// =============================================================================
// Body Management
// =============================================================================

TEST_CASE("PhysicsWorld body management", "[physics][world]") {
    PhysicsWorld world;

    SECTION("add assigns distinct ids") {
        BodyId a = world.add_body(make_sphere(0.5f, 1.0f, Vec3(0.0f, 5.0f, 0.0f)));
        BodyId b = world.add_body(make_sphere(0.5f, 1.0f, Vec3(2.0f, 5.0f, 0.0f)));

        REQUIRE(a.is_valid());
        REQUIRE(b.is_valid());
        REQUIRE(a != b);
        REQUIRE(world.body_count() == 2);
        REQUIRE(world.get_body(a)->id() == a);
        REQUIRE(world.bodies()[1]->id() == b);
    }

    SECTION("null body is rejected") {
        BodyId id = world.add_body(nullptr);
        REQUIRE_FALSE(id.is_valid());
        REQUIRE(world.body_count() == 0);
    }

    SECTION("remove by id and by address") {
        BodyId a = world.add_body(make_sphere(0.5f, 1.0f, Vec3(0.0f, 5.0f, 0.0f)));
        BodyId b = world.add_body(make_sphere(0.5f, 1.0f, Vec3(2.0f, 5.0f, 0.0f)));

        REQUIRE(world.remove_body(a));
        REQUIRE_FALSE(world.remove_body(a));
        REQUIRE(world.get_body(a) == nullptr);

        const RigidBody* body = world.get_body(b);
        REQUIRE(world.remove_body(body));
        REQUIRE(world.body_count() == 0);
    }

    SECTION("clear drops everything") {
        world.add_body(make_sphere(0.5f, 1.0f, Vec3(0.0f, 5.0f, 0.0f)));
        world.add_body(make_sphere(0.5f, 1.0f, Vec3(1.0f, 5.0f, 0.0f)));
        world.update(k_dt);

        world.clear();
        REQUIRE(world.body_count() == 0);
        REQUIRE(world.collision_count() == 0);
        REQUIRE(world.grid().cell_count() == 0);
    }
}

TEST_CASE("PhysicsWorld configuration", "[physics][world]") {
    SECTION("defaults") {
        PhysicsWorld world;
        REQUIRE(world.gravity() == Vec3(0.0f, -10.0f, 0.0f));
        REQUIRE(world.bounds() == Vec3(20.0f, 20.0f, 20.0f));
    }

    SECTION("builder") {
        auto world = PhysicsWorldBuilder()
            .gravity(0.0f, -5.0f, 0.0f)
            .bounds(10.0f, 8.0f, 10.0f)
            .build();

        REQUIRE(world->gravity().y == -5.0f);
        REQUIRE(world->bounds() == Vec3(10.0f, 8.0f, 10.0f));
    }

    SECTION("gravity can change between updates") {
        PhysicsWorld world;
        BodyId id = world.add_body(make_sphere(0.5f, 2.0f, Vec3(0.0f, 10.0f, 0.0f)));
        world.set_gravity(Vec3(0.0f));
        world.update(k_dt);
        REQUIRE(world.get_body(id)->velocity() == Vec3(0.0f));
    }
}

// =============================================================================
// Stepping
// =============================================================================

TEST_CASE("Gravity accelerates dynamic bodies", "[physics][world]") {
    PhysicsWorld world;
    BodyId id = world.add_body(make_sphere(0.5f, 3.0f, Vec3(0.0f, 10.0f, 0.0f)));

    world.update(0.1f);

    // Acceleration is independent of mass
    const RigidBody* body = world.get_body(id);
    REQUIRE_THAT(body->velocity().y, WithinAbs(-1.0f, 1e-5f));
    REQUIRE_THAT(body->position().y, WithinAbs(9.9f, 1e-5f));
}

TEST_CASE("Immovable bodies ignore gravity", "[physics][world]") {
    PhysicsWorld world;
    BodyId id = world.add_body(make_sphere(0.5f, 0.0f, Vec3(0.0f, 3.0f, 0.0f)));

    for (int i = 0; i < 60; ++i) {
        world.update(k_dt);
    }

    REQUIRE(world.get_body(id)->position() == Vec3(0.0f, 3.0f, 0.0f));
    REQUIRE(world.stats().static_bodies == 1);
}

TEST_CASE("Bouncing sphere loses height and settles", "[physics][world]") {
    PhysicsWorld world;
    auto sphere = make_sphere(0.5f, 1.0f, Vec3(0.0f, 5.0f, 0.0f));
    sphere->set_restitution(0.5f);
    sphere->set_friction(0.0f);
    BodyId id = world.add_body(std::move(sphere));
    const RigidBody* body = world.get_body(id);

    std::vector<float> apexes;
    float previous_vy = 0.0f;
    for (int i = 0; i < 600; ++i) {
        world.update(k_dt);
        const float vy = body->velocity().y;
        if (previous_vy > 0.0f && vy <= 0.0f) {
            apexes.push_back(body->position().y);
        }
        previous_vy = vy;

        REQUIRE(body->position().y >= 0.5f);
    }

    REQUIRE(apexes.size() >= 2);
    REQUIRE(apexes.front() < 5.0f);
    for (std::size_t i = 1; i < apexes.size(); ++i) {
        REQUIRE(apexes[i] <= apexes[i - 1] + 1e-4f);
    }

    REQUIRE_THAT(body->position().y, WithinAbs(0.5f, 1e-3f));
    REQUIRE(std::abs(body->velocity().y) < 0.1f);
}

TEST_CASE("Head-on pair is resolved once", "[physics][world]") {
    auto world = PhysicsWorldBuilder().gravity(0.0f, 0.0f, 0.0f).build();

    auto a = make_sphere(0.2f, 1.0f, Vec3(0.3f, 0.5f, 0.5f));
    auto b = make_sphere(0.2f, 1.0f, Vec3(0.7f, 0.5f, 0.5f));
    a->set_velocity(Vec3(1.0f, 0.0f, 0.0f));
    b->set_velocity(Vec3(-1.0f, 0.0f, 0.0f));
    BodyId ida = world->add_body(std::move(a));
    BodyId idb = world->add_body(std::move(b));

    world->update(k_dt);
    REQUIRE(world->collision_count() == 1);
    REQUIRE(world->stats().collisions == 1);
    REQUIRE(world->stats().candidate_pairs == 1);

    // Bodies now move apart
    REQUIRE(world->get_body(ida)->velocity().x < 0.0f);
    REQUIRE(world->get_body(idb)->velocity().x > 0.0f);

    // The counter reflects only the latest step
    world->update(k_dt);
    REQUIRE(world->collision_count() == 0);
}

TEST_CASE("Overlapping bodies in different cells never collide", "[physics][world]") {
    auto world = PhysicsWorldBuilder().gravity(0.0f, 0.0f, 0.0f).build();
    BodyId a = world->add_body(make_sphere(0.5f, 1.0f, Vec3(0.9f, 0.5f, 0.5f)));
    BodyId b = world->add_body(make_sphere(0.5f, 1.0f, Vec3(1.1f, 0.5f, 0.5f)));

    world->update(k_dt);

    REQUIRE(world->collision_count() == 0);
    REQUIRE(world->stats().candidate_pairs == 0);
    REQUIRE(world->stats().occupied_cells == 2);
    REQUIRE(world->get_body(a)->position().x == 0.9f);
    REQUIRE(world->get_body(b)->position().x == 1.1f);
}

TEST_CASE("Mixed-kind pairs are counted as skipped", "[physics][world]") {
    auto world = PhysicsWorldBuilder().gravity(0.0f, 0.0f, 0.0f).build();
    world->add_body(make_sphere(0.3f, 1.0f, Vec3(0.3f, 0.5f, 0.5f)));
    world->add_body(std::make_unique<RigidBody>(Shape::box(0.6f).value(), 1.0f, Vec3(0.6f, 0.5f, 0.5f)));
    world->add_body(make_sphere(0.5f, 0.0f, Vec3(5.5f, 0.5f, 5.5f)));

    world->update(k_dt);

    const PhysicsStats& stats = world->stats();
    REQUIRE(stats.body_count == 3);
    REQUIRE(stats.static_bodies == 1);
    REQUIRE(stats.occupied_cells == 2);
    REQUIRE(stats.candidate_pairs == 1);
    REQUIRE(stats.skipped_pairs == 1);
    REQUIRE(stats.collisions == 0);
    REQUIRE(stats.step_time_ms >= 0.0f);
}

TEST_CASE("Compound bodies have no collision effect", "[physics][world]") {
    auto world = PhysicsWorldBuilder().gravity(0.0f, 0.0f, 0.0f).build();
    BodyId sphere = world->add_body(make_sphere(0.3f, 1.0f, Vec3(0.3f, 0.5f, 0.5f)));
    BodyId compound = world->add_body(
        std::make_unique<RigidBody>(Shape::compound({}).value(), 1.0f, Vec3(0.6f, 0.5f, 0.5f)));

    REQUIRE_NOTHROW(world->update(k_dt));

    const PhysicsStats& stats = world->stats();
    REQUIRE(stats.candidate_pairs == 1);
    REQUIRE(stats.skipped_pairs == 1);
    REQUIRE(world->collision_count() == 0);

    REQUIRE(world->get_body(compound)->position() == Vec3(0.6f, 0.5f, 0.5f));
    REQUIRE(world->get_body(compound)->velocity() == Vec3(0.0f));
    REQUIRE(world->get_body(sphere)->position() == Vec3(0.3f, 0.5f, 0.5f));
}

TEST_CASE("Invalid time steps are rejected", "[physics][world]") {
    PhysicsWorld world;
    BodyId id = world.add_body(make_sphere(0.5f, 1.0f, Vec3(0.0f, 5.0f, 0.0f)));

    SECTION("negative") {
        world.update(-k_dt);
        REQUIRE(world.get_body(id)->position() == Vec3(0.0f, 5.0f, 0.0f));
        REQUIRE(world.get_body(id)->velocity() == Vec3(0.0f));
    }

    SECTION("not a number") {
        world.update(std::numeric_limits<float>::quiet_NaN());
        REQUIRE(world.get_body(id)->position() == Vec3(0.0f, 5.0f, 0.0f));
        REQUIRE(world.collision_count() == 0);
    }

    SECTION("zero leaves bodies in place") {
        world.update(0.0f);
        REQUIRE(world.get_body(id)->position() == Vec3(0.0f, 5.0f, 0.0f));
        REQUIRE(world.grid().body_count() == 1);
    }
}

// =============================================================================
// Boundaries
// =============================================================================

TEST_CASE("Boundary resolution", "[physics][world]") {
    PhysicsWorld world;

    SECTION("ground reflects and applies friction") {
        RigidBody body(Shape::sphere(0.5f).value(), 1.0f, Vec3(15.0f, -3.0f, 0.0f));
        body.set_velocity(Vec3(5.0f, -2.0f, 0.0f));
        body.set_restitution(0.5f);
        body.set_friction(0.2f);

        REQUIRE(world.resolve_bounds(body));

        REQUIRE_THAT(body.position().y, WithinAbs(0.5f, 1e-6f));
        REQUIRE_THAT(body.velocity().y, WithinAbs(1.0f, 1e-6f));

        // Friction first (5 -> 4), then the +x wall reflects with restitution
        REQUIRE_THAT(body.position().x, WithinAbs(9.5f, 1e-6f));
        REQUIRE_THAT(body.velocity().x, WithinAbs(-2.0f, 1e-5f));

        SECTION("second pass is a no-op") {
            const Vec3 position = body.position();
            const Vec3 velocity = body.velocity();
            REQUIRE_FALSE(world.resolve_bounds(body));
            REQUIRE(body.position() == position);
            REQUIRE(body.velocity() == velocity);
        }
    }

    SECTION("negative walls") {
        RigidBody body(Shape::box(1.0f).value(), 1.0f, Vec3(-12.0f, 2.0f, -11.0f));
        REQUIRE(world.resolve_bounds(body));
        REQUIRE_THAT(body.position().x, WithinAbs(-9.5f, 1e-6f));
        REQUIRE_THAT(body.position().z, WithinAbs(-9.5f, 1e-6f));
    }

    SECTION("ceiling") {
        RigidBody body(Shape::sphere(0.5f).value(), 1.0f, Vec3(0.0f, 25.0f, 0.0f));
        body.set_velocity(Vec3(0.0f, 4.0f, 0.0f));
        body.set_restitution(0.5f);

        REQUIRE(world.resolve_bounds(body));
        REQUIRE_THAT(body.position().y, WithinAbs(19.5f, 1e-6f));
        REQUIRE_THAT(body.velocity().y, WithinAbs(-2.0f, 1e-6f));
    }

    SECTION("cylinders clamp with half their height") {
        RigidBody body(Shape::cylinder(0.3f, 1.2f).value(), 1.0f, Vec3(0.0f, 0.1f, 0.0f));
        REQUIRE(world.resolve_bounds(body));
        REQUIRE_THAT(body.position().y, WithinAbs(0.6f, 1e-6f));
    }

    SECTION("body inside the box is untouched") {
        RigidBody body(Shape::sphere(0.5f).value(), 1.0f, Vec3(1.0f, 3.0f, -2.0f));
        body.set_velocity(Vec3(1.0f, 1.0f, 1.0f));
        REQUIRE_FALSE(world.resolve_bounds(body));
        REQUIRE(body.position() == Vec3(1.0f, 3.0f, -2.0f));
        REQUIRE(body.velocity() == Vec3(1.0f, 1.0f, 1.0f));
    }
}
