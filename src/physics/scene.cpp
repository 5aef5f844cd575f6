/// @file scene.cpp
/// @brief Body record conversion

#include <impulse/physics/scene.hpp>
#include <impulse/physics/body.hpp>
#include <impulse/physics/shape.hpp>
#include <impulse/physics/world.hpp>
#include <impulse/core/log.hpp>

namespace impulse_physics {

impulse_core::Result<BodyRecord> to_record(const RigidBody& body) {
    BodyRecord record;
    record.kind = body.shape_kind();

    const Shape& shape = body.shape();
    if (const auto* s = shape.as<SphereShape>()) {
        record.size = s->radius;
    } else if (const auto* b = shape.as<BoxShape>()) {
        record.size = b->edge_length;
    } else if (const auto* c = shape.as<CylinderShape>()) {
        record.size = c->radius;
        record.height = c->height;
    } else {
        return impulse_core::Err<BodyRecord>(
            impulse_core::GeometryError::unsupported_shape(shape.name(), "scene records"));
    }

    record.position = body.position();
    record.velocity = body.velocity();
    record.angular_velocity = body.angular_velocity();
    record.mass = body.mass();
    record.friction = body.friction();
    record.restitution = body.restitution();
    return record;
}

impulse_core::Result<std::unique_ptr<RigidBody>> from_record(const BodyRecord& record) {
    auto shape = [&]() -> impulse_core::Result<Shape> {
        switch (record.kind) {
            case ShapeKind::Sphere:
                return Shape::sphere(record.size);
            case ShapeKind::Box:
                return Shape::box(record.size);
            case ShapeKind::Cylinder:
                return Shape::cylinder(record.size, record.height.value_or(k_default_cylinder_height));
            case ShapeKind::Compound:
            default:
                return impulse_core::Err<Shape>(
                    impulse_core::GeometryError::unsupported_shape(shape_kind_name(record.kind), "scene records"));
        }
    }();

    if (!shape) {
        return impulse_core::Err<std::unique_ptr<RigidBody>>(std::move(shape.error()));
    }

    auto body = std::make_unique<RigidBody>(std::move(*shape), record.mass, record.position);
    body->set_velocity(record.velocity);
    body->set_angular_velocity(record.angular_velocity);
    body->set_friction(record.friction);
    body->set_restitution(record.restitution);
    return impulse_core::Ok(std::move(body));
}

std::vector<BodyRecord> capture_scene(const PhysicsWorld& world) {
    std::vector<BodyRecord> records;
    records.reserve(world.body_count());

    for (const auto& body : world.bodies()) {
        auto record = to_record(*body);
        if (!record) {
            impulse_core::physics_logger()->warn("Body {} not captured: {}",
                body->id().value, record.error().message());
            continue;
        }
        records.push_back(std::move(*record));
    }

    return records;
}

std::size_t restore_scene(PhysicsWorld& world, const std::vector<BodyRecord>& records) {
    world.clear();

    std::size_t restored = 0;
    for (std::size_t i = 0; i < records.size(); ++i) {
        auto body = from_record(records[i]);
        if (!body) {
            impulse_core::physics_logger()->warn("Scene record {} skipped: {}",
                i, impulse_core::build_error_chain(body.error()));
            continue;
        }
        world.add_body(std::move(*body));
        ++restored;
    }

    impulse_core::physics_logger()->info("Restored {} of {} bodies", restored, records.size());
    return restored;
}

} // namespace impulse_physics
