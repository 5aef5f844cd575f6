/// @file fwd.hpp
/// @brief Forward declarations for impulse_physics

#pragma once

#include <cstdint>

namespace impulse_physics {

// Identifiers
struct BodyId;

// Enums
enum class ShapeKind : std::uint8_t;

// Shapes
struct SphereShape;
struct BoxShape;
struct CylinderShape;
struct CompoundShape;
struct CompoundChild;
class Shape;

// Bodies
class RigidBody;

// Configuration and statistics
struct PhysicsConfig;
struct PhysicsStats;

// Broadphase
struct CellKey;
class SpatialHashGrid;

// Collision
struct Contact;
class CollisionResolver;

// World
class PhysicsWorld;
class PhysicsWorldBuilder;

// Scene records
struct BodyRecord;

} // namespace impulse_physics
