/// @file physics.hpp
/// @brief Main include header for impulse_physics
///
/// Rigid-body core: validated shapes, bodies with per-axis angular rates,
/// a unit-cell spatial hash broad phase, same-kind narrow phase with
/// impulse response, and scene records for save/load collaborators.

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "shape.hpp"
#include "body.hpp"
#include "broadphase.hpp"
#include "collision.hpp"
#include "world.hpp"
#include "scene.hpp"
