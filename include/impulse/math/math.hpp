#pragma once

/// @file math.hpp
/// @brief Main include header for impulse_math

#include "fwd.hpp"
#include "types.hpp"
#include "vec.hpp"
#include "quat.hpp"
