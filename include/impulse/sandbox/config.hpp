#pragma once

/// @file config.hpp
/// @brief Sandbox configuration loaded from TOML
///
/// Example:
/// @code
/// [physics]
/// gravity = [0.0, -10.0, 0.0]
/// bounds = [20.0, 20.0, 20.0]
///
/// [driver]
/// time_scale = 1.0
/// duration_seconds = 10.0
/// spawn_count = 12
///
/// [spawn]
/// restitution = 0.35
/// friction = 0.3
///
/// [log]
/// level = "info"
/// @endcode

#include <impulse/core/error.hpp>
#include <impulse/core/log.hpp>
#include <impulse/math/types.hpp>
#include <impulse/physics/types.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace impulse_sandbox {

/// Frame pacing and run length
struct DriverConfig {
    float max_step = 0.05f;             ///< Upper bound on one frame's dt before scaling
    float time_scale = 1.0f;
    float fixed_frame = 1.0f / 60.0f;   ///< Frame time fed to the clock by the headless runner
    float duration_seconds = 10.0f;
    std::uint32_t spawn_count = 12;
    std::uint32_t seed = 1;
};

/// Defaults applied to spawned bodies
struct SpawnConfig {
    float restitution = 0.35f;
    float friction = 0.3f;
    impulse_math::Vec3 spawn_point{0.0f, 5.0f, 0.0f};
    impulse_math::Vec3 shoot_velocity{0.0f, 0.0f, -12.0f};
};

/// Complete sandbox configuration
struct SandboxConfig {
    impulse_physics::PhysicsConfig physics;
    DriverConfig driver;
    SpawnConfig spawn;
    impulse_core::LogConfig log;

    [[nodiscard]] static SandboxConfig defaults() { return SandboxConfig{}; }
};

/// Parse configuration text; missing keys keep their defaults
/// @param source Name used in error messages
[[nodiscard]] impulse_core::Result<SandboxConfig> parse_config(std::string_view text, std::string_view source = "config");

/// Load configuration from a TOML file
[[nodiscard]] impulse_core::Result<SandboxConfig> load_config(const std::string& path);

} // namespace impulse_sandbox
