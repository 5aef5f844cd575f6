/// @file main.cpp
/// @brief impulse_sandbox entry point - runs the rigid-body sandbox headless
///
/// Loads an optional TOML configuration, spawns bodies the way the
/// interactive sandbox does (one every quarter second at the spawn point),
/// advances the world at a fixed frame time and logs a status line once per
/// second of frame time.

#include <impulse/core/error.hpp>
#include <impulse/core/log.hpp>
#include <impulse/physics/physics.hpp>
#include <impulse/sandbox/config.hpp>
#include <impulse/sandbox/sandbox.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

constexpr float k_spawn_interval = 0.25f;

struct CommandLine {
    std::optional<std::string> config_path;
    std::optional<float> seconds;
    std::optional<std::uint32_t> bodies;
    std::optional<std::uint32_t> seed;
    bool show_help = false;
    bool show_version = false;
    std::string error;
};

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
              << "\n"
              << "Options:\n"
              << "  --config <file>   TOML configuration file\n"
              << "  --seconds <n>     Frame time to simulate (overrides [driver] duration_seconds)\n"
              << "  --bodies <n>      Number of bodies to spawn (overrides [driver] spawn_count)\n"
              << "  --seed <n>        Random seed for spawned bodies\n"
              << "  --help, -h        Show this help message\n"
              << "  --version, -v     Show version information\n";
}

void print_version() {
    std::cout << "impulse_sandbox 0.1.0\n";
}

CommandLine parse_command_line(int argc, char* argv[]) {
    CommandLine cmd;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        auto next_value = [&](const char* flag) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                cmd.error = std::string("Missing value for ") + flag;
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        try {
            if (arg == "--help" || arg == "-h") {
                cmd.show_help = true;
            } else if (arg == "--version" || arg == "-v") {
                cmd.show_version = true;
            } else if (arg == "--config") {
                cmd.config_path = next_value("--config");
            } else if (arg == "--seconds") {
                if (auto v = next_value("--seconds")) {
                    cmd.seconds = std::stof(*v);
                    if (!(*cmd.seconds >= 0.0f)) {
                        cmd.error = "--seconds must not be negative";
                    }
                }
            } else if (arg == "--bodies") {
                if (auto v = next_value("--bodies")) cmd.bodies = static_cast<std::uint32_t>(std::stoul(*v));
            } else if (arg == "--seed") {
                if (auto v = next_value("--seed")) cmd.seed = static_cast<std::uint32_t>(std::stoul(*v));
            } else {
                cmd.error = "Unknown option: " + arg;
            }
        } catch (const std::logic_error&) {
            cmd.error = "Invalid number for " + arg;
        }

        if (!cmd.error.empty()) {
            break;
        }
    }

    return cmd;
}

void log_body_states(const impulse_physics::PhysicsWorld& world) {
    for (const auto& body : world.bodies()) {
        const auto& p = body->position();
        const auto& v = body->velocity();
        IMPULSE_LOG_INFO("  body {:>3} {:<8} pos ({:7.3f}, {:7.3f}, {:7.3f}) vel ({:7.3f}, {:7.3f}, {:7.3f})",
            body->id().value, body->shape().name(), p.x, p.y, p.z, v.x, v.y, v.z);
    }
}

} // anonymous namespace

// =============================================================================
// Main
// =============================================================================

int main(int argc, char* argv[]) {
    impulse_core::init_logging();

    const CommandLine cmd = parse_command_line(argc, argv);
    if (!cmd.error.empty()) {
        std::cerr << cmd.error << "\n\n";
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }
    if (cmd.show_help) {
        print_usage(argv[0]);
        return EXIT_SUCCESS;
    }
    if (cmd.show_version) {
        print_version();
        return EXIT_SUCCESS;
    }

    impulse_sandbox::SandboxConfig config = impulse_sandbox::SandboxConfig::defaults();
    if (cmd.config_path) {
        auto loaded = impulse_sandbox::load_config(*cmd.config_path);
        if (!loaded) {
            IMPULSE_LOG_ERROR("Failed to load configuration: {}", impulse_core::build_error_chain(loaded.error()));
            return EXIT_FAILURE;
        }
        config = std::move(*loaded);
    }
    if (cmd.seconds) config.driver.duration_seconds = *cmd.seconds;
    if (cmd.bodies) config.driver.spawn_count = *cmd.bodies;
    if (cmd.seed) config.driver.seed = *cmd.seed;

    impulse_core::configure_logging(config.log);

    IMPULSE_LOG_INFO("Impulse sandbox");
    IMPULSE_LOG_INFO("  - Gravity: ({}, {}, {})",
        config.physics.gravity.x, config.physics.gravity.y, config.physics.gravity.z);
    IMPULSE_LOG_INFO("  - Bounds: ({}, {}, {})",
        config.physics.bounds.x, config.physics.bounds.y, config.physics.bounds.z);
    IMPULSE_LOG_INFO("  - Frame: {:.4f}s, max step {:.3f}s, time scale {}",
        config.driver.fixed_frame, config.driver.max_step, config.driver.time_scale);
    IMPULSE_LOG_INFO("  - Bodies: {}, seed {}", config.driver.spawn_count, config.driver.seed);

    impulse_sandbox::Sandbox sandbox(config);

    const float frame = config.driver.fixed_frame;
    const auto total_frames = static_cast<std::uint64_t>(std::ceil(config.driver.duration_seconds / frame));
    const auto frames_per_report = std::max<std::uint64_t>(1, static_cast<std::uint64_t>(std::lround(1.0f / frame)));
    const auto frames_per_spawn = std::max<std::uint64_t>(1, static_cast<std::uint64_t>(std::lround(k_spawn_interval / frame)));

    {
        IMPULSE_LOG_SCOPE("simulation loop");

        std::uint32_t spawned = 0;
        for (std::uint64_t f = 0; f < total_frames; ++f) {
            if (spawned < config.driver.spawn_count && f % frames_per_spawn == 0) {
                auto id = sandbox.spawn_random();
                if (!id) {
                    IMPULSE_LOG_ERROR("Spawn failed: {}", impulse_core::build_error_chain(id.error()));
                    return EXIT_FAILURE;
                }
                ++spawned;
            }

            const float dt = sandbox.advance(frame);
            IMPULSE_LOG_TRACE("frame {}: dt {:.4f}, {} collisions", f, dt, sandbox.world().collision_count());

            if ((f + 1) % frames_per_report == 0) {
                IMPULSE_LOG_INFO("[{:6.2f}s] {}", sandbox.clock().simulated_time(), sandbox.stats_line());
            }
        }
    }

    const auto& stats = sandbox.world().stats();
    IMPULSE_LOG_INFO("Finished after {} steps ({:.2f}s simulated)",
        sandbox.clock().step_count(), sandbox.clock().simulated_time());
    IMPULSE_LOG_INFO("Last step: {} cells, {} candidate pairs, {} skipped, {} boundary contacts, {:.3f} ms",
        stats.occupied_cells, stats.candidate_pairs, stats.skipped_pairs, stats.boundary_contacts,
        stats.step_time_ms);
    log_body_states(sandbox.world());

    impulse_core::shutdown_logging();
    return EXIT_SUCCESS;
}
