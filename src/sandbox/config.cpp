/// @file config.cpp
/// @brief TOML configuration loading for the sandbox

#include <impulse/sandbox/config.hpp>

#include <toml++/toml.hpp>

#include <cmath>
#include <cstdint>
#include <filesystem>
#include <optional>

namespace fs = std::filesystem;

namespace impulse_sandbox {

namespace {

using impulse_core::ConfigError;

/// Reads optional keys from one table, keeping the first error
class TableReader {
public:
    TableReader(const toml::table* table, std::string section)
        : m_table(table)
        , m_section(std::move(section))
    {
    }

    void vec3(std::string_view key, impulse_math::Vec3& out) {
        const toml::node* node = find(key);
        if (!node) {
            return;
        }

        const toml::array* arr = node->as_array();
        if (!arr || arr->size() != 3) {
            fail(key, "expected an array of 3 numbers");
            return;
        }

        impulse_math::Vec3 v{0.0f};
        for (std::size_t i = 0; i < 3; ++i) {
            auto component = (*arr)[i].value<double>();
            if (!component || !std::isfinite(*component)) {
                fail(key, "component " + std::to_string(i) + " is not a number");
                return;
            }
            v[static_cast<int>(i)] = static_cast<float>(*component);
        }
        out = v;
    }

    void number(std::string_view key, float& out) {
        const toml::node* node = find(key);
        if (!node) {
            return;
        }

        auto value = node->value<double>();
        if (!value || !std::isfinite(*value)) {
            fail(key, "expected a number");
            return;
        }
        out = static_cast<float>(*value);
    }

    void count(std::string_view key, std::uint32_t& out) {
        const toml::node* node = find(key);
        if (!node) {
            return;
        }

        auto value = node->value<std::int64_t>();
        if (!value || *value < 0 || *value > static_cast<std::int64_t>(UINT32_MAX)) {
            fail(key, "expected a non-negative integer");
            return;
        }
        out = static_cast<std::uint32_t>(*value);
    }

    void flag(std::string_view key, bool& out) {
        const toml::node* node = find(key);
        if (!node) {
            return;
        }

        auto value = node->value<bool>();
        if (!value) {
            fail(key, "expected true or false");
            return;
        }
        out = *value;
    }

    void text(std::string_view key, std::string& out) {
        const toml::node* node = find(key);
        if (!node) {
            return;
        }

        auto value = node->value<std::string>();
        if (!value) {
            fail(key, "expected a string");
            return;
        }
        out = *value;
    }

    /// Record a semantic error against a key of this table
    void fail(std::string_view key, const std::string& reason) {
        if (!m_error) {
            m_error = impulse_core::Error(ConfigError::invalid_value(m_section + "." + std::string(key), reason));
        }
    }

    [[nodiscard]] std::optional<impulse_core::Error>& error() { return m_error; }

private:
    [[nodiscard]] const toml::node* find(std::string_view key) const {
        return m_table ? m_table->get(key) : nullptr;
    }

    const toml::table* m_table;
    std::string m_section;
    std::optional<impulse_core::Error> m_error;
};

impulse_core::Result<SandboxConfig> from_table(const toml::table& tbl, const std::string& source) {
    SandboxConfig config = SandboxConfig::defaults();

    // [physics]
    TableReader physics(tbl["physics"].as_table(), "physics");
    physics.vec3("gravity", config.physics.gravity);
    physics.vec3("bounds", config.physics.bounds);
    if (!physics.error() && (config.physics.bounds.x <= 0.0f || config.physics.bounds.y <= 0.0f ||
                             config.physics.bounds.z <= 0.0f)) {
        physics.fail("bounds", "every extent must be positive");
    }

    // [driver]
    TableReader driver(tbl["driver"].as_table(), "driver");
    driver.number("max_step", config.driver.max_step);
    driver.number("time_scale", config.driver.time_scale);
    driver.number("fixed_frame", config.driver.fixed_frame);
    driver.number("duration_seconds", config.driver.duration_seconds);
    driver.count("spawn_count", config.driver.spawn_count);
    driver.count("seed", config.driver.seed);
    if (config.driver.max_step <= 0.0f) {
        driver.fail("max_step", "must be positive");
    }
    if (config.driver.time_scale < 0.0f) {
        driver.fail("time_scale", "must not be negative");
    }
    if (config.driver.fixed_frame <= 0.0f) {
        driver.fail("fixed_frame", "must be positive");
    }
    if (config.driver.duration_seconds < 0.0f) {
        driver.fail("duration_seconds", "must not be negative");
    }

    // [spawn]
    TableReader spawn(tbl["spawn"].as_table(), "spawn");
    spawn.number("restitution", config.spawn.restitution);
    spawn.number("friction", config.spawn.friction);
    spawn.vec3("spawn_point", config.spawn.spawn_point);
    spawn.vec3("shoot_velocity", config.spawn.shoot_velocity);
    if (config.spawn.restitution < 0.0f || config.spawn.restitution > 1.0f) {
        spawn.fail("restitution", "must be within [0, 1]");
    }
    if (config.spawn.friction < 0.0f || config.spawn.friction > 1.0f) {
        spawn.fail("friction", "must be within [0, 1]");
    }

    // [log]
    TableReader log(tbl["log"].as_table(), "log");
    std::string level = impulse_core::log_level_name(config.log.level);
    log.text("level", level);
    log.flag("console", config.log.console_enabled);
    log.flag("file", config.log.file_enabled);
    log.text("directory", config.log.log_directory);
    if (auto parsed = impulse_core::parse_log_level(level)) {
        config.log.level = *parsed;
    } else {
        log.fail("level", "unknown log level '" + level + "'");
    }

    for (TableReader* reader : {&physics, &driver, &spawn, &log}) {
        if (auto& err = reader->error()) {
            return impulse_core::Err<SandboxConfig>(std::move(err->with_context("source", source)));
        }
    }

    return config;
}

} // anonymous namespace

impulse_core::Result<SandboxConfig> parse_config(std::string_view text, std::string_view source) {
    const std::string source_name(source);
    try {
        toml::table tbl = toml::parse(text, source_name);
        return from_table(tbl, source_name);
    } catch (const toml::parse_error& err) {
        return impulse_core::Err<SandboxConfig>(
            ConfigError::parse_failed(source_name, std::string(err.description())));
    }
}

impulse_core::Result<SandboxConfig> load_config(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return impulse_core::Err<SandboxConfig>(ConfigError::file_not_found(path));
    }

    try {
        toml::table tbl = toml::parse_file(path);
        return from_table(tbl, path);
    } catch (const toml::parse_error& err) {
        return impulse_core::Err<SandboxConfig>(ConfigError::parse_failed(path, std::string(err.description())));
    }
}

} // namespace impulse_sandbox
