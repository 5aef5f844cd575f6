/// @file error.cpp
/// @brief Error formatting for impulse_core
///
/// The error system is header-only apart from the formatting helpers here
/// and explicit instantiations of the Result types used across the project.

#include <impulse/core/error.hpp>

#include <sstream>

namespace impulse_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

std::string format_geometry_error(const GeometryError& err) {
    std::ostringstream oss;
    oss << "[GeometryError] " << err.message;

    if (err.kind == GeometryError::Kind::InvalidGeometry && !err.field.empty()) {
        oss << " (shape: " << err.shape << ", field: " << err.field << ")";
    }

    return oss.str();
}

std::string format_body_error(const BodyError& err) {
    std::ostringstream oss;
    oss << "[BodyError] " << err.message;
    return oss.str();
}

std::string format_config_error(const ConfigError& err) {
    std::ostringstream oss;
    oss << "[ConfigError] " << err.message;

    if (!err.path.empty() && err.kind != ConfigError::Kind::FileNotFound) {
        oss << " (file: " << err.path << ")";
    }
    if (!err.key.empty()) {
        oss << " (key: " << err.key << ")";
    }

    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, GeometryError>) {
            oss << detail::format_geometry_error(err);
        } else if constexpr (std::is_same_v<T, BodyError>) {
            oss << detail::format_body_error(err);
        } else if constexpr (std::is_same_v<T, ConfigError>) {
            oss << detail::format_config_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << " [" << key << "=" << value << "]";
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;

} // namespace impulse_core
