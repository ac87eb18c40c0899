/// @file error.cpp
/// @brief Error formatting for habitat_core

#include <habitat/core/error.hpp>
#include <sstream>
#include <vector>

namespace habitat_core {

namespace detail {

std::string format_entity_error(const EntityError& err) {
    std::ostringstream oss;
    oss << "[EntityError] " << err.message;

    if (!err.entity_id.empty()) {
        oss << " (entity: " << err.entity_id << ")";
    }
    if (!err.component_type.empty()) {
        oss << " (component: " << err.component_type << ")";
    }

    return oss.str();
}

std::string format_grid_error(const GridError& err) {
    std::ostringstream oss;
    oss << "[GridError] " << err.message;
    return oss.str();
}

std::string format_config_error(const ConfigError& err) {
    std::ostringstream oss;
    oss << "[ConfigError] " << err.message;

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
        } else if constexpr (std::is_same_v<T, EntityError>) {
            oss << detail::format_entity_error(err);
        } else if constexpr (std::is_same_v<T, GridError>) {
            oss << detail::format_grid_error(err);
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
template class Result<bool, Error>;
template class Result<int, Error>;
template class Result<std::string, Error>;

} // namespace habitat_core
