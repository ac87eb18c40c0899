#pragma once

/// @file config.hpp
/// @brief Simulation configuration for habitat_core

#include "fwd.hpp"
#include "error.hpp"
#include "log.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

namespace habitat_core {

// =============================================================================
// Constants
// =============================================================================

inline constexpr int DEFAULT_WORLD_WIDTH = 100;
inline constexpr int DEFAULT_WORLD_HEIGHT = 100;
inline constexpr int DEFAULT_TILE_SIZE = 32;
inline constexpr int DEFAULT_PLACEMENT_SEARCH_DISTANCE = 5;
inline constexpr int DEFAULT_CLOSEST_SEARCH_DISTANCE = 10;

/// Environment variable overriding the log level
inline constexpr const char* LOG_LEVEL_ENV = "HABITAT_LOG_LEVEL";

// =============================================================================
// SimulationConfig
// =============================================================================

/// Session-wide settings for the simulation core
///
/// JSON layout:
/// @code
/// {
///   "world": { "width": 100, "height": 100, "tile_size": 32 },
///   "placement": { "search_distance": 5, "closest_search_distance": 10 },
///   "logging": { "level": "info", "console": true, "file": false, "directory": "logs" }
/// }
/// @endcode
/// Every key is optional; missing keys keep their defaults.
struct SimulationConfig {
    int world_width = DEFAULT_WORLD_WIDTH;
    int world_height = DEFAULT_WORLD_HEIGHT;
    int tile_size = DEFAULT_TILE_SIZE;
    int placement_search_distance = DEFAULT_PLACEMENT_SEARCH_DISTANCE;
    int closest_search_distance = DEFAULT_CLOSEST_SEARCH_DISTANCE;
    LogConfig log;

    [[nodiscard]] static Result<SimulationConfig> from_json(const nlohmann::json& j);
    [[nodiscard]] static Result<SimulationConfig> from_json_string(const std::string& json_str);
    [[nodiscard]] nlohmann::json to_json() const;

    /// Apply HABITAT_LOG_LEVEL if set to a recognised level
    /// @return true if the environment changed the configuration
    bool apply_environment_overrides();
};

/// Load a configuration file
[[nodiscard]] Result<SimulationConfig> load_config(const std::filesystem::path& path);

} // namespace habitat_core
