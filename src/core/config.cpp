/// @file config.cpp
/// @brief SimulationConfig parsing and loading

#include <habitat/core/config.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace habitat_core {

namespace {

/// Read an optional positive integer field
Result<void> read_positive_int(const nlohmann::json& section, const char* key,
                               const std::string& path, int& out) {
    if (!section.contains(key)) {
        return Ok();
    }
    const auto& value = section[key];
    if (!value.is_number_integer()) {
        return Err(Error(ConfigError::invalid_value(path, "expected an integer")));
    }
    auto v = value.get<long long>();
    if (v <= 0 || v > 1'000'000) {
        return Err(Error(ConfigError::invalid_value(path, "must be positive, got " + std::to_string(v))));
    }
    out = static_cast<int>(v);
    return Ok();
}

Result<void> read_bool(const nlohmann::json& section, const char* key,
                       const std::string& path, bool& out) {
    if (!section.contains(key)) {
        return Ok();
    }
    if (!section[key].is_boolean()) {
        return Err(Error(ConfigError::invalid_value(path, "expected a boolean")));
    }
    out = section[key].get<bool>();
    return Ok();
}

} // anonymous namespace

// =============================================================================
// SimulationConfig
// =============================================================================

Result<SimulationConfig> SimulationConfig::from_json(const nlohmann::json& j) {
    SimulationConfig config;

    if (!j.is_object()) {
        return Err<SimulationConfig>(Error(ConfigError::parse_failed("root must be an object")));
    }

    if (j.contains("world")) {
        const auto& world = j["world"];
        if (!world.is_object()) {
            return Err<SimulationConfig>(Error(ConfigError::invalid_value("world", "expected an object")));
        }
        if (auto r = read_positive_int(world, "width", "world.width", config.world_width); !r) {
            return Err<SimulationConfig>(r.error());
        }
        if (auto r = read_positive_int(world, "height", "world.height", config.world_height); !r) {
            return Err<SimulationConfig>(r.error());
        }
        if (auto r = read_positive_int(world, "tile_size", "world.tile_size", config.tile_size); !r) {
            return Err<SimulationConfig>(r.error());
        }
    }

    if (j.contains("placement")) {
        const auto& placement = j["placement"];
        if (!placement.is_object()) {
            return Err<SimulationConfig>(Error(ConfigError::invalid_value("placement", "expected an object")));
        }
        if (auto r = read_positive_int(placement, "search_distance",
                "placement.search_distance", config.placement_search_distance); !r) {
            return Err<SimulationConfig>(r.error());
        }
        if (auto r = read_positive_int(placement, "closest_search_distance",
                "placement.closest_search_distance", config.closest_search_distance); !r) {
            return Err<SimulationConfig>(r.error());
        }
    }

    if (j.contains("logging")) {
        const auto& logging = j["logging"];
        if (!logging.is_object()) {
            return Err<SimulationConfig>(Error(ConfigError::invalid_value("logging", "expected an object")));
        }

        if (logging.contains("level")) {
            if (!logging["level"].is_string()) {
                return Err<SimulationConfig>(Error(ConfigError::invalid_value("logging.level", "expected a string")));
            }
            auto name = logging["level"].get<std::string>();
            auto level = parse_log_level(name);
            if (!level) {
                return Err<SimulationConfig>(Error(ConfigError::invalid_value("logging.level", "unknown level '" + name + "'")));
            }
            config.log.level = *level;
        }
        if (auto r = read_bool(logging, "console", "logging.console", config.log.console_enabled); !r) {
            return Err<SimulationConfig>(r.error());
        }
        if (auto r = read_bool(logging, "file", "logging.file", config.log.file_enabled); !r) {
            return Err<SimulationConfig>(r.error());
        }
        if (logging.contains("directory")) {
            if (!logging["directory"].is_string()) {
                return Err<SimulationConfig>(Error(ConfigError::invalid_value("logging.directory", "expected a string")));
            }
            config.log.log_directory = logging["directory"].get<std::string>();
        }
    }

    return config;
}

Result<SimulationConfig> SimulationConfig::from_json_string(const std::string& json_str) {
    try {
        auto j = nlohmann::json::parse(json_str);
        return from_json(j);
    } catch (const nlohmann::json::exception& e) {
        return Err<SimulationConfig>(Error(ConfigError::parse_failed(e.what())));
    }
}

nlohmann::json SimulationConfig::to_json() const {
    nlohmann::json j;
    j["world"] = {
        {"width", world_width},
        {"height", world_height},
        {"tile_size", tile_size}
    };
    j["placement"] = {
        {"search_distance", placement_search_distance},
        {"closest_search_distance", closest_search_distance}
    };
    j["logging"] = {
        {"level", log_level_name(log.level)},
        {"console", log.console_enabled},
        {"file", log.file_enabled},
        {"directory", log.log_directory}
    };
    return j;
}

bool SimulationConfig::apply_environment_overrides() {
    const char* value = std::getenv(LOG_LEVEL_ENV);
    if (!value || *value == '\0') {
        return false;
    }

    auto level = parse_log_level(value);
    if (!level) {
        core_logger()->warn("Ignoring {}='{}': not a log level", LOG_LEVEL_ENV, value);
        return false;
    }

    log.level = *level;
    return true;
}

// =============================================================================
// Loading
// =============================================================================

Result<SimulationConfig> load_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<SimulationConfig>(Error(ConfigError::file_not_found(path.string())));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = SimulationConfig::from_json_string(buffer.str());
    if (!result) {
        result.error().with_context("path", path.string());
        core_logger()->warn("Failed to load config: {}", result.error().message());
        return result;
    }

    core_logger()->info("Loaded config from {} ({}x{} world)",
        path.string(), result->world_width, result->world_height);
    return result;
}

} // namespace habitat_core
