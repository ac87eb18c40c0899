#pragma once

/// @file log.hpp
/// @brief Named spdlog loggers for the habitat modules

#include <spdlog/spdlog.h>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace habitat_core {

// =============================================================================
// Log Configuration
// =============================================================================

/// Sink and level settings shared by every habitat logger
struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;
    std::size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    std::size_t max_files = 5;
    spdlog::level::level_enum level = spdlog::level::info;
};

/// Apply @p config; loggers created earlier are rebuilt with the new sinks
void configure_logging(const LogConfig& config);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger using the current configuration
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

std::shared_ptr<spdlog::logger> core_logger();
std::shared_ptr<spdlog::logger> ecs_logger();
std::shared_ptr<spdlog::logger> grid_logger();

// =============================================================================
// Levels
// =============================================================================

/// Set the level of every habitat logger and of loggers created later
void set_global_log_level(spdlog::level::level_enum level);

/// Accepts the spdlog names plus "warning", "err" and "fatal"
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Structured Logging
// =============================================================================

/// Log @p message followed by {key="value", ...} on the named logger
void log_structured(
    spdlog::level::level_enum level,
    const std::string& logger_name,
    const std::string& message,
    const std::map<std::string, std::string>& fields);

} // namespace habitat_core
