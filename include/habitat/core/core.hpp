#pragma once

/// @file core.hpp
/// @brief Main include file for habitat_core module
///
/// This header includes all habitat_core components in dependency order.

// Forward declarations
#include "fwd.hpp"

// Core types
#include "error.hpp"
#include "id.hpp"

// Logging and configuration
#include "log.hpp"
#include "config.hpp"

/// @namespace habitat_core
/// @brief Shared infrastructure for the simulation core
///
/// - **Error Handling**: Result<T> with domain error kinds
/// - **Identifiers**: process-unique entity id strings
/// - **Logging**: named spdlog loggers per subsystem
/// - **Configuration**: SimulationConfig loaded from JSON
