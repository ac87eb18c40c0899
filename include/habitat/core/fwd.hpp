#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for habitat_core module

#include <cstdint>

namespace habitat_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct EntityError;
struct GridError;
struct ConfigError;
class Error;
class InactiveEntityError;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// ID Types
// =============================================================================

class IdGenerator;

// =============================================================================
// Logging / Configuration
// =============================================================================

struct LogConfig;
struct SimulationConfig;

} // namespace habitat_core
