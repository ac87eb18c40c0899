#pragma once

/// @file error.hpp
/// @brief Error handling types for habitat_core
///
/// Absence and out-of-bounds conditions are ordinary outcomes and are
/// reported as false / nullptr / nullopt by the modules themselves. The types
/// here carry recoverable caller errors (Result) and the single hard-failure
/// class, InactiveEntityError.

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>

namespace habitat_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    AlreadyExists,
    InvalidArgument,
    InvalidState,
    IOError,
    ParseError,
    ValidationError,
    OutOfBounds,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::ValidationError: return "ValidationError";
        case ErrorCode::OutOfBounds: return "OutOfBounds";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Entity store errors
struct EntityError {
    enum class Kind : std::uint8_t {
        DuplicateId,     // Caller-supplied id already present in the store
        NotFound,        // No entity with that id
        InactiveEntity,  // Mutation attempted on a deactivated entity
    };

    Kind kind;
    std::string message;
    std::string entity_id;
    std::string component_type;  // For InactiveEntity

    [[nodiscard]] static EntityError duplicate_id(const std::string& id) {
        return EntityError{Kind::DuplicateId, "Entity id already exists: " + id, id, {}};
    }

    [[nodiscard]] static EntityError not_found(const std::string& id) {
        return EntityError{Kind::NotFound, "Entity not found: " + id, id, {}};
    }

    [[nodiscard]] static EntityError inactive(const std::string& id, const std::string& component) {
        return EntityError{Kind::InactiveEntity,
            "Cannot add component '" + component + "' to inactive entity " + id, id, component};
    }
};

/// Spatial grid errors
struct GridError {
    enum class Kind : std::uint8_t {
        InvalidDimensions,  // Width or height not positive
        DimensionMismatch,  // Tile rows disagree with declared dimensions
        InvalidTile,        // Tile record malformed or unknown tile type
        OutOfBounds,        // Coordinate outside the grid
    };

    Kind kind;
    std::string message;
    int x = 0;
    int y = 0;

    [[nodiscard]] static GridError invalid_dimensions(int width, int height) {
        return GridError{Kind::InvalidDimensions,
            "Invalid grid dimensions: " + std::to_string(width) + "x" + std::to_string(height),
            width, height};
    }

    [[nodiscard]] static GridError dimension_mismatch(const std::string& detail) {
        return GridError{Kind::DimensionMismatch, "Tile data does not match dimensions: " + detail, 0, 0};
    }

    [[nodiscard]] static GridError invalid_tile(int tx, int ty, const std::string& reason) {
        return GridError{Kind::InvalidTile,
            "Invalid tile at (" + std::to_string(tx) + "," + std::to_string(ty) + "): " + reason, tx, ty};
    }

    [[nodiscard]] static GridError out_of_bounds(int tx, int ty) {
        return GridError{Kind::OutOfBounds,
            "Position out of bounds: (" + std::to_string(tx) + "," + std::to_string(ty) + ")", tx, ty};
    }
};

/// Configuration errors
struct ConfigError {
    enum class Kind : std::uint8_t {
        FileNotFound,
        ParseFailed,
        InvalidValue,
    };

    Kind kind;
    std::string message;
    std::string key;  // For InvalidValue

    [[nodiscard]] static ConfigError file_not_found(const std::string& path) {
        return ConfigError{Kind::FileNotFound, "Config file not found: " + path, {}};
    }

    [[nodiscard]] static ConfigError parse_failed(const std::string& reason) {
        return ConfigError{Kind::ParseFailed, "Config parse failed: " + reason, {}};
    }

    [[nodiscard]] static ConfigError invalid_value(const std::string& k, const std::string& reason) {
        return ConfigError{Kind::InvalidValue, "Invalid config value '" + k + "': " + reason, k};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        EntityError,
        GridError,
        ConfigError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(EntityError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(GridError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(ConfigError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}

    /// Get error code
    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    /// Check error type
    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    /// Get error as specific type
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    /// Get underlying variant
    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    /// Get context value
    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    /// All context entries
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept {
        return m_context;
    }

private:
    static ErrorCode to_error_code(EntityError::Kind kind) {
        switch (kind) {
            case EntityError::Kind::DuplicateId: return ErrorCode::AlreadyExists;
            case EntityError::Kind::NotFound: return ErrorCode::NotFound;
            case EntityError::Kind::InactiveEntity: return ErrorCode::InvalidState;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(GridError::Kind kind) {
        switch (kind) {
            case GridError::Kind::InvalidDimensions: return ErrorCode::InvalidArgument;
            case GridError::Kind::DimensionMismatch: return ErrorCode::ValidationError;
            case GridError::Kind::InvalidTile: return ErrorCode::ParseError;
            case GridError::Kind::OutOfBounds: return ErrorCode::OutOfBounds;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(ConfigError::Kind kind) {
        switch (kind) {
            case ConfigError::Kind::FileNotFound: return ErrorCode::NotFound;
            case ConfigError::Kind::ParseFailed: return ErrorCode::ParseError;
            case ConfigError::Kind::InvalidValue: return ErrorCode::InvalidArgument;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// InactiveEntityError
// =============================================================================

/// Thrown when a deactivated entity is mutated.
///
/// Using an entity past its lifetime is a logic bug in the caller, so this is
/// the one condition in the simulation core that is not returned as data.
class InactiveEntityError : public std::logic_error {
public:
    explicit InactiveEntityError(EntityError error)
        : std::logic_error(error.message), m_error(std::move(error)) {}

    [[nodiscard]] const EntityError& error() const noexcept { return m_error; }
    [[nodiscard]] const std::string& entity_id() const noexcept { return m_error.entity_id; }

private:
    EntityError m_error;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Result type (value or error)
/// @tparam T Value type
/// @tparam E Error type (defaults to Error)
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    /// Success constructor
    Result(T value) : m_value(std::move(value)) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)) {}

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Get value or default
    [[nodiscard]] T value_or(T default_value) const {
        return m_value.has_value() ? *m_value : std::move(default_value);
    }

    /// Operator bool (true if ok)
    explicit operator bool() const noexcept { return m_value.has_value(); }

    /// Dereference operator (returns value)
    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

    /// Arrow operator
    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Unwrap (throws if error)
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::move(*m_value);
    }

    /// Map success value
    template<typename F>
    auto map(F&& func) -> Result<decltype(func(std::declval<T>())), E> {
        using U = decltype(func(std::declval<T>()));
        if (m_value.has_value()) {
            return Result<U, E>(func(std::move(*m_value)));
        }
        return Result<U, E>(std::move(m_error));
    }

private:
    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    /// Success constructor
    Result() : m_has_value(true) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    /// Static factory for success
    [[nodiscard]] static Result ok() { return Result(); }

    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    explicit operator bool() const noexcept { return m_has_value; }

    void unwrap() const {
        if (!m_has_value) {
            throw std::runtime_error("Result contains error");
        }
    }

private:
    E m_error;
    bool m_has_value;
};

/// Helper for creating Ok result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Helper for creating Ok void result
inline Result<void> Ok() {
    return Result<void>();
}

/// Helper for creating Err result
template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with code, kind details and context
std::string build_error_chain(const Error& error);

} // namespace habitat_core
