#pragma once

/// @file id.hpp
/// @brief Unique id generation for habitat_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <atomic>

namespace habitat_core {

// =============================================================================
// IdGenerator
// =============================================================================

/// Thread-safe monotonic counter
class IdGenerator {
public:
    /// Constructor
    IdGenerator() noexcept : m_next(1) {}

    /// Generate next value (thread-safe)
    [[nodiscard]] std::uint64_t next() noexcept {
        return m_next.fetch_add(1, std::memory_order_relaxed);
    }

    /// Generate next value formatted as "<prefix>_<n>"
    [[nodiscard]] std::string next_name(const std::string& prefix) {
        return prefix + "_" + std::to_string(next());
    }

    /// Get current count (approximate, for debugging)
    [[nodiscard]] std::uint64_t current() const noexcept {
        return m_next.load(std::memory_order_relaxed);
    }

    /// Reset generator (NOT thread-safe, use only during initialization)
    void reset() noexcept {
        m_next.store(1, std::memory_order_relaxed);
    }

private:
    std::atomic<std::uint64_t> m_next;
};

// =============================================================================
// Global Generators (Implemented in id.cpp)
// =============================================================================

/// Get the global entity id generator
IdGenerator& entity_id_generator();

/// Generate a new entity id string ("entity_<n>")
///
/// Unique within the process. Stores still check the result against their
/// own contents since callers may supply ids of the same shape.
std::string next_entity_name();

} // namespace habitat_core
