#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for habitat_ecs
///
/// All ECS types are declared here for header dependency management.

#include <habitat/structures/slot_map.hpp>

#include <cstdint>
#include <string>

namespace habitat_ecs {

// =============================================================================
// Component Types
// =============================================================================

/// Component type tag ("position", "animal", ...)
using ComponentType = std::string;

struct PositionComponent;
struct RenderComponent;
struct AnimalComponent;
struct EnclosureComponent;
struct VisitorComponent;
struct FinancialComponent;
class DynamicComponent;

/// Tagged union over every component kind
class Component;

// =============================================================================
// Entity Types
// =============================================================================

/// Entity identifier (opaque, unique within a store)
using EntityId = std::string;

/// Identifier plus owned components
class Entity;

/// Stale-safe reference to an entity slot inside its store
using EntityHandle = habitat_structures::SlotKey<Entity>;

// =============================================================================
// Storage and Query Types
// =============================================================================

/// Component type -> entity id index
class ComponentIndex;

/// Owner of all entities
class EntityStore;

/// Result of EntityStore::validate_consistency
enum class ViolationKind : std::uint8_t;
struct ConsistencyViolation;
struct ConsistencyReport;

/// all/any/none query description
class ComponentQuery;

/// Query view over an EntityStore
class QueryEngine;

} // namespace habitat_ecs
