#pragma once

/// @file entity_store.hpp
/// @brief EntityStore for habitat_ecs
///
/// The store owns every entity and keeps the ComponentIndex in sync with the
/// components of its active entities. Entities live in a SlotMap so handles
/// stay stale-safe across removal and slot reuse; an id map provides lookup by
/// string id.
///
/// The index invariant (index[T] == {active e : e has T}) holds after every
/// store-level mutation. The low-level register_component /
/// unregister_component primitives, and components added to an entity
/// directly, can break it; validate_consistency reports every violation and
/// rebuild_index restores it.

#include "fwd.hpp"
#include "entity.hpp"
#include "component_index.hpp"
#include <habitat/core/error.hpp>
#include <habitat/structures/slot_map.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace habitat_ecs {

// =============================================================================
// Consistency Report
// =============================================================================

enum class ViolationKind : std::uint8_t {
    MissingEntity,       // Indexed id has no entity in the store
    InactiveEntity,      // Indexed id belongs to a deactivated entity
    MissingComponent,    // Indexed entity lacks the component it is indexed under
    UnindexedComponent,  // Active entity holds a component the index does not list
};

[[nodiscard]] const char* violation_kind_name(ViolationKind kind);

struct ConsistencyViolation {
    ViolationKind kind;
    EntityId entity_id;
    ComponentType component_type;
    std::string message;
};

struct ConsistencyReport {
    bool valid = true;
    std::vector<ConsistencyViolation> violations;

    [[nodiscard]] std::vector<std::string> messages() const;
    [[nodiscard]] std::size_t count(ViolationKind kind) const;
};

// =============================================================================
// EntityStore
// =============================================================================

class EntityStore {
public:
    EntityStore() = default;

    EntityStore(EntityStore&&) noexcept = default;
    EntityStore& operator=(EntityStore&&) noexcept = default;
    EntityStore(const EntityStore&) = delete;
    EntityStore& operator=(const EntityStore&) = delete;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// Create an active entity with a generated id
    [[nodiscard]] habitat_core::Result<Entity*> create();

    /// Create an active entity with a caller-supplied id
    /// @return EntityError::DuplicateId if the id is already present
    [[nodiscard]] habitat_core::Result<Entity*> create(const EntityId& id);

    /// Unregister every component, deactivate and evict the entity
    /// @return The evicted record, or nullopt if no such entity
    std::optional<Entity> remove(const EntityId& id);

    /// Unregister every component and deactivate, keeping the record
    /// @return false if no such entity
    bool deactivate(const EntityId& id);

    /// Deactivate and drop every entity and empty the index
    void clear();

    // =========================================================================
    // Lookup
    // =========================================================================

    /// Lookup by id (does not filter by active state)
    [[nodiscard]] Entity* get(const EntityId& id);
    [[nodiscard]] const Entity* get(const EntityId& id) const;

    /// Lookup by handle (nullptr once the entity was removed)
    [[nodiscard]] Entity* get(EntityHandle handle);
    [[nodiscard]] const Entity* get(EntityHandle handle) const;

    [[nodiscard]] bool contains(const EntityId& id) const;

    [[nodiscard]] std::vector<Entity*> get_all(bool include_inactive = false);
    [[nodiscard]] std::vector<const Entity*> get_all(bool include_inactive = false) const;

    [[nodiscard]] std::size_t entity_count(bool include_inactive = false) const;

    // =========================================================================
    // Components
    // =========================================================================

    /// Insert or replace a component and register it in the index
    /// @return false if no such entity
    /// @throws habitat_core::InactiveEntityError if the entity is inactive
    bool add_component(const EntityId& id, Component component);

    /// Remove a component and unregister it
    /// @return false if the entity is unknown, inactive or lacks the component
    bool remove_component(const EntityId& id, const ComponentType& type);

    // =========================================================================
    // Index
    // =========================================================================

    /// Low-level index mutators (no entity checks)
    void register_component(const EntityId& id, const ComponentType& type);
    void unregister_component(const EntityId& id, const ComponentType& type);

    [[nodiscard]] std::vector<ComponentType> registered_component_types() const;
    [[nodiscard]] std::size_t entity_count_by_component(const ComponentType& type) const;

    [[nodiscard]] const ComponentIndex& index() const noexcept { return m_index; }

    /// Discard the index and repopulate it from the active entities
    void rebuild_index();

    /// Check both directions of the index invariant, collecting every violation
    [[nodiscard]] ConsistencyReport validate_consistency() const;

    // =========================================================================
    // Queries (forwarded to QueryEngine)
    // =========================================================================

    [[nodiscard]] QueryEngine queries();

    [[nodiscard]] std::vector<Entity*> entities_with_component(const ComponentType& type);
    [[nodiscard]] std::vector<Entity*> entities_with_components(const std::vector<ComponentType>& types);
    [[nodiscard]] std::vector<Entity*> query_entities(const ComponentQuery& query);

    // =========================================================================
    // Serialization
    // =========================================================================

    /// Array of entity dumps (inactive records included)
    [[nodiscard]] nlohmann::json serialize() const;

    /// Rebuild a store from serialize() output; the index is rebuilt
    [[nodiscard]] static habitat_core::Result<EntityStore> deserialize(const nlohmann::json& data);

private:
    Entity* insert(Entity entity);
    void unregister_all(const Entity& entity);

    habitat_structures::SlotMap<Entity> m_entities;
    std::unordered_map<EntityId, EntityHandle> m_lookup;
    ComponentIndex m_index;
};

} // namespace habitat_ecs
