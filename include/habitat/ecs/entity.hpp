#pragma once

/// @file entity.hpp
/// @brief Entity for habitat_ecs
///
/// An Entity is an id plus the components it exclusively owns, keyed by
/// component type. Entities are created and destroyed by EntityStore; once
/// deactivated an entity rejects new components for the rest of its life.

#include "fwd.hpp"
#include "component.hpp"
#include <habitat/core/error.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <unordered_map>
#include <vector>

namespace habitat_ecs {

// =============================================================================
// Entity
// =============================================================================

class Entity {
public:
    /// Create an active entity with no components
    explicit Entity(EntityId id);

    // =========================================================================
    // Identity
    // =========================================================================

    [[nodiscard]] const EntityId& id() const noexcept { return m_id; }

    /// Slot key inside the owning store (null for detached entities)
    [[nodiscard]] EntityHandle handle() const noexcept { return m_handle; }

    [[nodiscard]] bool is_active() const noexcept { return m_active; }

    // =========================================================================
    // Components
    // =========================================================================

    /// Insert or replace the component of the same type
    /// @throws habitat_core::InactiveEntityError if the entity is inactive
    void add_component(Component component);

    /// @return false if inactive or the component is absent
    bool remove_component(const ComponentType& type);

    /// Remove every component (no-op when inactive)
    void clear_components();

    [[nodiscard]] Component* get_component(const ComponentType& type);
    [[nodiscard]] const Component* get_component(const ComponentType& type) const;

    /// Typed access by the kind's tag
    template<typename T>
    [[nodiscard]] T* get() {
        Component* c = get_component(T::TAG);
        return c ? c->get_if<T>() : nullptr;
    }

    template<typename T>
    [[nodiscard]] const T* get() const {
        const Component* c = get_component(T::TAG);
        return c ? c->get_if<T>() : nullptr;
    }

    [[nodiscard]] bool has_component(const ComponentType& type) const;

    /// True if every listed type is present (vacuously true for none)
    [[nodiscard]] bool has_components(const std::vector<ComponentType>& types) const;

    /// True if at least one listed type is present
    [[nodiscard]] bool has_any_component(const std::vector<ComponentType>& types) const;

    [[nodiscard]] std::vector<ComponentType> component_types() const;
    [[nodiscard]] std::vector<const Component*> components() const;
    [[nodiscard]] std::size_t component_count() const noexcept { return m_components.size(); }

    // =========================================================================
    // Serialization
    // =========================================================================

    /// {"id": ..., "components": {tag: dump}, "active": bool}
    [[nodiscard]] nlohmann::json to_json() const;

    [[nodiscard]] static habitat_core::Result<Entity> from_json(const nlohmann::json& j);

private:
    friend class EntityStore;

    void deactivate() noexcept { m_active = false; }
    void set_handle(EntityHandle handle) noexcept { m_handle = handle; }

    EntityId m_id;
    EntityHandle m_handle;
    bool m_active = true;
    std::unordered_map<ComponentType, Component> m_components;
};

} // namespace habitat_ecs
