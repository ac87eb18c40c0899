#pragma once

/// @file component_index.hpp
/// @brief Component type -> entity id index for habitat_ecs
///
/// Derived data kept in sync by EntityStore. The index never retains an
/// empty set: removing the last id of a type drops the type key.

#include "fwd.hpp"

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace habitat_ecs {

class ComponentIndex {
public:
    using EntitySet = std::unordered_set<EntityId>;
    using Map = std::unordered_map<ComponentType, EntitySet>;

    /// Record that @p entity_id holds @p type (idempotent)
    void add(const EntityId& entity_id, const ComponentType& type);

    /// Forget @p entity_id under @p type; drops the type once its set is empty
    void remove(const EntityId& entity_id, const ComponentType& type);

    /// @return The id set for @p type, or nullptr if the type is unknown
    [[nodiscard]] const EntitySet* entities_with(const ComponentType& type) const;

    [[nodiscard]] bool contains(const ComponentType& type, const EntityId& entity_id) const;

    /// Number of ids registered under @p type (0 if unknown)
    [[nodiscard]] std::size_t count(const ComponentType& type) const;

    [[nodiscard]] std::vector<ComponentType> types() const;
    [[nodiscard]] std::size_t type_count() const noexcept { return m_index.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_index.empty(); }

    void clear() noexcept { m_index.clear(); }

    [[nodiscard]] const Map& entries() const noexcept { return m_index; }

private:
    Map m_index;
};

} // namespace habitat_ecs
