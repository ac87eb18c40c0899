#pragma once

/// @file query.hpp
/// @brief Component queries for habitat_ecs
///
/// Queries select active entities by the component types they hold. The
/// ComponentIndex narrows candidates for "has type" lookups; composite
/// queries filter the active entity set clause by clause.

#include "fwd.hpp"
#include "entity_store.hpp"

#include <vector>

namespace habitat_ecs {

// =============================================================================
// ComponentQuery
// =============================================================================

/// Builder for composite queries
///
/// Clauses are applied in the order all -> any -> none; an empty clause
/// imposes no filter, so a default-constructed query matches every active
/// entity.
///
/// Example:
/// @code
/// auto query = ComponentQuery()
///     .all({"animal", "position"})
///     .none({"visitor"});
/// auto animals = store.query_entities(query);
/// @endcode
class ComponentQuery {
private:
    std::vector<ComponentType> all_;
    std::vector<ComponentType> any_;
    std::vector<ComponentType> none_;

public:
    ComponentQuery() = default;

    /// Entities must hold every listed type
    ComponentQuery& all(std::vector<ComponentType> types) {
        all_.insert(all_.end(), types.begin(), types.end());
        return *this;
    }

    /// Entities must hold at least one listed type
    ComponentQuery& any(std::vector<ComponentType> types) {
        any_.insert(any_.end(), types.begin(), types.end());
        return *this;
    }

    /// Entities must hold none of the listed types
    ComponentQuery& none(std::vector<ComponentType> types) {
        none_.insert(none_.end(), types.begin(), types.end());
        return *this;
    }

    [[nodiscard]] const std::vector<ComponentType>& all_types() const noexcept { return all_; }
    [[nodiscard]] const std::vector<ComponentType>& any_types() const noexcept { return any_; }
    [[nodiscard]] const std::vector<ComponentType>& none_types() const noexcept { return none_; }

    [[nodiscard]] bool is_empty() const noexcept {
        return all_.empty() && any_.empty() && none_.empty();
    }

    /// Check a single entity against every clause (ignores the active flag)
    [[nodiscard]] bool matches(const Entity& entity) const {
        if (!all_.empty() && !entity.has_components(all_)) {
            return false;
        }
        if (!any_.empty() && !entity.has_any_component(any_)) {
            return false;
        }
        if (!none_.empty() && entity.has_any_component(none_)) {
            return false;
        }
        return true;
    }
};

// =============================================================================
// QueryEngine
// =============================================================================

/// Lightweight query view over an EntityStore
///
/// Returned pointers are valid until the next structural mutation of the
/// store (create, remove, clear, deserialize).
class QueryEngine {
public:
    explicit QueryEngine(EntityStore& store) noexcept : m_store(store) {}

    /// Active entities registered under @p type (empty for unknown types)
    [[nodiscard]] std::vector<Entity*> by_type(const ComponentType& type) const;

    /// Active entities holding every type; no types means every active entity
    ///
    /// Candidates are seeded from the smallest indexed set among @p types and
    /// filtered by the entities' own components.
    [[nodiscard]] std::vector<Entity*> by_all_types(const std::vector<ComponentType>& types) const;

    /// Active entities holding at least one of @p types
    [[nodiscard]] std::vector<Entity*> by_any_types(const std::vector<ComponentType>& types) const;

    /// Active entities holding none of @p types
    [[nodiscard]] std::vector<Entity*> by_none_types(const std::vector<ComponentType>& types) const;

    /// Composite all/any/none query
    [[nodiscard]] std::vector<Entity*> query(const ComponentQuery& query) const;

private:
    EntityStore& m_store;
};

} // namespace habitat_ecs
