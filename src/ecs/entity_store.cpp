/// @file entity_store.cpp
/// @brief EntityStore implementation

#include <habitat/ecs/entity_store.hpp>
#include <habitat/ecs/query.hpp>
#include <habitat/core/id.hpp>
#include <habitat/core/log.hpp>

namespace habitat_ecs {

using habitat_core::EntityError;
using habitat_core::Err;
using habitat_core::Error;
using habitat_core::ErrorCode;
using habitat_core::Result;

// =============================================================================
// ConsistencyReport
// =============================================================================

const char* violation_kind_name(ViolationKind kind) {
    switch (kind) {
        case ViolationKind::MissingEntity: return "MissingEntity";
        case ViolationKind::InactiveEntity: return "InactiveEntity";
        case ViolationKind::MissingComponent: return "MissingComponent";
        case ViolationKind::UnindexedComponent: return "UnindexedComponent";
        default: return "Unknown";
    }
}

std::vector<std::string> ConsistencyReport::messages() const {
    std::vector<std::string> result;
    result.reserve(violations.size());
    for (const auto& v : violations) {
        result.push_back(v.message);
    }
    return result;
}

std::size_t ConsistencyReport::count(ViolationKind kind) const {
    std::size_t n = 0;
    for (const auto& v : violations) {
        if (v.kind == kind) {
            ++n;
        }
    }
    return n;
}

// =============================================================================
// Lifecycle
// =============================================================================

Entity* EntityStore::insert(Entity entity) {
    EntityId id = entity.id();
    EntityHandle handle = m_entities.insert(std::move(entity));
    m_lookup[id] = handle;

    Entity* stored = m_entities.get(handle);
    stored->set_handle(handle);
    return stored;
}

Result<Entity*> EntityStore::create() {
    EntityId id = habitat_core::next_entity_name();
    while (contains(id)) {
        id = habitat_core::next_entity_name();
    }
    return create(id);
}

Result<Entity*> EntityStore::create(const EntityId& id) {
    if (id.empty()) {
        return Err<Entity*>(Error(ErrorCode::InvalidArgument, std::string("Entity id must not be empty")));
    }
    if (contains(id)) {
        habitat_core::ecs_logger()->warn("Rejected duplicate entity id '{}'", id);
        return Err<Entity*>(Error(EntityError::duplicate_id(id)));
    }

    Entity* entity = insert(Entity(id));
    habitat_core::ecs_logger()->debug("Created entity '{}'", id);
    return entity;
}

void EntityStore::unregister_all(const Entity& entity) {
    for (const auto& type : entity.component_types()) {
        m_index.remove(entity.id(), type);
    }
}

std::optional<Entity> EntityStore::remove(const EntityId& id) {
    auto it = m_lookup.find(id);
    if (it == m_lookup.end()) {
        return std::nullopt;
    }

    EntityHandle handle = it->second;
    Entity* entity = m_entities.get(handle);
    unregister_all(*entity);
    entity->deactivate();

    m_lookup.erase(it);
    std::optional<Entity> removed = m_entities.remove(handle);
    habitat_core::ecs_logger()->debug("Removed entity '{}'", id);
    return removed;
}

bool EntityStore::deactivate(const EntityId& id) {
    Entity* entity = get(id);
    if (!entity) {
        return false;
    }

    unregister_all(*entity);
    entity->deactivate();
    habitat_core::ecs_logger()->debug("Deactivated entity '{}'", id);
    return true;
}

void EntityStore::clear() {
    for (auto [handle, entity] : m_entities) {
        entity.deactivate();
    }

    std::size_t count = m_entities.size();
    m_entities.clear();
    m_lookup.clear();
    m_index.clear();
    habitat_core::ecs_logger()->debug("Cleared {} entities", count);
}

// =============================================================================
// Lookup
// =============================================================================

Entity* EntityStore::get(const EntityId& id) {
    auto it = m_lookup.find(id);
    return it != m_lookup.end() ? m_entities.get(it->second) : nullptr;
}

const Entity* EntityStore::get(const EntityId& id) const {
    auto it = m_lookup.find(id);
    return it != m_lookup.end() ? m_entities.get(it->second) : nullptr;
}

Entity* EntityStore::get(EntityHandle handle) {
    return m_entities.get(handle);
}

const Entity* EntityStore::get(EntityHandle handle) const {
    return m_entities.get(handle);
}

bool EntityStore::contains(const EntityId& id) const {
    return m_lookup.find(id) != m_lookup.end();
}

std::vector<Entity*> EntityStore::get_all(bool include_inactive) {
    std::vector<Entity*> result;
    result.reserve(m_entities.size());
    for (auto [handle, entity] : m_entities) {
        if (include_inactive || entity.is_active()) {
            result.push_back(&entity);
        }
    }
    return result;
}

std::vector<const Entity*> EntityStore::get_all(bool include_inactive) const {
    std::vector<const Entity*> result;
    result.reserve(m_entities.size());
    for (auto [handle, entity] : m_entities) {
        if (include_inactive || entity.is_active()) {
            result.push_back(&entity);
        }
    }
    return result;
}

std::size_t EntityStore::entity_count(bool include_inactive) const {
    if (include_inactive) {
        return m_entities.size();
    }

    std::size_t count = 0;
    for (auto [handle, entity] : m_entities) {
        if (entity.is_active()) {
            ++count;
        }
    }
    return count;
}

// =============================================================================
// Components
// =============================================================================

bool EntityStore::add_component(const EntityId& id, Component component) {
    Entity* entity = get(id);
    if (!entity) {
        return false;
    }

    ComponentType type = component.type();
    entity->add_component(std::move(component));
    m_index.add(id, type);
    return true;
}

bool EntityStore::remove_component(const EntityId& id, const ComponentType& type) {
    Entity* entity = get(id);
    if (!entity) {
        return false;
    }

    if (!entity->remove_component(type)) {
        return false;
    }
    m_index.remove(id, type);
    return true;
}

// =============================================================================
// Index
// =============================================================================

void EntityStore::register_component(const EntityId& id, const ComponentType& type) {
    m_index.add(id, type);
}

void EntityStore::unregister_component(const EntityId& id, const ComponentType& type) {
    m_index.remove(id, type);
}

std::vector<ComponentType> EntityStore::registered_component_types() const {
    return m_index.types();
}

std::size_t EntityStore::entity_count_by_component(const ComponentType& type) const {
    return m_index.count(type);
}

void EntityStore::rebuild_index() {
    m_index.clear();

    for (auto [handle, entity] : m_entities) {
        if (!entity.is_active()) {
            continue;
        }
        for (const auto& type : entity.component_types()) {
            m_index.add(entity.id(), type);
        }
    }

    habitat_core::ecs_logger()->info("Rebuilt component index: {} types over {} entities",
        m_index.type_count(), m_entities.size());
}

ConsistencyReport EntityStore::validate_consistency() const {
    ConsistencyReport report;

    auto record = [&report](ViolationKind kind, const EntityId& id, const ComponentType& type,
                            std::string message) {
        habitat_core::log_structured(spdlog::level::warn, "habitat_ecs", message, {
            {"kind", violation_kind_name(kind)},
            {"entity", id},
            {"component", type}
        });
        report.violations.push_back(ConsistencyViolation{kind, id, type, std::move(message)});
    };

    // Every indexed id must name an active entity holding the component
    for (const auto& [type, ids] : m_index.entries()) {
        for (const auto& id : ids) {
            const Entity* entity = get(id);
            if (!entity) {
                record(ViolationKind::MissingEntity, id, type,
                    "Component registry contains non-existent entity " + id + " for component " + type);
                continue;
            }
            if (!entity->is_active()) {
                record(ViolationKind::InactiveEntity, id, type,
                    "Entity " + id + " is inactive but registered for component " + type);
            }
            if (!entity->has_component(type)) {
                record(ViolationKind::MissingComponent, id, type,
                    "Entity " + id + " is registered for component " + type + " but doesn't have it");
            }
        }
    }

    // Every component of an active entity must be indexed
    for (auto [handle, entity] : m_entities) {
        if (!entity.is_active()) {
            continue;
        }
        for (const auto& type : entity.component_types()) {
            if (!m_index.contains(type, entity.id())) {
                record(ViolationKind::UnindexedComponent, entity.id(), type,
                    "Entity " + entity.id() + " has component " + type + " but is not registered");
            }
        }
    }

    report.valid = report.violations.empty();
    return report;
}

// =============================================================================
// Queries
// =============================================================================

QueryEngine EntityStore::queries() {
    return QueryEngine(*this);
}

std::vector<Entity*> EntityStore::entities_with_component(const ComponentType& type) {
    return queries().by_type(type);
}

std::vector<Entity*> EntityStore::entities_with_components(const std::vector<ComponentType>& types) {
    return queries().by_all_types(types);
}

std::vector<Entity*> EntityStore::query_entities(const ComponentQuery& query) {
    return queries().query(query);
}

// =============================================================================
// Serialization
// =============================================================================

nlohmann::json EntityStore::serialize() const {
    nlohmann::json result = nlohmann::json::array();
    for (auto [handle, entity] : m_entities) {
        result.push_back(entity.to_json());
    }
    return result;
}

Result<EntityStore> EntityStore::deserialize(const nlohmann::json& data) {
    if (!data.is_array()) {
        return Err<EntityStore>(Error(ErrorCode::ParseError, std::string("Entity store dump must be an array")));
    }

    EntityStore store;
    for (const auto& dump : data) {
        auto entity = Entity::from_json(dump);
        if (!entity) {
            return Err<EntityStore>(entity.error());
        }
        if (store.contains(entity->id())) {
            habitat_core::ecs_logger()->warn("Rejected entity store dump: duplicate id '{}'", entity->id());
            return Err<EntityStore>(Error(EntityError::duplicate_id(entity->id())));
        }
        store.insert(std::move(*entity));
    }

    store.rebuild_index();
    return store;
}

} // namespace habitat_ecs
