/// @file entity.cpp
/// @brief Entity component ownership and serialization

#include <habitat/ecs/entity.hpp>
#include <habitat/core/log.hpp>

namespace habitat_ecs {

using habitat_core::Err;
using habitat_core::Error;
using habitat_core::ErrorCode;
using habitat_core::Result;

Entity::Entity(EntityId id)
    : m_id(std::move(id)) {}

// =============================================================================
// Components
// =============================================================================

void Entity::add_component(Component component) {
    if (!m_active) {
        auto error = habitat_core::EntityError::inactive(m_id, component.type());
        habitat_core::ecs_logger()->error("{}", error.message);
        throw habitat_core::InactiveEntityError(std::move(error));
    }

    ComponentType type = component.type();
    m_components.insert_or_assign(std::move(type), std::move(component));
}

bool Entity::remove_component(const ComponentType& type) {
    if (!m_active) {
        return false;
    }
    return m_components.erase(type) > 0;
}

void Entity::clear_components() {
    if (!m_active) {
        return;
    }
    m_components.clear();
}

Component* Entity::get_component(const ComponentType& type) {
    auto it = m_components.find(type);
    return it != m_components.end() ? &it->second : nullptr;
}

const Component* Entity::get_component(const ComponentType& type) const {
    auto it = m_components.find(type);
    return it != m_components.end() ? &it->second : nullptr;
}

bool Entity::has_component(const ComponentType& type) const {
    return m_components.find(type) != m_components.end();
}

bool Entity::has_components(const std::vector<ComponentType>& types) const {
    for (const auto& type : types) {
        if (!has_component(type)) {
            return false;
        }
    }
    return true;
}

bool Entity::has_any_component(const std::vector<ComponentType>& types) const {
    for (const auto& type : types) {
        if (has_component(type)) {
            return true;
        }
    }
    return false;
}

std::vector<ComponentType> Entity::component_types() const {
    std::vector<ComponentType> types;
    types.reserve(m_components.size());
    for (const auto& [type, component] : m_components) {
        types.push_back(type);
    }
    return types;
}

std::vector<const Component*> Entity::components() const {
    std::vector<const Component*> result;
    result.reserve(m_components.size());
    for (const auto& [type, component] : m_components) {
        result.push_back(&component);
    }
    return result;
}

// =============================================================================
// Serialization
// =============================================================================

nlohmann::json Entity::to_json() const {
    nlohmann::json components = nlohmann::json::object();
    for (const auto& [type, component] : m_components) {
        components[type] = component.to_json();
    }

    return nlohmann::json{
        {"id", m_id},
        {"components", std::move(components)},
        {"active", m_active}
    };
}

Result<Entity> Entity::from_json(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("id") || !j["id"].is_string()) {
        return Err<Entity>(Error(ErrorCode::ParseError, std::string("Entity dump has no string 'id'")));
    }

    Entity entity(j["id"].get<std::string>());
    if (entity.m_id.empty()) {
        return Err<Entity>(Error(ErrorCode::ValidationError, std::string("Entity id is empty")));
    }

    if (j.contains("components")) {
        const auto& components = j["components"];
        if (!components.is_object()) {
            return Err<Entity>(Error(ErrorCode::ParseError,
                "Entity " + entity.m_id + ": 'components' is not an object"));
        }
        for (const auto& [tag, dump] : components.items()) {
            auto component = Component::from_json(tag, dump);
            if (!component) {
                auto error = component.error();
                error.with_context("entity", entity.m_id);
                return Err<Entity>(std::move(error));
            }
            entity.m_components.insert_or_assign(tag, std::move(*component));
        }
    }

    if (j.contains("active")) {
        if (!j["active"].is_boolean()) {
            return Err<Entity>(Error(ErrorCode::ParseError,
                "Entity " + entity.m_id + ": 'active' is not a boolean"));
        }
        entity.m_active = j["active"].get<bool>();
    }

    return entity;
}

} // namespace habitat_ecs
