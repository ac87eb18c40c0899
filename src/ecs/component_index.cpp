/// @file component_index.cpp
/// @brief ComponentIndex implementation

#include <habitat/ecs/component_index.hpp>

namespace habitat_ecs {

void ComponentIndex::add(const EntityId& entity_id, const ComponentType& type) {
    m_index[type].insert(entity_id);
}

void ComponentIndex::remove(const EntityId& entity_id, const ComponentType& type) {
    auto it = m_index.find(type);
    if (it == m_index.end()) {
        return;
    }

    it->second.erase(entity_id);
    if (it->second.empty()) {
        m_index.erase(it);
    }
}

const ComponentIndex::EntitySet* ComponentIndex::entities_with(const ComponentType& type) const {
    auto it = m_index.find(type);
    return it != m_index.end() ? &it->second : nullptr;
}

bool ComponentIndex::contains(const ComponentType& type, const EntityId& entity_id) const {
    const EntitySet* set = entities_with(type);
    return set && set->count(entity_id) > 0;
}

std::size_t ComponentIndex::count(const ComponentType& type) const {
    const EntitySet* set = entities_with(type);
    return set ? set->size() : 0;
}

std::vector<ComponentType> ComponentIndex::types() const {
    std::vector<ComponentType> result;
    result.reserve(m_index.size());
    for (const auto& [type, ids] : m_index) {
        result.push_back(type);
    }
    return result;
}

} // namespace habitat_ecs
