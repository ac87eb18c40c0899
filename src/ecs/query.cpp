/// @file query.cpp
/// @brief QueryEngine implementation

#include <habitat/ecs/query.hpp>

namespace habitat_ecs {

std::vector<Entity*> QueryEngine::by_type(const ComponentType& type) const {
    return by_all_types({type});
}

std::vector<Entity*> QueryEngine::by_all_types(const std::vector<ComponentType>& types) const {
    if (types.empty()) {
        return m_store.get_all();
    }

    // Seed from the smallest indexed set; the per-entity check below decides
    // membership, so unindexed types only narrow the result, never empty it
    const ComponentIndex::EntitySet* seed = nullptr;
    for (const auto& type : types) {
        const auto* ids = m_store.index().entities_with(type);
        if (ids && (!seed || ids->size() < seed->size())) {
            seed = ids;
        }
    }
    if (!seed) {
        return {};
    }

    std::vector<Entity*> result;
    result.reserve(seed->size());
    for (const auto& id : *seed) {
        Entity* entity = m_store.get(id);
        if (entity && entity->is_active() && entity->has_components(types)) {
            result.push_back(entity);
        }
    }
    return result;
}

std::vector<Entity*> QueryEngine::by_any_types(const std::vector<ComponentType>& types) const {
    // Unlike an empty "any" clause, holding one of zero types is impossible
    if (types.empty()) {
        return {};
    }
    return query(ComponentQuery().any(types));
}

std::vector<Entity*> QueryEngine::by_none_types(const std::vector<ComponentType>& types) const {
    return query(ComponentQuery().none(types));
}

std::vector<Entity*> QueryEngine::query(const ComponentQuery& query) const {
    std::vector<Entity*> candidates = m_store.get_all();

    std::vector<Entity*> result;
    result.reserve(candidates.size());
    for (Entity* entity : candidates) {
        if (query.matches(*entity)) {
            result.push_back(entity);
        }
    }
    return result;
}

} // namespace habitat_ecs
