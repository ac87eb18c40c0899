#pragma once

/// @file ecs.hpp
/// @brief Main include file for habitat_ecs module

#include "fwd.hpp"
#include "component.hpp"
#include "entity.hpp"
#include "component_index.hpp"
#include "entity_store.hpp"
#include "query.hpp"

/// @namespace habitat_ecs
/// @brief Entities, components and indexed queries
///
/// Example usage:
/// @code
/// habitat_ecs::EntityStore store;
/// auto lion = store.create("lion_1");
/// store.add_component("lion_1", habitat_ecs::make_animal("lion", 25.0, 80.0));
/// store.add_component("lion_1", habitat_ecs::make_position(4.0f, 7.0f));
///
/// auto animals = store.query_entities(
///     habitat_ecs::ComponentQuery().all({"animal", "position"}));
/// @endcode
