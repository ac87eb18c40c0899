// habitat_ecs query tests

#include <catch2/catch_test_macros.hpp>
#include <habitat/ecs/query.hpp>
#include <set>

using namespace habitat_ecs;

namespace {

std::set<EntityId> ids_of(const std::vector<Entity*>& entities) {
    std::set<EntityId> ids;
    for (const Entity* e : entities) {
        ids.insert(e->id());
    }
    return ids;
}

// lion: position, animal, render
// zebra: position, animal
// visitor: position, visitor
// bank: financial
void populate(EntityStore& store) {
    (void)store.create("lion");
    (void)store.create("zebra");
    (void)store.create("visitor");
    (void)store.create("bank");

    (void)store.add_component("lion", make_position(1, 1));
    (void)store.add_component("lion", make_animal("lion", 20, 90));
    (void)store.add_component("lion", make_render("lion.png"));
    (void)store.add_component("zebra", make_position(2, 2));
    (void)store.add_component("zebra", make_animal("zebra", 10, 50));
    (void)store.add_component("visitor", make_position(3, 3));
    (void)store.add_component("visitor", make_visitor(15));
    (void)store.add_component("bank", make_financial(5000, 15));
}

} // namespace

// =============================================================================
// ComponentQuery
// =============================================================================

TEST_CASE("ComponentQuery builder", "[ecs][query]") {
    ComponentQuery q;
    REQUIRE(q.is_empty());

    q.all({"position"}).any({"animal", "visitor"}).none({"render"});
    REQUIRE_FALSE(q.is_empty());
    REQUIRE(q.all_types().size() == 1);
    REQUIRE(q.any_types().size() == 2);
    REQUIRE(q.none_types().size() == 1);

    Entity zebra("zebra");
    zebra.add_component(make_position(0, 0));
    zebra.add_component(make_animal("zebra", 1, 1));
    REQUIRE(q.matches(zebra));

    zebra.add_component(make_render("z.png"));
    REQUIRE_FALSE(q.matches(zebra));

    REQUIRE(ComponentQuery().matches(Entity("bare")));
}

// =============================================================================
// QueryEngine
// =============================================================================

TEST_CASE("QueryEngine by_type", "[ecs][query]") {
    EntityStore store;
    populate(store);
    auto engine = store.queries();

    REQUIRE(ids_of(engine.by_type("animal")) == std::set<EntityId>{"lion", "zebra"});
    REQUIRE(ids_of(engine.by_type("financial")) == std::set<EntityId>{"bank"});
    REQUIRE(engine.by_type("staff").empty());
    REQUIRE(ids_of(store.entities_with_component("visitor")) == std::set<EntityId>{"visitor"});
}

TEST_CASE("QueryEngine by_all_types", "[ecs][query]") {
    EntityStore store;
    populate(store);
    auto engine = store.queries();

    REQUIRE(ids_of(engine.by_all_types({"position", "animal"})) == std::set<EntityId>{"lion", "zebra"});
    REQUIRE(ids_of(engine.by_all_types({"animal", "render"})) == std::set<EntityId>{"lion"});
    REQUIRE(engine.by_all_types({"animal", "visitor"}).empty());
    REQUIRE(engine.by_all_types({"position", "staff"}).empty());
    REQUIRE(engine.by_all_types({}).size() == 4);
    REQUIRE(ids_of(store.entities_with_components({"position", "visitor"})) == std::set<EntityId>{"visitor"});
}

TEST_CASE("QueryEngine by_all_types with a partially indexed entity", "[ecs][query]") {
    EntityStore store;
    (void)store.create("e1");
    (void)store.create("e2");
    REQUIRE(store.add_component("e1", DynamicComponent("a")));
    REQUIRE(store.add_component("e2", DynamicComponent("a")));

    SECTION("component attached directly, not registered") {
        store.get("e1")->add_component(DynamicComponent("b"));
        REQUIRE(store.entity_count_by_component("b") == 0);

        auto result = store.entities_with_components({"a", "b"});
        REQUIRE(ids_of(result) == std::set<EntityId>{"e1"});
        REQUIRE(ids_of(store.queries().by_all_types({"b", "a"})) == std::set<EntityId>{"e1"});
    }

    SECTION("no requested type indexed") {
        store.get("e1")->add_component(DynamicComponent("b"));
        REQUIRE(store.queries().by_all_types({"b"}).empty());
    }
}

TEST_CASE("QueryEngine by_any_types", "[ecs][query]") {
    EntityStore store;
    populate(store);
    auto engine = store.queries();

    REQUIRE(ids_of(engine.by_any_types({"visitor", "financial"})) == std::set<EntityId>{"visitor", "bank"});
    REQUIRE(ids_of(engine.by_any_types({"render", "staff"})) == std::set<EntityId>{"lion"});
    REQUIRE(engine.by_any_types({}).empty());
}

TEST_CASE("QueryEngine by_none_types", "[ecs][query]") {
    EntityStore store;
    populate(store);
    auto engine = store.queries();

    REQUIRE(ids_of(engine.by_none_types({"position"})) == std::set<EntityId>{"bank"});
    REQUIRE(ids_of(engine.by_none_types({"animal", "financial"})) == std::set<EntityId>{"visitor"});
    REQUIRE(engine.by_none_types({}).size() == 4);
}

TEST_CASE("QueryEngine composite query", "[ecs][query]") {
    EntityStore store;

    SECTION("all with exclusion") {
        (void)store.create("e1");
        (void)store.create("e2");
        (void)store.create("e3");
        (void)store.add_component("e1", DynamicComponent("test", {}));
        (void)store.add_component("e1", DynamicComponent("another", {}));
        (void)store.add_component("e2", DynamicComponent("test", {}));
        (void)store.add_component("e2", DynamicComponent("third", {}));
        (void)store.add_component("e3", DynamicComponent("another", {}));

        auto result = store.query_entities(ComponentQuery().all({"test"}).none({"third"}));
        REQUIRE(ids_of(result) == std::set<EntityId>{"e1"});
    }

    SECTION("all, any and none together") {
        populate(store);
        auto result = store.queries().query(
            ComponentQuery().all({"position"}).any({"animal", "visitor"}).none({"render"}));
        REQUIRE(ids_of(result) == std::set<EntityId>{"zebra", "visitor"});
    }

    SECTION("empty query returns every active entity") {
        populate(store);
        REQUIRE(store.query_entities(ComponentQuery()).size() == 4);
    }
}

TEST_CASE("Queries skip inactive entities", "[ecs][query]") {
    EntityStore store;
    populate(store);
    REQUIRE(store.deactivate("zebra"));

    auto engine = store.queries();
    REQUIRE(ids_of(engine.by_type("animal")) == std::set<EntityId>{"lion"});
    REQUIRE(ids_of(engine.by_none_types({"render"})) == std::set<EntityId>{"visitor", "bank"});
    REQUIRE(engine.query(ComponentQuery()).size() == 3);
}
