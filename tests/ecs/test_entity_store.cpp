// habitat_ecs EntityStore tests

#include <catch2/catch_test_macros.hpp>
#include <habitat/ecs/entity_store.hpp>
#include <algorithm>
#include <set>
#include <string>

using namespace habitat_ecs;

namespace {

std::set<EntityId> ids_of(const std::vector<Entity*>& entities) {
    std::set<EntityId> ids;
    for (const Entity* e : entities) {
        ids.insert(e->id());
    }
    return ids;
}

} // namespace

// =============================================================================
// Lifecycle
// =============================================================================

TEST_CASE("EntityStore create", "[ecs][store]") {
    EntityStore store;

    SECTION("explicit id") {
        auto result = store.create("lion_1");
        REQUIRE(result.is_ok());
        Entity* entity = result.value();
        REQUIRE(entity->id() == "lion_1");
        REQUIRE(entity->is_active());
        REQUIRE(store.contains("lion_1"));
        REQUIRE(store.get("lion_1") == entity);
        REQUIRE(store.get(entity->handle()) == entity);
        REQUIRE(store.entity_count() == 1);
    }

    SECTION("duplicate id rejected") {
        REQUIRE(store.create("lion_1").is_ok());
        auto dup = store.create("lion_1");
        REQUIRE(dup.is_err());
        REQUIRE(dup.error().code() == habitat_core::ErrorCode::AlreadyExists);
        REQUIRE(store.entity_count() == 1);
    }

    SECTION("empty id rejected") {
        auto result = store.create("");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == habitat_core::ErrorCode::InvalidArgument);
    }

    SECTION("generated ids are unique") {
        std::set<EntityId> ids;
        for (int i = 0; i < 50; ++i) {
            auto result = store.create();
            REQUIRE(result.is_ok());
            ids.insert(result.value()->id());
        }
        REQUIRE(ids.size() == 50);
        REQUIRE(store.entity_count() == 50);
    }
}

TEST_CASE("EntityStore remove", "[ecs][store]") {
    EntityStore store;
    Entity* entity = store.create("giraffe_1").value();
    EntityHandle handle = entity->handle();
    REQUIRE(store.add_component("giraffe_1", make_position(2, 2)));
    REQUIRE(store.add_component("giraffe_1", make_animal("giraffe", 5, 70)));

    auto removed = store.remove("giraffe_1");
    REQUIRE(removed.has_value());
    REQUIRE(removed->id() == "giraffe_1");
    REQUIRE_FALSE(removed->is_active());
    REQUIRE(removed->component_count() == 2);

    REQUIRE_FALSE(store.contains("giraffe_1"));
    REQUIRE(store.get("giraffe_1") == nullptr);
    REQUIRE(store.get(handle) == nullptr);
    REQUIRE(store.entity_count_by_component("position") == 0);
    REQUIRE(store.entity_count_by_component("animal") == 0);

    REQUIRE_FALSE(store.remove("giraffe_1").has_value());
    REQUIRE_FALSE(store.remove("never_existed").has_value());

    SECTION("id is reusable after removal") {
        auto again = store.create("giraffe_1");
        REQUIRE(again.is_ok());
        REQUIRE(again.value()->handle() != handle);
    }
}

TEST_CASE("EntityStore deactivate", "[ecs][store]") {
    EntityStore store;
    (void)store.create("a");
    (void)store.create("b");
    REQUIRE(store.add_component("a", make_position(0, 0)));
    REQUIRE(store.add_component("b", make_position(1, 1)));

    REQUIRE(store.deactivate("a"));
    REQUIRE_FALSE(store.deactivate("missing"));

    REQUIRE(store.contains("a"));
    REQUIRE_FALSE(store.get("a")->is_active());
    REQUIRE(store.entity_count() == 1);
    REQUIRE(store.entity_count(true) == 2);
    REQUIRE(store.get_all().size() == 1);
    REQUIRE(store.get_all(true).size() == 2);

    REQUIRE(store.entity_count_by_component("position") == 1);
    REQUIRE(ids_of(store.entities_with_component("position")) == std::set<EntityId>{"b"});

    REQUIRE_THROWS_AS(store.add_component("a", make_render("a.png")), habitat_core::InactiveEntityError);
    REQUIRE(store.validate_consistency().valid);
}

TEST_CASE("EntityStore clear", "[ecs][store]") {
    EntityStore store;
    (void)store.create("a");
    (void)store.create("b");
    REQUIRE(store.add_component("a", make_visitor(10)));

    store.clear();

    REQUIRE(store.entity_count(true) == 0);
    REQUIRE_FALSE(store.contains("a"));
    REQUIRE(store.registered_component_types().empty());
    REQUIRE(store.create("a").is_ok());
}

// =============================================================================
// Components and Index
// =============================================================================

TEST_CASE("EntityStore component mutation keeps the index", "[ecs][store]") {
    EntityStore store;
    (void)store.create("lion");
    (void)store.create("keeper");

    SECTION("unknown entity") {
        REQUIRE_FALSE(store.add_component("ghost", make_position(0, 0)));
        REQUIRE_FALSE(store.remove_component("ghost", "position"));
        REQUIRE(store.entity_count_by_component("position") == 0);
    }

    SECTION("add registers, remove unregisters") {
        REQUIRE(store.add_component("lion", make_position(0, 0)));
        REQUIRE(store.add_component("lion", make_animal("lion", 10, 90)));
        REQUIRE(store.add_component("keeper", make_position(5, 5)));

        REQUIRE(store.entity_count_by_component("position") == 2);
        REQUIRE(store.entity_count_by_component("animal") == 1);
        REQUIRE(store.index().contains("position", "keeper"));

        REQUIRE(store.remove_component("lion", "position"));
        REQUIRE_FALSE(store.remove_component("lion", "position"));
        REQUIRE(store.entity_count_by_component("position") == 1);
        REQUIRE_FALSE(store.index().contains("position", "lion"));
    }

    SECTION("empty types disappear") {
        REQUIRE(store.add_component("lion", make_financial(1, 1)));
        REQUIRE(store.remove_component("lion", "financial"));

        auto types = store.registered_component_types();
        REQUIRE(std::find(types.begin(), types.end(), "financial") == types.end());
    }

    SECTION("mixed sequence stays consistent") {
        (void)store.create("visitor");
        REQUIRE(store.add_component("visitor", make_visitor(20)));
        REQUIRE(store.add_component("visitor", make_position(1, 1)));
        REQUIRE(store.add_component("lion", make_position(2, 2)));
        REQUIRE(store.add_component("lion", make_position(3, 3)));
        REQUIRE(store.remove_component("visitor", "visitor"));
        REQUIRE(store.deactivate("keeper"));
        REQUIRE(store.remove("lion").has_value());
        REQUIRE(store.add_component("visitor", DynamicComponent("ticket", {{"paid", true}})));

        auto report = store.validate_consistency();
        REQUIRE(report.valid);
        REQUIRE(report.violations.empty());
        REQUIRE(store.entity_count_by_component("position") == 1);
        REQUIRE(store.entity_count_by_component("ticket") == 1);
    }
}

TEST_CASE("EntityStore consistency report", "[ecs][store]") {
    EntityStore store;
    (void)store.create("e1");
    (void)store.create("e2");
    REQUIRE(store.add_component("e1", make_position(0, 0)));

    SECTION("missing entity") {
        store.register_component("ghost", "position");
        auto report = store.validate_consistency();
        REQUIRE_FALSE(report.valid);
        REQUIRE(report.count(ViolationKind::MissingEntity) == 1);
        REQUIRE(report.messages().front() ==
            "Component registry contains non-existent entity ghost for component position");
    }

    SECTION("missing component") {
        store.register_component("e2", "render");
        auto report = store.validate_consistency();
        REQUIRE(report.count(ViolationKind::MissingComponent) == 1);
        REQUIRE(report.messages().front() ==
            "Entity e2 is registered for component render but doesn't have it");
    }

    SECTION("unindexed component") {
        store.unregister_component("e1", "position");
        auto report = store.validate_consistency();
        REQUIRE(report.count(ViolationKind::UnindexedComponent) == 1);
        REQUIRE(report.violations.front().entity_id == "e1");
        REQUIRE(report.messages().front() == "Entity e1 has component position but is not registered");
    }

    SECTION("inactive entity") {
        REQUIRE(store.deactivate("e1"));
        store.register_component("e1", "position");
        auto report = store.validate_consistency();
        REQUIRE(report.count(ViolationKind::InactiveEntity) == 1);
        REQUIRE(report.messages().front() == "Entity e1 is inactive but registered for component position");
    }

    SECTION("rebuild repairs the index") {
        store.register_component("ghost", "position");
        store.register_component("e2", "render");
        store.unregister_component("e1", "position");
        REQUIRE(store.validate_consistency().violations.size() == 3);

        store.rebuild_index();
        REQUIRE(store.validate_consistency().valid);
        REQUIRE(store.entity_count_by_component("position") == 1);
        REQUIRE(store.entity_count_by_component("render") == 0);
    }

    REQUIRE(std::string(violation_kind_name(ViolationKind::MissingEntity)) == "MissingEntity");
}

// =============================================================================
// Serialization
// =============================================================================

TEST_CASE("EntityStore serialization", "[ecs][store]") {
    EntityStore store;
    (void)store.create("lion");
    (void)store.create("visitor");
    (void)store.create("retired");
    REQUIRE(store.add_component("lion", make_animal("lion", 25, 90)));
    REQUIRE(store.add_component("lion", make_position(4, 4)));
    REQUIRE(store.add_component("visitor", make_visitor(15)));
    REQUIRE(store.add_component("retired", make_position(0, 0)));
    REQUIRE(store.deactivate("retired"));

    auto dump = store.serialize();
    REQUIRE(dump.is_array());
    REQUIRE(dump.size() == 3);

    SECTION("round trip") {
        auto restored = EntityStore::deserialize(dump);
        REQUIRE(restored.is_ok());

        EntityStore& copy = restored.value();
        REQUIRE(copy.entity_count() == 2);
        REQUIRE(copy.entity_count(true) == 3);
        REQUIRE_FALSE(copy.get("retired")->is_active());
        REQUIRE(copy.get("lion")->get<AnimalComponent>()->species == "lion");
        REQUIRE(copy.entity_count_by_component("position") == 1);
        REQUIRE(copy.validate_consistency().valid);
    }

    SECTION("dynamic components keep their kind and fields") {
        REQUIRE(store.add_component("visitor", DynamicComponent("ticket", {{"foo", 1}})));
        auto restored = EntityStore::deserialize(store.serialize());
        REQUIRE(restored.is_ok());

        const Component* ticket = restored->get("visitor")->get_component("ticket");
        REQUIRE(ticket != nullptr);
        REQUIRE(ticket->holds<DynamicComponent>());
        REQUIRE(ticket->get_if<DynamicComponent>()->fields["foo"] == 1);
        REQUIRE(restored->get("visitor")->get_component("position") == nullptr);
    }

    SECTION("duplicate ids rejected") {
        dump.push_back(dump[0]);
        auto restored = EntityStore::deserialize(dump);
        REQUIRE(restored.is_err());
        REQUIRE(restored.error().code() == habitat_core::ErrorCode::AlreadyExists);
    }

    SECTION("non-array rejected") {
        REQUIRE(EntityStore::deserialize(nlohmann::json::object()).is_err());
    }
}
