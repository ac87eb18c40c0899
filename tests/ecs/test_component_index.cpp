// habitat_ecs ComponentIndex tests

#include <catch2/catch_test_macros.hpp>
#include <habitat/ecs/component_index.hpp>

using namespace habitat_ecs;

TEST_CASE("ComponentIndex add and remove", "[ecs][index]") {
    ComponentIndex index;
    REQUIRE(index.empty());

    index.add("lion", "animal");
    index.add("zebra", "animal");
    index.add("lion", "position");
    index.add("lion", "animal");

    REQUIRE(index.type_count() == 2);
    REQUIRE(index.count("animal") == 2);
    REQUIRE(index.contains("animal", "zebra"));
    REQUIRE_FALSE(index.contains("position", "zebra"));
    REQUIRE(index.count("render") == 0);
    REQUIRE(index.entities_with("render") == nullptr);

    SECTION("empty sets are dropped") {
        index.remove("lion", "position");
        REQUIRE(index.entities_with("position") == nullptr);
        REQUIRE(index.type_count() == 1);
    }

    SECTION("removing unknown pairs is harmless") {
        index.remove("ghost", "animal");
        index.remove("lion", "render");
        REQUIRE(index.count("animal") == 2);
    }

    SECTION("clear") {
        index.clear();
        REQUIRE(index.empty());
        REQUIRE(index.types().empty());
    }
}
