// habitat_grid coordinate and tile type tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <habitat/grid/types.hpp>

using namespace habitat_grid;
using Catch::Approx;

TEST_CASE("Coordinate conversion", "[grid][types]") {
    REQUIRE(world_to_grid({33.0f, 64.0f}, 32) == GridPosition{1, 2});
    REQUIRE(world_to_grid({-1.0f, 0.0f}, 32) == GridPosition{-1, 0});
    REQUIRE(grid_to_world({2, 3}, 32) == WorldPoint{64.0f, 96.0f});
}

TEST_CASE("Distances", "[grid][types]") {
    REQUIRE(distance({0, 0}, {3, 4}) == Approx(5.0));
    REQUIRE(manhattan_distance({0, 0}, {3, -4}) == 7);
    REQUIRE(manhattan_distance({2, 2}, {2, 2}) == 0);
}

TEST_CASE("Tile type names", "[grid][types]") {
    for (auto type : {TileType::Grass, TileType::Path, TileType::Water, TileType::Building}) {
        REQUIRE(parse_tile_type(tile_type_name(type)) == type);
    }
    REQUIRE_FALSE(parse_tile_type("lava").has_value());
}

TEST_CASE("TilePatch", "[grid][types]") {
    Tile tile;
    tile.occupant = "fence";

    SECTION("empty patch changes nothing") {
        Tile before = tile;
        REQUIRE(TilePatch().is_empty());
        TilePatch().apply(tile);
        REQUIRE(tile == before);
    }

    SECTION("from_tile copies every field") {
        Tile other;
        other.type = TileType::Path;
        other.walkable = false;
        TilePatch::from_tile(other).apply(tile);
        REQUIRE(tile == other);
    }

    SECTION("occupant can be cleared") {
        TilePatch().without_occupant().apply(tile);
        REQUIRE_FALSE(tile.is_occupied());
    }
}
