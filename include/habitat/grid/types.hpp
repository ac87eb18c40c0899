#pragma once

/// @file types.hpp
/// @brief Coordinate and tile types for habitat_grid

#include "fwd.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace habitat_grid {

// =============================================================================
// Coordinates
// =============================================================================

/// Integer tile coordinate (x = column, y = row)
struct GridPosition {
    int x{0};
    int y{0};

    bool operator==(const GridPosition&) const = default;
};

/// Rectangle size in tiles
struct GridSize {
    int width{1};
    int height{1};

    bool operator==(const GridSize&) const = default;

    [[nodiscard]] bool is_empty() const noexcept { return width <= 0 || height <= 0; }
};

/// Continuous world-space coordinate
struct WorldPoint {
    float x{0};
    float y{0};

    bool operator==(const WorldPoint&) const = default;
};

/// Tile containing a world point (floor division)
[[nodiscard]] GridPosition world_to_grid(WorldPoint point, int tile_size);

/// World coordinate of a tile's top-left corner
[[nodiscard]] WorldPoint grid_to_world(GridPosition pos, int tile_size);

/// Euclidean distance between tiles
[[nodiscard]] double distance(GridPosition a, GridPosition b);

[[nodiscard]] int manhattan_distance(GridPosition a, GridPosition b) noexcept;

// =============================================================================
// TileType
// =============================================================================

enum class TileType : std::uint8_t {
    Grass,
    Path,
    Water,
    Building,
};

/// Serialized name ("grass", "path", "water", "building")
[[nodiscard]] const char* tile_type_name(TileType type);

[[nodiscard]] std::optional<TileType> parse_tile_type(const std::string& name);

// =============================================================================
// Tile
// =============================================================================

/// One grid cell. The occupant is an entity id, never a live reference.
struct Tile {
    TileType type{TileType::Grass};
    std::optional<std::string> occupant;
    bool walkable{true};
    bool buildable{true};

    bool operator==(const Tile&) const = default;

    [[nodiscard]] bool is_occupied() const noexcept { return occupant.has_value(); }
};

// =============================================================================
// TilePatch
// =============================================================================

/// Partial tile update; fields that were not set are left untouched
///
/// Example:
/// @code
/// grid.set_tile({2, 1}, TilePatch().with_walkable(false));
/// grid.set_tile({4, 4}, TilePatch().with_type(TileType::Path).without_occupant());
/// @endcode
class TilePatch {
public:
    TilePatch() = default;

    TilePatch& with_type(TileType type) {
        type_ = type;
        return *this;
    }

    TilePatch& with_walkable(bool walkable) {
        walkable_ = walkable;
        return *this;
    }

    TilePatch& with_buildable(bool buildable) {
        buildable_ = buildable;
        return *this;
    }

    TilePatch& with_occupant(std::string entity_id) {
        occupant_ = std::optional<std::string>(std::move(entity_id));
        return *this;
    }

    /// Explicitly set the occupant to none
    TilePatch& without_occupant() {
        occupant_ = std::optional<std::string>(std::nullopt);
        return *this;
    }

    /// Patch that overwrites every field with @p tile
    [[nodiscard]] static TilePatch from_tile(const Tile& tile) {
        TilePatch patch;
        patch.type_ = tile.type;
        patch.occupant_ = tile.occupant;
        patch.walkable_ = tile.walkable;
        patch.buildable_ = tile.buildable;
        return patch;
    }

    [[nodiscard]] bool is_empty() const noexcept {
        return !type_ && !occupant_ && !walkable_ && !buildable_;
    }

    void apply(Tile& tile) const {
        if (type_) tile.type = *type_;
        if (occupant_) tile.occupant = *occupant_;
        if (walkable_) tile.walkable = *walkable_;
        if (buildable_) tile.buildable = *buildable_;
    }

private:
    std::optional<TileType> type_;
    std::optional<std::optional<std::string>> occupant_;  // engaged-empty clears the occupant
    std::optional<bool> walkable_;
    std::optional<bool> buildable_;
};

} // namespace habitat_grid
