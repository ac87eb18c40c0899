#pragma once

/// @file spatial_grid.hpp
/// @brief Fixed-size tile grid for habitat_grid
///
/// SpatialGrid stores one Tile per cell in a flat row-major array. Dimensions
/// are fixed at construction and every coordinate argument is bounds-checked;
/// out-of-bounds access reads as absent / not walkable / not buildable and is
/// never an error.

#include "fwd.hpp"
#include "types.hpp"
#include <habitat/core/error.hpp>
#include <habitat/core/config.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace habitat_grid {

class SpatialGrid {
public:
    /// Default world size grid, every tile grass/walkable/buildable
    SpatialGrid();

    /// @throws std::invalid_argument if either dimension is not positive
    SpatialGrid(int width, int height);

    /// World size taken from the configuration
    explicit SpatialGrid(const habitat_core::SimulationConfig& config);

    /// Non-throwing construction
    [[nodiscard]] static habitat_core::Result<SpatialGrid> create(int width, int height);

    // =========================================================================
    // Dimensions
    // =========================================================================

    [[nodiscard]] int width() const noexcept { return m_width; }
    [[nodiscard]] int height() const noexcept { return m_height; }
    [[nodiscard]] GridSize dimensions() const noexcept { return GridSize{m_width, m_height}; }

    /// 0 <= x < width and 0 <= y < height
    [[nodiscard]] bool is_valid_position(GridPosition pos) const noexcept {
        return pos.x >= 0 && pos.y >= 0 && pos.x < m_width && pos.y < m_height;
    }

    // =========================================================================
    // Tile Access
    // =========================================================================

    /// @return The tile, or nullptr if out of bounds
    [[nodiscard]] const Tile* get_tile(GridPosition pos) const;

    /// Merge @p patch into the tile
    /// @return false if out of bounds
    bool set_tile(GridPosition pos, const TilePatch& patch);

    [[nodiscard]] bool is_walkable(GridPosition pos) const;

    /// Buildable flag set and no occupant
    [[nodiscard]] bool is_buildable(GridPosition pos) const;

    // =========================================================================
    // Area Operations
    // =========================================================================

    /// Every tile of the rectangle is in bounds and buildable
    /// (vacuously true for an empty rectangle)
    [[nodiscard]] bool is_area_available(GridPosition pos, GridSize size) const;

    /// Claim every tile of the rectangle for @p entity_id, all or nothing
    /// @return false (and no change) if the area is not available
    bool occupy_area(GridPosition pos, GridSize size, const std::string& entity_id);

    /// Clear the occupant of every in-bounds tile of the rectangle
    void free_area(GridPosition pos, GridSize size);

    /// In-bounds tiles of the rectangle, row by row
    [[nodiscard]] std::vector<const Tile*> get_tiles_in_area(GridPosition pos, GridSize size) const;

    /// In-bounds N, E, S, W neighbor tiles
    [[nodiscard]] std::vector<const Tile*> get_neighbors(GridPosition pos) const;

    /// In-bounds N, E, S, W neighbor positions
    [[nodiscard]] std::vector<GridPosition> get_neighbor_positions(GridPosition pos) const;

    // =========================================================================
    // Search
    // =========================================================================

    [[nodiscard]] std::vector<GridPosition> find_tiles_by_type(TileType type) const;
    [[nodiscard]] std::vector<GridPosition> find_tiles_by_entity(const std::string& entity_id) const;

    // =========================================================================
    // Serialization
    // =========================================================================

    /// {"width", "height", "tiles": tiles[y][x] = {type, occupiedBy, walkable, buildable}}
    [[nodiscard]] nlohmann::json serialize() const;

    /// Rebuild a grid from serialize() output
    ///
    /// Rejects non-positive dimensions, tile rows that disagree with them and
    /// malformed tile records.
    [[nodiscard]] static habitat_core::Result<SpatialGrid> deserialize(const nlohmann::json& data);

    bool operator==(const SpatialGrid&) const = default;

private:
    [[nodiscard]] std::size_t index_of(GridPosition pos) const noexcept {
        return static_cast<std::size_t>(pos.y) * static_cast<std::size_t>(m_width) +
               static_cast<std::size_t>(pos.x);
    }

    int m_width;
    int m_height;
    std::vector<Tile> m_tiles;
};

} // namespace habitat_grid
