#pragma once

/// @file placement.hpp
/// @brief Placement and line-of-sight checks over a SpatialGrid
///
/// Stateless functions. Nothing here mutates the grid it is given.

#include "fwd.hpp"
#include "types.hpp"
#include "spatial_grid.hpp"
#include <habitat/core/config.hpp>

#include <optional>
#include <vector>

namespace habitat_grid {

// =============================================================================
// Rectangle Geometry
// =============================================================================

/// Half-open overlap test; rectangles that only share an edge do not overlap
[[nodiscard]] bool rectangles_overlap(GridPosition pos_a, GridSize size_a,
                                      GridPosition pos_b, GridSize size_b) noexcept;

/// Half-open containment; the top-left corner is inside, the far edges are not
[[nodiscard]] bool point_in_rectangle(GridPosition point, GridPosition rect_pos,
                                      GridSize rect_size) noexcept;

/// Pure bounds arithmetic against a width x height world
[[nodiscard]] bool is_area_within_bounds(GridPosition pos, GridSize size,
                                         int world_width, int world_height) noexcept;

// =============================================================================
// Placement
// =============================================================================

/// Within bounds and every covered tile buildable and unoccupied
[[nodiscard]] bool is_placement_valid(const SpatialGrid& grid, GridPosition pos, GridSize size);

/// Expanding-ring search around @p target
///
/// For distance 1..max_distance only the perimeter of the Chebyshev ring is
/// examined (columns outer, rows inner). Every valid position of the first
/// ring with any hit is returned; larger rings are not searched.
[[nodiscard]] std::vector<GridPosition> find_valid_placement_positions(
    const SpatialGrid& grid, GridPosition target, GridSize size,
    int max_distance = habitat_core::DEFAULT_PLACEMENT_SEARCH_DISTANCE);

/// Manhattan-closest result of find_valid_placement_positions
///
/// Ties keep the first position in scan order.
[[nodiscard]] std::optional<GridPosition> closest_valid_position(
    const SpatialGrid& grid, GridPosition target, GridSize size,
    int max_distance = habitat_core::DEFAULT_CLOSEST_SEARCH_DISTANCE);

// =============================================================================
// Lines and Paths
// =============================================================================

/// Bresenham rasterization from @p start to @p end, both endpoints included
///
/// Consecutive cells are 8-connected. The cell set does not depend on the
/// direction of travel: line_positions(b, a) is line_positions(a, b) reversed.
[[nodiscard]] std::vector<GridPosition> line_positions(GridPosition start, GridPosition end);

/// World-space overload; endpoints are floored to tiles first
[[nodiscard]] std::vector<GridPosition> line_positions(WorldPoint start, WorldPoint end);

/// Every tile on the line is walkable (out-of-bounds tiles are not)
[[nodiscard]] bool is_path_clear(const SpatialGrid& grid, GridPosition start, GridPosition end);

/// Would placing a footprint at @p pos cut any segment of the given paths
///
/// Works on a copy of @p grid with the footprint marked unwalkable and
/// unbuildable; each path is checked between consecutive waypoints.
[[nodiscard]] bool would_block_essential_paths(
    const SpatialGrid& grid, GridPosition pos, GridSize size,
    const std::vector<std::vector<GridPosition>>& essential_paths);

} // namespace habitat_grid
