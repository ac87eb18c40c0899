#pragma once

/// @file grid.hpp
/// @brief Main include file for habitat_grid module

#include "fwd.hpp"
#include "types.hpp"
#include "spatial_grid.hpp"
#include "placement.hpp"

/// @namespace habitat_grid
/// @brief Tile grid with occupancy, placement search and path clearance
///
/// Example usage:
/// @code
/// habitat_grid::SpatialGrid grid(40, 30);
/// habitat_grid::GridSize footprint{3, 2};
///
/// if (auto spot = habitat_grid::closest_valid_position(grid, {10, 10}, footprint)) {
///     grid.occupy_area(*spot, footprint, "enclosure_1");
/// }
/// @endcode
