#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for habitat_grid

#include <cstdint>

namespace habitat_grid {

// =============================================================================
// Coordinate Types
// =============================================================================

struct GridPosition;
struct GridSize;
struct WorldPoint;

// =============================================================================
// Tile Types
// =============================================================================

enum class TileType : std::uint8_t;
struct Tile;
class TilePatch;

// =============================================================================
// Grid
// =============================================================================

class SpatialGrid;

} // namespace habitat_grid
