/// @file placement.cpp
/// @brief Placement search and Bresenham line checks

#include <habitat/grid/placement.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>

namespace habitat_grid {

namespace {

/// Raw Bresenham walk from (x0, y0) to (x1, y1); steps in 64-bit so spans
/// wider than INT_MAX do not overflow
std::vector<GridPosition> bresenham(std::int64_t x0, std::int64_t y0, std::int64_t x1, std::int64_t y1) {
    const std::int64_t dx = x1 > x0 ? x1 - x0 : x0 - x1;
    const std::int64_t dy = y1 > y0 ? y1 - y0 : y0 - y1;
    const std::int64_t sx = x0 < x1 ? 1 : -1;
    const std::int64_t sy = y0 < y1 ? 1 : -1;
    std::int64_t err = dx - dy;

    std::vector<GridPosition> positions;
    positions.reserve(static_cast<std::size_t>(std::max(dx, dy)) + 1);

    while (true) {
        positions.push_back({static_cast<int>(x0), static_cast<int>(y0)});
        if (x0 == x1 && y0 == y1) {
            break;
        }

        const std::int64_t e2 = 2 * err;
        if (e2 > -dy) {
            err -= dy;
            x0 += sx;
        }
        if (e2 < dx) {
            err += dx;
            y0 += sy;
        }
    }

    return positions;
}

} // anonymous namespace

// =============================================================================
// Rectangle Geometry
// =============================================================================

bool rectangles_overlap(GridPosition pos_a, GridSize size_a,
                        GridPosition pos_b, GridSize size_b) noexcept {
    const std::int64_t a_right = static_cast<std::int64_t>(pos_a.x) + size_a.width;
    const std::int64_t a_bottom = static_cast<std::int64_t>(pos_a.y) + size_a.height;
    const std::int64_t b_right = static_cast<std::int64_t>(pos_b.x) + size_b.width;
    const std::int64_t b_bottom = static_cast<std::int64_t>(pos_b.y) + size_b.height;

    return !(a_right <= pos_b.x || b_right <= pos_a.x ||
             a_bottom <= pos_b.y || b_bottom <= pos_a.y);
}

bool point_in_rectangle(GridPosition point, GridPosition rect_pos, GridSize rect_size) noexcept {
    return point.x >= rect_pos.x &&
           point.x < static_cast<std::int64_t>(rect_pos.x) + rect_size.width &&
           point.y >= rect_pos.y &&
           point.y < static_cast<std::int64_t>(rect_pos.y) + rect_size.height;
}

bool is_area_within_bounds(GridPosition pos, GridSize size,
                           int world_width, int world_height) noexcept {
    return pos.x >= 0 &&
           pos.y >= 0 &&
           static_cast<std::int64_t>(pos.x) + size.width <= world_width &&
           static_cast<std::int64_t>(pos.y) + size.height <= world_height;
}

// =============================================================================
// Placement
// =============================================================================

bool is_placement_valid(const SpatialGrid& grid, GridPosition pos, GridSize size) {
    if (!is_area_within_bounds(pos, size, grid.width(), grid.height())) {
        return false;
    }
    return grid.is_area_available(pos, size);
}

std::vector<GridPosition> find_valid_placement_positions(
    const SpatialGrid& grid, GridPosition target, GridSize size, int max_distance) {
    std::vector<GridPosition> valid;

    for (int d = 1; d <= max_distance; ++d) {
        for (int dx = -d; dx <= d; ++dx) {
            for (int dy = -d; dy <= d; ++dy) {
                // Perimeter of the ring only
                if (std::abs(dx) != d && std::abs(dy) != d) {
                    continue;
                }

                const std::int64_t cx = static_cast<std::int64_t>(target.x) + dx;
                const std::int64_t cy = static_cast<std::int64_t>(target.y) + dy;
                if (cx < std::numeric_limits<int>::min() || cx > std::numeric_limits<int>::max() ||
                    cy < std::numeric_limits<int>::min() || cy > std::numeric_limits<int>::max()) {
                    continue;
                }

                GridPosition candidate{static_cast<int>(cx), static_cast<int>(cy)};
                if (is_placement_valid(grid, candidate, size)) {
                    valid.push_back(candidate);
                }
            }
        }

        if (!valid.empty()) {
            break;
        }
    }

    return valid;
}

std::optional<GridPosition> closest_valid_position(
    const SpatialGrid& grid, GridPosition target, GridSize size, int max_distance) {
    auto candidates = find_valid_placement_positions(grid, target, size, max_distance);
    if (candidates.empty()) {
        return std::nullopt;
    }

    GridPosition closest = candidates.front();
    int closest_distance = manhattan_distance(closest, target);
    for (std::size_t i = 1; i < candidates.size(); ++i) {
        int d = manhattan_distance(candidates[i], target);
        if (d < closest_distance) {
            closest_distance = d;
            closest = candidates[i];
        }
    }
    return closest;
}

// =============================================================================
// Lines and Paths
// =============================================================================

std::vector<GridPosition> line_positions(GridPosition start, GridPosition end) {
    // Always rasterize from the lexicographically smaller endpoint so both
    // directions visit the same cells
    const bool swapped = end.x < start.x || (end.x == start.x && end.y < start.y);
    if (!swapped) {
        return bresenham(start.x, start.y, end.x, end.y);
    }

    auto positions = bresenham(end.x, end.y, start.x, start.y);
    std::reverse(positions.begin(), positions.end());
    return positions;
}

std::vector<GridPosition> line_positions(WorldPoint start, WorldPoint end) {
    return line_positions(
        GridPosition{static_cast<int>(std::floor(start.x)), static_cast<int>(std::floor(start.y))},
        GridPosition{static_cast<int>(std::floor(end.x)), static_cast<int>(std::floor(end.y))});
}

bool is_path_clear(const SpatialGrid& grid, GridPosition start, GridPosition end) {
    for (const auto& pos : line_positions(start, end)) {
        if (!grid.is_walkable(pos)) {
            return false;
        }
    }
    return true;
}

bool would_block_essential_paths(
    const SpatialGrid& grid, GridPosition pos, GridSize size,
    const std::vector<std::vector<GridPosition>>& essential_paths) {
    if (essential_paths.empty()) {
        return false;
    }

    SpatialGrid simulated = grid;
    const auto blocked = TilePatch().with_walkable(false).with_buildable(false);
    // Only the in-bounds part of the footprint can change anything
    const auto x_begin = std::max<std::int64_t>(pos.x, 0);
    const auto y_begin = std::max<std::int64_t>(pos.y, 0);
    const auto x_end = std::min<std::int64_t>(static_cast<std::int64_t>(pos.x) + size.width, grid.width());
    const auto y_end = std::min<std::int64_t>(static_cast<std::int64_t>(pos.y) + size.height, grid.height());
    for (auto y = y_begin; y < y_end; ++y) {
        for (auto x = x_begin; x < x_end; ++x) {
            simulated.set_tile({static_cast<int>(x), static_cast<int>(y)}, blocked);
        }
    }

    for (const auto& path : essential_paths) {
        for (std::size_t i = 0; i + 1 < path.size(); ++i) {
            if (!is_path_clear(simulated, path[i], path[i + 1])) {
                return true;
            }
        }
    }
    return false;
}

} // namespace habitat_grid
