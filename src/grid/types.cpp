/// @file types.cpp
/// @brief Coordinate helpers and tile type names

#include <habitat/grid/types.hpp>

#include <cmath>
#include <cstdlib>

namespace habitat_grid {

GridPosition world_to_grid(WorldPoint point, int tile_size) {
    return GridPosition{
        static_cast<int>(std::floor(point.x / static_cast<float>(tile_size))),
        static_cast<int>(std::floor(point.y / static_cast<float>(tile_size)))
    };
}

WorldPoint grid_to_world(GridPosition pos, int tile_size) {
    return WorldPoint{
        static_cast<float>(pos.x * tile_size),
        static_cast<float>(pos.y * tile_size)
    };
}

double distance(GridPosition a, GridPosition b) {
    double dx = static_cast<double>(b.x) - a.x;
    double dy = static_cast<double>(b.y) - a.y;
    return std::sqrt(dx * dx + dy * dy);
}

int manhattan_distance(GridPosition a, GridPosition b) noexcept {
    return std::abs(a.x - b.x) + std::abs(a.y - b.y);
}

const char* tile_type_name(TileType type) {
    switch (type) {
        case TileType::Grass: return "grass";
        case TileType::Path: return "path";
        case TileType::Water: return "water";
        case TileType::Building: return "building";
        default: return "unknown";
    }
}

std::optional<TileType> parse_tile_type(const std::string& name) {
    if (name == "grass") return TileType::Grass;
    if (name == "path") return TileType::Path;
    if (name == "water") return TileType::Water;
    if (name == "building") return TileType::Building;
    return std::nullopt;
}

} // namespace habitat_grid
