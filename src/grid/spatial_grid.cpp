/// @file spatial_grid.cpp
/// @brief SpatialGrid implementation

#include <habitat/grid/spatial_grid.hpp>
#include <habitat/core/log.hpp>

#include <algorithm>
#include <cstdint>
#include <stdexcept>

namespace habitat_grid {

using habitat_core::Err;
using habitat_core::Error;
using habitat_core::GridError;
using habitat_core::Result;

namespace {

constexpr GridPosition NEIGHBOR_OFFSETS[] = {
    {0, -1},  // North
    {1, 0},   // East
    {0, 1},   // South
    {-1, 0},  // West
};

/// Visit every cell of the rectangle (64-bit bounds so huge sizes cannot wrap)
template<typename F>
void for_each_cell(GridPosition pos, GridSize size, F&& func) {
    const std::int64_t x_end = static_cast<std::int64_t>(pos.x) + size.width;
    const std::int64_t y_end = static_cast<std::int64_t>(pos.y) + size.height;
    for (std::int64_t y = pos.y; y < y_end; ++y) {
        for (std::int64_t x = pos.x; x < x_end; ++x) {
            if (!func(GridPosition{static_cast<int>(x), static_cast<int>(y)})) {
                return;
            }
        }
    }
}

nlohmann::json tile_to_json(const Tile& tile) {
    return nlohmann::json{
        {"type", tile_type_name(tile.type)},
        {"occupiedBy", tile.occupant ? nlohmann::json(*tile.occupant) : nlohmann::json(nullptr)},
        {"walkable", tile.walkable},
        {"buildable", tile.buildable}
    };
}

Result<Tile> tile_from_json(const nlohmann::json& j, int x, int y) {
    if (!j.is_object()) {
        return Err<Tile>(Error(GridError::invalid_tile(x, y, "not an object")));
    }

    Tile tile;

    if (!j.contains("type") || !j["type"].is_string()) {
        return Err<Tile>(Error(GridError::invalid_tile(x, y, "missing 'type'")));
    }
    auto type = parse_tile_type(j["type"].get<std::string>());
    if (!type) {
        return Err<Tile>(Error(GridError::invalid_tile(x, y,
            "unknown tile type '" + j["type"].get<std::string>() + "'")));
    }
    tile.type = *type;

    if (j.contains("occupiedBy") && !j["occupiedBy"].is_null()) {
        if (!j["occupiedBy"].is_string()) {
            return Err<Tile>(Error(GridError::invalid_tile(x, y, "'occupiedBy' must be a string or null")));
        }
        tile.occupant = j["occupiedBy"].get<std::string>();
    }

    for (const char* flag : {"walkable", "buildable"}) {
        if (!j.contains(flag) || !j[flag].is_boolean()) {
            return Err<Tile>(Error(GridError::invalid_tile(x, y,
                std::string("missing boolean '") + flag + "'")));
        }
    }
    tile.walkable = j["walkable"].get<bool>();
    tile.buildable = j["buildable"].get<bool>();

    return tile;
}

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

SpatialGrid::SpatialGrid()
    : SpatialGrid(habitat_core::DEFAULT_WORLD_WIDTH, habitat_core::DEFAULT_WORLD_HEIGHT) {}

SpatialGrid::SpatialGrid(int width, int height)
    : m_width(width)
    , m_height(height) {
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument(GridError::invalid_dimensions(width, height).message);
    }
    m_tiles.resize(static_cast<std::size_t>(width) * static_cast<std::size_t>(height));
}

SpatialGrid::SpatialGrid(const habitat_core::SimulationConfig& config)
    : SpatialGrid(config.world_width, config.world_height) {}

Result<SpatialGrid> SpatialGrid::create(int width, int height) {
    if (width <= 0 || height <= 0) {
        return Err<SpatialGrid>(Error(GridError::invalid_dimensions(width, height)));
    }
    return SpatialGrid(width, height);
}

// =============================================================================
// Tile Access
// =============================================================================

const Tile* SpatialGrid::get_tile(GridPosition pos) const {
    if (!is_valid_position(pos)) {
        return nullptr;
    }
    return &m_tiles[index_of(pos)];
}

bool SpatialGrid::set_tile(GridPosition pos, const TilePatch& patch) {
    if (!is_valid_position(pos)) {
        return false;
    }
    patch.apply(m_tiles[index_of(pos)]);
    return true;
}

bool SpatialGrid::is_walkable(GridPosition pos) const {
    const Tile* tile = get_tile(pos);
    return tile ? tile->walkable : false;
}

bool SpatialGrid::is_buildable(GridPosition pos) const {
    const Tile* tile = get_tile(pos);
    return tile ? tile->buildable && !tile->occupant : false;
}

// =============================================================================
// Area Operations
// =============================================================================

bool SpatialGrid::is_area_available(GridPosition pos, GridSize size) const {
    bool available = true;
    for_each_cell(pos, size, [&](GridPosition cell) {
        available = is_buildable(cell);
        return available;
    });
    return available;
}

bool SpatialGrid::occupy_area(GridPosition pos, GridSize size, const std::string& entity_id) {
    if (!is_area_available(pos, size)) {
        habitat_core::grid_logger()->debug("Cannot occupy {}x{} at ({},{}) for '{}': area unavailable",
            size.width, size.height, pos.x, pos.y, entity_id);
        return false;
    }

    for_each_cell(pos, size, [&](GridPosition cell) {
        m_tiles[index_of(cell)].occupant = entity_id;
        return true;
    });
    return true;
}

void SpatialGrid::free_area(GridPosition pos, GridSize size) {
    for_each_cell(pos, size, [&](GridPosition cell) {
        if (is_valid_position(cell)) {
            m_tiles[index_of(cell)].occupant.reset();
        }
        return true;
    });
}

std::vector<const Tile*> SpatialGrid::get_tiles_in_area(GridPosition pos, GridSize size) const {
    std::vector<const Tile*> tiles;
    for_each_cell(pos, size, [&](GridPosition cell) {
        if (const Tile* tile = get_tile(cell)) {
            tiles.push_back(tile);
        }
        return true;
    });
    return tiles;
}

std::vector<const Tile*> SpatialGrid::get_neighbors(GridPosition pos) const {
    std::vector<const Tile*> neighbors;
    for (const auto& offset : NEIGHBOR_OFFSETS) {
        if (const Tile* tile = get_tile({pos.x + offset.x, pos.y + offset.y})) {
            neighbors.push_back(tile);
        }
    }
    return neighbors;
}

std::vector<GridPosition> SpatialGrid::get_neighbor_positions(GridPosition pos) const {
    std::vector<GridPosition> neighbors;
    for (const auto& offset : NEIGHBOR_OFFSETS) {
        GridPosition neighbor{pos.x + offset.x, pos.y + offset.y};
        if (is_valid_position(neighbor)) {
            neighbors.push_back(neighbor);
        }
    }
    return neighbors;
}

// =============================================================================
// Search
// =============================================================================

std::vector<GridPosition> SpatialGrid::find_tiles_by_type(TileType type) const {
    std::vector<GridPosition> positions;
    for (int y = 0; y < m_height; ++y) {
        for (int x = 0; x < m_width; ++x) {
            if (m_tiles[index_of({x, y})].type == type) {
                positions.push_back({x, y});
            }
        }
    }
    return positions;
}

std::vector<GridPosition> SpatialGrid::find_tiles_by_entity(const std::string& entity_id) const {
    std::vector<GridPosition> positions;
    for (int y = 0; y < m_height; ++y) {
        for (int x = 0; x < m_width; ++x) {
            const auto& occupant = m_tiles[index_of({x, y})].occupant;
            if (occupant && *occupant == entity_id) {
                positions.push_back({x, y});
            }
        }
    }
    return positions;
}

// =============================================================================
// Serialization
// =============================================================================

nlohmann::json SpatialGrid::serialize() const {
    nlohmann::json rows = nlohmann::json::array();
    for (int y = 0; y < m_height; ++y) {
        nlohmann::json row = nlohmann::json::array();
        for (int x = 0; x < m_width; ++x) {
            row.push_back(tile_to_json(m_tiles[index_of({x, y})]));
        }
        rows.push_back(std::move(row));
    }

    return nlohmann::json{
        {"width", m_width},
        {"height", m_height},
        {"tiles", std::move(rows)}
    };
}

Result<SpatialGrid> SpatialGrid::deserialize(const nlohmann::json& data) {
    auto reject = [](Error error) {
        habitat_core::grid_logger()->warn("Rejected grid data: {}", error.message());
        return Err<SpatialGrid>(std::move(error));
    };

    if (!data.is_object() ||
        !data.contains("width") || !data["width"].is_number_integer() ||
        !data.contains("height") || !data["height"].is_number_integer()) {
        return reject(Error(GridError::dimension_mismatch("missing integer width/height")));
    }

    auto width = data["width"].get<std::int64_t>();
    auto height = data["height"].get<std::int64_t>();
    if (width > INT32_MAX || height > INT32_MAX) {
        return reject(Error(GridError::dimension_mismatch("dimensions exceed the integer range")));
    }
    if (width <= 0 || height <= 0) {
        return reject(Error(GridError::invalid_dimensions(static_cast<int>(std::max<std::int64_t>(width, INT32_MIN)),
                                                          static_cast<int>(std::max<std::int64_t>(height, INT32_MIN)))));
    }

    if (!data.contains("tiles") || !data["tiles"].is_array()) {
        return reject(Error(GridError::dimension_mismatch("missing 'tiles' array")));
    }
    const auto& rows = data["tiles"];
    if (rows.size() != static_cast<std::size_t>(height)) {
        return reject(Error(GridError::dimension_mismatch(
            std::to_string(rows.size()) + " rows for height " + std::to_string(height))));
    }

    SpatialGrid grid(static_cast<int>(width), static_cast<int>(height));
    for (int y = 0; y < grid.m_height; ++y) {
        const auto& row = rows[static_cast<std::size_t>(y)];
        if (!row.is_array() || row.size() != static_cast<std::size_t>(width)) {
            return reject(Error(GridError::dimension_mismatch(
                "row " + std::to_string(y) + " does not have " + std::to_string(width) + " tiles")));
        }
        for (int x = 0; x < grid.m_width; ++x) {
            auto tile = tile_from_json(row[static_cast<std::size_t>(x)], x, y);
            if (!tile) {
                return reject(tile.error());
            }
            grid.m_tiles[grid.index_of({x, y})] = std::move(*tile);
        }
    }

    return grid;
}

} // namespace habitat_grid
