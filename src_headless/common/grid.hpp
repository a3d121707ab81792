#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <vector>

#include "tile.hpp"
#include "types.hpp"

// Static environment: one tile per cell, row-major. The layout never changes
// after construction, only the contents of nest and food tiles do.
class Grid {
   public:
    Grid() : width(0), height(0) {}

    // Empty grid, every cell DEFAULT
    Grid(uint32_t width, uint32_t height) : width(width), height(height) {
        tiles.reserve(static_cast<size_t>(width) * height);
        for (uint32_t y = 0; y < height; y++) {
            for (uint32_t x = 0; x < width; x++) {
                tiles.emplace_back(x, y);
            }
        }
    }

    // Custom layout, e.g. from the map editor. Tiles outside the grid are dropped.
    Grid(uint32_t width, uint32_t height, const std::vector<Tile>& layout) : Grid(width, height) {
        for (const Tile& tile : layout) {
            if (!contains(tile.position.x, tile.position.y))
                continue;
            tiles[to_index(tile.position.x, tile.position.y, width)] = tile;
        }
    }

    // Random layout: one nest, 1-3 food sources, walls and death zones.
    static Grid random(uint32_t width, uint32_t height, RNG& rng) {
        Grid grid(width, height);
        uint32_t total = width * height;
        if (total == 0)
            return grid;

        uint32_t food_tiles = static_cast<uint32_t>(rng.random_int(1, 3));
        uint32_t remaining_after_food = saturating_sub(total, food_tiles);
        uint32_t wall_tiles = 0;
        if (remaining_after_food > 0)
            wall_tiles = static_cast<uint32_t>(rng.random_int(0, static_cast<int>(total / 4)));
        uint32_t remaining_after_walls = saturating_sub(remaining_after_food, wall_tiles);
        uint32_t death_tiles = 0;
        if (remaining_after_walls > 0)
            death_tiles = static_cast<uint32_t>(rng.random_int(0, static_cast<int>(remaining_after_walls / 10)));

        uint32_t nest_x = static_cast<uint32_t>(rng.random_int(0, static_cast<int>(width) - 1));
        uint32_t nest_y = static_cast<uint32_t>(rng.random_int(0, static_cast<int>(height) - 1));
        uint32_t explorers = static_cast<uint32_t>(rng.random_int(0, 9));
        uint32_t pickers = static_cast<uint32_t>(rng.random_int(0, 9));
        uint32_t fighters = static_cast<uint32_t>(rng.random_int(0, 9));
        size_t nest_idx = to_index(nest_x, nest_y, width);
        grid.tiles[nest_idx] = Tile::nest(nest_x, nest_y, explorers, pickers, fighters);

        grid.place_items(food_tiles, nest_idx, TileType::FOOD_SOURCE, rng);
        grid.place_items(wall_tiles, nest_idx, TileType::WALL, rng);
        grid.place_items(death_tiles, nest_idx, TileType::DEATH_ZONE, rng);
        return grid;
    }

    uint32_t get_width() const { return width; }
    uint32_t get_height() const { return height; }
    const std::vector<Tile>& get_tiles() const { return tiles; }

    bool contains(uint32_t x, uint32_t y) const { return x < width && y < height; }

    const Tile* get_tile(uint32_t x, uint32_t y) const {
        if (!contains(x, y))
            return nullptr;
        return &tiles[to_index(x, y, width)];
    }

    Tile* get_mut_tile(uint32_t x, uint32_t y) {
        if (!contains(x, y))
            return nullptr;
        return &tiles[to_index(x, y, width)];
    }

    // Off-grid coordinates answer false to every query
    bool is_walkable(uint32_t x, uint32_t y) const {
        const Tile* tile = get_tile(x, y);
        return tile && tile->is_walkable();
    }

    bool is_lethal(uint32_t x, uint32_t y) const {
        const Tile* tile = get_tile(x, y);
        return tile && tile->is_lethal();
    }

    bool has_food(uint32_t x, uint32_t y) const {
        const Tile* tile = get_tile(x, y);
        return tile && tile->has_food();
    }

    bool is_nest(uint32_t x, uint32_t y) const {
        const Tile* tile = get_tile(x, y);
        return tile && tile->is_nest();
    }

    // First nest in row-major order
    std::optional<Position> get_nest_position() const {
        for (const Tile& tile : tiles) {
            if (tile.is_nest())
                return tile.position;
        }
        return std::nullopt;
    }

    std::optional<uint32_t> nest_stored_food() const {
        std::optional<Position> nest = get_nest_position();
        if (!nest)
            return std::nullopt;
        return get_tile(nest->x, nest->y)->stored_food;
    }

    // Construction paths guarantee a nest, so a missing one is a logic error
    void add_food_to_nest(uint32_t amount) {
        std::optional<Position> nest = get_nest_position();
        if (!nest)
            throw std::logic_error("add_food_to_nest: grid has no nest tile");
        get_mut_tile(nest->x, nest->y)->add_food_to_nest(amount);
    }

    std::vector<Position> get_walls_positions() const {
        std::vector<Position> walls;
        for (const Tile& tile : tiles) {
            if (tile.type == TileType::WALL)
                walls.push_back(tile.position);
        }
        return walls;
    }

    bool is_food_remaining() const {
        for (const Tile& tile : tiles) {
            if (tile.has_food())
                return true;
        }
        return false;
    }

    uint64_t total_food_remaining() const {
        uint64_t total = 0;
        for (const Tile& tile : tiles) {
            if (tile.type == TileType::FOOD_SOURCE)
                total += tile.food;
        }
        return total;
    }

    void print_grid(std::ostream& out) const {
        out << "Grid " << width << "x" << height << ":\n";
        for (uint32_t y = 0; y < height; y++) {
            for (uint32_t x = 0; x < width; x++) {
                out << tile_symbol(tiles[to_index(x, y, width)].type);
            }
            out << '\n';
        }
    }

    bool operator==(const Grid& other) const {
        return width == other.width && height == other.height && tiles == other.tiles;
    }
    bool operator!=(const Grid& other) const { return !(*this == other); }

   private:
    std::vector<Tile> tiles;
    uint32_t width;
    uint32_t height;

    static char tile_symbol(TileType type) {
        switch (type) {
            case TileType::DEFAULT:
                return '.';
            case TileType::WALL:
                return 'W';
            case TileType::DEATH_ZONE:
                return 'X';
            case TileType::FOOD_SOURCE:
                return 'F';
            case TileType::NEST:
                return 'N';
        }
        return '?';
    }

    // Rejection sampling on free cells. Gives up after count * 100 attempts,
    // so a crowded grid can end up with fewer items than requested.
    void place_items(uint32_t count, size_t forbidden_idx, TileType type, RNG& rng) {
        uint32_t placed = 0;
        uint64_t attempts = 0;
        uint64_t max_attempts = static_cast<uint64_t>(count) * 100;

        while (placed < count && attempts < max_attempts) {
            attempts++;

            uint32_t x = static_cast<uint32_t>(rng.random_int(0, static_cast<int>(width) - 1));
            uint32_t y = static_cast<uint32_t>(rng.random_int(0, static_cast<int>(height) - 1));
            size_t idx = to_index(x, y, width);

            if (idx == forbidden_idx)
                continue;
            if (tiles[idx].type != TileType::DEFAULT)
                continue;

            if (type == TileType::FOOD_SOURCE) {
                tiles[idx] = Tile::food_source(x, y, static_cast<uint32_t>(rng.random_int(100, 9999)));
            } else {
                tiles[idx] = Tile(x, y, type);
            }
            placed++;
        }
    }
};
