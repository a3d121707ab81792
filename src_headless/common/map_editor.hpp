#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "tile.hpp"
#include "types.hpp"

// Food placed by the editor on each food tile
#define EDITOR_FOOD_AMOUNT 1000
// Capacity hints given to an edited nest
#define EDITOR_NEST_CAPACITY 10

// Editable layout behind the viewer's editor screen. Produces the tile list
// for a custom AntsGameManager.
class MapEditor {
   public:
    MapEditor(uint32_t width, uint32_t height)
        : width(width),
          height(height),
          cells(static_cast<size_t>(width) * height, TileType::DEFAULT),
          selected(TileType::WALL),
          nest_count(0) {}

    uint32_t get_width() const { return width; }
    uint32_t get_height() const { return height; }
    uint32_t get_nest_count() const { return nest_count; }

    TileType get_selected() const { return selected; }
    void select(TileType type) { selected = type; }

    TileType get_tile(uint32_t x, uint32_t y) const {
        if (x >= width || y >= height)
            return TileType::DEFAULT;
        return cells[to_index(x, y, width)];
    }

    void set_tile(uint32_t x, uint32_t y, TileType type) {
        if (x >= width || y >= height)
            return;

        TileType& cell = cells[to_index(x, y, width)];
        if (cell == TileType::NEST && type != TileType::NEST)
            nest_count--;
        if (cell != TileType::NEST && type == TileType::NEST)
            nest_count++;
        cell = type;
    }

    void paint(uint32_t x, uint32_t y) { set_tile(x, y, selected); }

    // Filling with nests would make the map invalid, so only (0, 0) gets one
    void fill_all(TileType type) {
        for (uint32_t y = 0; y < height; y++) {
            for (uint32_t x = 0; x < width; x++) {
                set_tile(x, y, type == TileType::NEST ? TileType::DEFAULT : type);
            }
        }
        if (type == TileType::NEST)
            set_tile(0, 0, TileType::NEST);
    }

    void clear() { fill_all(TileType::DEFAULT); }

    bool is_valid() const { return get_validation_error().empty(); }

    // Empty when the layout can be launched
    std::string get_validation_error() const {
        if (nest_count == 0)
            return "Place 1 nest";
        if (nest_count > 1)
            return "Too many nests (" + std::to_string(nest_count) + "/1)";

        for (TileType type : cells) {
            if (type == TileType::FOOD_SOURCE)
                return "";
        }
        return "Place some food";
    }

    std::vector<Tile> to_tiles() const {
        std::vector<Tile> tiles;
        tiles.reserve(cells.size());
        for (uint32_t y = 0; y < height; y++) {
            for (uint32_t x = 0; x < width; x++) {
                TileType type = cells[to_index(x, y, width)];
                switch (type) {
                    case TileType::NEST:
                        tiles.push_back(Tile::nest(x, y, EDITOR_NEST_CAPACITY, EDITOR_NEST_CAPACITY,
                                                   EDITOR_NEST_CAPACITY));
                        break;
                    case TileType::FOOD_SOURCE:
                        tiles.push_back(Tile::food_source(x, y, EDITOR_FOOD_AMOUNT));
                        break;
                    case TileType::DEFAULT:
                    case TileType::WALL:
                    case TileType::DEATH_ZONE:
                        tiles.emplace_back(x, y, type);
                        break;
                }
            }
        }
        return tiles;
    }

   private:
    uint32_t width;
    uint32_t height;
    std::vector<TileType> cells;
    TileType selected;
    uint32_t nest_count;
};
