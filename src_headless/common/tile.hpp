#pragma once

#include <cstdint>
#include <optional>

#include "types.hpp"

// Tile variants
enum class TileType : int {
    DEFAULT = 0,
    WALL = 1,
    NEST = 2,
    FOOD_SOURCE = 3,
    DEATH_ZONE = 4
};

inline const char* tile_type_name(TileType type) {
    switch (type) {
        case TileType::DEFAULT:
            return "Default";
        case TileType::WALL:
            return "Wall";
        case TileType::NEST:
            return "Nest";
        case TileType::FOOD_SOURCE:
            return "Food";
        case TileType::DEATH_ZONE:
            return "Danger";
    }
    return "?";
}

// One grid cell. Only the fields of the active variant are meaningful:
// food for FOOD_SOURCE, stored_food and the capacity hints for NEST.
struct Tile {
    Position position;
    TileType type = TileType::DEFAULT;
    uint32_t food = 0;
    uint32_t stored_food = 0;
    uint32_t explorer_capacity = 0;
    uint32_t picker_capacity = 0;
    uint32_t fighter_capacity = 0;

    Tile() {}
    Tile(uint32_t x, uint32_t y, TileType type = TileType::DEFAULT) : position(x, y), type(type) {}

    static Tile food_source(uint32_t x, uint32_t y, uint32_t amount) {
        Tile tile(x, y, TileType::FOOD_SOURCE);
        tile.food = amount;
        return tile;
    }

    static Tile nest(uint32_t x, uint32_t y, uint32_t explorers = 0, uint32_t pickers = 0, uint32_t fighters = 0) {
        Tile tile(x, y, TileType::NEST);
        tile.explorer_capacity = explorers;
        tile.picker_capacity = pickers;
        tile.fighter_capacity = fighters;
        return tile;
    }

    std::optional<uint32_t> food_amount() const {
        if (type == TileType::FOOD_SOURCE)
            return food;
        return std::nullopt;
    }

    bool is_walkable() const { return type != TileType::WALL; }
    bool is_lethal() const { return type == TileType::DEATH_ZONE; }
    bool has_food() const { return type == TileType::FOOD_SOURCE && food > 0; }
    bool is_nest() const { return type == TileType::NEST; }

    // Removes one unit of food. Returns false when there was nothing to take.
    bool take_food() {
        if (!has_food())
            return false;
        food--;
        return true;
    }

    void add_food_to_nest(uint32_t amount) {
        if (type == TileType::NEST)
            stored_food += amount;
    }

    bool operator==(const Tile& other) const {
        return position == other.position && type == other.type && food == other.food &&
               stored_food == other.stored_food && explorer_capacity == other.explorer_capacity &&
               picker_capacity == other.picker_capacity && fighter_capacity == other.fighter_capacity;
    }
    bool operator!=(const Tile& other) const { return !(*this == other); }
};
