#pragma once

#include <cstdint>
#include <optional>

#include "grid.hpp"
#include "types.hpp"

// Ant types
enum class AntType : int {
    EXPLORER = 0,
    FIGHTER = 1,
    PICKER = 2
};

// Ant modes
enum class AntMode : int {
    FINDING = 0,   // Looking for food
    RETURNING = 1  // Carrying food back to the nest
};

struct Ant {
    AntType type;
    uint32_t maximal_charge;
    uint32_t current_charge = 0;
    uint32_t seconds_for_movement;  // Cooldown period between two moves
    uint32_t cooldown = 0;
    uint32_t scope;  // 0 = blind, otherwise refuses to step on lethal tiles
    AntMode mode = AntMode::FINDING;
    std::optional<Position> position;  // Empty when not spawned yet or dead

    explicit Ant(AntType type) : type(type) {
        switch (type) {
            case AntType::EXPLORER:
            case AntType::FIGHTER:
                maximal_charge = 10;
                seconds_for_movement = 5;
                scope = 1;
                break;
            case AntType::PICKER:
                maximal_charge = 100;
                seconds_for_movement = 10;
                scope = 0;
                break;
        }
    }

    bool is_active() const { return position.has_value(); }

    // An unspawned ant computes from (0, 0)
    Position get_target_position(Action action) const {
        return apply_action(position.value_or(Position(0, 0)), action);
    }

    void move_to(uint32_t x, uint32_t y) { position = Position(x, y); }

    void spawn_at_nest(const Grid& grid) {
        std::optional<Position> nest = grid.get_nest_position();
        if (nest)
            position = *nest;
    }

    bool operator==(const Ant& other) const {
        return type == other.type && maximal_charge == other.maximal_charge &&
               current_charge == other.current_charge && seconds_for_movement == other.seconds_for_movement &&
               cooldown == other.cooldown && scope == other.scope && mode == other.mode &&
               position == other.position;
    }
    bool operator!=(const Ant& other) const { return !(*this == other); }
};
