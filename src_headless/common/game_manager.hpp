#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <utility>
#include <vector>

#include "ant.hpp"
#include "config.hpp"
#include "grid.hpp"
#include "pheromone.hpp"
#include "q_learning.hpp"
#include "tile.hpp"
#include "types.hpp"

// Full copy of the simulation state at one tick
struct GameStateSnapshot {
    Grid grid;
    std::vector<Ant> ants;
    PheromoneMap pheromones_food;
    PheromoneMap pheromones_nest;
};

// Explorers first, then pickers, then fighters
inline std::vector<Ant> make_colony(const SimulationConfig& config) {
    std::vector<Ant> ants;
    ants.reserve(config.num_explorers + config.num_pickers + config.num_fighters);
    for (uint32_t i = 0; i < config.num_explorers; i++)
        ants.emplace_back(AntType::EXPLORER);
    for (uint32_t i = 0; i < config.num_pickers; i++)
        ants.emplace_back(AntType::PICKER);
    for (uint32_t i = 0; i < config.num_fighters; i++)
        ants.emplace_back(AntType::FIGHTER);
    return ants;
}

// Runs the colony one tick at a time and records every tick in a history
// that can be rewound. Single-threaded; the only randomness comes from the
// generator seeded with config.seed.
class AntsGameManager {
   public:
    static constexpr size_t MIN_EXPLORERS_ACTIVE = 3;
    static constexpr uint32_t SPAWN_COOLDOWN = 2;  // Grace period before the first move

    // Custom map, e.g. from the editor. Ants that already have a position
    // keep it, unplaced ones start at the nest as long as it has room.
    AntsGameManager(uint32_t width, uint32_t height, const std::vector<Tile>& tiles, std::vector<Ant> ants,
                    const SimulationConfig& config)
        : AntsGameManager(config) {
        Grid grid(width, height, tiles);
        place_at_nest(grid, ants, config.nest_capacity);
        reset_state(std::move(grid), std::move(ants));
    }

    // Random map, ants start at the nest as long as it has room
    static AntsGameManager random(uint32_t width, uint32_t height, std::vector<Ant> ants,
                                  const SimulationConfig& config) {
        AntsGameManager manager(config);
        Grid grid = Grid::random(width, height, manager.rng);
        place_at_nest(grid, ants, config.nest_capacity);
        manager.reset_state(std::move(grid), std::move(ants));
        return manager;
    }

    void game_step() {
        // Parameters may have been changed through get_config() since the last tick
        rl_params.alpha = config.alpha;
        rl_params.gamma = config.gamma;
        rl_params.epsilon = config.epsilon;

        const uint32_t width = grid.get_width();
        const uint32_t height = grid.get_height();

        std::vector<uint8_t> ant_density = compute_ant_density();
        manage_smart_spawn(ant_density);

        // Fixed order: an earlier ant wins a contested cell
        for (size_t i = 0; i < ants.size(); i++) {
            Ant& ant = ants[i];
            if (!ant.position)
                continue;

            if (ant.cooldown > 0) {
                ant.cooldown--;
                continue;
            }
            ant.cooldown = ant.seconds_for_movement;

            const Position origin = *ant.position;
            const AntMode mode = ant.mode;
            PheromoneMap& map = pheromones_for(mode);

            std::pair<Action, double> choice = choose_action(origin, mode);
            const Action action = choice.first;
            const double q_current = choice.second;
            const Position target = ant.get_target_position(action);

            const bool is_out = target.x >= width || target.y >= height;
            bool move_allowed = !is_out && grid.is_walkable(target.x, target.y);
            bool is_lethal = false;

            if (!is_out) {
                is_lethal = grid.is_lethal(target.x, target.y);
                if (ant_density[to_index(target.x, target.y, width)] >= MAX_ANTS_PER_CELL)
                    move_allowed = false;
            }

            // Ants with vision see the danger and refuse to go
            if (is_lethal && ant.scope > 0)
                move_allowed = false;

            const double reward = calculate_reward(is_lethal, mode, target.x, target.y);
            const double max_next_q = (is_out || is_lethal) ? 0.0 : map.get_max_q(target.x, target.y);
            map.queue_update(origin.x, origin.y, action, rl_params.compute_delta(q_current, reward, max_next_q));

            if (!move_allowed)
                continue;

            if (grid.contains(origin.x, origin.y)) {
                uint8_t& count = ant_density[to_index(origin.x, origin.y, width)];
                if (count > 0)
                    count--;
            }

            if (is_lethal) {
                ant.position.reset();
                continue;
            }

            uint8_t& count = ant_density[to_index(target.x, target.y, width)];
            if (count < UINT8_MAX)
                count++;

            ant.move_to(target.x, target.y);
            handle_interactions(ant, target);
        }

        pheromones_food.apply_tick(config.pheromone_evaporation);
        pheromones_nest.apply_tick(config.pheromone_evaporation);
        save_snapshot();
    }

    double calculate_reward(bool is_lethal, AntMode mode, uint32_t x, uint32_t y) const {
        if (is_lethal)
            return config.reward_death;

        switch (mode) {
            case AntMode::FINDING:
                if (grid.has_food(x, y))
                    return config.reward_food;
                break;
            case AntMode::RETURNING:
                if (grid.is_nest(x, y))
                    return config.reward_nest;
                break;
        }
        return config.reward_default;
    }

    // Over when every ant is off the map or no food source has food left
    bool is_game_finished() const {
        for (const Ant& ant : ants) {
            if (ant.is_active())
                return !grid.is_food_remaining();
        }
        return true;
    }

    // Jump to a recorded tick. Out-of-range indices are ignored.
    void restore_snapshot(size_t index) {
        if (index < history_first || index >= history_end())
            return;

        const GameStateSnapshot& snapshot = history[index - history_first];
        grid = snapshot.grid;
        ants = snapshot.ants;
        pheromones_food = snapshot.pheromones_food;
        pheromones_nest = snapshot.pheromones_nest;
        current_tick_index = index;
    }

    const GameStateSnapshot* snapshot(size_t index) const {
        if (index < history_first || index >= history_end())
            return nullptr;
        return &history[index - history_first];
    }

    size_t current_tick() const { return current_tick_index; }
    size_t history_size() const { return history.size(); }
    size_t history_begin() const { return history_first; }
    size_t history_end() const { return history_first + history.size(); }

    const Grid& get_grid() const { return grid; }
    const std::vector<Ant>& get_ants() const { return ants; }
    const PheromoneMap& get_pheromones_food() const { return pheromones_food; }
    const PheromoneMap& get_pheromones_nest() const { return pheromones_nest; }
    const QLearningParams& get_rl_params() const { return rl_params; }

    // Live configuration, read again at the start of every tick
    SimulationConfig& get_config() { return config; }
    const SimulationConfig& get_config() const { return config; }

    size_t active_ant_count() const {
        size_t count = 0;
        for (const Ant& ant : ants) {
            if (ant.is_active())
                count++;
        }
        return count;
    }

    size_t density_at(uint32_t x, uint32_t y) const {
        size_t count = 0;
        for (const Ant& ant : ants) {
            if (ant.position && *ant.position == Position(x, y))
                count++;
        }
        return count;
    }

   private:
    Grid grid;
    std::vector<Ant> ants;
    PheromoneMap pheromones_food;  // Guides FINDING ants
    PheromoneMap pheromones_nest;  // Guides RETURNING ants
    QLearningParams rl_params;
    SimulationConfig config;
    RNG rng;

    std::deque<GameStateSnapshot> history;
    size_t history_first;  // Tick of history.front()
    size_t current_tick_index;

    explicit AntsGameManager(const SimulationConfig& config)
        : rl_params(config.alpha, config.gamma, config.epsilon),
          config(config),
          rng(config.seed),
          history_first(0),
          current_tick_index(0) {}

    void reset_state(Grid new_grid, std::vector<Ant> new_ants) {
        pheromones_food = PheromoneMap(new_grid.get_width(), new_grid.get_height());
        pheromones_nest = PheromoneMap(new_grid.get_width(), new_grid.get_height());
        grid = std::move(new_grid);
        ants = std::move(new_ants);

        history.clear();
        history_first = 0;
        current_tick_index = 0;
        save_snapshot();  // Tick 0
    }

    // Stops at the per-cell cap or once nest_capacity ants are active, the
    // rest wait for spawn admission
    static void place_at_nest(const Grid& grid, std::vector<Ant>& ants, uint32_t nest_capacity) {
        std::optional<Position> nest = grid.get_nest_position();
        if (!nest)
            return;

        size_t active = 0;
        size_t at_nest = 0;
        for (const Ant& ant : ants) {
            if (!ant.is_active())
                continue;
            active++;
            if (*ant.position == *nest)
                at_nest++;
        }

        for (Ant& ant : ants) {
            if (at_nest >= MAX_ANTS_PER_CELL || active >= nest_capacity)
                break;
            if (ant.is_active())
                continue;
            ant.spawn_at_nest(grid);
            at_nest++;
            active++;
        }
    }

    PheromoneMap& pheromones_for(AntMode mode) {
        return mode == AntMode::FINDING ? pheromones_food : pheromones_nest;
    }

    // Overwrites any future left over from a rewind
    void save_snapshot() {
        if (current_tick_index + 1 < history_end())
            history.erase(history.begin() + static_cast<std::ptrdiff_t>(current_tick_index - history_first + 1),
                          history.end());

        history.push_back(GameStateSnapshot{grid, ants, pheromones_food, pheromones_nest});
        current_tick_index = history_end() - 1;

        if (config.history_capacity > 0) {
            while (history.size() > config.history_capacity) {
                history.pop_front();
                history_first++;
            }
        }
    }

    std::vector<uint8_t> compute_ant_density() const {
        const uint32_t width = grid.get_width();
        std::vector<uint8_t> density(static_cast<size_t>(width) * grid.get_height(), 0);

        for (const Ant& ant : ants) {
            if (!ant.position || !grid.contains(ant.position->x, ant.position->y))
                continue;
            uint8_t& count = density[to_index(ant.position->x, ant.position->y, width)];
            if (count < UINT8_MAX)
                count++;
        }
        return density;
    }

    // Brings at most one ant out of the nest per tick
    void manage_smart_spawn(std::vector<uint8_t>& ant_density) {
        size_t active_explorers = 0;
        size_t active_total = 0;
        for (const Ant& ant : ants) {
            if (!ant.is_active())
                continue;
            active_total++;
            if (ant.type == AntType::EXPLORER)
                active_explorers++;
        }

        if (active_total >= config.nest_capacity)
            return;

        std::optional<Position> nest = grid.get_nest_position();
        if (!nest)
            return;

        uint8_t& nest_count = ant_density[to_index(nest->x, nest->y, grid.get_width())];
        if (nest_count >= MAX_ANTS_PER_CELL)
            return;

        Ant* candidate = nullptr;
        if (active_explorers < MIN_EXPLORERS_ACTIVE) {
            for (Ant& ant : ants) {
                if (!ant.is_active() && ant.type == AntType::EXPLORER) {
                    candidate = &ant;
                    break;
                }
            }
        }
        if (!candidate) {
            for (Ant& ant : ants) {
                if (!ant.is_active()) {
                    candidate = &ant;
                    break;
                }
            }
        }
        if (!candidate)
            return;

        candidate->position = *nest;
        candidate->mode = AntMode::FINDING;
        candidate->current_charge = 0;
        candidate->cooldown = SPAWN_COOLDOWN;
        nest_count++;
    }

    // Epsilon-greedy over the map of the ant's mode
    std::pair<Action, double> choose_action(Position from, AntMode mode) {
        const PheromoneMap& map = pheromones_for(mode);

        if (rng.random_double() < rl_params.epsilon) {
            Action action = MOVEMENT_ACTIONS[rng.random_int(0, 3)];
            return std::make_pair(action, map.get_q(from.x, from.y, action));
        }

        Action best = map.get_best_action(from.x, from.y, grid);
        return std::make_pair(best, map.get_q(from.x, from.y, best));
    }

    // Pickup on food, deposit on the nest. Either one reinforces the Stay slot
    // of the cell right away with half the food reward.
    void handle_interactions(Ant& ant, Position target) {
        const double immediate_boost = config.reward_food * 0.5;

        switch (ant.mode) {
            case AntMode::FINDING: {
                Tile* tile = grid.get_mut_tile(target.x, target.y);
                if (tile && tile->take_food()) {
                    ant.current_charge = ant.maximal_charge;
                    ant.mode = AntMode::RETURNING;
                    pheromones_food.queue_update(target.x, target.y, Action::STAY, immediate_boost);
                }
                break;
            }
            case AntMode::RETURNING:
                if (grid.is_nest(target.x, target.y)) {
                    grid.add_food_to_nest(ant.current_charge);
                    ant.current_charge = 0;
                    ant.mode = AntMode::FINDING;
                    pheromones_nest.queue_update(target.x, target.y, Action::STAY, immediate_boost);
                }
                break;
        }
    }
};
