#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <vector>

#include "grid.hpp"
#include "types.hpp"

// Learned action values, one slot per (cell, action). Updates queued during a
// tick stay invisible until apply_tick(), so every ant of a tick reads the
// same values.
class PheromoneMap {
   public:
    static constexpr double OUT_OF_BOUNDS_Q = -1000.0;
    static constexpr double SNAP_THRESHOLD = 0.001;

    PheromoneMap() : width(0), height(0), dirty(false) {}

    PheromoneMap(uint32_t width, uint32_t height)
        : width(width),
          height(height),
          values(static_cast<size_t>(width) * height * ACTION_COUNT, 0.0),
          pending(static_cast<size_t>(width) * height * ACTION_COUNT, 0.0),
          dirty(false) {}

    uint32_t get_width() const { return width; }
    uint32_t get_height() const { return height; }

    double get_q(uint32_t x, uint32_t y, Action action) const {
        if (x >= width || y >= height)
            return OUT_OF_BOUNDS_Q;
        return values[slot(x, y, action)];
    }

    double get_max_q(uint32_t x, uint32_t y) const {
        if (x >= width || y >= height)
            return 0.0;
        size_t base = slot(x, y, Action::UP);
        return *std::max_element(values.begin() + base, values.begin() + base + ACTION_COUNT);
    }

    // Greedy choice among the legal moves. Ties keep the first action in
    // Up, Down, Left, Right order. Stay when every move is blocked.
    Action get_best_action(uint32_t x, uint32_t y, const Grid& grid) const {
        Action best_action = Action::STAY;
        double max_val = -std::numeric_limits<double>::infinity();

        for (Action action : MOVEMENT_ACTIONS) {
            Position target = apply_action(Position(x, y), action);
            if (target.x >= width || target.y >= height || !grid.is_walkable(target.x, target.y))
                continue;

            double val = get_q(x, y, action);
            if (val > max_val) {
                max_val = val;
                best_action = action;
            }
        }

        return best_action;
    }

    void queue_update(uint32_t x, uint32_t y, Action action, double delta) {
        if (x >= width || y >= height)
            return;
        pending[slot(x, y, action)] += delta;
        dirty = true;
    }

    bool has_pending() const { return dirty; }

    // Drain the queued deltas, then evaporate everything
    void apply_tick(double evaporation_rate) {
        double keep = 1.0 - evaporation_rate;
        for (size_t i = 0; i < values.size(); i++) {
            values[i] += pending[i];
            pending[i] = 0.0;

            values[i] *= keep;
            if (std::abs(values[i]) < SNAP_THRESHOLD) {
                values[i] = 0.0;
            }
        }
        dirty = false;
    }

    // Largest stored value, 0 for an empty map
    double max_value() const {
        if (values.empty())
            return 0.0;
        return *std::max_element(values.begin(), values.end());
    }

    bool operator==(const PheromoneMap& other) const {
        return width == other.width && height == other.height && values == other.values &&
               pending == other.pending;
    }
    bool operator!=(const PheromoneMap& other) const { return !(*this == other); }

   private:
    uint32_t width;
    uint32_t height;
    std::vector<double> values;   // (y * width + x) * ACTION_COUNT + action
    std::vector<double> pending;  // Same layout, cleared every tick
    bool dirty;

    size_t slot(uint32_t x, uint32_t y, Action action) const {
        return to_index(x, y, width) * ACTION_COUNT + action_index(action);
    }
};
