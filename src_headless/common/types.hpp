#pragma once

#include <cstddef>
#include <cstdint>
#include <random>

// Maximum number of ants allowed on one cell at the same time
constexpr std::uint8_t MAX_ANTS_PER_CELL = 10;

// Grid coordinate, (0, 0) is the top-left cell
struct Position {
    uint32_t x, y;

    Position() : x(0), y(0) {}
    Position(uint32_t x, uint32_t y) : x(x), y(y) {}

    bool operator==(const Position& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Position& other) const { return !(*this == other); }
};

// The five actions an ant can take, also the slot order of the Q-value table
enum class Action : int {
    UP = 0,
    DOWN = 1,
    LEFT = 2,
    RIGHT = 3,
    STAY = 4
};

constexpr int ACTION_COUNT = 5;

// Stay is never a movement candidate
constexpr Action MOVEMENT_ACTIONS[4] = {Action::UP, Action::DOWN, Action::LEFT, Action::RIGHT};

// Direction offsets, indexed by Action
constexpr int ACTION_DX[ACTION_COUNT] = {0, 0, -1, 1, 0};
constexpr int ACTION_DY[ACTION_COUNT] = {-1, 1, 0, 0, 0};

inline int action_index(Action action) {
    return static_cast<int>(action);
}

inline uint32_t saturating_sub(uint32_t value, uint32_t amount) {
    return value > amount ? value - amount : 0;
}

// Destination of an action. Clamped at zero on the lower bound only: the
// caller checks the upper bound against the grid dimensions.
inline Position apply_action(Position from, Action action) {
    int dx = ACTION_DX[action_index(action)];
    int dy = ACTION_DY[action_index(action)];
    uint32_t nx = dx < 0 ? saturating_sub(from.x, 1) : from.x + static_cast<uint32_t>(dx);
    uint32_t ny = dy < 0 ? saturating_sub(from.y, 1) : from.y + static_cast<uint32_t>(dy);
    return Position(nx, ny);
}

// Row-major cell index
inline size_t to_index(uint32_t x, uint32_t y, uint32_t width) {
    return static_cast<size_t>(y) * width + x;
}

// Random number generator wrapper, one per simulation
class RNG {
   public:
    RNG(unsigned seed = 42) : gen(seed), dist(0.0, 1.0) {}

    double random_double() { return dist(gen); }

    // Uniform in [min, max]
    int random_int(int min, int max) {
        std::uniform_int_distribution<int> d(min, max);
        return d(gen);
    }

   private:
    std::mt19937 gen;
    std::uniform_real_distribution<double> dist;
};
