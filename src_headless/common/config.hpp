#pragma once

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

// Grid configuration
#define DEFAULT_GRID_WIDTH 20
#define DEFAULT_GRID_HEIGHT 20

// Colony composition
#define DEFAULT_NUM_EXPLORERS 2
#define DEFAULT_NUM_FIGHTERS 1
#define DEFAULT_NUM_PICKERS 3

// Q-learning
#define DEFAULT_ALPHA 0.1
#define DEFAULT_GAMMA 0.99
#define DEFAULT_EPSILON 0.05

// Rewards
#define DEFAULT_REWARD_FOOD 1000.0
#define DEFAULT_REWARD_NEST 1000.0
#define DEFAULT_REWARD_DEATH -100.0
#define DEFAULT_REWARD_DEFAULT -1.0

// Nest and pheromones
#define DEFAULT_NEST_CAPACITY 100
#define DEFAULT_PHEROMONE_EVAPORATION 0.01  // 1% of every value fades per tick

// Run control
#define DEFAULT_MAX_TICKS 1000000000ULL  // Safety bound for the caller's loop
#define DEFAULT_SIMULATION_SPEED 1       // Ticks per rendered frame
#define DEFAULT_HISTORY_CAPACITY 0       // 0 keeps every snapshot
#define DEFAULT_SEED 42

struct SimulationConfig {
    uint32_t grid_width = DEFAULT_GRID_WIDTH;
    uint32_t grid_height = DEFAULT_GRID_HEIGHT;

    uint32_t num_explorers = DEFAULT_NUM_EXPLORERS;
    uint32_t num_fighters = DEFAULT_NUM_FIGHTERS;
    uint32_t num_pickers = DEFAULT_NUM_PICKERS;

    double alpha = DEFAULT_ALPHA;
    double gamma = DEFAULT_GAMMA;
    double epsilon = DEFAULT_EPSILON;

    uint64_t max_ticks = DEFAULT_MAX_TICKS;
    uint32_t simulation_speed = DEFAULT_SIMULATION_SPEED;

    double reward_food = DEFAULT_REWARD_FOOD;
    double reward_nest = DEFAULT_REWARD_NEST;
    double reward_death = DEFAULT_REWARD_DEATH;
    double reward_default = DEFAULT_REWARD_DEFAULT;

    uint32_t nest_capacity = DEFAULT_NEST_CAPACITY;  // Also the cap on active ants
    double pheromone_evaporation = DEFAULT_PHEROMONE_EVAPORATION;

    size_t history_capacity = DEFAULT_HISTORY_CAPACITY;
    unsigned seed = DEFAULT_SEED;

    bool validate(std::string* error) const {
        const char* message = nullptr;
        if (grid_width == 0 || grid_height == 0) {
            message = "grid dimensions must be greater than 0";
        } else if (alpha < 0.0 || alpha > 1.0) {
            message = "alpha must be between 0.0 and 1.0";
        } else if (gamma < 0.0 || gamma > 1.0) {
            message = "gamma must be between 0.0 and 1.0";
        } else if (epsilon < 0.0 || epsilon > 1.0) {
            message = "epsilon must be between 0.0 and 1.0";
        } else if (pheromone_evaporation < 0.0 || pheromone_evaporation > 1.0) {
            message = "pheromone evaporation must be between 0.0 and 1.0";
        }

        if (message && error)
            *error = message;
        return message == nullptr;
    }
};

inline void print_help(const char* program) {
    std::cout << "Usage: " << program << " [OPTIONS]\n"
              << "\n"
              << "OPTIONS:\n"
              << "  --width <N>             Grid width (default: " << DEFAULT_GRID_WIDTH << ")\n"
              << "  --height <N>            Grid height (default: " << DEFAULT_GRID_HEIGHT << ")\n"
              << "  --explorers <N>         Number of explorers (default: " << DEFAULT_NUM_EXPLORERS << ")\n"
              << "  --fighters <N>          Number of fighters (default: " << DEFAULT_NUM_FIGHTERS << ")\n"
              << "  --pickers <N>           Number of pickers (default: " << DEFAULT_NUM_PICKERS << ")\n"
              << "  --alpha <F>             Learning rate (default: " << DEFAULT_ALPHA << ")\n"
              << "  --gamma <F>             Discount factor (default: " << DEFAULT_GAMMA << ")\n"
              << "  --epsilon <F>           Exploration rate (default: " << DEFAULT_EPSILON << ")\n"
              << "  --reward-food <F>       Reward for reaching food (default: " << DEFAULT_REWARD_FOOD << ")\n"
              << "  --reward-nest <F>       Reward for returning to the nest (default: " << DEFAULT_REWARD_NEST << ")\n"
              << "  --reward-death <F>      Reward for entering a death zone (default: " << DEFAULT_REWARD_DEATH << ")\n"
              << "  --reward-default <F>    Cost of an ordinary step (default: " << DEFAULT_REWARD_DEFAULT << ")\n"
              << "  --nest-capacity <N>     Maximum number of active ants (default: " << DEFAULT_NEST_CAPACITY << ")\n"
              << "  --evaporation <F>       Pheromone evaporation rate (default: " << DEFAULT_PHEROMONE_EVAPORATION << ")\n"
              << "  --max-ticks <N>         Tick limit (default: " << DEFAULT_MAX_TICKS << ")\n"
              << "  --speed <N>             Ticks per frame in the viewer (default: " << DEFAULT_SIMULATION_SPEED << ")\n"
              << "  --history <N>           Snapshots kept for rewind, 0 = all (default: " << DEFAULT_HISTORY_CAPACITY << ")\n"
              << "  --seed <N>              Random seed (default: " << DEFAULT_SEED << ")\n"
              << "  --help                  Show this help\n";
}

inline bool parse_number(const char* text, double& out) {
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(text, &end);
    if (end == text || *end != '\0' || errno == ERANGE)
        return false;
    out = value;
    return true;
}

inline bool parse_number(const char* text, uint64_t& out) {
    if (text[0] == '-')
        return false;
    char* end = nullptr;
    errno = 0;
    unsigned long long value = std::strtoull(text, &end, 10);
    if (end == text || *end != '\0' || errno == ERANGE)
        return false;
    out = value;
    return true;
}

// Fills config from the command line. Arguments it does not know go to
// unparsed when given, otherwise they are reported and skipped. Returns false
// when --help was printed and the program should exit.
inline bool parse_args(int argc, char* argv[], SimulationConfig& config,
                       std::vector<std::string>* unparsed = nullptr) {
    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];
        const char* value = (i + 1 < argc) ? argv[i + 1] : nullptr;

        uint32_t* uint_field = nullptr;
        uint64_t* u64_field = nullptr;
        size_t* size_field = nullptr;
        unsigned* seed_field = nullptr;
        double* double_field = nullptr;

        if (std::strcmp(arg, "--help") == 0) {
            print_help(argv[0]);
            return false;
        } else if (std::strcmp(arg, "--width") == 0) {
            uint_field = &config.grid_width;
        } else if (std::strcmp(arg, "--height") == 0) {
            uint_field = &config.grid_height;
        } else if (std::strcmp(arg, "--explorers") == 0) {
            uint_field = &config.num_explorers;
        } else if (std::strcmp(arg, "--fighters") == 0) {
            uint_field = &config.num_fighters;
        } else if (std::strcmp(arg, "--pickers") == 0) {
            uint_field = &config.num_pickers;
        } else if (std::strcmp(arg, "--nest-capacity") == 0) {
            uint_field = &config.nest_capacity;
        } else if (std::strcmp(arg, "--speed") == 0) {
            uint_field = &config.simulation_speed;
        } else if (std::strcmp(arg, "--max-ticks") == 0) {
            u64_field = &config.max_ticks;
        } else if (std::strcmp(arg, "--history") == 0) {
            size_field = &config.history_capacity;
        } else if (std::strcmp(arg, "--seed") == 0) {
            seed_field = &config.seed;
        } else if (std::strcmp(arg, "--alpha") == 0) {
            double_field = &config.alpha;
        } else if (std::strcmp(arg, "--gamma") == 0) {
            double_field = &config.gamma;
        } else if (std::strcmp(arg, "--epsilon") == 0) {
            double_field = &config.epsilon;
        } else if (std::strcmp(arg, "--reward-food") == 0) {
            double_field = &config.reward_food;
        } else if (std::strcmp(arg, "--reward-nest") == 0) {
            double_field = &config.reward_nest;
        } else if (std::strcmp(arg, "--reward-death") == 0) {
            double_field = &config.reward_death;
        } else if (std::strcmp(arg, "--reward-default") == 0) {
            double_field = &config.reward_default;
        } else if (std::strcmp(arg, "--evaporation") == 0) {
            double_field = &config.pheromone_evaporation;
        } else {
            if (unparsed) {
                unparsed->push_back(arg);
            } else {
                std::cerr << "Unknown argument: " << arg << std::endl;
            }
            continue;
        }

        if (!value) {
            std::cerr << "Missing value for " << arg << ", keeping the default" << std::endl;
            continue;
        }
        i++;

        bool ok = false;
        if (double_field) {
            ok = parse_number(value, *double_field);
        } else {
            uint64_t number = 0;
            ok = parse_number(value, number);
            if (ok && (uint_field || seed_field) && number > UINT32_MAX)
                ok = false;
            if (ok) {
                if (uint_field)
                    *uint_field = static_cast<uint32_t>(number);
                else if (u64_field)
                    *u64_field = number;
                else if (size_field)
                    *size_field = static_cast<size_t>(number);
                else if (seed_field)
                    *seed_field = static_cast<unsigned>(number);
            }
        }

        if (!ok)
            std::cerr << "Invalid value for " << arg << ": " << value << ", keeping the default" << std::endl;
    }

    return true;
}
