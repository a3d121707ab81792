#include <omp.h>
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>
#include "../common/config.hpp"
#include "../common/game_manager.hpp"

// Sweep grid
const double ALPHAS[] = {0.1, 0.3, 0.5, 0.7, 0.9};
const double GAMMAS[] = {0.8, 0.9, 0.95, 0.99};
const double EPSILONS[] = {0.01, 0.05, 0.1, 0.2};

struct SweepResult {
    double alpha = 0.0;
    double gamma = 0.0;
    double epsilon = 0.0;
    uint64_t ticks = 0;
    bool finished = false;
};

class HyperparameterSweepOpenMP {
   private:
    SimulationConfig base;
    std::vector<SweepResult> results;

   public:
    HyperparameterSweepOpenMP(const SimulationConfig& base) : base(base) {
        for (double alpha : ALPHAS) {
            for (double gamma : GAMMAS) {
                for (double epsilon : EPSILONS) {
                    SweepResult result;
                    result.alpha = alpha;
                    result.gamma = gamma;
                    result.epsilon = epsilon;
                    results.push_back(result);
                }
            }
        }
    }

    // One complete run, no rendering and no history
    static SweepResult run_single_simulation(SimulationConfig config, SweepResult result) {
        config.alpha = result.alpha;
        config.gamma = result.gamma;
        config.epsilon = result.epsilon;
        config.history_capacity = 1;

        AntsGameManager manager =
            AntsGameManager::random(config.grid_width, config.grid_height, make_colony(config), config);

        uint64_t tick = 0;
        while (tick < config.max_ticks) {
            manager.game_step();
            tick++;
            if (manager.is_game_finished())
                break;
        }

        result.ticks = tick;
        result.finished = manager.is_game_finished();
        return result;
    }

    void run() {
        auto start_time = std::chrono::high_resolution_clock::now();
        int count = static_cast<int>(results.size());

        std::cout << "Running " << count << " simulations in parallel..." << std::endl;

        // Every run owns its manager and seed, nothing is shared but its result slot
#pragma omp parallel for schedule(dynamic)
        for (int i = 0; i < count; i++) {
            SimulationConfig config = base;
            config.seed = base.seed + static_cast<unsigned>(i);
            results[i] = run_single_simulation(config, results[i]);
        }

        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

        std::sort(results.begin(), results.end(), [](const SweepResult& a, const SweepResult& b) {
            return a.ticks < b.ticks;
        });

        std::cout << "\n=== Sweep Complete (OpenMP Version) ===" << std::endl;
        std::cout << std::setw(8) << "alpha" << std::setw(8) << "gamma" << std::setw(10) << "epsilon"
                  << std::setw(12) << "ticks" << std::endl;
        for (const SweepResult& result : results) {
            std::cout << std::setw(8) << result.alpha << std::setw(8) << result.gamma << std::setw(10)
                      << result.epsilon << std::setw(12) << result.ticks << (result.finished ? "" : " (limit)")
                      << std::endl;
        }

        if (!results.empty()) {
            const SweepResult& best = results.front();
            std::cout << "\nBest configuration:" << std::endl;
            std::cout << "  Alpha:   " << best.alpha << std::endl;
            std::cout << "  Gamma:   " << best.gamma << std::endl;
            std::cout << "  Epsilon: " << best.epsilon << std::endl;
            std::cout << "  Ticks:   " << best.ticks << std::endl;
        }
        std::cout << "Execution time: " << duration.count() << " ms" << std::endl;
    }
};

int main(int argc, char* argv[]) {
    // Sweep defaults, the command line can still override them
    SimulationConfig config;
    config.grid_width = 30;
    config.grid_height = 30;
    config.num_explorers = 10;
    config.num_pickers = 20;
    config.num_fighters = 0;
    config.max_ticks = 100000;
    config.pheromone_evaporation = 0.999;

    std::vector<std::string> extra;
    if (!parse_args(argc, argv, config, &extra))
        return 0;

    int num_threads = omp_get_max_threads();
    for (size_t i = 0; i < extra.size(); i++) {
        if (extra[i] == "--threads" && i + 1 < extra.size()) {
            num_threads = std::atoi(extra[++i].c_str());
            if (num_threads > 0) {
                omp_set_num_threads(num_threads);
            } else {
                std::cerr << "Invalid thread count, using " << omp_get_max_threads() << std::endl;
                num_threads = omp_get_max_threads();
            }
        } else {
            std::cerr << "Unknown argument: " << extra[i] << std::endl;
        }
    }

    std::string error;
    if (!config.validate(&error)) {
        std::cerr << "Configuration error: " << error << std::endl;
        std::cerr << "Use --help to list the available options" << std::endl;
        return 1;
    }

    std::cout << "=== Ant Colony Hyperparameter Sweep (OpenMP Version) ===" << std::endl;
    std::cout << "Grid size: " << config.grid_width << " x " << config.grid_height << std::endl;
    std::cout << "Ants: " << config.num_explorers << " explorers, " << config.num_pickers << " pickers, "
              << config.num_fighters << " fighters" << std::endl;
    std::cout << "Tick limit per run: " << config.max_ticks << std::endl;
    std::cout << "Number of threads: " << num_threads << std::endl;
    std::cout << "Base seed: " << config.seed << std::endl;
    std::cout << "========================================================\n"
              << std::endl;

    HyperparameterSweepOpenMP sweep(config);
    sweep.run();

    return 0;
}
