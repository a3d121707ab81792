#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>
#include "../common/config.hpp"
#include "../common/game_manager.hpp"

class AntSimulationCPU {
   private:
    AntsGameManager manager;
    uint64_t max_ticks;
    uint64_t ticks;

   public:
    AntSimulationCPU(const SimulationConfig& config)
        : manager(AntsGameManager::random(config.grid_width, config.grid_height, make_colony(config), config)),
          max_ticks(config.max_ticks),
          ticks(0) {}

    const AntsGameManager& get_manager() const {
        return manager;
    }

    void report_progress() const {
        const Grid& grid = manager.get_grid();
        std::cout << "Tick " << ticks
                  << ": Stored " << grid.nest_stored_food().value_or(0) << " food"
                  << ", " << grid.total_food_remaining() << " left on the map"
                  << ", " << manager.active_ant_count() << " active ants" << std::endl;
    }

    uint64_t run() {
        auto start_time = std::chrono::high_resolution_clock::now();

        while (ticks < max_ticks) {
            manager.game_step();
            ticks++;

            if (manager.is_game_finished())
                break;

            // Progress report every 1000 ticks
            if (ticks % 1000 == 0)
                report_progress();
        }

        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

        std::cout << "\n=== Simulation Complete (CPU Version) ===" << std::endl;
        std::cout << "Total ticks: " << ticks << std::endl;
        std::cout << "Finished: " << (manager.is_game_finished() ? "yes" : "no (tick limit)") << std::endl;
        std::cout << "Food stored in nest: " << manager.get_grid().nest_stored_food().value_or(0) << std::endl;
        std::cout << "Food left on map: " << manager.get_grid().total_food_remaining() << std::endl;
        std::cout << "Strongest food / nest trail: " << manager.get_pheromones_food().max_value() << " / "
                  << manager.get_pheromones_nest().max_value() << std::endl;
        std::cout << "Execution time: " << duration.count() << " ms" << std::endl;
        if (ticks > 0)
            std::cout << "Time per tick: " << (double)duration.count() / ticks << " ms" << std::endl;

        return ticks;
    }
};

int main(int argc, char* argv[]) {
    SimulationConfig config;
    std::vector<std::string> extra;
    if (!parse_args(argc, argv, config, &extra))
        return 0;

    bool print_map = false;
    for (const std::string& arg : extra) {
        if (arg == "--print-map") {
            print_map = true;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
        }
    }

    std::string error;
    if (!config.validate(&error)) {
        std::cerr << "Configuration error: " << error << std::endl;
        std::cerr << "Use --help to list the available options" << std::endl;
        return 1;
    }

    // Rewind is a viewer feature, keep only the latest snapshot
    config.history_capacity = 1;

    std::cout << "=== Ant Colony Q-Learning (CPU Version) ===" << std::endl;
    std::cout << "Grid size: " << config.grid_width << " x " << config.grid_height << std::endl;
    std::cout << "Ants: " << config.num_explorers << " explorers, " << config.num_pickers << " pickers, "
              << config.num_fighters << " fighters" << std::endl;
    std::cout << "Alpha / Gamma / Epsilon: " << config.alpha << " / " << config.gamma << " / " << config.epsilon
              << std::endl;
    std::cout << "Evaporation: " << config.pheromone_evaporation << std::endl;
    std::cout << "Random seed: " << config.seed << std::endl;
    std::cout << "===========================================\n"
              << std::endl;

    AntSimulationCPU simulation(config);
    if (print_map) {
        simulation.get_manager().get_grid().print_grid(std::cout);
        std::cout << std::endl;
    }
    simulation.run();

    return 0;
}
