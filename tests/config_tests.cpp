#include <gtest/gtest.h>

#include <initializer_list>
#include <string>
#include <vector>

#include "config.hpp"

namespace {

// Owns the strings behind an argv array
struct Args {
    std::vector<std::string> storage;
    std::vector<char*> argv;

    Args(std::initializer_list<const char*> args) : storage(args.begin(), args.end()) {
        storage.insert(storage.begin(), "ants");
        for (std::string& arg : storage)
            argv.push_back(&arg[0]);
    }

    int argc() const { return static_cast<int>(argv.size()); }
};

}  // namespace

TEST(ConfigTest, DefaultsAreValid) {
    SimulationConfig config;
    std::string error;
    EXPECT_TRUE(config.validate(&error));
    EXPECT_TRUE(error.empty());
    EXPECT_TRUE(config.validate(nullptr));

    EXPECT_EQ(config.grid_width, 20u);
    EXPECT_EQ(config.nest_capacity, 100u);
    EXPECT_DOUBLE_EQ(config.pheromone_evaporation, 0.01);
    EXPECT_EQ(config.history_capacity, 0u);
}

TEST(ConfigTest, ValidateRejectsEachBadField) {
    std::string error;

    SimulationConfig config;
    config.grid_height = 0;
    EXPECT_FALSE(config.validate(&error));
    EXPECT_EQ(error, "grid dimensions must be greater than 0");

    config = SimulationConfig();
    config.alpha = 1.5;
    EXPECT_FALSE(config.validate(&error));
    EXPECT_EQ(error, "alpha must be between 0.0 and 1.0");

    config = SimulationConfig();
    config.gamma = -0.1;
    EXPECT_FALSE(config.validate(&error));
    EXPECT_EQ(error, "gamma must be between 0.0 and 1.0");

    config = SimulationConfig();
    config.epsilon = 2.0;
    EXPECT_FALSE(config.validate(&error));
    EXPECT_EQ(error, "epsilon must be between 0.0 and 1.0");

    config = SimulationConfig();
    config.pheromone_evaporation = 1.01;
    EXPECT_FALSE(config.validate(&error));
    EXPECT_EQ(error, "pheromone evaporation must be between 0.0 and 1.0");
}

TEST(ConfigTest, BoundsAreInclusive) {
    SimulationConfig config;
    config.alpha = 0.0;
    config.gamma = 1.0;
    config.epsilon = 1.0;
    config.pheromone_evaporation = 0.0;
    EXPECT_TRUE(config.validate(nullptr));
}

TEST(ConfigTest, ParseArgsFillsTheConfig) {
    Args args({"--width", "30", "--height", "12", "--explorers", "4", "--pickers", "6", "--fighters", "0",
               "--alpha", "0.5", "--gamma", "0.8", "--epsilon", "0.2", "--reward-food", "250",
               "--reward-death", "-50", "--nest-capacity", "7", "--evaporation", "0.999", "--max-ticks",
               "5000000000", "--history", "64", "--seed", "123", "--speed", "8"});
    SimulationConfig config;

    ASSERT_TRUE(parse_args(args.argc(), args.argv.data(), config));
    EXPECT_EQ(config.grid_width, 30u);
    EXPECT_EQ(config.grid_height, 12u);
    EXPECT_EQ(config.num_explorers, 4u);
    EXPECT_EQ(config.num_pickers, 6u);
    EXPECT_EQ(config.num_fighters, 0u);
    EXPECT_DOUBLE_EQ(config.alpha, 0.5);
    EXPECT_DOUBLE_EQ(config.gamma, 0.8);
    EXPECT_DOUBLE_EQ(config.epsilon, 0.2);
    EXPECT_DOUBLE_EQ(config.reward_food, 250.0);
    EXPECT_DOUBLE_EQ(config.reward_death, -50.0);
    EXPECT_EQ(config.nest_capacity, 7u);
    EXPECT_DOUBLE_EQ(config.pheromone_evaporation, 0.999);
    EXPECT_EQ(config.max_ticks, 5000000000ULL);
    EXPECT_EQ(config.history_capacity, 64u);
    EXPECT_EQ(config.seed, 123u);
    EXPECT_EQ(config.simulation_speed, 8u);
}

TEST(ConfigTest, BadValuesKeepTheDefault) {
    Args args({"--width", "-3", "--alpha", "abc", "--pickers", "99999999999", "--seed"});
    SimulationConfig config;

    ASSERT_TRUE(parse_args(args.argc(), args.argv.data(), config));
    EXPECT_EQ(config.grid_width, static_cast<uint32_t>(DEFAULT_GRID_WIDTH));
    EXPECT_DOUBLE_EQ(config.alpha, DEFAULT_ALPHA);
    EXPECT_EQ(config.num_pickers, static_cast<uint32_t>(DEFAULT_NUM_PICKERS));
    EXPECT_EQ(config.seed, static_cast<unsigned>(DEFAULT_SEED));
}

TEST(ConfigTest, UnknownArgumentsAreHandedBack) {
    Args args({"--editor", "--width", "8", "--threads", "4"});
    SimulationConfig config;
    std::vector<std::string> extra;

    ASSERT_TRUE(parse_args(args.argc(), args.argv.data(), config, &extra));
    EXPECT_EQ(config.grid_width, 8u);
    EXPECT_EQ(extra, (std::vector<std::string>{"--editor", "--threads", "4"}));
}

TEST(ConfigTest, HelpStopsParsing) {
    Args args({"--width", "8", "--help", "--height", "9"});
    SimulationConfig config;

    testing::internal::CaptureStdout();
    EXPECT_FALSE(parse_args(args.argc(), args.argv.data(), config));
    std::string help = testing::internal::GetCapturedStdout();

    EXPECT_NE(help.find("--evaporation"), std::string::npos);
    EXPECT_EQ(config.grid_width, 8u);
    EXPECT_EQ(config.grid_height, static_cast<uint32_t>(DEFAULT_GRID_HEIGHT));
}
