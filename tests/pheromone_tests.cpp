#include <gtest/gtest.h>

#include <vector>

#include "grid.hpp"
#include "pheromone.hpp"
#include "q_learning.hpp"
#include "types.hpp"

TEST(PheromoneMapTest, StartsAtZero) {
    PheromoneMap map(3, 2);
    EXPECT_EQ(map.get_width(), 3u);
    EXPECT_EQ(map.get_height(), 2u);
    EXPECT_DOUBLE_EQ(map.get_q(2, 1, Action::STAY), 0.0);
    EXPECT_DOUBLE_EQ(map.get_max_q(0, 0), 0.0);
    EXPECT_FALSE(map.has_pending());
}

TEST(PheromoneMapTest, OutOfBoundsReads) {
    PheromoneMap map(2, 2);
    EXPECT_DOUBLE_EQ(map.get_q(2, 0, Action::UP), PheromoneMap::OUT_OF_BOUNDS_Q);
    EXPECT_DOUBLE_EQ(map.get_q(0, 9, Action::STAY), -1000.0);
    EXPECT_DOUBLE_EQ(map.get_max_q(5, 5), 0.0);

    map.queue_update(2, 2, Action::UP, 50.0);
    EXPECT_FALSE(map.has_pending());
}

TEST(PheromoneMapTest, QueuedUpdatesStayHiddenUntilTheTickEnds) {
    PheromoneMap map(2, 2);
    map.queue_update(1, 1, Action::LEFT, 10.0);
    map.queue_update(1, 1, Action::LEFT, 5.0);

    EXPECT_TRUE(map.has_pending());
    EXPECT_DOUBLE_EQ(map.get_q(1, 1, Action::LEFT), 0.0);

    map.apply_tick(0.0);
    EXPECT_FALSE(map.has_pending());
    EXPECT_DOUBLE_EQ(map.get_q(1, 1, Action::LEFT), 15.0);
    EXPECT_DOUBLE_EQ(map.get_max_q(1, 1), 15.0);
    EXPECT_DOUBLE_EQ(map.max_value(), 15.0);

    // Pending buffer is drained
    map.apply_tick(0.0);
    EXPECT_DOUBLE_EQ(map.get_q(1, 1, Action::LEFT), 15.0);
}

TEST(PheromoneMapTest, EvaporationScalesThenSnapsNearZero) {
    PheromoneMap map(2, 1);
    map.queue_update(0, 0, Action::UP, 10.0);
    map.queue_update(0, 0, Action::DOWN, -4.0);
    map.queue_update(1, 0, Action::STAY, 0.0015);
    map.apply_tick(0.0);

    map.apply_tick(0.5);
    EXPECT_DOUBLE_EQ(map.get_q(0, 0, Action::UP), 5.0);
    EXPECT_DOUBLE_EQ(map.get_q(0, 0, Action::DOWN), -2.0);
    // 0.00075 falls under the threshold
    EXPECT_EQ(map.get_q(1, 0, Action::STAY), 0.0);
}

TEST(PheromoneMapTest, PendingIsAddedBeforeEvaporation) {
    PheromoneMap map(1, 1);
    map.queue_update(0, 0, Action::RIGHT, 100.0);
    map.apply_tick(0.01);
    EXPECT_DOUBLE_EQ(map.get_q(0, 0, Action::RIGHT), 99.0);
}

TEST(PheromoneMapTest, NegativeValuesAlsoSnap) {
    PheromoneMap map(1, 1);
    map.queue_update(0, 0, Action::UP, -0.0009);
    map.apply_tick(0.0);
    EXPECT_EQ(map.get_q(0, 0, Action::UP), 0.0);
}

TEST(PheromoneMapTest, TiesGoToUp) {
    Grid grid(3, 3);
    PheromoneMap map(3, 3);
    EXPECT_EQ(map.get_best_action(1, 1, grid), Action::UP);
}

TEST(PheromoneMapTest, BestActionPicksTheLargestLegalMove) {
    Grid grid(3, 3);
    PheromoneMap map(3, 3);
    map.queue_update(1, 1, Action::RIGHT, 3.0);
    map.queue_update(1, 1, Action::DOWN, 2.0);
    map.queue_update(1, 1, Action::STAY, 50.0);
    map.apply_tick(0.0);

    // Stay is never a candidate
    EXPECT_EQ(map.get_best_action(1, 1, grid), Action::RIGHT);
}

TEST(PheromoneMapTest, BestActionSkipsWallsAndTheEdge) {
    std::vector<Tile> layout = {Tile(2, 1, TileType::WALL)};
    Grid grid(3, 2, layout);
    PheromoneMap map(3, 2);
    map.queue_update(2, 0, Action::DOWN, 10.0);
    map.queue_update(2, 0, Action::RIGHT, 20.0);
    map.queue_update(2, 0, Action::LEFT, -5.0);
    map.apply_tick(0.0);

    // Down is a wall, Right leaves the grid, Up clamps onto the same cell
    EXPECT_EQ(map.get_best_action(2, 0, grid), Action::UP);
}

TEST(PheromoneMapTest, EnclosedCellStays) {
    std::vector<Tile> layout = {Tile(1, 0, TileType::WALL), Tile(0, 1, TileType::WALL), Tile(2, 1, TileType::WALL),
                                Tile(1, 2, TileType::WALL)};
    Grid grid(3, 3, layout);
    PheromoneMap map(3, 3);
    EXPECT_EQ(map.get_best_action(1, 1, grid), Action::STAY);
}

TEST(QLearningTest, DeltaFollowsTheBellmanUpdate) {
    QLearningParams params(0.1, 0.9, 0.0);
    EXPECT_DOUBLE_EQ(params.compute_delta(0.0, 1000.0, 0.0), 100.0);
    EXPECT_DOUBLE_EQ(params.compute_delta(2.0, -1.0, 10.0), 0.1 * (-1.0 + 0.9 * 10.0 - 2.0));

    const double qs[] = {-3.5, 0.0, 12.25};
    const double rewards[] = {-100.0, -1.0, 1000.0};
    for (double q : qs) {
        for (double r : rewards) {
            QLearningParams p(0.3, 0.95, 0.1);
            EXPECT_DOUBLE_EQ(p.compute_delta(q, r, 4.0), 0.3 * (r + 0.95 * 4.0 - q));
        }
    }
}

TEST(QLearningTest, DefaultParameters) {
    QLearningParams params;
    EXPECT_DOUBLE_EQ(params.alpha, 0.1);
    EXPECT_DOUBLE_EQ(params.gamma, 0.99);
    EXPECT_DOUBLE_EQ(params.epsilon, 0.05);
}
