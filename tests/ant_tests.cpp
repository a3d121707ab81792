#include <gtest/gtest.h>

#include <vector>

#include "ant.hpp"
#include "grid.hpp"
#include "types.hpp"

TEST(AntTest, ConstantsFollowTheType) {
    Ant explorer(AntType::EXPLORER);
    EXPECT_EQ(explorer.maximal_charge, 10u);
    EXPECT_EQ(explorer.seconds_for_movement, 5u);
    EXPECT_EQ(explorer.scope, 1u);

    Ant fighter(AntType::FIGHTER);
    EXPECT_EQ(fighter.maximal_charge, 10u);
    EXPECT_EQ(fighter.seconds_for_movement, 5u);
    EXPECT_EQ(fighter.scope, 1u);

    Ant picker(AntType::PICKER);
    EXPECT_EQ(picker.maximal_charge, 100u);
    EXPECT_EQ(picker.seconds_for_movement, 10u);
    EXPECT_EQ(picker.scope, 0u);
}

TEST(AntTest, StartsUnspawnedAndFinding) {
    Ant ant(AntType::PICKER);
    EXPECT_FALSE(ant.is_active());
    EXPECT_EQ(ant.mode, AntMode::FINDING);
    EXPECT_EQ(ant.current_charge, 0u);
    EXPECT_EQ(ant.cooldown, 0u);
}

TEST(AntTest, TargetPositionClampsAtZero) {
    Ant ant(AntType::EXPLORER);
    ant.move_to(0, 0);
    EXPECT_EQ(ant.get_target_position(Action::UP), Position(0, 0));
    EXPECT_EQ(ant.get_target_position(Action::LEFT), Position(0, 0));
    EXPECT_EQ(ant.get_target_position(Action::DOWN), Position(0, 1));
    EXPECT_EQ(ant.get_target_position(Action::RIGHT), Position(1, 0));
    EXPECT_EQ(ant.get_target_position(Action::STAY), Position(0, 0));

    ant.move_to(3, 4);
    EXPECT_EQ(ant.get_target_position(Action::UP), Position(3, 3));
    EXPECT_EQ(ant.get_target_position(Action::LEFT), Position(2, 4));
}

TEST(AntTest, UnspawnedAntComputesFromOrigin) {
    Ant ant(AntType::FIGHTER);
    EXPECT_EQ(ant.get_target_position(Action::RIGHT), Position(1, 0));
}

TEST(AntTest, SpawnAtNestNeedsANest) {
    Ant ant(AntType::EXPLORER);
    ant.spawn_at_nest(Grid(3, 3));
    EXPECT_FALSE(ant.is_active());

    std::vector<Tile> layout = {Tile::nest(2, 1)};
    ant.spawn_at_nest(Grid(3, 3, layout));
    ASSERT_TRUE(ant.is_active());
    EXPECT_EQ(*ant.position, Position(2, 1));
}
