#include <gtest/gtest.h>

#include <vector>

#include "game_manager.hpp"
#include "grid.hpp"
#include "map_editor.hpp"

TEST(MapEditorTest, StartsEmptyWithWallBrush) {
    MapEditor editor(4, 3);
    EXPECT_EQ(editor.get_selected(), TileType::WALL);
    EXPECT_EQ(editor.get_nest_count(), 0u);
    EXPECT_EQ(editor.get_tile(3, 2), TileType::DEFAULT);
    EXPECT_FALSE(editor.is_valid());
    EXPECT_EQ(editor.get_validation_error(), "Place 1 nest");
}

TEST(MapEditorTest, CountsNestsAsTheyArePaintedAndErased) {
    MapEditor editor(4, 4);
    editor.select(TileType::NEST);
    editor.paint(0, 0);
    editor.paint(0, 0);
    EXPECT_EQ(editor.get_nest_count(), 1u);

    editor.paint(3, 3);
    EXPECT_EQ(editor.get_nest_count(), 2u);
    EXPECT_EQ(editor.get_validation_error(), "Too many nests (2/1)");

    editor.select(TileType::WALL);
    editor.paint(3, 3);
    EXPECT_EQ(editor.get_nest_count(), 1u);
    EXPECT_EQ(editor.get_validation_error(), "Place some food");

    editor.select(TileType::FOOD_SOURCE);
    editor.paint(2, 1);
    EXPECT_TRUE(editor.is_valid());
    EXPECT_EQ(editor.get_validation_error(), "");
}

TEST(MapEditorTest, PaintingOffTheGridIsIgnored) {
    MapEditor editor(2, 2);
    editor.select(TileType::NEST);
    editor.paint(2, 0);
    editor.paint(0, 5);
    EXPECT_EQ(editor.get_nest_count(), 0u);
}

TEST(MapEditorTest, FillingWithNestsLeavesOne) {
    MapEditor editor(3, 3);
    editor.fill_all(TileType::NEST);
    EXPECT_EQ(editor.get_nest_count(), 1u);
    EXPECT_EQ(editor.get_tile(0, 0), TileType::NEST);
    EXPECT_EQ(editor.get_tile(2, 2), TileType::DEFAULT);

    editor.fill_all(TileType::WALL);
    EXPECT_EQ(editor.get_nest_count(), 0u);
    EXPECT_EQ(editor.get_tile(1, 1), TileType::WALL);

    editor.clear();
    EXPECT_EQ(editor.get_tile(1, 1), TileType::DEFAULT);
}

TEST(MapEditorTest, TilesCarryEditorDefaults) {
    MapEditor editor(3, 2);
    editor.select(TileType::NEST);
    editor.paint(0, 0);
    editor.select(TileType::FOOD_SOURCE);
    editor.paint(2, 1);
    editor.select(TileType::DEATH_ZONE);
    editor.paint(1, 1);

    std::vector<Tile> tiles = editor.to_tiles();
    ASSERT_EQ(tiles.size(), 6u);

    Grid grid(3, 2, tiles);
    const Tile* nest = grid.get_tile(0, 0);
    ASSERT_TRUE(nest->is_nest());
    EXPECT_EQ(nest->explorer_capacity, static_cast<uint32_t>(EDITOR_NEST_CAPACITY));
    EXPECT_EQ(grid.get_tile(2, 1)->food_amount().value(), static_cast<uint32_t>(EDITOR_FOOD_AMOUNT));
    EXPECT_TRUE(grid.is_lethal(1, 1));
    EXPECT_EQ(grid.get_tile(1, 0)->type, TileType::DEFAULT);
}

TEST(MapEditorTest, EditedMapRunsInTheManager) {
    MapEditor editor(5, 5);
    editor.select(TileType::NEST);
    editor.paint(2, 2);
    editor.select(TileType::FOOD_SOURCE);
    editor.paint(4, 4);
    ASSERT_TRUE(editor.is_valid());

    SimulationConfig config;
    AntsGameManager manager(editor.get_width(), editor.get_height(), editor.to_tiles(), make_colony(config), config);
    EXPECT_FALSE(manager.is_game_finished());
    EXPECT_EQ(manager.active_ant_count(), 6u);
    EXPECT_EQ(manager.density_at(2, 2), 6u);

    for (int i = 0; i < 20; i++)
        manager.game_step();

    EXPECT_GT(manager.active_ant_count(), 0u);
    EXPECT_EQ(*manager.get_grid().get_nest_position(), Position(2, 2));
}
