#include "pathway/tilemap.hpp"
#include "vec2.hpp"

#include <gtest/gtest.h>
#include <unordered_set>

TEST(GridMapTest, FillsEveryCell) {
    GridMap map(3, 2, TILE_BLOCKED);
    EXPECT_EQ(map.width(), 3);
    EXPECT_EQ(map.height(), 2);
    for (int y = 0; y < 2; ++y)
        for (int x = 0; x < 3; ++x) {
            ASSERT_TRUE(map.tile(x, y));
            EXPECT_EQ(*map.tile(x, y), TILE_BLOCKED);
        }
}

TEST(GridMapTest, OffMapHasNoTile) {
    GridMap map(4, 4);
    EXPECT_FALSE(map.tile(-1, 0));
    EXPECT_FALSE(map.tile(0, -1));
    EXPECT_FALSE(map.tile(4, 0));
    EXPECT_FALSE(map.tile(0, 4));
    EXPECT_TRUE(map.tile(3, 3));
}

TEST(GridMapTest, LookupIsRowMajor) {
    GridMap map(5, 2);
    map.set(4, 1, 7);
    EXPECT_EQ(*map.tile(4, 1), 7);
    EXPECT_EQ(*map.tile(1, 0), TILE_OPEN);
    EXPECT_FALSE(map.tile(1, 4));
}

TEST(GridMapTest, ClearedCellHasNoTile) {
    GridMap map(2, 2);
    map.clear(1, 0);
    EXPECT_FALSE(map.tile(1, 0));
    map.set(1, 0, TILE_OPEN);
    EXPECT_TRUE(map.tile(1, 0));
}

TEST(GridMapTest, RejectsOutOfRangeMutation) {
    GridMap map(2, 2);
    EXPECT_THROW(map.set(2, 0, TILE_OPEN), std::runtime_error);
    EXPECT_THROW(map.clear(0, -1), std::runtime_error);
}

TEST(GridMapTest, RejectsEmptyGrid) {
    EXPECT_THROW(GridMap(0, 3), std::runtime_error);
    EXPECT_THROW(GridMap(3, -1), std::runtime_error);
}

TEST(WalkableTest, NeedsAnUnblockedTile) {
    EXPECT_TRUE(walkable(boost::optional<tile_t>(TILE_OPEN), 0, 0));
    EXPECT_TRUE(walkable(boost::optional<tile_t>(42), 0, 0));
    EXPECT_FALSE(walkable(boost::optional<tile_t>(TILE_BLOCKED), 0, 0));
    EXPECT_FALSE(walkable(boost::none, -1, 0));
}

TEST(Vec2Test, KeysAreDistinctAroundTheOrigin) {
    std::unordered_set<uint64_t> keys;
    for (int y = -2; y <= 2; ++y)
        for (int x = -2; x <= 2; ++x)
            keys.insert(vec2(x, y).key());
    EXPECT_EQ(keys.size(), 25u);
}

TEST(Vec2Test, ManhattanDistance) {
    EXPECT_EQ(vec2(0, 0).manhattan(vec2(3, 4)), 7);
    EXPECT_EQ(vec2(2, -1).manhattan(vec2(-1, 1)), 5);
    EXPECT_EQ(vec2(3, 4).str(), "(3,4)");
}
