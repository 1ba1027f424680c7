#include "pathway/input/custom.hpp"
#include "pathway/input/random.hpp"
#include "pathway/input/zigzag.hpp"

#include <gtest/gtest.h>
#include <sstream>

namespace {
int count_open(const GridMap& map, int row) {
    int open = 0;
    for (int x = 0; x < map.width(); ++x)
        if (walkable(map.tile(x, row), x, row))
            ++open;
    return open;
}
}

TEST(CustomInputTest, ReadsEndpointsAndCells) {
    std::istringstream in(
        "0 0 2 1\n"
        "1 0 1\n"
        "1 1 5\n");
    GridMap map(3, 2, TILE_BLOCKED);
    CustomPathwayInput input(2, 3, in);

    input.generate(map);

    EXPECT_EQ(input.getStartPoint(), vec2(0, 0));
    EXPECT_EQ(input.getEndPoint(), vec2(2, 1));
    EXPECT_EQ(*map.tile(0, 0), TILE_OPEN);
    EXPECT_EQ(*map.tile(1, 0), TILE_BLOCKED);
    EXPECT_EQ(*map.tile(2, 0), TILE_OPEN);
    EXPECT_EQ(*map.tile(1, 1), TILE_OPEN);
    EXPECT_EQ(*map.tile(2, 1), TILE_OPEN);
}

TEST(CustomInputTest, RejectsTruncatedMap) {
    std::istringstream in("0 0 1 1\n1 1\n1");
    GridMap map(2, 2);
    CustomPathwayInput input(2, 2, in);
    EXPECT_THROW(input.generate(map), std::runtime_error);
}

TEST(CustomInputTest, RejectsEndpointsOutsideTheMap) {
    std::istringstream before_start("-1 0 2 0\n1 1 1\n");
    GridMap map(3, 1);
    CustomPathwayInput start_off(1, 3, before_start);
    EXPECT_THROW(start_off.generate(map), std::runtime_error);

    std::istringstream past_end("0 0 3 0\n1 1 1\n");
    CustomPathwayInput end_off(1, 3, past_end);
    EXPECT_THROW(end_off.generate(map), std::runtime_error);

    std::istringstream below_end("0 0 2 1\n1 1 1\n");
    CustomPathwayInput end_below(1, 3, below_end);
    EXPECT_THROW(end_below.generate(map), std::runtime_error);
}

TEST(CustomInputTest, RejectsGarbage) {
    std::istringstream in("0 zero 1 1");
    GridMap map(2, 2);
    CustomPathwayInput input(2, 2, in);
    EXPECT_THROW(input.generate(map), std::runtime_error);
}

TEST(ZigzagInputTest, EveryWallHasOneOpening) {
    GridMap map(7, 8);
    ZigzagPathwayInput input(8, 7, 2);
    input.generate(map);

    EXPECT_EQ(input.getStartPoint(), vec2(3, 0));
    EXPECT_EQ(input.getEndPoint(), vec2(3, 7));
    for (int y = 0; y < 8; ++y) {
        if (y && y % 2 == 0)
            EXPECT_EQ(count_open(map, y), 1) << "row " << y;
        else
            EXPECT_EQ(count_open(map, y), 7) << "row " << y;
    }
    // Openings alternate, starting on the right.
    EXPECT_EQ(*map.tile(6, 2), TILE_OPEN);
    EXPECT_EQ(*map.tile(0, 4), TILE_OPEN);
    EXPECT_EQ(*map.tile(6, 6), TILE_OPEN);
}

TEST(ZigzagInputTest, RejectsZeroGap) {
    EXPECT_THROW(ZigzagPathwayInput(5, 5, 0), std::runtime_error);
}

TEST(RandomInputTest, SameSeedSameMap) {
    boost::mt19937 a(1234);
    boost::mt19937 b(1234);
    GridMap first(16, 12);
    GridMap second(16, 12);
    RandomPathwayInput(12, 16, 40, a).generate(first);
    RandomPathwayInput(12, 16, 40, b).generate(second);

    int blocked = 0;
    for (int y = 0; y < 12; ++y)
        for (int x = 0; x < 16; ++x) {
            EXPECT_EQ(*first.tile(x, y), *second.tile(x, y));
            if (*first.tile(x, y) == TILE_BLOCKED)
                ++blocked;
        }
    EXPECT_GT(blocked, 0);
    EXPECT_LT(blocked, 16 * 12);
}

TEST(RandomInputTest, EndpointsStayOpen) {
    boost::mt19937 engine(7);
    GridMap map(10, 10);
    RandomPathwayInput input(10, 10, 99, engine);
    input.generate(map);
    EXPECT_EQ(input.getStartPoint(), vec2(0, 0));
    EXPECT_EQ(input.getEndPoint(), vec2(9, 9));
    EXPECT_EQ(*map.tile(0, 0), TILE_OPEN);
    EXPECT_EQ(*map.tile(9, 9), TILE_OPEN);
}

TEST(RandomInputTest, RejectsBlockRateOutOfRange) {
    boost::mt19937 engine;
    EXPECT_THROW(RandomPathwayInput(4, 4, 0, engine), std::runtime_error);
    EXPECT_THROW(RandomPathwayInput(4, 4, 100, engine), std::runtime_error);
}
