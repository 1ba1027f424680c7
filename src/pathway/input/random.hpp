#ifndef __RANDOM_HPP_C5HMS8VU
#define __RANDOM_HPP_C5HMS8VU

#include "pathway/input.hpp"

// Blocks each cell with probability blockRate percent.  The path runs from
// the top left to the bottom right corner; both corners stay open.
class RandomPathwayInput : public PathwayInput {
public:
    RandomPathwayInput(int height, int width, int blockRate,
                       boost::mt19937 &engine);
    void generate(GridMap &map) override;
    vec2 getStartPoint() const override;
    vec2 getEndPoint() const override;

protected:
    int m_height;
    int m_width;
    int m_blockRate;
    boost::mt19937 &m_engine;
};

#endif /* end of include guard: __RANDOM_HPP_C5HMS8VU */
