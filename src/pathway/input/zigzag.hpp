#ifndef __ZIGZAG_INPUT_HPP_M9CWL4FU
#define __ZIGZAG_INPUT_HPP_M9CWL4FU

#include "pathway/input.hpp"

// Every `gap`-th row is a wall with a single opening, alternating between
// the right and the left edge, so the path has to snake down the map.
class ZigzagPathwayInput : public PathwayInput {
public:
    ZigzagPathwayInput(int height, int width, int gap);
    void generate(GridMap &map) override;
    vec2 getStartPoint() const override;
    vec2 getEndPoint() const override;

protected:
    int m_height;
    int m_width;
    int m_gap;
    vec2 m_start;
    vec2 m_end;
};

#endif /* end of include guard: __ZIGZAG_INPUT_HPP_M9CWL4FU */
