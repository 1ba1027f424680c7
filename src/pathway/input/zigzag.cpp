#include "pathway/input/zigzag.hpp"

ZigzagPathwayInput::ZigzagPathwayInput(int height, int width, int gap)
    : m_height(height), m_width(width), m_gap(gap)
{
    if (gap < 1)
        throw runtime_error("zigzag gap must be positive");
}

void ZigzagPathwayInput::generate(GridMap &map)
{
    m_start = vec2(m_width / 2, 0);
    m_end = vec2(m_width / 2, m_height - 1);

    bool left = false;
    for (int y = 0; y < m_height; ++y) {
        if (y && y % m_gap == 0) {
            int opening = left ? 0 : m_width - 1;
            for (int x = 0; x < m_width; ++x)
                map.set(x, y, x == opening ? TILE_OPEN : TILE_BLOCKED);
            left = !left;
        } else {
            for (int x = 0; x < m_width; ++x)
                map.set(x, y, TILE_OPEN);
        }
    }
}

vec2 ZigzagPathwayInput::getStartPoint() const
{
    return m_start;
}

vec2 ZigzagPathwayInput::getEndPoint() const
{
    return m_end;
}
