#include "pathway/input/custom.hpp"

CustomPathwayInput::CustomPathwayInput(int height, int width, std::istream &in)
    : m_height(height), m_width(width), m_in(in)
{
    // pass
}

vec2 CustomPathwayInput::getStartPoint() const
{
    return m_start;
}

vec2 CustomPathwayInput::getEndPoint() const
{
    return m_end;
}

void CustomPathwayInput::generate(GridMap &map)
{
    m_start.x = readInt("start x");
    m_start.y = readInt("start y");
    m_end.x = readInt("end x");
    m_end.y = readInt("end y");
    if (!map.inrange(m_start.x, m_start.y))
        throw runtime_error("start point " + m_start.str() + " is outside the map");
    if (!map.inrange(m_end.x, m_end.y))
        throw runtime_error("end point " + m_end.str() + " is outside the map");

    for (int y = 0; y < m_height; ++y) {
        for (int x = 0; x < m_width; ++x) {
            int t = readInt("map cell");
            map.set(x, y, t ? TILE_OPEN : TILE_BLOCKED);
        }
    }
}

int CustomPathwayInput::readInt(const char *what)
{
    int value;
    if (!(m_in >> value))
        throw runtime_error(string("malformed map input: expected ") + what);
    return value;
}
