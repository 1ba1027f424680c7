#include "pathway/input/random.hpp"

RandomPathwayInput::RandomPathwayInput(
    int height, int width, int blockRate, boost::mt19937 &engine)
    : m_height(height), m_width(width), m_blockRate(blockRate), m_engine(engine)
{
    if (blockRate < 1 || blockRate > 99)
        throw runtime_error(
            "block rate must be within 1-99, got " +
            lexical_cast<string>(blockRate));
}

void RandomPathwayInput::generate(GridMap &map)
{
    boost::random::uniform_int_distribution<int> percent(0, 99);
    for (int y = 0; y < m_height; ++y)
        for (int x = 0; x < m_width; ++x)
            map.set(x, y, percent(m_engine) < m_blockRate ? TILE_BLOCKED : TILE_OPEN);

    vec2 start = getStartPoint();
    vec2 end = getEndPoint();
    map.set(start.x, start.y, TILE_OPEN);
    map.set(end.x, end.y, TILE_OPEN);
}

vec2 RandomPathwayInput::getStartPoint() const
{
    return vec2(0, 0);
}

vec2 RandomPathwayInput::getEndPoint() const
{
    return vec2(m_width - 1, m_height - 1);
}
