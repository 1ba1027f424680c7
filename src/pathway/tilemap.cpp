#include "pathway/tilemap.hpp"
#include "vec2.hpp"

GridMap::GridMap(int width, int height, tile_t fill)
    : m_width(width), m_height(height)
{
    if (width <= 0 || height <= 0)
        throw runtime_error(
            "invalid map size " + lexical_cast<string>(width) +
            "x" + lexical_cast<string>(height));
    m_tiles.assign((size_t)width * height, fill);
}

boost::optional<tile_t> GridMap::tile(int x, int y) const
{
    if (!inrange(x, y))
        return boost::none;
    return m_tiles[toID(x, y)];
}

void GridMap::set(int x, int y, tile_t value)
{
    if (!inrange(x, y))
        throw runtime_error("cell " + vec2(x, y).str() + " is outside the map");
    m_tiles[toID(x, y)] = value;
}

void GridMap::clear(int x, int y)
{
    if (!inrange(x, y))
        throw runtime_error("cell " + vec2(x, y).str() + " is outside the map");
    m_tiles[toID(x, y)] = boost::none;
}

bool walkable(const boost::optional<tile_t> &tile, int, int)
{
    return tile && *tile != TILE_BLOCKED;
}
