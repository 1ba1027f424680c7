#ifndef __TILEMAP_HPP_N4VBX0QE
#define __TILEMAP_HPP_N4VBX0QE

#include "utils.hpp"
#include <boost/optional.hpp>

typedef int tile_t;

const tile_t TILE_BLOCKED = 0;
const tile_t TILE_OPEN = 1;

// Read-only view of a tile map.  tile() returns boost::none for coordinates
// outside the map and for cells that hold no tile.
class TileMap {
public:
    virtual ~TileMap() { }
    virtual int width() const = 0;
    virtual int height() const = 0;
    virtual boost::optional<tile_t> tile(int x, int y) const = 0;
};

// A width x height grid of optional tiles stored row by row.
class GridMap : public TileMap {
public:
    GridMap(int width, int height, tile_t fill = TILE_OPEN);
    int width() const override;
    int height() const override;
    boost::optional<tile_t> tile(int x, int y) const override;

    void set(int x, int y, tile_t value);
    void clear(int x, int y);
    bool inrange(int x, int y) const;

private:
    int toID(int x, int y) const;

    int m_width;
    int m_height;
    vector<boost::optional<tile_t>> m_tiles;
};

// Stock passability rule: a tile must exist and must not be blocked.
bool walkable(const boost::optional<tile_t> &tile, int x, int y);

inline int GridMap::width() const
{
    return m_width;
}

inline int GridMap::height() const
{
    return m_height;
}

inline bool GridMap::inrange(int x, int y) const
{
    return 0 <= x && x < width() && 0 <= y && y < height();
}

inline int GridMap::toID(int x, int y) const
{
    return y * width() + x;
}

#endif /* end of include guard: __TILEMAP_HPP_N4VBX0QE */
