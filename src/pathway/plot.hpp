#ifndef __PLOT_HPP_G6LPRA2E
#define __PLOT_HPP_G6LPRA2E

#include "pathway/tilemap.hpp"
#include "vec2.hpp"

// Renders the map and the path to a BMP image.  Returns false when the map
// is too large to plot.
bool plotSolution(const TileMap &map, const vector<vec2> &pathList,
                  const string &filename);

#endif /* end of include guard: __PLOT_HPP_G6LPRA2E */
