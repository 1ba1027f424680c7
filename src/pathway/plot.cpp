#include <bitmap_image.hpp>

#include "pathway/plot.hpp"

static void drawCell(
    bitmap_image &image, int pixel_size,
    int x, int y, uint8_t r, uint8_t g, uint8_t b)
{
    for (int p = 0; p < pixel_size; ++p)
        for (int q = 0; q < pixel_size; ++q)
            image.set_pixel(x * pixel_size + p, y * pixel_size + q, r, g, b);
}

bool plotSolution(const TileMap &map, const vector<vec2> &pathList,
                  const string &filename)
{
    int pixel_size = min(1024 / map.width(), 768 / map.height());
    if (pixel_size < 4) {
        puts("Warning:  too small pixel to plot");
        return false;
    }

    bitmap_image image(map.width() * pixel_size, map.height() * pixel_size);

    // draw the background
    for (int y = 0; y < map.height(); ++y)
        for (int x = 0; x < map.width(); ++x) {
            boost::optional<tile_t> tile = map.tile(x, y);
            if (!tile)
                drawCell(image, pixel_size, x, y, 0, 0, 0);
            else if (*tile == TILE_BLOCKED)
                drawCell(image, pixel_size, x, y, 128, 128, 128);
            else
                drawCell(image, pixel_size, x, y, 255, 255, 255);
        }

    // draw the path, then its endpoints on top
    for (const vec2 &v : pathList)
        drawCell(image, pixel_size, v.x, v.y, 0, 255, 0);
    if (!pathList.empty()) {
        const vec2 &s = pathList.front();
        const vec2 &e = pathList.back();
        drawCell(image, pixel_size, s.x, s.y, 0, 0, 255);
        drawCell(image, pixel_size, e.x, e.y, 255, 0, 0);
    }

    // grid lines
    image_drawer drawer(image);
    drawer.pen_color(0, 0, 255);
    drawer.pen_width(1);
    for (int y = 1; y < map.height(); ++y)
        drawer.horiztonal_line_segment(
            0, map.width() * pixel_size - 1, y * pixel_size);
    for (int x = 1; x < map.width(); ++x)
        drawer.vertical_line_segment(
            0, map.height() * pixel_size - 1, x * pixel_size);

    image.save_image(filename);
    return true;
}
