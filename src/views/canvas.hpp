#pragma once

#include <cmath>
#include <cstdlib>
#include <string>
#include <vector>

#include "views/view.hpp"

namespace views {

inline constexpr char kCanvasMarker = '*';

struct Cell {
    int row = 0;
    int col = 0;
};

// Maps a data point into a width x height cell grid, row 0 at the top.
inline Cell to_cell(const Panel& chart, ChartPoint p, int width, int height)
{
    const double x_span = chart.x_max - chart.x_min;
    const double y_span = chart.y_max - chart.y_min;
    const double fx = x_span > 0.0 ? (p.x - chart.x_min) / x_span : 0.0;
    const double fy = y_span > 0.0 ? (chart.y_max - p.y) / y_span : 0.0;

    Cell c;
    c.col = static_cast<int>(std::lround(fx * (width - 1)));
    c.row = static_cast<int>(std::lround(fy * (height - 1)));
    return c;
}

inline void plot(std::vector<std::string>& grid, int row, int col)
{
    if (row < 0 || row >= static_cast<int>(grid.size())) return;
    auto& line = grid[static_cast<std::size_t>(row)];
    if (col < 0 || col >= static_cast<int>(line.size())) return;
    line[static_cast<std::size_t>(col)] = kCanvasMarker;
}

// Bresenham between two cells, both ends inclusive
inline void draw_segment(std::vector<std::string>& grid, Cell a, Cell b)
{
    const int dx = std::abs(b.col - a.col);
    const int dy = -std::abs(b.row - a.row);
    const int sx = a.col < b.col ? 1 : -1;
    const int sy = a.row < b.row ? 1 : -1;
    int err = dx + dy;

    while (true) {
        plot(grid, a.row, a.col);
        if (a.col == b.col && a.row == b.row) break;
        const int e2 = 2 * err;
        if (e2 >= dy) {
            err += dy;
            a.col += sx;
        }
        if (e2 <= dx) {
            err += dx;
            a.row += sy;
        }
    }
}

// Plots consecutive chart points as connected line segments.
inline std::vector<std::string>
rasterize_chart(const Panel& chart, int width, int height)
{
    if (width <= 0 || height <= 0) return {};

    std::vector<std::string> grid(static_cast<std::size_t>(height),
                                  std::string(static_cast<std::size_t>(width), ' '));

    if (chart.points.size() == 1) {
        const Cell c = to_cell(chart, chart.points.front(), width, height);
        plot(grid, c.row, c.col);
    }

    for (std::size_t i = 1; i < chart.points.size(); ++i) {
        draw_segment(grid,
                     to_cell(chart, chart.points[i - 1], width, height),
                     to_cell(chart, chart.points[i], width, height));
    }

    return grid;
}

} // namespace views
