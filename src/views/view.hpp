#pragma once

#include <string>
#include <vector>

namespace views {

enum class PanelKind { Split, Text, Table, Chart };
enum class Direction { Vertical, Horizontal };

struct Rect {
    int y = 0;
    int x = 0;
    int height = 0;
    int width = 0;
};

struct ChartPoint {
    double x = 0.0;
    double y = 0.0;
};

// Declarative screen description. Only the fields of the panel's kind are
// meaningful; Split panels carry children, the others draw a titled box.
struct Panel {
    PanelKind kind = PanelKind::Text;
    std::string title;

    // Split
    Direction direction = Direction::Vertical;
    int margin = 0;
    std::vector<int> percents;
    std::vector<Panel> children;

    // Text
    std::vector<std::string> lines;

    // Table
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;
    std::vector<int> widths;

    // Chart
    std::vector<ChartPoint> points;
    double x_min = 0.0;
    double x_max = 0.0;
    double y_min = 0.0;
    double y_max = 0.0;
};

} // namespace views
