#pragma once
#include <curses.h>

#include <algorithm>
#include <string>
#include <vector>

#include "views/canvas.hpp"
#include "views/layout.hpp"
#include "views/view.hpp"

namespace views {

inline constexpr short kColorPairPositive = 1;
inline constexpr short kColorPairHeader = 3;

inline Rect inner_rect(const Rect& r)
{
    return Rect{r.y + 1, r.x + 1, std::max(0, r.height - 2),
                std::max(0, r.width - 2)};
}

inline void print_clipped(int y, int x, int width, const std::string& text)
{
    if (width <= 0 || y < 0 || y >= LINES || x >= COLS) return;
    const int shown = std::min(static_cast<int>(text.size()),
                               std::min(width, COLS - x));
    if (shown <= 0) return;
    mvprintw(y, x, "%.*s", shown, text.c_str());
}

inline void draw_box(const Rect& r, const std::string& title)
{
    if (r.height < 2 || r.width < 2) return;

    const int bottom = r.y + r.height - 1;
    const int right = r.x + r.width - 1;

    mvaddch(r.y, r.x, ACS_ULCORNER);
    mvhline(r.y, r.x + 1, ACS_HLINE, r.width - 2);
    mvaddch(r.y, right, ACS_URCORNER);
    mvvline(r.y + 1, r.x, ACS_VLINE, r.height - 2);
    mvvline(r.y + 1, right, ACS_VLINE, r.height - 2);
    mvaddch(bottom, r.x, ACS_LLCORNER);
    mvhline(bottom, r.x + 1, ACS_HLINE, r.width - 2);
    mvaddch(bottom, right, ACS_LRCORNER);

    if (title.empty()) return;
    if (has_colors()) attron(COLOR_PAIR(kColorPairHeader));
    attron(A_BOLD);
    print_clipped(r.y, r.x + 1, r.width - 2, title);
    attroff(A_BOLD);
    if (has_colors()) attroff(COLOR_PAIR(kColorPairHeader));
}

inline void draw_lines(const Rect& area, const std::vector<std::string>& lines)
{
    const int shown = std::min(area.height, static_cast<int>(lines.size()));
    for (int i = 0; i < shown; ++i) {
        print_clipped(area.y + i,
                      area.x,
                      area.width,
                      lines[static_cast<std::size_t>(i)]);
    }
}

inline std::string table_row_text(const std::vector<std::string>& cells,
                                  const std::vector<int>& widths)
{
    std::string out;
    for (std::size_t c = 0; c < cells.size() && c < widths.size(); ++c) {
        const auto w = static_cast<std::size_t>(std::max(0, widths[c]));
        std::string cell = cells[c].substr(0, w);
        cell.resize(w, ' ');
        if (c) out.push_back(' ');
        out += cell;
    }
    return out;
}

inline void draw_table(const Rect& area, const Panel& panel)
{
    if (area.height <= 0) return;

    attron(A_BOLD);
    print_clipped(area.y, area.x, area.width,
                  table_row_text(panel.header, panel.widths));
    attroff(A_BOLD);

    // header, blank spacer, then rows
    const int first_row_y = area.y + 2;
    const int last_y = area.y + area.height;
    for (std::size_t i = 0; i < panel.rows.size(); ++i) {
        const int y = first_row_y + static_cast<int>(i);
        if (y >= last_y) break;
        print_clipped(y, area.x, area.width,
                      table_row_text(panel.rows[i], panel.widths));
    }
}

inline void draw_chart(const Rect& area, const Panel& panel)
{
    const auto grid = rasterize_chart(panel, area.width, area.height);

    if (has_colors()) attron(COLOR_PAIR(kColorPairPositive));
    for (std::size_t row = 0; row < grid.size(); ++row) {
        const std::string& line = grid[row];
        for (std::size_t col = 0; col < line.size(); ++col) {
            if (line[col] == ' ') continue;
            mvaddch(area.y + static_cast<int>(row),
                    area.x + static_cast<int>(col),
                    static_cast<chtype>(line[col]));
        }
    }
    if (has_colors()) attroff(COLOR_PAIR(kColorPairPositive));
}

inline void draw_panel(const Panel& panel, const Rect& area)
{
    if (area.height <= 0 || area.width <= 0) return;

    switch (panel.kind) {
    case PanelKind::Split: {
        const auto rects =
            split_rect(area, panel.direction, panel.percents, panel.margin);
        for (std::size_t i = 0; i < rects.size() && i < panel.children.size();
             ++i) {
            draw_panel(panel.children[i], rects[i]);
        }
        break;
    }
    case PanelKind::Text:
        draw_box(area, panel.title);
        draw_lines(inner_rect(area), panel.lines);
        break;
    case PanelKind::Table:
        draw_box(area, panel.title);
        draw_table(inner_rect(area), panel);
        break;
    case PanelKind::Chart:
        draw_box(area, panel.title);
        draw_chart(inner_rect(area), panel);
        break;
    }
}

inline void draw_screen(const Panel& root)
{
    curs_set(0);
    erase();
    draw_panel(root, Rect{0, 0, LINES, COLS});
    wnoutrefresh(stdscr);
    doupdate();
}

// Shown on the bottom border while a script blocks the loop; the next
// frame erases it.
inline void draw_busy_note(const std::string& note)
{
    if (LINES <= 0) return;
    attron(A_REVERSE);
    print_clipped(LINES - 1, 2, std::max(0, COLS - 4), " " + note + " ");
    attroff(A_REVERSE);
    wnoutrefresh(stdscr);
    doupdate();
}

} // namespace views
