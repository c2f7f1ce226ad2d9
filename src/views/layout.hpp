#pragma once

#include <algorithm>
#include <array>
#include <string>
#include <vector>

#include "data/catalog.hpp"
#include "data/records.hpp"
#include "state.hpp"
#include "text.hpp"
#include "views/view.hpp"
#include "views/view_help.hpp"

namespace views {

inline constexpr int kOuterMargin = 1;
inline constexpr int kTableColumnWidth = 10;

inline const std::vector<int>& rows_split() // top / middle / bottom
{
    static const std::vector<int> split = {50, 30, 20};
    return split;
}

inline const std::vector<int>& wide_narrow_split()
{
    static const std::vector<int> split = {70, 30};
    return split;
}

// illustrative trend, not tied to the catalog
inline constexpr std::array<ChartPoint, 7> kTrendSeries = {{
    {0.0, 100.0},
    {1.0, 102.5},
    {2.0, 105.0},
    {3.0, 103.0},
    {4.0, 107.0},
    {5.0, 106.0},
    {6.0, 110.0},
}};

// *
// **
// ***
// ****
// ***** GEOMETRY

// Splits area (shrunk by margin) into chunks of the given percentages.
// Each chunk is floored; the last one takes whatever is left.
inline std::vector<Rect> split_rect(Rect area,
                                    Direction direction,
                                    const std::vector<int>& percents,
                                    int margin = 0)
{
    Rect inner = area;
    inner.y += margin;
    inner.x += margin;
    inner.height = std::max(0, area.height - 2 * margin);
    inner.width = std::max(0, area.width - 2 * margin);

    const bool vertical = direction == Direction::Vertical;
    const int total = vertical ? inner.height : inner.width;

    std::vector<Rect> out;
    out.reserve(percents.size());
    int offset = 0;
    for (std::size_t i = 0; i < percents.size(); ++i) {
        int size = (i + 1 == percents.size()) ? total - offset
                                              : total * percents[i] / 100;
        size = std::clamp(size, 0, std::max(0, total - offset));

        Rect r = inner;
        if (vertical) {
            r.y = inner.y + offset;
            r.height = size;
        }
        else {
            r.x = inner.x + offset;
            r.width = size;
        }
        out.push_back(r);
        offset += size;
    }
    return out;
}

// *
// **
// ***
// ****
// ***** PANELS

inline Panel split_panel(Direction direction,
                         const std::vector<int>& percents,
                         std::vector<Panel> children,
                         int margin = 0)
{
    Panel panel;
    panel.kind = PanelKind::Split;
    panel.direction = direction;
    panel.percents = percents;
    panel.children = std::move(children);
    panel.margin = margin;
    return panel;
}

inline Panel chart_panel()
{
    Panel panel;
    panel.kind = PanelKind::Chart;
    panel.title = "Stock Chart";
    panel.points.assign(kTrendSeries.begin(), kTrendSeries.end());

    const auto [x_lo, x_hi] = std::minmax_element(
        panel.points.begin(), panel.points.end(),
        [](const ChartPoint& a, const ChartPoint& b) { return a.x < b.x; });
    const auto [y_lo, y_hi] = std::minmax_element(
        panel.points.begin(), panel.points.end(),
        [](const ChartPoint& a, const ChartPoint& b) { return a.y < b.y; });

    panel.x_min = x_lo->x - 0.5;
    panel.x_max = x_hi->x + 0.5;
    panel.y_min = y_lo->y - 2.0;
    panel.y_max = y_hi->y + 2.0;
    return panel;
}

inline std::string trade_line(const data::TradeRecord& t)
{
    return t.name + "  " + format_fixed2(t.transaction) + "  " +
           format_fixed2(t.new_balance);
}

inline Panel trades_panel(const std::vector<data::TradeRecord>& trades)
{
    Panel panel;
    panel.kind = PanelKind::Text;
    panel.title = "Live Trades";
    panel.lines.reserve(trades.size());
    for (const auto& t : trades) panel.lines.push_back(trade_line(t));
    return panel;
}

inline Panel accounts_panel(const std::vector<data::AccountSummary>& accounts)
{
    Panel panel;
    panel.kind = PanelKind::Table;
    panel.title = "Account Summary";
    panel.header = {"Name", "Initial", "Current", "Change", "% Change"};
    panel.widths.assign(panel.header.size(), kTableColumnWidth);

    for (const auto& a : accounts) {
        panel.rows.push_back({
            a.name,
            format_fixed2(a.initial_amount),
            format_fixed2(a.current_amount),
            format_fixed2(a.change),
            format_fixed2(a.percentage_change) + "%",
        });
    }
    return panel;
}

inline std::string catalog_line(const data::StockInfo& s, bool selected)
{
    return std::string(selected ? ">" : " ") + " " + s.ticker + "  " +
           format_fixed2(s.price) + "  " + format_fixed2(s.change) + " (" +
           format_fixed2(s.pct_change) + "%)";
}

inline Panel catalog_panel(const std::vector<data::StockInfo>& catalog,
                           int selected)
{
    Panel panel;
    panel.kind = PanelKind::Text;
    panel.title = "ML List";
    for (std::size_t i = 0; i < catalog.size(); ++i) {
        panel.lines.push_back(
            catalog_line(catalog[i], static_cast<int>(i) == selected));
    }
    return panel;
}

inline void append_lines(std::vector<std::string>& out, const std::string& text)
{
    std::size_t start = 0;
    while (start <= text.size()) {
        const std::size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            out.push_back(text.substr(start));
            break;
        }
        out.push_back(text.substr(start, end - start));
        start = end + 1;
    }
}

inline Panel search_panel(const SessionState& app)
{
    Panel panel;
    panel.kind = PanelKind::Text;
    panel.title = "Search";
    panel.lines.push_back("Search Ticker: " + app.search_query());
    panel.lines.push_back("");
    append_lines(panel.lines, app.output);
    return panel;
}

// Pure: same inputs, same tree. The overlay replaces the whole layout.
inline Panel render_layout(const SessionState& app,
                           const std::vector<data::AccountSummary>& accounts,
                           const std::vector<data::TradeRecord>& trades,
                           const std::vector<data::StockInfo>& catalog)
{
    if (app.show_instructions) return help_panel();

    Panel top = split_panel(Direction::Horizontal,
                            wide_narrow_split(),
                            {chart_panel(), trades_panel(trades)});
    Panel bottom = split_panel(Direction::Horizontal,
                               wide_narrow_split(),
                               {catalog_panel(catalog, app.selected),
                                search_panel(app)});

    return split_panel(Direction::Vertical,
                       rows_split(),
                       {std::move(top), accounts_panel(accounts),
                        std::move(bottom)},
                       kOuterMargin);
}

} // namespace views
