#pragma once
#include <curses.h>

#include <spdlog/spdlog.h>

#include <cctype>
#include <cstdio>
#include <functional>
#include <string>
#include <variant>
#include <vector>

#include "actions.hpp"
#include "data/catalog.hpp"
#include "data/records.hpp"
#include "settings.hpp"
#include "state.hpp"
#include "text.hpp"
#include "views/layout.hpp"

namespace session {

inline constexpr int kKeyEscape = 27;

// Per-dispatch collaborators. catalog is refreshed in place after a
// download; on_busy (optional) is told before a blocking script run.
struct Context {
    const Settings& settings;
    std::vector<data::StockInfo>& catalog;
    std::function<void(const std::string&)> on_busy;
};

inline bool is_enter(int ch)
{
    return ch == '\n' || ch == '\r' || ch == KEY_ENTER;
}

inline bool is_backspace(int ch)
{
    return ch == KEY_BACKSPACE || ch == 127 || ch == 8;
}

inline data::CatalogOptions catalog_options(const Settings& settings)
{
    data::CatalogOptions options;
    options.extension = settings.series_ext;
    options.close_column = settings.close_column;
    return options;
}

inline void refresh_catalog(SessionState& app, const Context& ctx)
{
    ctx.catalog =
        data::scan_catalog(ctx.settings.cache_dir, catalog_options(ctx.settings));
    app.clamp_selected(ctx.catalog.size());
}

// Startup problems go to stderr (the screen is not up yet), the log and
// the first output message.
inline void warn_startup(SessionState& app, const std::string& msg)
{
    std::fprintf(stderr, "warning: %s\n", msg.c_str());
    spdlog::warn("{}", msg);
    if (!app.output.empty()) app.output += "\n";
    app.output += "warning: " + msg;
}

// Accounts are read once. A failure is reported and leaves the table empty.
inline std::vector<data::AccountSummary>
load_startup_accounts(SessionState& app, const Settings& settings)
{
    std::string err;
    auto accounts = data::load_accounts(settings.accounts_file, &err);
    if (!err.empty()) {
        warn_startup(app,
                     "could not read " + settings.accounts_file.string() +
                         ": " + err);
    }
    return accounts;
}

// One tick before input: rescan the cache, reload trades and build the
// screen. Trade load failures are silent and show as an empty feed.
inline views::Panel next_frame(SessionState& app,
                               const Context& ctx,
                               const std::vector<data::AccountSummary>& accounts)
{
    refresh_catalog(app, ctx);
    const auto trades = data::load_trades(ctx.settings.trades_file);
    return views::render_layout(app, accounts, trades, ctx.catalog);
}

inline void notify_busy(const Context& ctx, const std::string& what)
{
    if (ctx.on_busy) ctx.on_busy(what);
}

inline void move_selection(SessionState& app, int count, int step)
{
    if (count <= 0) return;
    app.selected = ((app.selected + step) % count + count) % count;
}

// Enter in search: download the typed ticker, then back to the list
inline void submit_search(SessionState& app, const Context& ctx)
{
    const std::string ticker = upper_copy(trim_copy(app.search_query()));
    if (ticker.empty()) return;

    notify_busy(ctx, "downloading " + ticker + "...");
    app.output = actions::download(ctx.settings, ticker);
    app.exit_search();
    refresh_catalog(app, ctx);
}

// Enter in list: preprocess then predict the selected ticker; the predict
// step runs even when preprocess failed, and its message wins
inline void run_model(SessionState& app, const Context& ctx)
{
    const auto& catalog = ctx.catalog;
    if (catalog.empty()) return;
    if (app.selected < 0 || app.selected >= static_cast<int>(catalog.size())) {
        return;
    }

    const std::string ticker = catalog[static_cast<std::size_t>(app.selected)].ticker;

    notify_busy(ctx, "preprocessing " + ticker + "...");
    app.output = actions::preprocess(ctx.settings, ticker);

    notify_busy(ctx, "running model for " + ticker + "...");
    app.output = actions::predict(ctx.settings, ticker);
}

inline bool handle_mode_key(SessionState& app,
                            ListMode&,
                            const Context& ctx,
                            int ch)
{
    const int count = static_cast<int>(ctx.catalog.size());

    if (ch == KEY_DOWN) {
        move_selection(app, count, +1);
        return true;
    }
    if (ch == KEY_UP) {
        move_selection(app, count, -1);
        return true;
    }
    if (is_enter(ch)) {
        run_model(app, ctx);
        return true;
    }

    return false;
}

inline bool handle_mode_key(SessionState& app,
                            SearchMode& search,
                            const Context& ctx,
                            int ch)
{
    if (is_enter(ch)) {
        submit_search(app, ctx);
        return true;
    }

    if (is_backspace(ch)) {
        if (!search.query.empty()) search.query.pop_back();
        return true;
    }

    // printable ASCII only; tickers never need more
    if (ch >= 0 && ch <= 255 && std::isprint(static_cast<unsigned char>(ch))) {
        search.query.push_back(static_cast<char>(ch));
        return true;
    }

    return false;
}

// Returns true when the key was consumed. Quit is requested through
// app.quit_requested.
inline bool handle_key(SessionState& app, const Context& ctx, int ch)
{
    // commands valid in every mode, overlay or not
    switch (ch) {
    case 'q':
        app.quit_requested = true;
        return true;
    case 'h':
        app.show_instructions = !app.show_instructions;
        return true;
    case 's':
        app.enter_search();
        return true;
    case kKeyEscape:
        app.exit_search();
        return true;
    default:
        break;
    }

    return std::visit(
        [&](auto& mode) { return handle_mode_key(app, mode, ctx, ch); },
        app.mode);
}

} // namespace session
