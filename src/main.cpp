#include <curses.h>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "data/catalog.hpp"
#include "logging.hpp"
#include "session.hpp"
#include "settings.hpp"
#include "state.hpp"
#include "terminal.hpp"
#include "views/draw.hpp"

int main()
{
    try {
        SessionState app;
        Settings settings;

        std::string settings_err;
        const bool settings_ok = load_settings(settings, &settings_err);

        std::string log_err;
        if (!init_file_logging(settings.log_file, &log_err)) {
            std::fprintf(stderr, "warning: logging disabled: %s\n",
                         log_err.c_str());
        }
        spdlog::info("stockdash starting");

        if (!settings_ok) session::warn_startup(app, settings_err);

        const auto accounts = session::load_startup_accounts(app, settings);

        Terminal terminal(settings.poll_ms);

        std::vector<data::StockInfo> catalog;
        session::Context ctx{settings, catalog, {}};
        ctx.on_busy = [](const std::string& note) {
            views::draw_busy_note(note);
        };

        while (!app.quit_requested) {
            views::draw_screen(session::next_frame(app, ctx, accounts));

            const int ch = getch();
            if (ch == ERR) continue; // poll timed out

            session::handle_key(app, ctx, ch);
        }

        spdlog::info("stockdash exiting");
        return 0;
    }
    catch (const std::exception& e) {
        std::fprintf(stderr, "error: %s\n", e.what());
        return 1;
    }
}
