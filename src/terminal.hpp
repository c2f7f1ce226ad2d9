#pragma once
#include <curses.h>

#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>

#include "views/draw.hpp"

// Owns the ncurses screen. newterm reports an unusable terminal by
// returning null where initscr would exit the process.
class Terminal {
public:
    explicit Terminal(int poll_ms)
    {
        screen_ = newterm(nullptr, stdout, stdin);
        if (!screen_) {
            const char* term = std::getenv("TERM");
            throw std::runtime_error(
                std::string("failed to initialize terminal '") +
                (term ? term : "") + "'");
        }
        set_term(screen_);

        cbreak();
        noecho();
        keypad(stdscr, TRUE);
#if defined(NCURSES_VERSION)
        set_escdelay(25);
#endif
        curs_set(0);
        timeout(poll_ms); // bounded wait per tick
        if (has_colors()) {
            start_color();
#if defined(NCURSES_VERSION)
            use_default_colors();
#endif
            init_pair(views::kColorPairPositive, COLOR_GREEN, -1);
            init_pair(views::kColorPairHeader, COLOR_BLUE, -1);
        }
    }

    ~Terminal()
    {
        endwin();
        delscreen(screen_);
    }

    Terminal(const Terminal&) = delete;
    Terminal& operator=(const Terminal&) = delete;

private:
    SCREEN* screen_ = nullptr;
};
