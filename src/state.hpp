#pragma once

#include <cstddef>
#include <string>
#include <variant>

struct ListMode {};

struct SearchMode {
    std::string query; // raw typed text, normalized on submit
};

using Mode = std::variant<ListMode, SearchMode>;

struct SessionState {
    Mode mode = ListMode{};
    int selected = 0;               // index into the current catalog
    std::string output;             // outcome of the last action
    bool show_instructions = false; // help overlay, render-only
    bool quit_requested = false;    // checked at the top of each tick

    bool searching() const { return std::holds_alternative<SearchMode>(mode); }

    const std::string& search_query() const
    {
        static const std::string empty;
        const auto* search = std::get_if<SearchMode>(&mode);
        return search ? search->query : empty;
    }

    void enter_search() { mode = SearchMode{}; }
    void exit_search() { mode = ListMode{}; }

    // keeps selected valid while catalog files come and go
    void clamp_selected(std::size_t count)
    {
        if (count == 0 || selected < 0) {
            selected = 0;
            return;
        }
        if (selected >= static_cast<int>(count)) {
            selected = static_cast<int>(count - 1);
        }
    }
};
