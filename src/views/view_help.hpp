#pragma once

#include <array>
#include <string>

#include "views/view.hpp"

namespace views {

inline constexpr std::array<const char*, 8> kInstructionLines = {
    "Instructions:",
    " - Up/Down: Navigate ML stock list",
    " - Enter (List mode): Preprocess & train on selected stock",
    " - s: Activate search box",
    " - In Search mode: Type ticker and press Enter to download data",
    " - Esc (in Search mode): Cancel search",
    " - h: Toggle instructions overlay",
    " - q: Quit",
};

inline Panel help_panel()
{
    Panel panel;
    panel.kind = PanelKind::Text;
    panel.title = "Instructions";
    panel.lines.assign(kInstructionLines.begin(), kInstructionLines.end());
    return panel;
}

} // namespace views
