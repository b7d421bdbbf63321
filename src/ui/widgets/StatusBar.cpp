#include "ui/widgets/StatusBar.hpp"
#include "ui/Formatting.hpp"
#include "ui/VisualBlocks.hpp"
#include <algorithm>
#include <cmath>
#include <format>

namespace cadence::ui::widgets {

void StatusBar::render(Canvas& canvas, const LayoutRect& rect, const model::Snapshot& snap) {
    if (rect.empty()) return;
    const auto& player = snap.player;

    std::string left;
    if (player.muted) {
        left = "Vol: muted";
    } else {
        int pct = static_cast<int>(std::lround(player.volume * 100.0f));
        left = std::format("Vol: {} {}%", blocks::bar_chart(pct, 10), pct);
    }
    left += std::format(" │ Repeat: {}", player.repeat_track ? "on" : "off");
    left += " │ Sort: " + model::to_string(snap.ui.sort_key);
    left += " │ Search: " + model::to_string(snap.ui.search_field);
    if (!snap.playlists.pending.empty()) {
        left += std::format(" │ Chosen: {}", snap.playlists.pending.size());
    }

    std::string right = "F1 help";
    Style right_style{Color::BrightWhite, Color::Default, Attribute::Bold};

    // Newest alert replaces the help hint
    if (!snap.alerts.empty()) {
        const auto& alert = snap.alerts.back();
        right = alert.message;
        if (alert.level == "error") {
            right_style = Style{Color::Red, Color::Default, Attribute::Bold};
        } else if (alert.level == "warn") {
            right_style = Style{Color::Yellow, Color::Default, Attribute::Bold};
        } else {
            right_style = Style{Color::Green, Color::Default, Attribute::None};
        }
    }

    int right_cols = std::min(display_cols(right), rect.width / 2);
    right = take_cols(right, right_cols);
    int right_x = rect.x + rect.width - display_cols(right);

    canvas.draw_text(rect.x, rect.y, left, Style{}, right_x - 1);
    canvas.draw_text(right_x, rect.y, right, right_style, rect.x + rect.width);
}

SizeConstraints StatusBar::get_constraints() const {
    // Always exactly 1 line tall
    SizeConstraints constraints;
    constraints.min_height = 1;
    constraints.max_height = 1;
    return constraints;
}

}  // namespace cadence::ui::widgets
