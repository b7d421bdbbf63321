#include "ui/widgets/NowPlaying.hpp"
#include "ui/Formatting.hpp"
#include "ui/VisualBlocks.hpp"
#include <chrono>
#include <cmath>

namespace cadence::ui::widgets {

void NowPlaying::render(Canvas& canvas, const LayoutRect& rect, const model::Snapshot& snap) {
    auto inner = draw_box_border(canvas, rect, "NOW PLAYING");
    if (inner.empty()) return;

    const auto& player = snap.player;
    const int right = inner.x + inner.width;
    int y = inner.y;

    auto line = [&](const std::string& text, Style style) {
        if (y >= inner.y + inner.height) return;
        canvas.draw_text(inner.x + 1, y++, truncate_text(text, inner.width - 1), style, right);
    };

    if (!player.current) {
        line("Nothing playing", Style{Color::Default, Color::Default, Attribute::Dim});
        return;
    }
    const model::Track& track = *player.current;

    line(track.title, Style{Color::BrightWhite, Color::Default, Attribute::Bold});
    line(track.artist, Style{Color::Cyan, Color::Default, Attribute::None});
    line(track.album, Style{});

    std::string details = model::format_name(track.format);
    details += track.cover ? " • cover" : " • no cover";
    line(details, Style{Color::Cyan, Color::Default, Attribute::Dim});
    if (!track.error.empty()) {
        line(track.error, Style{Color::Red, Color::Default, Attribute::Dim});
    }

    // Progress: bar on one line, status and times on the next
    int elapsed_s = static_cast<int>(std::chrono::duration_cast<std::chrono::seconds>(player.elapsed).count());
    int total_s = static_cast<int>(std::lround(track.duration_seconds));
    int pct = 0;
    if (track.duration_seconds > 0.0) {
        pct = static_cast<int>(player.elapsed.count() * 100 / std::llround(track.duration_seconds * 1000.0));
    }

    if (y < inner.y + inner.height) {
        canvas.draw_text(inner.x + 1, y++, blocks::bar_chart(pct, inner.width - 2),
                         Style{Color::Green, Color::Default, Attribute::None}, right);
    }

    const char* status = "■ Stopped";
    if (player.status == model::PlayerStatus::Playing) status = "▶ Playing";
    else if (player.status == model::PlayerStatus::Paused) status = "⏸ Paused";

    std::string times = format_duration(elapsed_s) + " / " +
        (total_s > 0 ? format_duration(total_s) : std::string("--:--"));
    if (y < inner.y + inner.height) {
        canvas.draw_text(inner.x + 1, y++, lr_align(inner.width - 2, status, times), Style{}, right);
    }
}

SizeConstraints NowPlaying::get_constraints() const {
    SizeConstraints constraints;
    constraints.min_height = 9;
    constraints.max_height = 10;
    return constraints;
}

}  // namespace cadence::ui::widgets
