#include "ui/widgets/TrackList.hpp"
#include "ui/Formatting.hpp"
#include <algorithm>
#include <cmath>
#include <format>

namespace cadence::ui::widgets {

void TrackList::render(Canvas& canvas, const LayoutRect& rect, const model::Snapshot& snap) {
    const auto& library = snap.library;
    const auto& lists = snap.playlists;

    std::string title = lists.selected < lists.names.size() ? lists.names[lists.selected] : "Tracks";
    if (!snap.ui.search_text.empty()) {
        title += std::format(" [{}/{}]", library.visible.size(), library.catalog_size);
    } else {
        title += std::format(" [{}]", library.visible.size());
    }
    auto inner = draw_box_border(canvas, rect, title);
    if (inner.empty()) return;

    if (library.visible.empty()) {
        canvas.draw_text(inner.x + 2, inner.y, "(no matches)",
                         Style{Color::Default, Color::Default, Attribute::Dim});
        return;
    }

    size_t first = std::min(library.scroll, library.visible.size());
    size_t last = std::min(library.visible.size(), first + static_cast<size_t>(inner.height));

    int y = inner.y;
    for (size_t i = first; i < last; ++i) {
        const model::Track& track = *library.visible[i];
        bool selected = library.selected && *library.selected == i;
        bool pending = std::find(lists.pending.begin(), lists.pending.end(), track.id) != lists.pending.end();
        render_row(canvas, LayoutRect{inner.x, y++, inner.width, 1}, track, selected, pending);
    }
}

void TrackList::render_row(Canvas& canvas, const LayoutRect& row, const model::Track& track,
                           bool selected, bool pending) const {
    // Columns: marker(2) title artist album duration(8)
    constexpr int DURATION_W = 8;
    int text_w = std::max(0, row.width - 2 - DURATION_W);
    int title_w = text_w * 2 / 5;
    int artist_w = text_w * 3 / 10;
    int album_w = text_w - title_w - artist_w;

    std::string marker = track.is_playing ? "▶" : " ";
    marker += pending ? "+" : " ";

    std::string duration = track.duration_seconds > 0.0
        ? format_duration(static_cast<int>(std::lround(track.duration_seconds)))
        : "--:--";

    std::string line = marker
        + trunc_pad(track.title, title_w)
        + trunc_pad(" " + track.artist, artist_w)
        + trunc_pad(" " + track.album, album_w)
        + rpad_trunc(duration + " ", DURATION_W);

    Style style;
    if (selected) {
        style = Style{Color::BrightYellow, Color::Default, Attribute::Bold | Attribute::Reverse};
    } else if (track.is_playing) {
        style = Style{Color::BrightGreen, Color::Default, Attribute::Bold};
    } else if (pending) {
        style = Style{Color::Yellow, Color::Default, Attribute::None};
    } else if (!track.error.empty()) {
        style = Style{Color::Default, Color::Default, Attribute::Dim};
    }
    canvas.draw_text(row.x, row.y, line, style, row.x + row.width);
}

}  // namespace cadence::ui::widgets
