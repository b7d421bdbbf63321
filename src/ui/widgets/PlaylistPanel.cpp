#include "ui/widgets/PlaylistPanel.hpp"
#include "ui/Formatting.hpp"
#include <algorithm>
#include <format>

namespace cadence::ui::widgets {

void PlaylistPanel::render(Canvas& canvas, const LayoutRect& rect, const model::Snapshot& snap) {
    const auto& lists = snap.playlists;

    auto inner = draw_box_border(canvas, rect, std::format("PLAYLISTS [{}]", lists.names.size()));
    if (inner.empty()) return;

    size_t first = std::min(lists.scroll, lists.names.size());
    size_t last = std::min(lists.names.size(), first + static_cast<size_t>(inner.height));

    int y = inner.y;
    for (size_t i = first; i < last; ++i) {
        bool selected = i == lists.selected;
        std::string line = (selected ? "▸ " : "  ") + lists.names[i];
        Style style = selected ?
            Style{Color::BrightYellow, Color::Default, Attribute::Bold} :
            Style{};
        canvas.draw_text(inner.x, y++, trunc_pad(line, inner.width), style, inner.x + inner.width);
    }
}

}  // namespace cadence::ui::widgets
