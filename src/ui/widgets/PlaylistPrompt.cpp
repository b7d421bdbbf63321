#include "ui/widgets/PlaylistPrompt.hpp"
#include "ui/Formatting.hpp"
#include <algorithm>
#include <format>

namespace cadence::ui::widgets {

void PlaylistPrompt::render(Canvas& canvas, const LayoutRect& rect, const model::Snapshot& snap) {
    if (!snap.ui.show_prompt) return;

    int box_width = std::min(50, rect.width);
    int box_height = std::min(7, rect.height);
    LayoutRect box{rect.x + (rect.width - box_width) / 2, rect.y + (rect.height - box_height) / 2,
                   box_width, box_height};

    Style base{Color::BrightWhite, Color::Black, Attribute::None};
    canvas.fill_rect(box.x, box.y, box.width, box.height, Cell{" ", base});
    auto inner = draw_box_border(canvas, box, "NEW PLAYLIST", base, true);
    if (inner.empty()) return;

    const int right = inner.x + inner.width;
    int y = inner.y;

    // Keep the tail of a long name visible
    std::string name = snap.ui.prompt_text + "█";
    int field_w = inner.width - 8;
    while (field_w > 0 && display_cols(name) > field_w) {
        size_t cut = 1;
        while (cut < name.size() && (static_cast<unsigned char>(name[cut]) & 0xC0) == 0x80) ++cut;
        name.erase(0, cut);
    }
    canvas.draw_text(inner.x + 1, y, "Name: ", base, right);
    canvas.draw_text(inner.x + 7, y++, name,
                     Style{Color::BrightYellow, Color::Black, Attribute::Bold}, right);

    size_t chosen = snap.playlists.pending.size();
    canvas.draw_text(inner.x + 1, y++,
                     std::format("{} song{} chosen", chosen, chosen == 1 ? "" : "s"),
                     Style{Color::Cyan, Color::Black, Attribute::None}, right);

    if (!snap.ui.prompt_message.empty()) {
        canvas.draw_text(inner.x + 1, y, truncate_text(snap.ui.prompt_message, inner.width - 2),
                         Style{Color::Red, Color::Black, Attribute::Bold}, right);
    }

    canvas.draw_text(inner.x + 1, inner.y + inner.height - 1, "Enter to save | Esc to cancel",
                     Style{Color::BrightBlack, Color::Black, Attribute::Dim}, right);
}

}  // namespace cadence::ui::widgets
