#include "ui/widgets/HelpOverlay.hpp"
#include "ui/Formatting.hpp"
#include <algorithm>
#include <utility>
#include <vector>

namespace cadence::ui::widgets {

namespace {

const std::vector<std::pair<const char*, const char*>>& descriptions() {
    static const std::vector<std::pair<const char*, const char*>> rows = {
        {"track_up", "Previous track in list"},
        {"track_down", "Next track in list"},
        {"playlist_up", "Previous playlist"},
        {"playlist_down", "Next playlist"},
        {"play_stop", "Play selected / stop"},
        {"pause", "Pause / resume"},
        {"next", "Play next track"},
        {"prev", "Play previous track"},
        {"seek_forward", "Seek forward 5s"},
        {"seek_backward", "Seek backward 5s"},
        {"volume_up", "Volume up"},
        {"volume_down", "Volume down"},
        {"mute", "Mute / unmute"},
        {"search_field", "Cycle search field"},
        {"sort", "Cycle sort order"},
        {"repeat", "Toggle repeat track"},
        {"choose_track", "Choose track for new playlist"},
        {"new_playlist", "New playlist from chosen tracks"},
        {"delete_playlist", "Delete selected playlist"},
        {"remove_from_playlist", "Remove track from playlist"},
        {"help", "Toggle this help"},
        {"close", "Close popup"},
        {"quit", "Save playlists and quit"},
    };
    return rows;
}

}  // namespace

void HelpOverlay::render(Canvas& canvas, const LayoutRect& rect, const model::Snapshot& snap) {
    if (!snap.ui.show_help) return;

    const auto& rows = descriptions();
    int box_width = std::min(64, rect.width);
    int box_height = std::min(static_cast<int>(rows.size()) + 5, rect.height);
    LayoutRect box{rect.x + (rect.width - box_width) / 2, rect.y + (rect.height - box_height) / 2,
                   box_width, box_height};

    Style text_style{Color::BrightWhite, Color::Black, Attribute::None};
    Style key_style{Color::BrightCyan, Color::Black, Attribute::Bold};
    Style heading_style{Color::BrightYellow, Color::Black, Attribute::Bold};

    canvas.fill_rect(box.x, box.y, box.width, box.height, Cell{" ", text_style});
    auto inner = draw_box_border(canvas, box, "HELP", text_style);
    if (inner.empty()) return;

    int y = inner.y;
    const int right = inner.x + inner.width;
    canvas.draw_text(inner.x + 2, y++, "Keys (type to search)", heading_style, right);
    y++;

    constexpr int KEY_COL = 22;
    for (const auto& [action, text] : rows) {
        if (y >= inner.y + inner.height) break;
        std::string keys;
        for (const auto& key : keymap_.keys_for(action)) {
            if (!keys.empty()) keys += ", ";
            keys += key;
        }
        if (keys.empty()) keys = "(unbound)";
        canvas.draw_text(inner.x + 2, y, trunc_pad(keys, KEY_COL - 1), key_style, right);
        canvas.draw_text(inner.x + 2 + KEY_COL, y, text, text_style, right);
        ++y;
    }
}

}  // namespace cadence::ui::widgets
