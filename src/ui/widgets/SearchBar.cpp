#include "ui/widgets/SearchBar.hpp"
#include "ui/Formatting.hpp"

namespace cadence::ui::widgets {

void SearchBar::render(Canvas& canvas, const LayoutRect& rect, const model::Snapshot& snap) {
    auto inner = draw_box_border(canvas, rect, "SEARCH");
    if (inner.empty()) return;

    std::string left = model::to_string(snap.ui.search_field) + ": " + snap.ui.search_text;
    // The cursor belongs to the prompt while it is open
    if (!snap.ui.show_prompt) {
        left += "█";
    }
    std::string right = "Sort: " + model::to_string(snap.ui.sort_key);

    int right_x = inner.x + inner.width - display_cols(right);
    canvas.draw_text(inner.x, inner.y, left,
                     Style{Color::BrightWhite, Color::Default, Attribute::Bold},
                     right_x - 1);
    if (right_x > inner.x) {
        canvas.draw_text(right_x, inner.y, right, Style{Color::Cyan, Color::Default, Attribute::None});
    }
}

SizeConstraints SearchBar::get_constraints() const {
    SizeConstraints constraints;
    constraints.min_height = 3;
    constraints.max_height = 3;
    return constraints;
}

}  // namespace cadence::ui::widgets
