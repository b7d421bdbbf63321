#include "ui/Component.hpp"
#include "ui/Formatting.hpp"

namespace cadence::ui {

LayoutRect Component::draw_box_border(Canvas& canvas, const LayoutRect& rect,
                                      const std::string& title, Style border_style,
                                      bool title_highlighted) const {
    canvas.draw_rect(rect.x, rect.y, rect.width, rect.height, border_style);

    if (!title.empty() && rect.width > 6) {
        Style title_style = title_highlighted ?
            Style{Color::BrightYellow, Color::Default, Attribute::Bold} :
            Style{Color::BrightWhite, Color::Default, Attribute::Bold};

        canvas.draw_text(rect.x + 2, rect.y, " " + truncate_text(title, rect.width - 6) + " ",
                         title_style, rect.x + rect.width - 1);
    }

    return LayoutRect{rect.x + 1, rect.y + 1, rect.width - 2, rect.height - 2};
}

std::string Component::truncate_text(const std::string& text, int max_width) const {
    if (max_width <= 0) return "";
    if (display_cols(text) <= max_width) {
        return text;
    }
    if (max_width == 1) {
        return take_cols(text, 1);
    }
    return take_cols(text, max_width - 1) + "…";
}

std::string Component::center_text(const std::string& text, int width) const {
    int cols = display_cols(text);
    if (cols >= width) {
        return take_cols(text, width);
    }
    return std::string((width - cols) / 2, ' ') + text;
}

}  // namespace cadence::ui
