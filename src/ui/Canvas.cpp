#include "ui/Canvas.hpp"
#include "ui/Formatting.hpp"
#include <algorithm>
#include <format>

namespace cadence::ui {

Canvas::Canvas(int width, int height) : width_(width), height_(height) {
    buffer_.resize(static_cast<size_t>(std::max(0, width * height)));
}

Cell& Canvas::at(int x, int y) {
    static Cell scratch;
    if (!is_in_bounds(x, y)) {
        scratch = Cell{};
        return scratch;
    }
    return buffer_[index(x, y)];
}

const Cell& Canvas::at(int x, int y) const {
    static const Cell blank;
    return is_in_bounds(x, y) ? buffer_[index(x, y)] : blank;
}

void Canvas::clear(const Cell& fill_cell) {
    std::fill(buffer_.begin(), buffer_.end(), fill_cell);
}

void Canvas::put(int x, int y, const std::string& grapheme, Style style) {
    if (is_in_bounds(x, y)) {
        buffer_[index(x, y)] = Cell{grapheme, style};
    }
}

void Canvas::resize(int width, int height) {
    if (width_ == width && height_ == height) return;
    width_ = width;
    height_ = height;
    buffer_.clear();
    buffer_.resize(static_cast<size_t>(std::max(0, width * height)));
}

int Canvas::draw_text(int x, int y, std::string_view text, Style style, int max_x) {
    if (y < 0 || y >= height_) return x;
    int limit = (max_x < 0) ? width_ : std::min(max_x, width_);

    int current_x = x;
    size_t i = 0;
    while (i < text.size() && current_x < limit) {
        Glyph g = next_glyph(text, i);
        if (!g.complete) break;
        auto ch = text.substr(i, g.bytes);
        i += g.bytes;

        // Control characters would corrupt the terminal
        if (static_cast<unsigned char>(ch[0]) < 0x20) continue;

        if (g.cols == 0) {
            // Combining mark joins the previous cell
            if (current_x > x && is_in_bounds(current_x - 1, y)) {
                buffer_[index(current_x - 1, y)].content.append(ch);
            }
            continue;
        }

        // A wide character that would straddle the limit is dropped
        if (current_x + g.cols > limit) break;

        if (current_x >= 0) {
            put(current_x, y, std::string(ch), style);
            if (g.cols == 2) put(current_x + 1, y, "", style);  // continuation cell
        }
        current_x += g.cols;
    }
    return current_x;
}

void Canvas::draw_rect(int x, int y, int w, int h, Style style) {
    if (w <= 1 || h <= 1) return;
    const int right = x + w - 1;
    const int bottom = y + h - 1;

    for (int cx = x + 1; cx < right; ++cx) {
        put(cx, y, "─", style);
        put(cx, bottom, "─", style);
    }
    for (int cy = y + 1; cy < bottom; ++cy) {
        put(x, cy, "│", style);
        put(right, cy, "│", style);
    }
    put(x, y, "┌", style);
    put(right, y, "┐", style);
    put(x, bottom, "└", style);
    put(right, bottom, "┘", style);
}

void Canvas::fill_rect(int x, int y, int w, int h, const Cell& cell) {
    const int x0 = std::max(x, 0);
    const int x1 = std::min(x + w, width_);
    if (x0 >= x1) return;
    for (int cy = std::max(y, 0); cy < std::min(y + h, height_); ++cy) {
        std::fill(buffer_.begin() + index(x0, cy), buffer_.begin() + index(x1, cy), cell);
    }
}

std::string style_to_ansi(const Style& style) {
    std::string out = "\033[0";

    auto color_code = [](Color c, int base) {
        int index = static_cast<int>(c) - 1;
        return index < 8 ? base + index : base + 60 + (index - 8);
    };
    if (style.fg != Color::Default) out += std::format(";{}", color_code(style.fg, 30));
    if (style.bg != Color::Default) out += std::format(";{}", color_code(style.bg, 40));

    if (has_attribute(style.attr, Attribute::Bold)) out += ";1";
    if (has_attribute(style.attr, Attribute::Dim)) out += ";2";
    if (has_attribute(style.attr, Attribute::Underline)) out += ";4";
    if (has_attribute(style.attr, Attribute::Reverse)) out += ";7";

    out += "m";
    return out;
}

std::string Canvas::diff(const Canvas& prev) const {
    const bool full = prev.width_ != width_ || prev.height_ != height_;

    std::string out;
    int cursor_x = -1;
    int cursor_y = -1;
    const Style* last_style = nullptr;

    for (int y = 0; y < height_; ++y) {
        for (int x = 0; x < width_; ++x) {
            const Cell& cell = buffer_[index(x, y)];
            if (!full && cell == prev.buffer_[index(x, y)]) continue;
            if (cell.content.empty()) continue;  // Right half of a wide char

            if (cursor_x != x || cursor_y != y) {
                out += std::format("\033[{};{}H", y + 1, x + 1);
            }
            if (!last_style || !(*last_style == cell.style)) {
                out += style_to_ansi(cell.style);
                last_style = &cell.style;
            }
            out += cell.content;

            // Wide characters advance the terminal cursor by two
            cursor_y = y;
            cursor_x = x + ((x + 1 < width_ && buffer_[index(x, y) + 1].content.empty()) ? 2 : 1);
        }
    }

    if (!out.empty()) out += "\033[0m";
    return out;
}

std::string Canvas::row_text(int y) const {
    std::string out;
    if (y < 0 || y >= height_) return out;
    for (int x = 0; x < width_; ++x) {
        out += buffer_[index(x, y)].content;
    }
    return out;
}

} // namespace cadence::ui
