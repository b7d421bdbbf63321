#pragma once

#include "ui/Color.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace cadence::ui {

/**
 * A single cell on the terminal grid.
 * Represents what is visually displayed at one coordinate.
 */
struct Cell {
    std::string content = " "; // UTF-8 character, "" for the right half of a wide one
    Style style;

    bool operator==(const Cell& other) const = default;
};

/**
 * A 2D grid of Cells representing a rendering surface.
 * Origin (0,0) is top-left. Out-of-bounds writes are dropped.
 */
class Canvas {
public:
    Canvas(int width, int height);

    int width() const { return width_; }
    int height() const { return height_; }

    Cell& at(int x, int y);
    const Cell& at(int x, int y) const;

    void clear(const Cell& fill_cell = Cell{" ", {}});
    void put(int x, int y, const std::string& grapheme, Style style = {});

    // Returns the x-coordinate after the last character drawn. Stops at
    // max_x (exclusive) when given, else at the right edge.
    int draw_text(int x, int y, std::string_view text, Style style = {}, int max_x = -1);

    void draw_rect(int x, int y, int w, int h, Style style = {});
    void fill_rect(int x, int y, int w, int h, const Cell& cell);

    // Resize the canvas (clears content)
    void resize(int width, int height);

    /// Escape sequence stream that turns a terminal showing prev into this
    /// canvas. Sizes must match; otherwise every cell is emitted.
    std::string diff(const Canvas& prev) const;

    /// One line of plain text, for tests and logging.
    std::string row_text(int y) const;

private:
    int width_ = 0;
    int height_ = 0;
    std::vector<Cell> buffer_;

    bool is_in_bounds(int x, int y) const {
        return x >= 0 && y >= 0 && x < width_ && y < height_;
    }
    size_t index(int x, int y) const { return static_cast<size_t>(y) * width_ + x; }
};

std::string style_to_ansi(const Style& style);

} // namespace cadence::ui
