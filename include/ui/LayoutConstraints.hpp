#pragma once

#include <optional>

namespace cadence::ui {

/**
 * Size hints a widget gives the renderer's layout pass.
 */
struct SizeConstraints {
    std::optional<int> min_width;
    std::optional<int> max_width;
    std::optional<int> min_height;
    std::optional<int> max_height;
};

/**
 * Computed layout rectangle for a widget
 */
struct LayoutRect {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    bool operator==(const LayoutRect& other) const = default;

    bool empty() const { return width <= 0 || height <= 0; }
};

}  // namespace cadence::ui
