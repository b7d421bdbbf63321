#pragma once

#include "model/Snapshot.hpp"
#include "ui/Canvas.hpp"
#include "ui/LayoutConstraints.hpp"
#include <string>

namespace cadence::ui {

/**
 * Base class for all widgets.
 *
 * Widgets draw a snapshot into their rectangle of the canvas and never
 * mutate player state; input is routed through the key map instead.
 */
class Component {
public:
    virtual ~Component() = default;

    /**
     * Render this component to the canvas.
     *
     * @param canvas    The canvas to draw on
     * @param rect      Allocated screen space (x, y, width, height)
     * @param snap      Current application state snapshot
     */
    virtual void render(Canvas& canvas, const LayoutRect& rect, const model::Snapshot& snap) = 0;

    /// Size hints for the layout pass. Default: fill available space.
    virtual SizeConstraints get_constraints() const {
        return SizeConstraints{};
    }

protected:
    /**
     * Draws a border with the title in the top edge and returns the
     * rectangle inside it.
     */
    LayoutRect draw_box_border(Canvas& canvas, const LayoutRect& rect, const std::string& title,
                               Style border_style = Style{}, bool title_highlighted = false) const;

    /// Fits text into max_width columns, ending in "…" when cut.
    std::string truncate_text(const std::string& text, int max_width) const;

    std::string center_text(const std::string& text, int width) const;
};

}  // namespace cadence::ui
