#pragma once

#include "ui/Component.hpp"

namespace cadence::ui::widgets {

/// The filtered, sorted track view of the active playlist.
class TrackList : public Component {
public:
    void render(Canvas& canvas, const LayoutRect& rect, const model::Snapshot& snap) override;

    /// Rows available for tracks inside rect.
    static int capacity(const LayoutRect& rect) { return rect.height > 2 ? rect.height - 2 : 0; }

private:
    void render_row(Canvas& canvas, const LayoutRect& row, const model::Track& track,
                    bool selected, bool pending) const;
};

}  // namespace cadence::ui::widgets
