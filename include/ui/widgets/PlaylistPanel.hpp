#pragma once

#include "ui/Component.hpp"

namespace cadence::ui::widgets {

class PlaylistPanel : public Component {
public:
    void render(Canvas& canvas, const LayoutRect& rect, const model::Snapshot& snap) override;

    static int capacity(const LayoutRect& rect) { return rect.height > 2 ? rect.height - 2 : 0; }
};

}  // namespace cadence::ui::widgets
