#pragma once

#include "ui/Component.hpp"

namespace cadence::ui::widgets {

class NowPlaying : public Component {
public:
    void render(Canvas& canvas, const LayoutRect& rect, const model::Snapshot& snap) override;

    SizeConstraints get_constraints() const override;
};

}  // namespace cadence::ui::widgets
