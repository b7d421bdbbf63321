#pragma once

#include "ui/Component.hpp"

namespace cadence::ui::widgets {

/// Search text with the field it applies to, plus the current sort.
class SearchBar : public Component {
public:
    void render(Canvas& canvas, const LayoutRect& rect, const model::Snapshot& snap) override;

    SizeConstraints get_constraints() const override;
};

}  // namespace cadence::ui::widgets
