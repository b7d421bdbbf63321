#pragma once

#include "config/KeyMap.hpp"
#include "ui/Component.hpp"

namespace cadence::ui::widgets {

/// Centered key reference, built from the live key map so overrides show.
class HelpOverlay : public Component {
public:
    explicit HelpOverlay(const config::KeyMap& keymap) : keymap_(keymap) {}

    void render(Canvas& canvas, const LayoutRect& rect, const model::Snapshot& snap) override;

private:
    const config::KeyMap& keymap_;
};

}  // namespace cadence::ui::widgets
