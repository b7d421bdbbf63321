#pragma once

#include "ui/Component.hpp"

namespace cadence::ui::widgets {

/// Name popup for a new playlist from the chosen tracks. Validation
/// failures show inline under the name.
class PlaylistPrompt : public Component {
public:
    void render(Canvas& canvas, const LayoutRect& rect, const model::Snapshot& snap) override;
};

}  // namespace cadence::ui::widgets
