#pragma once

#include <string>

namespace cadence::ui::blocks {

/// Horizontal bar of `width` cells, pct in [0, 100], with an eighth-block
/// partial cell at the edge.
std::string bar_chart(int pct, int width);

}  // namespace cadence::ui::blocks
