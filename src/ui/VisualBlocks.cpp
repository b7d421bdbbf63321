#include "ui/VisualBlocks.hpp"
#include <algorithm>

namespace cadence::ui::blocks {

std::string bar_chart(int pct, int width) {
    if (width <= 0) return "";
    pct = std::clamp(pct, 0, 100);

    const char* partials[] = {"░", "▏", "▎", "▍", "▌", "▋", "▊", "▉"};
    int eighths = pct * width * 8 / 100;
    int filled = eighths / 8;
    int partial = eighths % 8;

    std::string result;
    for (int i = 0; i < filled; i++) result += "█";
    if (filled < width) result += partials[partial];
    for (int i = filled + 1; i < width; i++) result += "░";
    return result;
}

}  // namespace cadence::ui::blocks
