#include "ui/Formatting.hpp"
#include <format>
#include <wchar.h>

namespace cadence::ui {

Glyph next_glyph(std::string_view s, size_t i) {
    Glyph g;
    unsigned char c = s[i];
    wchar_t wc = c;
    if ((c & 0x80) == 0) {
        g.bytes = 1;
    } else if ((c & 0xE0) == 0xC0) {
        g.bytes = 2;
        wc = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
        g.bytes = 3;
        wc = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
        g.bytes = 4;
        wc = c & 0x07;
    } else {
        return g;  // stray continuation byte, one column
    }
    if (i + g.bytes > s.size()) {
        g.bytes = s.size() - i;
        g.complete = false;
        return g;
    }
    for (size_t k = 1; k < g.bytes; ++k) {
        wc = (wc << 6) | (static_cast<unsigned char>(s[i + k]) & 0x3F);
    }
    int w = wcwidth(wc);
    g.cols = w < 0 ? 1 : w;
    return g;
}

int display_cols(const std::string& s) {
    int total = 0;
    for (size_t i = 0; i < s.size(); ) {
        Glyph g = next_glyph(s, i);
        total += g.cols;
        i += g.bytes;
    }
    return total;
}

std::string take_cols(const std::string& s, int width) {
    if (width <= 0) return "";

    std::string out;
    out.reserve(s.size());
    int seen = 0;
    for (size_t i = 0; i < s.size(); ) {
        Glyph g = next_glyph(s, i);
        if (seen + g.cols > width) break;
        out.append(s, i, g.bytes);
        seen += g.cols;
        i += g.bytes;
    }
    return out;
}

std::string trunc_pad(const std::string& s, int w) {
    if (w <= 0) return "";

    int cols = display_cols(s);
    if (cols == w) {
        return s;
    }
    if (cols < w) {
        return s + std::string(w - cols, ' ');
    }

    if (w <= 1) {
        return trunc_pad(take_cols(s, w), w);
    }
    std::string cut = take_cols(s, w - 1) + "…";
    // A wide char may leave the cut one column short
    int short_by = w - display_cols(cut);
    return short_by > 0 ? cut + std::string(short_by, ' ') : cut;
}

std::string rpad_trunc(const std::string& s, int w) {
    if (w <= 0) return "";

    int cols = display_cols(s);
    if (cols == w) return s;
    if (cols < w) return std::string(w - cols, ' ') + s;

    return take_cols(s, w);
}

std::string lr_align(int width, const std::string& left, const std::string& right) {
    if (width <= 0) return "";

    int rvis = display_cols(right);
    int left_max = width - rvis - 1; // Leave space for at least 1 space between
    if (left_max < 0) left_max = 0;

    std::string l = trunc_pad(left, left_max);
    int lvis = display_cols(l);

    int space = width - lvis - rvis;
    if (space < 0) space = 0;

    return l + std::string(space, ' ') + right;
}

std::string format_duration(int total_seconds) {
    if (total_seconds < 0) total_seconds = 0;
    int hours = total_seconds / 3600;
    int minutes = (total_seconds % 3600) / 60;
    int seconds = total_seconds % 60;

    if (hours > 0) {
        return std::format("{}:{:02}:{:02}", hours, minutes, seconds);
    }
    return std::format("{}:{:02}", minutes, seconds);
}

} // namespace cadence::ui
