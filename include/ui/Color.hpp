#pragma once

#include <cstdint>

namespace cadence::ui {

// The 16 ANSI colors in SGR order; Default leaves the terminal's own color
enum class Color : uint8_t {
    Default,
    Black, Red, Green, Yellow, Blue, Magenta, Cyan, White,
    BrightBlack, BrightRed, BrightGreen, BrightYellow, BrightBlue, BrightMagenta, BrightCyan, BrightWhite,
};

enum class Attribute : uint8_t {
    None = 0,
    Bold = 1 << 0,
    Dim = 1 << 1,
    Underline = 1 << 2,
    Reverse = 1 << 3,
};

inline Attribute operator|(Attribute a, Attribute b) {
    return static_cast<Attribute>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

inline bool has_attribute(Attribute set, Attribute check) {
    return (static_cast<uint8_t>(set) & static_cast<uint8_t>(check)) != 0;
}

struct Style {
    Color fg = Color::Default;
    Color bg = Color::Default;
    Attribute attr = Attribute::None;

    bool operator==(const Style& other) const = default;
};

}  // namespace cadence::ui
