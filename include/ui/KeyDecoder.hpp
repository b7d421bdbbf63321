#pragma once

#include "ui/InputEvent.hpp"
#include <string_view>
#include <vector>

namespace cadence::ui {

/**
 * Turns raw terminal bytes into key events.
 *
 * Arrow keys, ctrl+arrows (xterm "1;5" modifier), F1 in its xterm, VT and
 * linux-console forms, ctrl+letter, ctrl+space, and UTF-8 text. A lone
 * ESC, or ESC followed by something unrecognised, is "escape".
 */
class KeyDecoder {
public:
    static std::vector<InputEvent> decode(std::string_view bytes);

private:
    // Returns bytes consumed starting at bytes[0] == ESC
    static size_t decode_escape(std::string_view bytes, std::vector<InputEvent>& out);
    static void push_named(std::vector<InputEvent>& out, std::string name, int key = 0);
};

}  // namespace cadence::ui
