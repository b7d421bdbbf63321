#include "ui/KeyDecoder.hpp"

namespace cadence::ui {

void KeyDecoder::push_named(std::vector<InputEvent>& out, std::string name, int key) {
    out.push_back({InputEvent::Type::KeyPress, key, std::move(name), false});
}

static const char* arrow_name(char final) {
    switch (final) {
        case 'A': return "up";
        case 'B': return "down";
        case 'C': return "right";
        case 'D': return "left";
    }
    return nullptr;
}

size_t KeyDecoder::decode_escape(std::string_view bytes, std::vector<InputEvent>& out) {
    if (bytes.size() < 2) {
        push_named(out, "escape", 27);
        return 1;
    }

    // SS3: ESC O P (F1), ESC O A-D (application cursor mode)
    if (bytes[1] == 'O' && bytes.size() >= 3) {
        if (bytes[2] == 'P') {
            push_named(out, "f1");
            return 3;
        }
        if (const char* arrow = arrow_name(bytes[2])) {
            push_named(out, arrow);
            return 3;
        }
        push_named(out, "escape", 27);
        return 1;
    }

    if (bytes[1] != '[') {
        push_named(out, "escape", 27);
        return 1;
    }

    // Linux console F1: ESC [ [ A
    if (bytes.size() >= 4 && bytes[2] == '[') {
        if (bytes[3] == 'A') push_named(out, "f1");
        return 4;
    }

    // CSI: parameters then one final byte in 0x40-0x7E
    size_t i = 2;
    while (i < bytes.size() && (bytes[i] < 0x40 || bytes[i] > 0x7E)) {
        ++i;
    }
    if (i >= bytes.size()) {
        push_named(out, "escape", 27);
        return 1;
    }

    std::string_view params = bytes.substr(2, i - 2);
    char final = bytes[i];
    size_t consumed = i + 1;

    if (const char* arrow = arrow_name(final)) {
        // Modifier 5 is ctrl; others are reported as the plain arrow
        bool ctrl = params == "1;5" || params == "5";
        push_named(out, ctrl ? std::string("ctrl+") + arrow : std::string(arrow));
        return consumed;
    }
    if (final == '~') {
        if (params == "11") push_named(out, "f1");
        else if (params == "3") push_named(out, "delete");
        return consumed;
    }
    if (final == 'P' && (params.empty() || params == "1")) {
        push_named(out, "f1");
    }
    return consumed;
}

std::vector<InputEvent> KeyDecoder::decode(std::string_view bytes) {
    std::vector<InputEvent> out;

    size_t i = 0;
    while (i < bytes.size()) {
        unsigned char c = static_cast<unsigned char>(bytes[i]);

        if (c == 0x1B) {
            i += decode_escape(bytes.substr(i), out);
            continue;
        }

        switch (c) {
            case 0x00: push_named(out, "ctrl+space", 0); ++i; continue;
            case 0x08: push_named(out, "ctrl+h", c); ++i; continue;
            case 0x09: push_named(out, "tab", c); ++i; continue;
            case 0x0A: push_named(out, "ctrl+j", c); ++i; continue;
            case 0x0D: push_named(out, "enter", c); ++i; continue;
            case 0x7F: push_named(out, "backspace", c); ++i; continue;
            default: break;
        }

        if (c >= 0x01 && c <= 0x1A) {
            push_named(out, std::string("ctrl+") + static_cast<char>('a' + c - 1), c);
            ++i;
            continue;
        }
        if (c < 0x20) {
            ++i; // ctrl+\ and friends are unbound
            continue;
        }

        size_t len = 1;
        if ((c & 0xE0) == 0xC0) len = 2;
        else if ((c & 0xF0) == 0xE0) len = 3;
        else if ((c & 0xF8) == 0xF0) len = 4;
        else if (c & 0x80) {
            ++i; // Stray continuation byte
            continue;
        }

        if (i + len > bytes.size()) {
            break; // Truncated character at the end of the read
        }
        out.push_back({InputEvent::Type::KeyPress, c, std::string(bytes.substr(i, len)), true});
        i += len;
    }
    return out;
}

}  // namespace cadence::ui
