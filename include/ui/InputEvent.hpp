#pragma once

#include <string>

namespace cadence::ui {

struct InputEvent {
    enum class Type {
        KeyPress,
        Resize,
    };

    Type type = Type::KeyPress;
    int key = 0;          // first byte, or 0 for named keys
    std::string key_name; // "up", "ctrl+up", "ctrl+k", "enter", "f1", or the character itself
    bool text = false;    // key_name is one printable UTF-8 character

    bool is_key(const std::string& name_to_check) const {
        return type == Type::KeyPress && key_name == name_to_check;
    }
};

} // namespace cadence::ui
