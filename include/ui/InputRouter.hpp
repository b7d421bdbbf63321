#pragma once

#include "config/KeyMap.hpp"
#include "events/EventBus.hpp"
#include "ui/InputEvent.hpp"
#include <optional>
#include <string>

namespace cadence::ui {

/**
 * Maps decoded keys to commands.
 *
 * With the name popup open, text, backspace, enter and escape edit the
 * name; every other key still goes through the key map. Otherwise mapped
 * keys become their command and unmapped text edits the search.
 */
class InputRouter {
public:
    explicit InputRouter(const config::KeyMap& keymap) : keymap_(keymap) {}

    std::optional<events::Event> route(const InputEvent& input, bool prompt_open) const;

    static std::optional<events::Event> action_event(const std::string& action);

private:
    const config::KeyMap& keymap_;
};

}  // namespace cadence::ui
