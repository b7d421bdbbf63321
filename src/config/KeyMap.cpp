#include "config/KeyMap.hpp"
#include "util/Logger.hpp"

#include <algorithm>

namespace cadence::config {

KeyMap::KeyMap() {
    load_default_keybinds();
}

const std::vector<std::string>& KeyMap::actions() {
    static const std::vector<std::string> names = {
        "quit", "track_up", "track_down", "playlist_up", "playlist_down",
        "play_stop", "pause", "next", "prev", "seek_forward", "seek_backward",
        "volume_up", "volume_down", "mute", "search_field", "sort", "repeat",
        "choose_track", "new_playlist", "delete_playlist", "remove_from_playlist",
        "help", "close",
    };
    return names;
}

bool KeyMap::is_known_action(const std::string& action) {
    const auto& names = actions();
    return std::find(names.begin(), names.end(), action) != names.end();
}

void KeyMap::load_default_keybinds() {
    bindings_.clear();

    bindings_["ctrl+q"] = "quit";
    bindings_["up"] = "track_up";
    bindings_["down"] = "track_down";
    bindings_["ctrl+k"] = "playlist_up";
    bindings_["ctrl+up"] = "playlist_up";
    bindings_["ctrl+j"] = "playlist_down";
    bindings_["ctrl+down"] = "playlist_down";
    bindings_["ctrl+space"] = "play_stop";
    bindings_["enter"] = "play_stop";
    bindings_["ctrl+p"] = "pause";
    bindings_["ctrl+l"] = "next";
    bindings_["ctrl+h"] = "prev";
    bindings_["right"] = "seek_forward";
    bindings_["left"] = "seek_backward";
    bindings_["ctrl+right"] = "volume_up";
    bindings_["ctrl+left"] = "volume_down";
    bindings_["ctrl+u"] = "mute";
    bindings_["ctrl+s"] = "search_field";
    bindings_["ctrl+t"] = "sort";
    bindings_["ctrl+r"] = "repeat";
    bindings_["ctrl+a"] = "choose_track";
    bindings_["ctrl+n"] = "new_playlist";
    bindings_["ctrl+x"] = "delete_playlist";
    bindings_["ctrl+d"] = "remove_from_playlist";
    bindings_["f1"] = "help";
    bindings_["escape"] = "close";
}

void KeyMap::add_binding(const std::string& action, const std::string& key_sequence) {
    bindings_[key_sequence] = action;
}

void KeyMap::apply_overrides(const std::map<std::string, std::string>& overrides) {
    for (const auto& [action, key] : overrides) {
        if (!is_known_action(action)) {
            util::Logger::warn("KeyMap: Unknown action '" + action + "' in [keybinds]");
            continue;
        }
        std::erase_if(bindings_, [&](const auto& entry) { return entry.second == action; });
        add_binding(action, key);
        util::Logger::debug("KeyMap: " + action + " -> " + key);
    }
}

std::string KeyMap::lookup_action(const std::string& key_sequence) const {
    auto it = bindings_.find(key_sequence);
    if (it != bindings_.end()) {
        return it->second;
    }
    return "";
}

std::vector<std::string> KeyMap::keys_for(const std::string& action) const {
    std::vector<std::string> keys;
    for (const auto& [key, bound] : bindings_) {
        if (bound == action) keys.push_back(key);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

}  // namespace cadence::config
