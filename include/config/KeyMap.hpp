#pragma once

#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace cadence::config {

/// Key name -> action name. One action may have several keys.
class KeyMap {
public:
    KeyMap();

    void load_default_keybinds();

    /// Adds key_sequence as a key for action. A key bound elsewhere moves.
    void add_binding(const std::string& action, const std::string& key_sequence);

    /// Replaces every key of each listed action with the given one, as read
    /// from the [keybinds] section. Unknown actions are ignored.
    void apply_overrides(const std::map<std::string, std::string>& overrides);

    /// Empty string when unbound.
    std::string lookup_action(const std::string& key_sequence) const;
    std::vector<std::string> keys_for(const std::string& action) const;

    static const std::vector<std::string>& actions();
    static bool is_known_action(const std::string& action);

private:
    std::unordered_map<std::string, std::string> bindings_;
};

}  // namespace cadence::config
