#pragma once

#include "model/PlaybackState.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace cadence::backend {

struct Config {
    // Playback settings
    int default_volume = 100;
    bool repeat_track = false;

    // UI settings
    model::SortKey sort = model::SortKey::Title;
    model::SearchField search_field = model::SearchField::Title;

    // action -> key overrides
    std::map<std::string, std::string> keybinds;

    // Directory settings, empty means platform default
    std::filesystem::path music_directory;
    std::filesystem::path playlist_directory;

    float initial_volume() const;
};

class ConfigLoader {
public:
    /// Reads ~/.config/cadence/config.toml, writing a default file first if
    /// there is none.
    static Config load_config();
    static Config load_from_file(const std::filesystem::path& path);
    static Config parse(std::string_view text);
    static bool save_config(const Config& cfg, const std::filesystem::path& path);

    static std::filesystem::path get_config_file();

    static std::optional<model::SortKey> parse_sort_key(std::string_view value);
    static std::optional<model::SearchField> parse_search_field(std::string_view value);
};

}  // namespace cadence::backend
