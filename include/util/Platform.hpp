#pragma once

#include <filesystem>
#include <string>

namespace cadence::util {

class Platform {
public:
    /// $XDG_MUSIC_DIR, then ~/Music. May not exist.
    static std::filesystem::path get_music_directory();

    /// $XDG_CONFIG_HOME/cadence, then ~/.config/cadence.
    static std::filesystem::path get_config_directory();

    static std::filesystem::path get_playlist_directory();

    /// "~" and "~/..." become paths under $HOME; anything else is returned as is.
    static std::filesystem::path expand_home(const std::string& path);
};

}  // namespace cadence::util
