#include "util/Platform.hpp"
#include "util/Logger.hpp"

#include <cstdlib>

namespace cadence::util {

namespace {

std::filesystem::path home_directory() {
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return home;
    }
    return {};
}

}  // namespace

std::filesystem::path Platform::get_music_directory() {
    if (const char* xdg = std::getenv("XDG_MUSIC_DIR"); xdg && *xdg) {
        Logger::debug(std::string("Platform: Music directory from XDG_MUSIC_DIR: ") + xdg);
        return expand_home(xdg);
    }

    auto home = home_directory();
    if (home.empty()) {
        Logger::warn("Platform: HOME env var not set, using fallback: ./Music");
        return "./Music";
    }
    return home / "Music";
}

std::filesystem::path Platform::get_config_directory() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "cadence";
    }

    auto home = home_directory();
    if (home.empty()) {
        Logger::warn("Platform: HOME env var not set, using fallback: .config/cadence");
        return ".config/cadence";
    }
    return home / ".config" / "cadence";
}

std::filesystem::path Platform::get_playlist_directory() {
    return get_config_directory() / "playlists";
}

std::filesystem::path Platform::expand_home(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    if (path.size() > 1 && path[1] != '/') {
        // ~user form is not supported
        return path;
    }

    auto home = home_directory();
    if (home.empty()) {
        return path;
    }
    if (path.size() <= 2) {
        return home;
    }
    return home / path.substr(2);
}

}  // namespace cadence::util
