#include "backend/Config.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <fstream>
#include <sstream>
#include <system_error>

namespace cadence::backend {

namespace {

std::string_view trim(std::string_view s) {
    auto start = s.find_first_not_of(" \t\r");
    if (start == std::string_view::npos) return {};
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::optional<bool> parse_bool(std::string_view value) {
    auto v = lower(value);
    if (v == "true" || v == "yes" || v == "1") return true;
    if (v == "false" || v == "no" || v == "0") return false;
    return std::nullopt;
}

const char* sort_name(model::SortKey key) {
    switch (key) {
        case model::SortKey::Title: return "title";
        case model::SortKey::Artist: return "artist";
        case model::SortKey::Duration: return "duration";
        case model::SortKey::Shuffle: return "shuffle";
    }
    return "title";
}

const char* field_name(model::SearchField field) {
    switch (field) {
        case model::SearchField::Title: return "title";
        case model::SearchField::Artist: return "artist";
        case model::SearchField::Album: return "album";
    }
    return "title";
}

}  // namespace

float Config::initial_volume() const {
    return static_cast<float>(std::clamp(default_volume, 0, 100)) / 100.0f;
}

std::optional<model::SortKey> ConfigLoader::parse_sort_key(std::string_view value) {
    auto v = lower(value);
    if (v == "title") return model::SortKey::Title;
    if (v == "artist") return model::SortKey::Artist;
    if (v == "duration") return model::SortKey::Duration;
    if (v == "shuffle" || v == "shuffled") return model::SortKey::Shuffle;
    return std::nullopt;
}

std::optional<model::SearchField> ConfigLoader::parse_search_field(std::string_view value) {
    auto v = lower(value);
    if (v == "title") return model::SearchField::Title;
    if (v == "artist") return model::SearchField::Artist;
    if (v == "album") return model::SearchField::Album;
    return std::nullopt;
}

Config ConfigLoader::load_config() {
    util::Logger::info("Config: Loading configuration");

    auto config_file = get_config_file();
    std::error_code ec;
    if (std::filesystem::exists(config_file, ec)) {
        return load_from_file(config_file);
    }

    Config cfg;
    if (!save_config(cfg, config_file)) {
        util::Logger::warn("Config: Could not write default config to " + config_file.string());
    }
    return cfg;
}

Config ConfigLoader::load_from_file(const std::filesystem::path& path) {
    util::Logger::debug("Config: Loading from " + path.string());

    std::ifstream file(path);
    if (!file) {
        util::Logger::warn("Config: Cannot open " + path.string() + ", using defaults");
        return Config{};
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

Config ConfigLoader::parse(std::string_view text) {
    Config cfg;
    std::string current_section;

    size_t line_no = 0;
    while (!text.empty()) {
        auto nl = text.find('\n');
        std::string_view line = trim(text.substr(0, nl));
        text = nl == std::string_view::npos ? std::string_view{} : text.substr(nl + 1);
        ++line_no;

        if (line.empty() || line[0] == '#') continue;

        if (line.front() == '[' && line.back() == ']') {
            current_section = lower(trim(line.substr(1, line.size() - 2)));
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string_view::npos) {
            util::Logger::warn(std::format("Config: Ignoring line {}: no '='", line_no));
            continue;
        }

        std::string key = lower(trim(line.substr(0, eq_pos)));
        std::string_view value = trim(line.substr(eq_pos + 1));

        // Trailing comment on an unquoted value
        if (!value.empty() && value.front() != '"') {
            auto hash = value.find('#');
            if (hash != std::string_view::npos) value = trim(value.substr(0, hash));
        }
        if (value.size() >= 2 && value.front() == '"') {
            auto close = value.find('"', 1);
            if (close != std::string_view::npos) value = value.substr(1, close - 1);
        }

        if (current_section == "playback") {
            if (key == "default_volume") {
                int volume = 0;
                auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), volume);
                if (ec == std::errc() && ptr == value.data() + value.size()) {
                    cfg.default_volume = std::clamp(volume, 0, 100);
                } else {
                    util::Logger::warn("Config: Bad default_volume '" + std::string(value) + "'");
                }
            } else if (key == "repeat_track") {
                if (auto b = parse_bool(value)) cfg.repeat_track = *b;
            }
        } else if (current_section == "ui") {
            if (key == "sort") {
                if (auto s = parse_sort_key(value)) cfg.sort = *s;
            } else if (key == "search_field") {
                if (auto f = parse_search_field(value)) cfg.search_field = *f;
            }
        } else if (current_section == "keybinds") {
            if (!value.empty()) cfg.keybinds[key] = std::string(value);
        } else if (current_section == "library") {
            if (key == "music_directory" && !value.empty()) {
                cfg.music_directory = util::Platform::expand_home(std::string(value));
            }
        } else if (current_section == "paths") {
            if (key == "playlist_directory" && !value.empty()) {
                cfg.playlist_directory = util::Platform::expand_home(std::string(value));
            } else if (key == "music_directory" && !value.empty()) {
                cfg.music_directory = util::Platform::expand_home(std::string(value));
            }
        }
    }

    return cfg;
}

bool ConfigLoader::save_config(const Config& cfg, const std::filesystem::path& path) {
    util::Logger::info("Config: Saving configuration to " + path.string());

    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        util::Logger::error("Config: Cannot create " + path.parent_path().string() + ": " + ec.message());
        return false;
    }

    std::ofstream file(path);
    if (!file) return false;

    file << "# cadence config\n";
    file << "# Generated on first run; edit with care\n\n";

    file << "[playback]\n";
    file << "# Volume at startup (0-100)\n";
    file << "default_volume = " << cfg.default_volume << "\n";
    file << "# Loop the current track instead of advancing\n";
    file << "repeat_track = " << (cfg.repeat_track ? "true" : "false") << "\n\n";

    file << "[library]\n";
    file << "# Music library directory\n";
    if (!cfg.music_directory.empty()) {
        file << "music_directory = \"" << cfg.music_directory.string() << "\"\n\n";
    } else {
        file << "# music_directory = \"~/Music\"\n\n";
    }

    file << "[paths]\n";
    file << "# Where playlist manifests (.m3u) are kept\n";
    if (!cfg.playlist_directory.empty()) {
        file << "playlist_directory = \"" << cfg.playlist_directory.string() << "\"\n\n";
    } else {
        file << "# playlist_directory = \"~/.config/cadence/playlists\"\n\n";
    }

    file << "[ui]\n";
    file << "# Sort: \"title\", \"artist\", \"duration\", \"shuffle\"\n";
    file << "sort = \"" << sort_name(cfg.sort) << "\"\n";
    file << "# Search field: \"title\", \"artist\", \"album\"\n";
    file << "search_field = \"" << field_name(cfg.search_field) << "\"\n\n";

    file << "[keybinds]\n";
    file << "# action = \"key\", e.g.\n";
    file << "# pause = \"ctrl+p\"\n";
    file << "# seek_forward = \"right\"\n";
    for (const auto& [action, key] : cfg.keybinds) {
        file << action << " = \"" << key << "\"\n";
    }

    file.flush();
    return static_cast<bool>(file);
}

std::filesystem::path ConfigLoader::get_config_file() {
    return util::Platform::get_config_directory() / "config.toml";
}

}  // namespace cadence::backend
