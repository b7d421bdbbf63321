#include "backend/PlaylistStore.hpp"
#include "util/Logger.hpp"
#include "util/PathHasher.hpp"

#include <algorithm>
#include <cstring>
#include <format>
#include <fstream>

namespace cadence::backend {

namespace fs = std::filesystem;

namespace {

constexpr const char* MANIFEST_HEADER = "#EXTM3U";
constexpr const char* MANIFEST_EXT = ".m3u";

bool is_safe_byte(unsigned char c) {
    if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) {
        return true;
    }
    return std::strchr(" _.,()'!&+=@-", c) != nullptr && c != '\0';
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

}  // namespace

PlaylistStore::PlaylistStore(fs::path directory)
    : directory_(std::move(directory)) {
}

std::string PlaylistStore::trim_name(const std::string& name) {
    size_t first = name.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = name.find_last_not_of(" \t\r\n");
    return name.substr(first, last - first + 1);
}

CreateResult PlaylistStore::create(const std::string& raw_name, const std::vector<model::TrackId>& ids) {
    CreateResult result;
    std::string name = trim_name(raw_name);
    result.missing_name = name.empty();
    result.missing_tracks = ids.empty();

    if (result.missing_name && result.missing_tracks) {
        result.message = "Need a name and at least 1 song";
        return result;
    }
    if (result.missing_name) {
        result.message = "Need a name";
        return result;
    }
    if (result.missing_tracks) {
        result.message = "Need at least 1 song";
        return result;
    }
    if (is_protected(name)) {
        result.reserved_name = true;
        result.message = std::format("\"{}\" is reserved", name);
        return result;
    }

    // Keep first occurrence order, drop repeats
    std::vector<model::TrackId> members;
    members.reserve(ids.size());
    for (const auto& id : ids) {
        if (std::find(members.begin(), members.end(), id) == members.end()) {
            members.push_back(id);
        }
    }

    bool replaced = playlists_.count(name) > 0;
    playlists_[name] = std::move(members);
    ++revision_;

    util::Logger::info(std::format("PlaylistStore: {} playlist '{}' ({} tracks)",
                                   replaced ? "Replaced" : "Created", name, playlists_[name].size()));
    result.ok = true;
    return result;
}

bool PlaylistStore::remove(const std::string& name) {
    if (is_protected(name)) {
        return false;
    }
    if (playlists_.erase(name) == 0) {
        return false;
    }
    ++revision_;

    std::error_code ec;
    fs::remove(manifest_path(name), ec);
    if (ec) {
        util::Logger::warn("PlaylistStore: Could not delete manifest for '" + name + "': " + ec.message());
    }
    util::Logger::info("PlaylistStore: Deleted playlist '" + name + "'");
    return true;
}

bool PlaylistStore::add_track(const std::string& name, const model::TrackId& id) {
    if (is_protected(name)) return false;
    auto it = playlists_.find(name);
    if (it == playlists_.end()) return false;

    auto& members = it->second;
    if (std::find(members.begin(), members.end(), id) != members.end()) {
        return false;
    }
    members.push_back(id);
    ++revision_;
    return true;
}

bool PlaylistStore::remove_track(const std::string& name, const model::TrackId& id) {
    if (is_protected(name)) return false;
    auto it = playlists_.find(name);
    if (it == playlists_.end()) return false;

    auto& members = it->second;
    auto pos = std::find(members.begin(), members.end(), id);
    if (pos == members.end()) {
        return false;
    }
    members.erase(pos);
    ++revision_;
    return true;
}

bool PlaylistStore::persist(const Catalog& catalog) {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        util::Logger::error("PlaylistStore: Cannot create " + directory_.string() + ": " + ec.message());
        return false;
    }

    bool all_ok = true;
    for (const auto& [name, ids] : playlists_) {
        if (!write_manifest(name, ids, catalog)) {
            all_ok = false;
        }
    }
    util::Logger::info(std::format("PlaylistStore: Saved {} playlists to {}", playlists_.size(),
                                   directory_.string()));
    return all_ok;
}

bool PlaylistStore::write_manifest(const std::string& name,
                                   const std::vector<model::TrackId>& ids,
                                   const Catalog& catalog) const {
    fs::path file = manifest_path(name);
    std::ofstream out(file, std::ios::trunc);
    if (!out) {
        util::Logger::error("PlaylistStore: Cannot write " + file.string());
        return false;
    }

    out << MANIFEST_HEADER << '\n';
    for (const auto& id : ids) {
        const std::string* path = nullptr;
        if (const auto* track = catalog.find(id)) {
            path = &track->path;
        } else if (auto it = known_paths_.find(id); it != known_paths_.end()) {
            path = &it->second;
        }
        // The placeholder track has no file behind it
        if (path && !path->empty()) {
            out << *path << '\n';
        }
    }

    out.flush();
    if (!out) {
        util::Logger::error("PlaylistStore: Write failed for " + file.string());
        return false;
    }
    return true;
}

void PlaylistStore::restore(const Catalog& catalog) {
    playlists_.clear();
    known_paths_.clear();
    ++revision_;

    std::error_code ec;
    if (!fs::is_directory(directory_, ec)) {
        util::Logger::info("PlaylistStore: No playlist directory at " + directory_.string());
        regenerate_all_songs(catalog);
        return;
    }

    fs::directory_iterator it(directory_, ec);
    if (ec) {
        util::Logger::warn("PlaylistStore: Cannot list " + directory_.string() + ": " + ec.message());
        regenerate_all_songs(catalog);
        return;
    }

    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            util::Logger::warn("PlaylistStore: Directory listing aborted: " + ec.message());
            break;
        }
        const fs::path& file = it->path();
        if (file.extension() != MANIFEST_EXT) continue;

        auto name = unescape_name(file.stem().string());
        if (!name || trim_name(*name).empty()) {
            util::Logger::warn("PlaylistStore: Skipping manifest with bad name: " + file.string());
            continue;
        }
        if (is_protected(*name)) {
            continue;  // regenerated below; its paths must not be remembered
        }

        auto ids = read_manifest(file);
        if (!ids) {
            continue;
        }
        playlists_[*name] = std::move(*ids);
    }

    // Paths that resolve to catalog tracks don't need remembering
    for (auto kp = known_paths_.begin(); kp != known_paths_.end();) {
        kp = catalog.find(kp->first) ? known_paths_.erase(kp) : std::next(kp);
    }

    regenerate_all_songs(catalog);
    util::Logger::info(std::format("PlaylistStore: Restored {} playlists", playlists_.size()));
}

std::optional<std::vector<model::TrackId>> PlaylistStore::read_manifest(const fs::path& file) {
    std::ifstream in(file);
    if (!in) {
        util::Logger::warn("PlaylistStore: Cannot read " + file.string());
        return std::nullopt;
    }

    std::vector<model::TrackId> ids;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || line[0] == '#' || trim_name(line).empty()) {
            continue;
        }

        auto id = util::PathHasher::track_id(line);
        if (std::find(ids.begin(), ids.end(), id) != ids.end()) {
            continue;
        }
        known_paths_.emplace(id, line);
        ids.push_back(id);
    }

    if (in.bad()) {
        util::Logger::warn("PlaylistStore: Read error in " + file.string());
        return std::nullopt;
    }
    return ids;
}

void PlaylistStore::regenerate_all_songs(const Catalog& catalog) {
    playlists_[ALL_SONGS] = catalog.ids();
    ++revision_;
}

std::vector<std::string> PlaylistStore::names() const {
    std::vector<std::string> out;
    out.reserve(playlists_.size());
    for (const auto& [name, ids] : playlists_) {
        out.push_back(name);
    }
    return out;
}

const std::vector<model::TrackId>* PlaylistStore::get(const std::string& name) const {
    auto it = playlists_.find(name);
    return it == playlists_.end() ? nullptr : &it->second;
}

fs::path PlaylistStore::manifest_path(const std::string& name) const {
    return directory_ / (escape_name(name) + MANIFEST_EXT);
}

std::string PlaylistStore::escape_name(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (size_t i = 0; i < name.size(); ++i) {
        auto c = static_cast<unsigned char>(name[i]);
        // A leading dot would hide the file
        if (is_safe_byte(c) && !(i == 0 && c == '.')) {
            out += static_cast<char>(c);
        } else {
            out += std::format("%{:02X}", c);
        }
    }
    return out;
}

std::optional<std::string> PlaylistStore::unescape_name(const std::string& escaped) {
    std::string out;
    out.reserve(escaped.size());
    for (size_t i = 0; i < escaped.size(); ++i) {
        if (escaped[i] != '%') {
            out += escaped[i];
            continue;
        }
        if (i + 2 >= escaped.size()) {
            return std::nullopt;
        }
        int hi = hex_value(escaped[i + 1]);
        int lo = hex_value(escaped[i + 2]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out += static_cast<char>((hi << 4) | lo);
        i += 2;
    }
    return out;
}

}  // namespace cadence::backend
