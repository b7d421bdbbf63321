#pragma once

#include "backend/MetadataParser.hpp"
#include "model/Track.hpp"
#include "util/PathHasher.hpp"

#include <filesystem>
#include <fstream>
#include <random>
#include <string>

namespace cadence::test {

inline model::Track make_track(const std::string& path, const std::string& title,
                               const std::string& artist = "Artist",
                               const std::string& album = "Album",
                               double duration_seconds = 10.0) {
    model::Track track;
    track.id = util::PathHasher::track_id(path);
    track.path = path;
    track.title = title;
    track.artist = artist;
    track.album = album;
    track.duration_seconds = duration_seconds;
    backend::MetadataParser::fill_search_keys(track);
    return track;
}

/// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& tag) {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("cadence_" + tag + "_" + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    std::filesystem::path write(const std::string& relative, const std::string& content) const {
        auto file = path_ / relative;
        std::filesystem::create_directories(file.parent_path());
        std::ofstream(file, std::ios::binary) << content;
        return file;
    }

private:
    std::filesystem::path path_;
};

}  // namespace cadence::test
