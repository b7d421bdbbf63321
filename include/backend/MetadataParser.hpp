#pragma once

#include "model/Track.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cadence::backend {

class MetadataParser {
public:
    /// Builds a complete Track for path: id, tags, duration, format, cover
    /// and search keys. Never fails; when tags can't be read the filename
    /// fills in and Track::error says why.
    static model::Track parse_file(const std::string& path);

    static model::AudioFormat detect_format(const std::string& path);

    /// First cover/folder/front/album image beside the file, raw bytes.
    static std::optional<std::vector<uint8_t>> find_cover(const std::string& path);

    // Filename parsing fallbacks
    static std::string title_from_filename(const std::string& path);
    static std::string artist_from_filename(const std::string& path);
    static std::string album_from_path(const std::string& path);

    static void fill_search_keys(model::Track& track);

private:
    static bool read_mp3(const std::string& path, model::Track& track);
    static bool read_sndfile(const std::string& path, model::Track& track);
    static bool read_ffmpeg(const std::string& path, model::Track& track);
};

}  // namespace cadence::backend
