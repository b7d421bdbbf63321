#include "backend/MetadataParser.hpp"
#include "util/Logger.hpp"
#include "util/PathHasher.hpp"
#include "util/UnicodeUtils.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <mpg123.h>
#include <mutex>
#include <sndfile.h>

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/dict.h>
}

namespace cadence::backend {

namespace fs = std::filesystem;

namespace {

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

// ID3v1 fields are fixed width and NUL padded
std::string fixed_field(const char* data, size_t width) {
    return trim(std::string(data, strnlen(data, width)));
}

bool has_track_number_prefix(const std::string& s) {
    return s.length() > 3 &&
           std::isdigit(static_cast<unsigned char>(s[0])) &&
           std::isdigit(static_cast<unsigned char>(s[1])) &&
           (s[2] == '.' || s[2] == ' ' || s[2] == '_');
}

void ensure_mpg123() {
    static std::once_flag once;
    std::call_once(once, [] { mpg123_init(); });
}

}  // namespace

model::Track MetadataParser::parse_file(const std::string& path) {
    model::Track track;
    track.path = path;
    track.id = util::PathHasher::track_id(path);
    track.format = detect_format(path);

    bool parsed = false;
    switch (track.format) {
        case model::AudioFormat::MP3:
            parsed = read_mp3(path, track);
            break;
        case model::AudioFormat::FLAC:
        case model::AudioFormat::WAV:
        case model::AudioFormat::OGG:
            parsed = read_sndfile(path, track);
            break;
        case model::AudioFormat::AAC:
            parsed = read_ffmpeg(path, track);
            break;
        case model::AudioFormat::Unknown:
            break;
    }

    if (!parsed) {
        track.title.clear();
        track.artist.clear();
        track.album.clear();
        track.duration_seconds = 0.0;
        track.error = "Could not read audio metadata";
        util::Logger::warn("MetadataParser: " + track.error + ": " + path);
    }

    if (track.title.empty()) track.title = title_from_filename(path);
    if (track.artist.empty()) track.artist = artist_from_filename(path);
    if (track.album.empty()) track.album = album_from_path(path);
    if (!(track.duration_seconds > 0.0)) track.duration_seconds = 0.0;

    track.cover = find_cover(path);
    fill_search_keys(track);
    return track;
}

bool MetadataParser::read_mp3(const std::string& path, model::Track& track) {
    ensure_mpg123();
    mpg123_handle* mh = mpg123_new(nullptr, nullptr);
    if (!mh) return false;

    if (mpg123_open(mh, path.c_str()) != MPG123_OK) {
        mpg123_delete(mh);
        return false;
    }

    // Full scan: exact length for VBR files and all ID3 frames parsed
    bool ok = mpg123_scan(mh) == MPG123_OK;

    long rate = 0;
    int channels = 0;
    int encoding = 0;
    if (ok && mpg123_getformat(mh, &rate, &channels, &encoding) == MPG123_OK && rate > 0) {
        off_t length = mpg123_length(mh);
        if (length > 0) {
            track.duration_seconds = static_cast<double>(length) / rate;
        }
    } else {
        ok = false;
    }

    mpg123_id3v1* v1 = nullptr;
    mpg123_id3v2* v2 = nullptr;
    if (ok && mpg123_id3(mh, &v1, &v2) == MPG123_OK) {
        auto text = [](mpg123_string* s) {
            return (s && s->p) ? trim(s->p) : std::string();
        };
        if (v2) {
            track.title = text(v2->title);
            track.artist = text(v2->artist);
            track.album = text(v2->album);
        }
        if (v1) {
            if (track.title.empty()) track.title = fixed_field(v1->title, sizeof(v1->title));
            if (track.artist.empty()) track.artist = fixed_field(v1->artist, sizeof(v1->artist));
            if (track.album.empty()) track.album = fixed_field(v1->album, sizeof(v1->album));
        }
    }

    mpg123_close(mh);
    mpg123_delete(mh);
    return ok;
}

bool MetadataParser::read_sndfile(const std::string& path, model::Track& track) {
    SF_INFO info{};
    SNDFILE* file = sf_open(path.c_str(), SFM_READ, &info);
    if (!file) return false;

    if (info.samplerate > 0 && info.frames > 0) {
        track.duration_seconds = static_cast<double>(info.frames) / info.samplerate;
    }

    auto tag = [file](int id) {
        const char* value = sf_get_string(file, id);
        return value ? trim(value) : std::string();
    };
    track.title = tag(SF_STR_TITLE);
    track.artist = tag(SF_STR_ARTIST);
    track.album = tag(SF_STR_ALBUM);

    sf_close(file);
    return true;
}

bool MetadataParser::read_ffmpeg(const std::string& path, model::Track& track) {
    AVFormatContext* ctx = nullptr;
    if (avformat_open_input(&ctx, path.c_str(), nullptr, nullptr) < 0) {
        return false;
    }
    if (avformat_find_stream_info(ctx, nullptr) < 0) {
        avformat_close_input(&ctx);
        return false;
    }

    if (ctx->duration != AV_NOPTS_VALUE && ctx->duration > 0) {
        track.duration_seconds = ctx->duration / static_cast<double>(AV_TIME_BASE);
    }

    auto tag = [ctx](const char* key) {
        const AVDictionaryEntry* e = av_dict_get(ctx->metadata, key, nullptr, 0);
        return (e && e->value) ? trim(e->value) : std::string();
    };
    track.title = tag("title");
    track.artist = tag("artist");
    if (track.artist.empty()) track.artist = tag("album_artist");
    track.album = tag("album");

    avformat_close_input(&ctx);
    return true;
}

model::AudioFormat MetadataParser::detect_format(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == ".mp3") return model::AudioFormat::MP3;
    if (ext == ".flac") return model::AudioFormat::FLAC;
    if (ext == ".ogg") return model::AudioFormat::OGG;
    if (ext == ".wav") return model::AudioFormat::WAV;
    if (ext == ".aac" || ext == ".m4a") return model::AudioFormat::AAC;
    return model::AudioFormat::Unknown;
}

std::optional<std::vector<uint8_t>> MetadataParser::find_cover(const std::string& path) {
    static const std::vector<std::string> art_names = {
        "cover.jpg", "cover.jpeg", "cover.png",
        "folder.jpg", "folder.jpeg", "folder.png",
        "front.jpg", "front.jpeg", "front.png",
        "album.jpg", "album.jpeg", "album.png",
        "Cover.jpg", "Cover.png", "Folder.jpg", "Folder.png",
        "Front.jpg", "Front.png", "Album.jpg", "Album.png",
    };

    fs::path dir = fs::path(path).parent_path();
    if (dir.empty()) return std::nullopt;

    std::error_code ec;
    for (const auto& name : art_names) {
        fs::path candidate = dir / name;
        if (!fs::is_regular_file(candidate, ec)) continue;

        std::ifstream file(candidate, std::ios::binary);
        if (!file) continue;
        std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)),
                                  std::istreambuf_iterator<char>());
        if (!data.empty()) {
            return data;
        }
    }
    return std::nullopt;
}

std::string MetadataParser::title_from_filename(const std::string& path) {
    std::string name = fs::path(path).stem().string();

    size_t dash = name.find(" - ");
    if (dash != std::string::npos && dash + 3 < name.length()) {
        name = name.substr(dash + 3);
    } else if (has_track_number_prefix(name)) {
        name = name.substr(3);
    }

    std::replace(name.begin(), name.end(), '_', ' ');
    return trim(name);
}

std::string MetadataParser::artist_from_filename(const std::string& path) {
    std::string name = fs::path(path).stem().string();

    size_t dash = name.find(" - ");
    if (dash == std::string::npos) {
        return "Unknown Artist";
    }
    std::string artist = name.substr(0, dash);
    if (has_track_number_prefix(artist)) {
        artist = artist.substr(3);
    }
    artist = trim(artist);
    return artist.empty() ? "Unknown Artist" : artist;
}

std::string MetadataParser::album_from_path(const std::string& path) {
    fs::path parent = fs::path(path).parent_path();
    std::string name = parent.filename().string();
    return name.empty() ? "Unknown Album" : name;
}

void MetadataParser::fill_search_keys(model::Track& track) {
    track.title_key = util::normalize_for_search(track.title);
    track.artist_key = util::normalize_for_search(track.artist);
    track.album_key = util::normalize_for_search(track.album);
}

}  // namespace cadence::backend
