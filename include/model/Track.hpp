#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace cadence::model {

enum class AudioFormat {
    Unknown,
    MP3,
    FLAC,
    OGG,
    WAV,
    AAC,
};

/// Name-based (version 5) UUID of a track's absolute path.
/// Same path, same id, on every run.
struct TrackId {
    std::array<uint8_t, 16> bytes{};

    std::string to_string() const;
    static std::optional<TrackId> parse(const std::string& text);

    auto operator<=>(const TrackId&) const = default;
};

struct TrackIdHash {
    size_t operator()(const TrackId& id) const noexcept {
        // Digest bytes are uniformly distributed, fold the first eight
        uint64_t v = 0;
        for (int i = 0; i < 8; ++i) {
            v = (v << 8) | id.bytes[i];
        }
        return static_cast<size_t>(v);
    }
};

struct Track {
    TrackId id;
    std::string title;
    std::string artist;
    std::string album;
    double duration_seconds = 0.0;  // 0 = unknown
    std::string path;
    std::optional<std::vector<uint8_t>> cover;

    AudioFormat format = AudioFormat::Unknown;

    // Case-folded, accent-stripped copies used by search
    std::string title_key;
    std::string artist_key;
    std::string album_key;

    // Set when tag reading failed and the filename stood in
    std::string error;

    bool is_playing = false;

    bool operator==(const Track&) const = default;
};

std::string format_name(AudioFormat format);

}  // namespace cadence::model
