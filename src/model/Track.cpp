#include "model/Track.hpp"
#include <format>

namespace cadence::model {

std::string TrackId::to_string() const {
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) out += '-';
        out += std::format("{:02x}", bytes[i]);
    }
    return out;
}

std::optional<TrackId> TrackId::parse(const std::string& text) {
    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    TrackId id;
    size_t out = 0;
    int high = -1;
    for (char c : text) {
        if (c == '-') continue;
        int v = nibble(c);
        if (v < 0 || out >= id.bytes.size()) return std::nullopt;
        if (high < 0) {
            high = v;
        } else {
            id.bytes[out++] = static_cast<uint8_t>((high << 4) | v);
            high = -1;
        }
    }
    if (out != id.bytes.size() || high >= 0) return std::nullopt;
    return id;
}

std::string format_name(AudioFormat format) {
    switch (format) {
        case AudioFormat::MP3:  return "MP3";
        case AudioFormat::FLAC: return "FLAC";
        case AudioFormat::OGG:  return "OGG/Vorbis";
        case AudioFormat::WAV:  return "WAV";
        case AudioFormat::AAC:  return "AAC";
        default: return "Unknown";
    }
}

}  // namespace cadence::model
