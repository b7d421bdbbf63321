#include "audio/AudioDecoder.hpp"
#include "audio/FFmpegDecoder.hpp"
#include "audio/MP3Decoder.hpp"
#include "audio/SndFileDecoder.hpp"
#include "audio/VorbisDecoder.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace audio {

bool AudioDecoder::seek_ms(int64_t ms) {
    if (sample_rate_ == 0) return false;
    long frame = static_cast<long>((std::max<int64_t>(ms, 0) * sample_rate_) / 1000);
    if (total_frames_ > 0) {
        frame = std::min(frame, total_frames_);
    }
    return seek_frame(frame);
}

int64_t AudioDecoder::position_ms() const {
    if (sample_rate_ == 0) return 0;
    return (static_cast<int64_t>(position_frames_) * 1000) / sample_rate_;
}

int64_t AudioDecoder::duration_ms() const {
    if (sample_rate_ == 0) return 0;
    return (static_cast<int64_t>(total_frames_) * 1000) / sample_rate_;
}

std::unique_ptr<AudioDecoder> AudioDecoder::for_path(const std::string& filepath) {
    std::string ext = std::filesystem::path(filepath).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == ".mp3") return std::make_unique<MP3Decoder>();
    if (ext == ".flac" || ext == ".wav") return std::make_unique<SndFileDecoder>();
    if (ext == ".ogg") return std::make_unique<VorbisDecoder>();
    if (ext == ".aac" || ext == ".m4a") return std::make_unique<FFmpegDecoder>();
    return nullptr;
}

}  // namespace audio
