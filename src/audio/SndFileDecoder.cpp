#include "audio/SndFileDecoder.hpp"
#include "util/Logger.hpp"

namespace audio {

using cadence::util::Logger;

SndFileDecoder::~SndFileDecoder() {
    close();
}

bool SndFileDecoder::open(const std::string& filepath) {
    close();

    SF_INFO info{};
    file_ = sf_open(filepath.c_str(), SFM_READ, &info);
    if (!file_) {
        Logger::error("SndFileDecoder: Failed to open " + filepath + " (" + sf_strerror(nullptr) + ")");
        return false;
    }

    sample_rate_ = info.samplerate;
    channels_ = info.channels;
    total_frames_ = static_cast<long>(info.frames);
    position_frames_ = 0;

    Logger::debug("SndFileDecoder: Opened " + filepath + " (" + std::to_string(sample_rate_) + "Hz, " +
                  std::to_string(channels_) + "ch, " + std::to_string(total_frames_) + " frames)");
    return true;
}

void SndFileDecoder::close() {
    if (file_) {
        sf_close(file_);
        file_ = nullptr;
    }
    reset_format();
}

int SndFileDecoder::read_frames(float* out, int max_frames) {
    if (!file_ || !out || max_frames <= 0) return 0;

    sf_count_t frames = sf_readf_float(file_, out, max_frames);
    if (frames < 0) {
        return 0;
    }
    position_frames_ += static_cast<long>(frames);
    return static_cast<int>(frames);
}

bool SndFileDecoder::seek_frame(long frame) {
    if (!file_) return false;

    sf_count_t pos = sf_seek(file_, static_cast<sf_count_t>(frame), SEEK_SET);
    if (pos < 0) {
        Logger::warn("SndFileDecoder: Seek to frame " + std::to_string(frame) + " failed");
        return false;
    }
    position_frames_ = static_cast<long>(pos);
    return true;
}

}  // namespace audio
