#pragma once

#include "audio/AudioDecoder.hpp"
#include <sndfile.h>

namespace audio {

/// FLAC and WAV through libsndfile.
class SndFileDecoder : public AudioDecoder {
public:
    SndFileDecoder() = default;
    ~SndFileDecoder() override;

    SndFileDecoder(const SndFileDecoder&) = delete;
    SndFileDecoder& operator=(const SndFileDecoder&) = delete;

    bool open(const std::string& filepath) override;
    void close() override;
    bool is_open() const override { return file_ != nullptr; }

    int read_frames(float* out, int max_frames) override;
    bool seek_frame(long frame) override;

private:
    SNDFILE* file_ = nullptr;
};

}  // namespace audio
