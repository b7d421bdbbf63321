#pragma once

#include "audio/AudioDecoder.hpp"
#include <vorbis/vorbisfile.h>

namespace audio {

class VorbisDecoder : public AudioDecoder {
public:
    VorbisDecoder() = default;
    ~VorbisDecoder() override;

    VorbisDecoder(const VorbisDecoder&) = delete;
    VorbisDecoder& operator=(const VorbisDecoder&) = delete;

    bool open(const std::string& filepath) override;
    void close() override;
    bool is_open() const override { return opened_; }

    int read_frames(float* out, int max_frames) override;
    bool seek_frame(long frame) override;

private:
    OggVorbis_File vf_{};
    bool opened_ = false;
};

}  // namespace audio
