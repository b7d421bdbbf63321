#pragma once

#include "audio/AudioDecoder.hpp"
#include <mpg123.h>
#include <vector>

namespace audio {

class MP3Decoder : public AudioDecoder {
public:
    MP3Decoder();
    ~MP3Decoder() override;

    MP3Decoder(const MP3Decoder&) = delete;
    MP3Decoder& operator=(const MP3Decoder&) = delete;

    bool open(const std::string& filepath) override;
    void close() override;
    bool is_open() const override { return opened_; }

    int read_frames(float* out, int max_frames) override;
    bool seek_frame(long frame) override;

private:
    mpg123_handle* handle_ = nullptr;
    bool opened_ = false;
    std::vector<short> scratch_;
};

}  // namespace audio
