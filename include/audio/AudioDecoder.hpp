#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace audio {

/// Pull-style PCM source. Every decoder hands out interleaved float
/// samples in [-1, 1] at the file's native rate and channel count.
class AudioDecoder {
public:
    virtual ~AudioDecoder() = default;

    virtual bool open(const std::string& filepath) = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;

    /// Fills up to max_frames frames. Returns 0 at end of stream or on a
    /// decode error.
    virtual int read_frames(float* out, int max_frames) = 0;
    virtual bool seek_frame(long frame) = 0;

    int sample_rate() const { return sample_rate_; }
    int channels() const { return channels_; }
    long total_frames() const { return total_frames_; }
    long position_frames() const { return position_frames_; }

    bool seek_ms(int64_t ms);
    int64_t position_ms() const;
    int64_t duration_ms() const;

    /// Picks the decoder for a path by extension; nullptr when unsupported.
    static std::unique_ptr<AudioDecoder> for_path(const std::string& filepath);

protected:
    void reset_format() {
        sample_rate_ = 0;
        channels_ = 0;
        total_frames_ = 0;
        position_frames_ = 0;
    }

    int sample_rate_ = 0;
    int channels_ = 0;
    long total_frames_ = 0;
    long position_frames_ = 0;
};

}  // namespace audio
