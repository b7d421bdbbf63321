#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace audio {

/// Decoded frames on their way to the output, tagged with the sink
/// generation they were read under. A partly written chunk survives a
/// pause; only a generation change (load, clear, seek) makes it stale.
class PcmChunk {
public:
    /// Buffer for up to max_frames interleaved frames; call fill() after.
    float* prepare(int channels, size_t max_frames) {
        channels_ = channels;
        samples_.resize(max_frames * static_cast<size_t>(channels));
        frames_ = done_ = 0;
        return samples_.data();
    }

    void fill(size_t frames, uint64_t generation) {
        frames_ = std::min(frames, channels_ > 0 ? samples_.size() / channels_ : 0);
        done_ = 0;
        generation_ = generation;
    }

    bool pending(uint64_t generation) const { return done_ < frames_ && generation_ == generation; }
    bool stale(uint64_t generation) const { return generation_ != generation; }
    void drop() { frames_ = done_ = 0; }

    const float* data() const { return samples_.data() + done_ * channels_; }
    size_t remaining() const { return frames_ - done_; }
    void consume(size_t frames) { done_ += std::min(frames, remaining()); }

private:
    std::vector<float> samples_;
    int channels_ = 0;
    size_t frames_ = 0;
    size_t done_ = 0;
    uint64_t generation_ = 0;
};

}  // namespace audio
