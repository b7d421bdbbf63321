#pragma once

#include "audio/PipeWireContext.hpp"
#include <atomic>
#include <cstddef>

struct pw_buffer;
struct pw_stream;
struct pw_thread_loop;

namespace audio {

/// One F32 playback stream. write() blocks until the server hands out a
/// buffer, so it must not be called from the PipeWire loop thread.
class PipeWireOutput {
public:
    PipeWireOutput() = default;
    ~PipeWireOutput();

    PipeWireOutput(const PipeWireOutput&) = delete;
    PipeWireOutput& operator=(const PipeWireOutput&) = delete;

    bool init(PipeWireContext& context, int sample_rate, int channels);

    /// drain=true lets queued audio play out first; false cuts it off.
    void close(bool drain = false);

    /// Returns frames accepted; 0 if the stream is not streaming.
    size_t write(const float* data, size_t frames);
    void pause(bool paused);

    bool is_initialized() const { return stream_ != nullptr; }
    bool matches(int sample_rate, int channels) const {
        return stream_ && sample_rate_ == sample_rate && channels_ == channels;
    }

    /// Linear gain in [0, 1], applied while copying into stream buffers.
    void set_volume(float volume);
    float volume() const { return volume_.load(std::memory_order_relaxed); }

private:
    struct pw_thread_loop* loop() const { return context_ ? context_->get_loop() : nullptr; }
    bool wait_until_streaming();
    // Caller holds the loop lock; the buffer is always handed back
    size_t fill_and_queue(struct pw_buffer* buffer, const float* data, size_t frames);

    int sample_rate_ = 0;
    int channels_ = 0;
    bool paused_ = false;
    std::atomic<float> volume_{1.0f};

    struct pw_stream* stream_ = nullptr;
    PipeWireContext* context_ = nullptr;  // non-owning
};

}  // namespace audio
