#include "audio/PipeWireOutput.hpp"
#include "util/Logger.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <pipewire/pipewire.h>
#include <spa/param/audio/format-utils.h>
#include <thread>

namespace audio {

using cadence::util::Logger;

namespace {

class LoopLock {
public:
    explicit LoopLock(pw_thread_loop* loop) : loop_(loop) { pw_thread_loop_lock(loop_); }
    ~LoopLock() { pw_thread_loop_unlock(loop_); }

    LoopLock(const LoopLock&) = delete;
    LoopLock& operator=(const LoopLock&) = delete;

private:
    pw_thread_loop* loop_;
};

// write() dequeues buffers itself, so the process callback stays empty
void on_process(void*) {}

const pw_stream_events kStreamEvents = {
    .version = PW_VERSION_STREAM_EVENTS,
    .process = on_process,
};

constexpr int kStreamingPolls = 100;  // x20ms, suspended sinks wake slowly
constexpr int kDequeueAttempts = 50;

std::string format_text(int rate, int channels) {
    return std::to_string(rate) + "Hz, " + std::to_string(channels) + "ch";
}

}  // namespace

PipeWireOutput::~PipeWireOutput() {
    close();
}

bool PipeWireOutput::init(PipeWireContext& context, int sample_rate, int channels) {
    close();
    if (sample_rate <= 0 || channels <= 0) {
        Logger::error("PipeWireOutput: Invalid format " + format_text(sample_rate, channels));
        return false;
    }
    if (!context.get_loop()) {
        Logger::error("PipeWireOutput: Context has no loop");
        return false;
    }

    context_ = &context;
    sample_rate_ = sample_rate;
    channels_ = channels;
    paused_ = false;

    int rc = 0;
    {
        LoopLock lock(loop());
        pw_properties* props = pw_properties_new(
            PW_KEY_MEDIA_TYPE, "Audio",
            PW_KEY_MEDIA_CATEGORY, "Playback",
            PW_KEY_MEDIA_ROLE, "Music",
            nullptr);
        stream_ = pw_stream_new_simple(pw_thread_loop_get_loop(loop()), "Cadence", props,
                                       &kStreamEvents, this);
        if (!stream_) {
            Logger::error("PipeWireOutput: Failed to create stream");
            return false;
        }

        uint8_t pod_storage[1024];
        spa_pod_builder builder = SPA_POD_BUILDER_INIT(pod_storage, sizeof(pod_storage));
        spa_audio_info_raw info{};
        info.format = SPA_AUDIO_FORMAT_F32;
        info.channels = static_cast<uint32_t>(channels_);
        info.rate = static_cast<uint32_t>(sample_rate_);
        const spa_pod* params[] = {spa_format_audio_raw_build(&builder, SPA_PARAM_EnumFormat, &info)};

        auto flags = static_cast<pw_stream_flags>(PW_STREAM_FLAG_AUTOCONNECT | PW_STREAM_FLAG_MAP_BUFFERS);
        rc = pw_stream_connect(stream_, PW_DIRECTION_OUTPUT, PW_ID_ANY, flags, params, 1);
    }

    if (rc < 0) {
        Logger::error("PipeWireOutput: Stream connect failed (" + std::to_string(rc) + ")");
        close();
        return false;
    }

    Logger::info("PipeWireOutput: Stream open (" + format_text(sample_rate_, channels_) + ")");
    return true;
}

void PipeWireOutput::close(bool drain) {
    if (!stream_) return;
    if (loop()) {
        LoopLock lock(loop());
        pw_stream_flush(stream_, drain);
        pw_stream_destroy(stream_);
    } else {
        pw_stream_destroy(stream_);
    }
    stream_ = nullptr;
    sample_rate_ = 0;
    channels_ = 0;
}

bool PipeWireOutput::wait_until_streaming() {
    pw_stream_state state = PW_STREAM_STATE_UNCONNECTED;
    for (int poll = 0; poll < kStreamingPolls; ++poll) {
        {
            LoopLock lock(loop());
            state = pw_stream_get_state(stream_, nullptr);
        }
        if (state == PW_STREAM_STATE_STREAMING) return true;
        if (state == PW_STREAM_STATE_ERROR) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    Logger::error(std::string("PipeWireOutput: Stream not streaming (state=") +
                  pw_stream_state_as_string(state) + ")");
    return false;
}

size_t PipeWireOutput::fill_and_queue(pw_buffer* buffer, const float* data, size_t frames) {
    spa_data& out = buffer->buffer->datas[0];
    size_t count = 0;

    if (out.data) {
        const size_t frame_bytes = static_cast<size_t>(channels_) * sizeof(float);
        count = std::min(frames, out.maxsize / frame_bytes);
        const float gain = volume();

        auto* dst = static_cast<float*>(out.data);
        const size_t samples = count * channels_;
        for (size_t i = 0; i < samples; ++i) {
            float v = data[i] * gain;
            dst[i] = std::isfinite(v) ? std::clamp(v, -1.0f, 1.0f) : 0.0f;
        }

        out.chunk->offset = 0;
        out.chunk->stride = static_cast<int32_t>(frame_bytes);
        out.chunk->size = static_cast<uint32_t>(count * frame_bytes);
    }

    pw_stream_queue_buffer(stream_, buffer);
    return count;
}

size_t PipeWireOutput::write(const float* data, size_t frames) {
    if (!stream_ || !loop() || !data || frames == 0 || paused_) {
        return 0;
    }
    if (!wait_until_streaming()) {
        return 0;
    }

    for (int attempt = 0; attempt < kDequeueAttempts; ++attempt) {
        {
            LoopLock lock(loop());
            if (pw_buffer* buffer = pw_stream_dequeue_buffer(stream_)) {
                return fill_and_queue(buffer, data, frames);
            }
        }
        // Backs off 2, 4, 8, 16, 32ms and stays at 32
        int delay_ms = 2 << std::min(attempt, 4);
        std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
    }

    Logger::warn("PipeWireOutput: No buffer available, sink may be suspended");
    return 0;
}

void PipeWireOutput::set_volume(float volume) {
    volume_.store(std::clamp(volume, 0.0f, 1.0f), std::memory_order_relaxed);
}

void PipeWireOutput::pause(bool paused) {
    if (paused_ == paused) return;
    paused_ = paused;
    if (!stream_ || !loop()) return;

    {
        LoopLock lock(loop());
        pw_stream_set_active(stream_, !paused);
    }
    Logger::debug(std::string("PipeWireOutput: ") + (paused ? "paused" : "resumed"));
}

}  // namespace audio
