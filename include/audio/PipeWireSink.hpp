#pragma once

#include "audio/AudioDecoder.hpp"
#include "audio/AudioSink.hpp"
#include "audio/PcmChunk.hpp"
#include "audio/PipeWireContext.hpp"
#include "audio/PipeWireOutput.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

namespace audio {

/// AudioSink backed by a PipeWire stream and a pump thread that moves
/// decoded PCM into it.
class PipeWireSink : public AudioSink {
public:
    PipeWireSink();
    ~PipeWireSink() override;

    PipeWireSink(const PipeWireSink&) = delete;
    PipeWireSink& operator=(const PipeWireSink&) = delete;

    bool load(const std::string& path) override;
    void clear() override;

    void play() override;
    void pause() override;
    bool is_paused() const override;

    std::chrono::milliseconds position() const override;
    bool try_seek(std::chrono::milliseconds position) override;

    float volume() const override;
    void set_volume(float volume) override;

    bool is_empty() const override;

private:
    void pump(std::stop_token stop);

    PipeWireContext context_;

    // decoder_, paused_, finished_ and generation_
    mutable std::mutex mutex_;
    std::condition_variable_any wake_;
    std::unique_ptr<AudioDecoder> decoder_;
    bool paused_ = false;
    bool finished_ = true;
    // Bumped whenever the stream is replaced or repositioned; a PcmChunk
    // read under an older generation is dropped instead of written.
    uint64_t generation_ = 0;

    // Held by the pump for one write() at a time and by load/clear/pause.
    // set_volume only touches the output's atomic gain.
    std::mutex output_mutex_;
    PipeWireOutput output_;

    std::atomic<float> volume_{1.0f};
    std::jthread pump_thread_;
};

}  // namespace audio
