#include "audio/PipeWireSink.hpp"
#include "util/Logger.hpp"

#include <algorithm>
#include <chrono>

namespace audio {

using cadence::util::Logger;

namespace {

// ~85ms at 192kHz, large enough to keep the stream fed between wakeups
constexpr int CHUNK_FRAMES = 16384;

}  // namespace

PipeWireSink::PipeWireSink()
    : pump_thread_([this](std::stop_token stop) { pump(stop); }) {
}

PipeWireSink::~PipeWireSink() {
    pump_thread_.request_stop();
    wake_.notify_all();
    if (pump_thread_.joinable()) {
        pump_thread_.join();
    }
    std::lock_guard out(output_mutex_);
    output_.close();
}

bool PipeWireSink::load(const std::string& path) {
    auto decoder = AudioDecoder::for_path(path);
    if (!decoder) {
        Logger::warn("PipeWireSink: Unsupported file type: " + path);
        return false;
    }
    if (!decoder->open(path)) {
        return false;
    }

    const int rate = decoder->sample_rate();
    const int channels = decoder->channels();

    {
        std::lock_guard lock(mutex_);
        decoder_.reset();
        finished_ = true;
        ++generation_;
    }

    {
        std::lock_guard out(output_mutex_);
        if (!context_.init()) {
            return false;
        }
        // Same format keeps the stream and avoids a gap
        if (!output_.matches(rate, channels)) {
            if (!output_.init(context_, rate, channels)) {
                return false;
            }
        }
        output_.set_volume(volume_.load());
    }

    bool paused = false;
    {
        std::lock_guard lock(mutex_);
        decoder_ = std::move(decoder);
        finished_ = false;
        paused = paused_;
        ++generation_;
    }
    {
        std::lock_guard out(output_mutex_);
        output_.pause(paused);
    }
    wake_.notify_all();

    Logger::debug("PipeWireSink: Loaded " + path);
    return true;
}

void PipeWireSink::clear() {
    {
        std::lock_guard lock(mutex_);
        if (decoder_) {
            decoder_->close();
            decoder_.reset();
        }
        finished_ = true;
        ++generation_;
    }

    // Drop whatever is still queued; the stream itself is kept for reuse
    std::lock_guard out(output_mutex_);
    output_.pause(true);
}

void PipeWireSink::play() {
    {
        std::lock_guard lock(mutex_);
        paused_ = false;
    }
    {
        std::lock_guard out(output_mutex_);
        output_.pause(false);
    }
    wake_.notify_all();
}

void PipeWireSink::pause() {
    {
        std::lock_guard lock(mutex_);
        paused_ = true;
    }
    std::lock_guard out(output_mutex_);
    output_.pause(true);
}

bool PipeWireSink::is_paused() const {
    std::lock_guard lock(mutex_);
    return paused_;
}

std::chrono::milliseconds PipeWireSink::position() const {
    std::lock_guard lock(mutex_);
    if (!decoder_) {
        return std::chrono::milliseconds{0};
    }
    return std::chrono::milliseconds{decoder_->position_ms()};
}

bool PipeWireSink::try_seek(std::chrono::milliseconds position) {
    std::lock_guard lock(mutex_);
    if (!decoder_) {
        return false;
    }
    if (!decoder_->seek_ms(position.count())) {
        return false;
    }
    finished_ = false;
    ++generation_;
    wake_.notify_all();
    return true;
}

float PipeWireSink::volume() const {
    return volume_.load();
}

void PipeWireSink::set_volume(float volume) {
    volume = std::clamp(volume, 0.0f, 1.0f);
    volume_.store(volume);
    // Atomic in the output, so output_mutex_ is not taken
    output_.set_volume(volume);
}

bool PipeWireSink::is_empty() const {
    std::lock_guard lock(mutex_);
    return !decoder_ || finished_;
}

void PipeWireSink::pump(std::stop_token stop) {
    PcmChunk chunk;

    while (!stop.stop_requested()) {
        {
            std::unique_lock lock(mutex_);
            bool ready = wake_.wait(lock, stop, [&] {
                return !paused_ && (chunk.pending(generation_) || (decoder_ && !finished_));
            });
            if (!ready) {
                break;
            }

            if (chunk.stale(generation_)) {
                chunk.drop();
            }
            if (chunk.remaining() == 0) {
                float* buffer = chunk.prepare(decoder_->channels(), CHUNK_FRAMES);
                int got = decoder_->read_frames(buffer, CHUNK_FRAMES);
                chunk.fill(got > 0 ? static_cast<size_t>(got) : 0, generation_);
                if (chunk.remaining() == 0) {
                    finished_ = true;
                    Logger::debug("PipeWireSink: End of stream");
                    continue;
                }
            }
        }

        // One stream buffer per lock so commands never wait on a whole chunk
        size_t n = 0;
        {
            std::lock_guard out(output_mutex_);
            n = output_.write(chunk.data(), chunk.remaining());
        }
        chunk.consume(n);

        if (n == 0) {
            // Paused mid-chunk or no usable stream; the remainder is kept
            std::unique_lock lock(mutex_);
            wake_.wait_for(lock, stop, std::chrono::milliseconds(20), [&] {
                return paused_ || chunk.stale(generation_);
            });
        }
    }
}

}  // namespace audio
