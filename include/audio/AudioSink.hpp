#pragma once

#include <chrono>
#include <string>

namespace audio {

/// Output device holding at most one decoded stream.
///
/// Each call is individually thread-safe. Callers that need several calls
/// to act as one unit (clear, load, play) serialize them themselves.
class AudioSink {
public:
    virtual ~AudioSink() = default;

    /// Replaces the current stream. Playback starts unless paused.
    /// False when the file cannot be decoded or no device is available.
    virtual bool load(const std::string& path) = 0;
    virtual void clear() = 0;

    virtual void play() = 0;
    virtual void pause() = 0;
    virtual bool is_paused() const = 0;

    /// Best-effort position in the current stream.
    virtual std::chrono::milliseconds position() const = 0;
    /// False when the stream cannot seek; the position is then unchanged.
    virtual bool try_seek(std::chrono::milliseconds position) = 0;

    virtual float volume() const = 0;
    virtual void set_volume(float volume) = 0;

    /// True when nothing is loaded or the stream has run out of audio.
    virtual bool is_empty() const = 0;
};

}  // namespace audio
