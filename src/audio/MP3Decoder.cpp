#include "audio/MP3Decoder.hpp"
#include "util/Logger.hpp"

#include <mutex>

namespace audio {

using cadence::util::Logger;

namespace {

// mpg123_init is process-wide and only needs to run once
void ensure_mpg123() {
    static std::once_flag once;
    std::call_once(once, [] { mpg123_init(); });
}

}  // namespace

MP3Decoder::MP3Decoder() {
    ensure_mpg123();
    int err = MPG123_OK;
    handle_ = mpg123_new(nullptr, &err);
    if (!handle_) {
        Logger::error(std::string("MP3Decoder: mpg123_new failed: ") + mpg123_plain_strerror(err));
    }
}

MP3Decoder::~MP3Decoder() {
    close();
    if (handle_) {
        mpg123_delete(handle_);
        handle_ = nullptr;
    }
}

bool MP3Decoder::open(const std::string& filepath) {
    close();
    if (!handle_) {
        return false;
    }

    if (mpg123_open(handle_, filepath.c_str()) != MPG123_OK) {
        Logger::error("MP3Decoder: Failed to open " + filepath + " (" + mpg123_strerror(handle_) + ")");
        return false;
    }

    long rate = 0;
    int channels = 0;
    int encoding = 0;
    if (mpg123_getformat(handle_, &rate, &channels, &encoding) != MPG123_OK) {
        Logger::error("MP3Decoder: No stream format in " + filepath);
        mpg123_close(handle_);
        return false;
    }

    // Pin the output format so a mid-stream change can't alter the frame size
    mpg123_format_none(handle_);
    if (mpg123_format(handle_, rate, channels, MPG123_ENC_SIGNED_16) != MPG123_OK) {
        Logger::error("MP3Decoder: Failed to set output format for " + filepath);
        mpg123_close(handle_);
        return false;
    }

    sample_rate_ = static_cast<int>(rate);
    channels_ = channels;
    off_t length = mpg123_length(handle_);
    total_frames_ = length == MPG123_ERR ? 0 : static_cast<long>(length);
    position_frames_ = 0;
    opened_ = true;

    Logger::debug("MP3Decoder: Opened " + filepath + " (" + std::to_string(sample_rate_) + "Hz, " +
                  std::to_string(channels_) + "ch)");
    return true;
}

void MP3Decoder::close() {
    if (opened_ && handle_) {
        mpg123_close(handle_);
    }
    opened_ = false;
    reset_format();
}

int MP3Decoder::read_frames(float* out, int max_frames) {
    if (!opened_ || !out || max_frames <= 0 || channels_ == 0) return 0;

    scratch_.resize(static_cast<size_t>(max_frames) * channels_);
    const size_t wanted = scratch_.size() * sizeof(short);
    size_t got = 0;

    int rc = mpg123_read(handle_, reinterpret_cast<unsigned char*>(scratch_.data()), wanted, &got);
    if (rc == MPG123_NEW_FORMAT) {
        rc = mpg123_read(handle_, reinterpret_cast<unsigned char*>(scratch_.data()), wanted, &got);
    }
    if (rc == MPG123_ERR) {
        // Partial data from a failed read is not trustworthy
        Logger::error(std::string("MP3Decoder: Read error: ") + mpg123_strerror(handle_));
        return 0;
    }

    const size_t samples = got / sizeof(short);
    for (size_t i = 0; i < samples; ++i) {
        out[i] = scratch_[i] / 32768.0f;
    }

    int frames = static_cast<int>(samples / channels_);
    position_frames_ += frames;
    return frames;
}

bool MP3Decoder::seek_frame(long frame) {
    if (!opened_) return false;

    off_t pos = mpg123_seek(handle_, static_cast<off_t>(frame), SEEK_SET);
    if (pos < 0) {
        Logger::warn("MP3Decoder: Seek to frame " + std::to_string(frame) + " failed");
        return false;
    }
    position_frames_ = static_cast<long>(pos);
    return true;
}

}  // namespace audio
