#pragma once

#include "audio/AudioDecoder.hpp"
#include <vector>

struct AVFormatContext;
struct AVCodecContext;
struct AVPacket;
struct AVFrame;
struct SwrContext;

namespace audio {

/// AAC and M4A through libavformat/libavcodec, converted to packed float
/// with libswresample.
class FFmpegDecoder : public AudioDecoder {
public:
    FFmpegDecoder() = default;
    ~FFmpegDecoder() override;

    FFmpegDecoder(const FFmpegDecoder&) = delete;
    FFmpegDecoder& operator=(const FFmpegDecoder&) = delete;

    bool open(const std::string& filepath) override;
    void close() override;
    bool is_open() const override { return format_ctx_ != nullptr; }

    int read_frames(float* out, int max_frames) override;
    bool seek_frame(long frame) override;

private:
    bool open_codec(const std::string& filepath);
    // Decodes the next audio packet into pending_. False at end of stream.
    bool decode_next();

    AVFormatContext* format_ctx_ = nullptr;
    AVCodecContext* codec_ctx_ = nullptr;
    AVPacket* packet_ = nullptr;
    AVFrame* frame_ = nullptr;
    SwrContext* swr_ctx_ = nullptr;
    int stream_index_ = -1;
    bool draining_ = false;

    // Converted samples not yet handed out
    std::vector<float> pending_;
    size_t pending_pos_ = 0;
};

}  // namespace audio
