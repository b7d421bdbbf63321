#include "audio/FFmpegDecoder.hpp"
#include "util/Logger.hpp"

#include <algorithm>
#include <cstring>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/opt.h>
#include <libswresample/swresample.h>
}

namespace audio {

using cadence::util::Logger;

namespace {

std::string av_error_text(int err) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {};
    av_strerror(err, buf, sizeof(buf));
    return buf;
}

}  // namespace

FFmpegDecoder::~FFmpegDecoder() {
    close();
}

bool FFmpegDecoder::open(const std::string& filepath) {
    close();

    int ret = avformat_open_input(&format_ctx_, filepath.c_str(), nullptr, nullptr);
    if (ret < 0) {
        Logger::error("FFmpegDecoder: Failed to open " + filepath + " (" + av_error_text(ret) + ")");
        format_ctx_ = nullptr;
        return false;
    }

    if (!open_codec(filepath)) {
        close();
        return false;
    }

    Logger::debug("FFmpegDecoder: Opened " + filepath + " (" + std::to_string(sample_rate_) + "Hz, " +
                  std::to_string(channels_) + "ch, " + std::to_string(total_frames_) + " frames)");
    return true;
}

bool FFmpegDecoder::open_codec(const std::string& filepath) {
    if (avformat_find_stream_info(format_ctx_, nullptr) < 0) {
        Logger::error("FFmpegDecoder: No stream info in " + filepath);
        return false;
    }

    const AVCodec* codec = nullptr;
    stream_index_ = av_find_best_stream(format_ctx_, AVMEDIA_TYPE_AUDIO, -1, -1, &codec, 0);
    if (stream_index_ < 0 || !codec) {
        Logger::error("FFmpegDecoder: No decodable audio stream in " + filepath);
        return false;
    }

    AVStream* stream = format_ctx_->streams[stream_index_];
    codec_ctx_ = avcodec_alloc_context3(codec);
    if (!codec_ctx_ ||
        avcodec_parameters_to_context(codec_ctx_, stream->codecpar) < 0 ||
        avcodec_open2(codec_ctx_, codec, nullptr) < 0) {
        Logger::error("FFmpegDecoder: Failed to open codec for " + filepath);
        return false;
    }

    sample_rate_ = codec_ctx_->sample_rate;
    channels_ = codec_ctx_->ch_layout.nb_channels;

    double seconds = 0.0;
    if (stream->duration != AV_NOPTS_VALUE) {
        seconds = stream->duration * av_q2d(stream->time_base);
    } else if (format_ctx_->duration != AV_NOPTS_VALUE) {
        seconds = format_ctx_->duration / static_cast<double>(AV_TIME_BASE);
    }
    total_frames_ = static_cast<long>(seconds * sample_rate_);
    position_frames_ = 0;

    AVChannelLayout out_layout;
    av_channel_layout_default(&out_layout, channels_);
    int ret = swr_alloc_set_opts2(&swr_ctx_,
                                  &out_layout, AV_SAMPLE_FMT_FLT, sample_rate_,
                                  &codec_ctx_->ch_layout, codec_ctx_->sample_fmt, sample_rate_,
                                  0, nullptr);
    av_channel_layout_uninit(&out_layout);
    if (ret < 0 || swr_init(swr_ctx_) < 0) {
        Logger::error("FFmpegDecoder: Failed to set up sample conversion");
        return false;
    }

    packet_ = av_packet_alloc();
    frame_ = av_frame_alloc();
    if (!packet_ || !frame_) {
        Logger::error("FFmpegDecoder: Out of memory");
        return false;
    }
    return true;
}

void FFmpegDecoder::close() {
    pending_.clear();
    pending_pos_ = 0;
    draining_ = false;

    if (frame_) av_frame_free(&frame_);
    if (packet_) av_packet_free(&packet_);
    if (swr_ctx_) swr_free(&swr_ctx_);
    if (codec_ctx_) avcodec_free_context(&codec_ctx_);
    if (format_ctx_) avformat_close_input(&format_ctx_);

    stream_index_ = -1;
    reset_format();
}

bool FFmpegDecoder::decode_next() {
    while (true) {
        int ret = avcodec_receive_frame(codec_ctx_, frame_);
        if (ret == 0) {
            pending_.resize(static_cast<size_t>(frame_->nb_samples) * channels_);
            auto* dst = reinterpret_cast<uint8_t*>(pending_.data());
            int converted = swr_convert(swr_ctx_, &dst, frame_->nb_samples,
                                        const_cast<const uint8_t**>(frame_->extended_data),
                                        frame_->nb_samples);
            av_frame_unref(frame_);
            if (converted <= 0) continue;
            pending_.resize(static_cast<size_t>(converted) * channels_);
            pending_pos_ = 0;
            return true;
        }
        if (ret == AVERROR_EOF) {
            return false;
        }
        if (ret != AVERROR(EAGAIN)) {
            Logger::warn("FFmpegDecoder: Decode error (" + av_error_text(ret) + ")");
            return false;
        }
        if (draining_) {
            return false;
        }

        // Decoder wants input
        ret = av_read_frame(format_ctx_, packet_);
        if (ret < 0) {
            draining_ = true;
            avcodec_send_packet(codec_ctx_, nullptr);
            continue;
        }
        if (packet_->stream_index == stream_index_) {
            avcodec_send_packet(codec_ctx_, packet_);
        }
        av_packet_unref(packet_);
    }
}

int FFmpegDecoder::read_frames(float* out, int max_frames) {
    if (!format_ctx_ || !codec_ctx_ || !out || max_frames <= 0) return 0;

    int written = 0;
    while (written < max_frames) {
        if (pending_pos_ >= pending_.size() && !decode_next()) {
            break;
        }

        size_t available = (pending_.size() - pending_pos_) / channels_;
        size_t take = std::min<size_t>(available, static_cast<size_t>(max_frames - written));
        std::memcpy(out + static_cast<size_t>(written) * channels_,
                    pending_.data() + pending_pos_,
                    take * channels_ * sizeof(float));
        pending_pos_ += take * channels_;
        written += static_cast<int>(take);
    }

    position_frames_ += written;
    return written;
}

bool FFmpegDecoder::seek_frame(long frame) {
    if (!format_ctx_ || stream_index_ < 0) return false;

    AVStream* stream = format_ctx_->streams[stream_index_];
    int64_t ts = av_rescale_q(frame, AVRational{1, sample_rate_}, stream->time_base);
    if (av_seek_frame(format_ctx_, stream_index_, ts, AVSEEK_FLAG_BACKWARD) < 0) {
        Logger::warn("FFmpegDecoder: Seek to frame " + std::to_string(frame) + " failed");
        return false;
    }

    avcodec_flush_buffers(codec_ctx_);
    pending_.clear();
    pending_pos_ = 0;
    draining_ = false;
    position_frames_ = frame;
    return true;
}

}  // namespace audio
