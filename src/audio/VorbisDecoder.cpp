#include "audio/VorbisDecoder.hpp"
#include "util/Logger.hpp"

namespace audio {

using cadence::util::Logger;

VorbisDecoder::~VorbisDecoder() {
    close();
}

bool VorbisDecoder::open(const std::string& filepath) {
    close();

    // ov_fopen owns the FILE and releases it in ov_clear
    if (ov_fopen(filepath.c_str(), &vf_) < 0) {
        Logger::error("VorbisDecoder: Not a Vorbis stream: " + filepath);
        return false;
    }

    vorbis_info* info = ov_info(&vf_, -1);
    if (!info) {
        Logger::error("VorbisDecoder: Missing stream info in " + filepath);
        ov_clear(&vf_);
        return false;
    }

    sample_rate_ = static_cast<int>(info->rate);
    channels_ = info->channels;
    ogg_int64_t total = ov_pcm_total(&vf_, -1);
    total_frames_ = total < 0 ? 0 : static_cast<long>(total);
    position_frames_ = 0;
    opened_ = true;

    Logger::debug("VorbisDecoder: Opened " + filepath + " (" + std::to_string(sample_rate_) + "Hz, " +
                  std::to_string(channels_) + "ch)");
    return true;
}

void VorbisDecoder::close() {
    if (opened_) {
        ov_clear(&vf_);
        opened_ = false;
    }
    reset_format();
}

int VorbisDecoder::read_frames(float* out, int max_frames) {
    if (!opened_ || !out || max_frames <= 0) return 0;

    int filled = 0;
    while (filled < max_frames) {
        float** planes = nullptr;
        int section = 0;
        long got = ov_read_float(&vf_, &planes, max_frames - filled, &section);
        if (got == OV_HOLE) continue;  // recoverable gap in the stream
        if (got <= 0) break;

        for (long i = 0; i < got; ++i) {
            float* frame = out + static_cast<size_t>(filled + i) * channels_;
            for (int ch = 0; ch < channels_; ++ch) {
                frame[ch] = planes[ch][i];
            }
        }
        filled += static_cast<int>(got);
    }

    position_frames_ += filled;
    return filled;
}

bool VorbisDecoder::seek_frame(long frame) {
    if (!opened_) return false;

    int rc = ov_pcm_seek(&vf_, static_cast<ogg_int64_t>(frame));
    if (rc != 0) {
        Logger::warn("VorbisDecoder: Seek failed (code=" + std::to_string(rc) + ")");
        return false;
    }
    position_frames_ = frame;
    return true;
}

}  // namespace audio
