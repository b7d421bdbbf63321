#include "audio/PipeWireContext.hpp"
#include "util/Logger.hpp"

#include <mutex>
#include <pipewire/pipewire.h>

namespace audio {

PipeWireContext::~PipeWireContext() {
    if (loop_) {
        pw_thread_loop_stop(loop_);
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
    }
    // pw_deinit is left to process exit; other contexts may still be alive
}

bool PipeWireContext::init() {
    if (loop_) return true;

    static std::once_flag pw_once;
    std::call_once(pw_once, [] { pw_init(nullptr, nullptr); });

    loop_ = pw_thread_loop_new("cadence-audio", nullptr);
    if (!loop_) {
        cadence::util::Logger::error("PipeWireContext: Failed to create thread loop");
        return false;
    }
    if (pw_thread_loop_start(loop_) < 0) {
        cadence::util::Logger::error("PipeWireContext: Failed to start thread loop");
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
        return false;
    }
    return true;
}

}  // namespace audio
