#pragma once

struct pw_thread_loop;

namespace audio {

/// Owns the PipeWire thread loop every output stream runs on.
class PipeWireContext {
public:
    PipeWireContext() = default;
    ~PipeWireContext();

    PipeWireContext(const PipeWireContext&) = delete;
    PipeWireContext& operator=(const PipeWireContext&) = delete;

    /// Idempotent. False when the loop could not be created or started.
    [[nodiscard]] bool init();
    struct pw_thread_loop* get_loop() const { return loop_; }

private:
    struct pw_thread_loop* loop_ = nullptr;
};

}  // namespace audio
