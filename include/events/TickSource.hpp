#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <thread>

namespace cadence::events {

struct Tick {
    uint64_t sequence = 0;
};

/// Background timer that posts a Tick every interval into a queue the main
/// loop drains without blocking. It only notifies; it owns no player state.
class TickSource {
public:
    explicit TickSource(std::chrono::milliseconds interval = std::chrono::milliseconds(100));
    ~TickSource();

    TickSource(const TickSource&) = delete;
    TickSource& operator=(const TickSource&) = delete;

    /// No-op if already running.
    void start();
    /// Signals the thread, joins it (bounded by one interval) and drops
    /// undelivered ticks. No-op if not running.
    void stop();
    bool running() const { return thread_.joinable(); }

    /// Pops one pending tick, false if none.
    bool try_receive(Tick& tick);
    size_t pending() const;

    std::chrono::milliseconds interval() const { return interval_; }

private:
    void run(std::stop_token stop);

    const std::chrono::milliseconds interval_;
    std::jthread thread_;

    mutable std::mutex mutex_;
    std::condition_variable_any wake_;
    std::deque<Tick> queue_;
    uint64_t sequence_ = 0;
};

}  // namespace cadence::events
