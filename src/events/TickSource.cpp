#include "events/TickSource.hpp"
#include "util/Logger.hpp"

namespace cadence::events {

TickSource::TickSource(std::chrono::milliseconds interval)
    : interval_(interval) {
}

TickSource::~TickSource() {
    stop();
}

void TickSource::start() {
    if (thread_.joinable()) {
        return;
    }
    thread_ = std::jthread([this](std::stop_token stop) { run(stop); });
    util::Logger::debug("TickSource: Started");
}

void TickSource::stop() {
    if (!thread_.joinable()) {
        return;
    }
    thread_.request_stop();
    wake_.notify_all();
    thread_.join();
    thread_ = std::jthread();

    std::lock_guard lock(mutex_);
    queue_.clear();
    util::Logger::debug("TickSource: Stopped");
}

bool TickSource::try_receive(Tick& tick) {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
        return false;
    }
    tick = queue_.front();
    queue_.pop_front();
    return true;
}

size_t TickSource::pending() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

void TickSource::run(std::stop_token stop) {
    std::unique_lock lock(mutex_);
    while (!stop.stop_requested()) {
        // Returns early only when stop is requested
        if (wake_.wait_for(lock, stop, interval_, [&stop] { return stop.stop_requested(); })) {
            break;
        }
        queue_.push_back(Tick{++sequence_});
    }
}

}  // namespace cadence::events
