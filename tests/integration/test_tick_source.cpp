#include "../framework/SimpleTest.hpp"
#include "events/TickSource.hpp"

#include <chrono>
#include <thread>

using namespace cadence::events;
using namespace std::chrono_literals;

namespace {

// Polls until at least n ticks are queued or the deadline passes
bool wait_for_ticks(const TickSource& source, size_t n, std::chrono::milliseconds deadline) {
    auto until = std::chrono::steady_clock::now() + deadline;
    while (std::chrono::steady_clock::now() < until) {
        if (source.pending() >= n) return true;
        std::this_thread::sleep_for(5ms);
    }
    return source.pending() >= n;
}

}  // namespace

TEST_CASE(test_not_running_by_default) {
    TickSource source(10ms);
    Tick tick;
    ASSERT_FALSE(source.running());
    ASSERT_FALSE(source.try_receive(tick));
    ASSERT_EQ(source.interval().count(), 10);
}

TEST_CASE(test_ticks_arrive_in_order) {
    TickSource source(10ms);
    source.start();
    ASSERT_TRUE(source.running());
    ASSERT_TRUE(wait_for_ticks(source, 3, 2000ms));

    Tick a, b, c;
    ASSERT_TRUE(source.try_receive(a));
    ASSERT_TRUE(source.try_receive(b));
    ASSERT_TRUE(source.try_receive(c));
    ASSERT_TRUE(a.sequence < b.sequence);
    ASSERT_TRUE(b.sequence < c.sequence);
    source.stop();
}

TEST_CASE(test_stop_drops_pending_and_joins) {
    TickSource source(5ms);
    source.start();
    ASSERT_TRUE(wait_for_ticks(source, 2, 2000ms));
    source.stop();
    ASSERT_FALSE(source.running());
    ASSERT_EQ(source.pending(), 0u);

    // Nothing more arrives once stopped
    std::this_thread::sleep_for(30ms);
    ASSERT_EQ(source.pending(), 0u);
}

TEST_CASE(test_start_stop_idempotent) {
    TickSource source(10ms);
    source.stop();
    source.start();
    source.start();
    ASSERT_TRUE(source.running());
    source.stop();
    source.stop();
    ASSERT_FALSE(source.running());

    // Restartable
    source.start();
    ASSERT_TRUE(wait_for_ticks(source, 1, 2000ms));
}

TEST_CASE(test_stop_is_prompt_with_long_interval) {
    TickSource source(10s);
    source.start();
    auto before = std::chrono::steady_clock::now();
    source.stop();
    auto took = std::chrono::steady_clock::now() - before;
    ASSERT_TRUE(took < 2s);
}

int main() {
    return cadence::test::TestRunner::instance().run_all();
}
