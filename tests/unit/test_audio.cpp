#include "../framework/SimpleTest.hpp"
#include "audio/PcmChunk.hpp"
#include "audio/PipeWireSink.hpp"

#include <chrono>

using audio::PcmChunk;

namespace {

// Stereo chunk whose sample i holds the value i
PcmChunk counting_chunk(size_t frames, uint64_t generation) {
    PcmChunk chunk;
    float* buf = chunk.prepare(2, frames);
    for (size_t i = 0; i < frames * 2; ++i) buf[i] = static_cast<float>(i);
    chunk.fill(frames, generation);
    return chunk;
}

}  // namespace

TEST_CASE(test_chunk_remainder_survives_partial_write) {
    auto chunk = counting_chunk(8, 1);
    ASSERT_EQ(chunk.remaining(), 8u);

    // Output stops accepting after 3 frames, as it does when paused
    chunk.consume(3);
    ASSERT_TRUE(chunk.pending(1));
    ASSERT_EQ(chunk.remaining(), 5u);
    ASSERT_NEAR(chunk.data()[0], 6.0f, 1e-6f);

    // Resume writes the rest from where it stopped
    chunk.consume(0);
    chunk.consume(5);
    ASSERT_EQ(chunk.remaining(), 0u);
    ASSERT_FALSE(chunk.pending(1));
}

TEST_CASE(test_chunk_new_generation_makes_it_stale) {
    auto chunk = counting_chunk(8, 1);
    chunk.consume(2);
    ASSERT_FALSE(chunk.stale(1));
    ASSERT_TRUE(chunk.stale(2));
    ASSERT_FALSE(chunk.pending(2));

    chunk.drop();
    ASSERT_EQ(chunk.remaining(), 0u);
}

TEST_CASE(test_chunk_bounds) {
    PcmChunk chunk;
    chunk.prepare(2, 4);
    chunk.fill(10, 3);
    ASSERT_EQ(chunk.remaining(), 4u);
    chunk.consume(100);
    ASSERT_EQ(chunk.remaining(), 0u);

    // A short read leaves nothing pending
    chunk.prepare(2, 4);
    chunk.fill(0, 4);
    ASSERT_FALSE(chunk.pending(4));
}

TEST_CASE(test_sink_volume_applies_without_stream) {
    audio::PipeWireSink sink;
    auto before = std::chrono::steady_clock::now();
    sink.set_volume(0.35f);
    sink.set_volume(1.5f);
    sink.set_volume(0.4f);
    auto took = std::chrono::steady_clock::now() - before;

    ASSERT_NEAR(sink.volume(), 0.4f, 1e-6f);
    ASSERT_TRUE(took < std::chrono::milliseconds(100));
    ASSERT_TRUE(sink.is_empty());

    sink.set_volume(-1.0f);
    ASSERT_NEAR(sink.volume(), 0.0f, 1e-6f);
}

int main() {
    return cadence::test::TestRunner::instance().run_all();
}
