/**
 * @file ChunkWriterTest.cpp
 * @brief Unit tests for ChunkWriter
 */

#include "algorithms/ChunkWriter.hpp"

#include "fixtures/TestFixtures.hpp"
#include "mocks/MockEntropySource.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <utility>

class ChunkWriterTest : public ::testing::Test {
protected:
    struct Call {
        uint64_t written;
        uint64_t total;
    };

    CountingEntropySource entropy;
    ChunkWriter writer{entropy};
    std::vector<Call> calls;

    ChunkWriter::ChunkCallback CreateCapturingCallback() {
        return [this](uint64_t written, uint64_t total) { calls.push_back({written, total}); };
    }

    static auto MakeDevice(uint64_t size, uint8_t initial = 0xA5)
        -> std::pair<std::shared_ptr<MemoryDeviceState>, MemoryDevice> {
        auto state = std::make_shared<MemoryDeviceState>();
        state->data.assign(static_cast<size_t>(size), initial);
        return {state, MemoryDevice("/dev/test", state)};
    }
};

// Test: an extent smaller than the chunk is written in one call
TEST_F(ChunkWriterTest, SmallExtent_SingleWriteAndCallback) {
    auto [state, device] = MakeDevice(100);

    auto result = writer.write_pattern(device, 100, PassPattern::zero(),
                                       WipeOptions::DEFAULT_CHUNK_SIZE, CreateCapturingCallback());

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(state->write_calls, 1u);
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].written, 100u);
    EXPECT_EQ(calls[0].total, 100u);
    EXPECT_TRUE(AllBytesEqual(state->data, 0x00));
    EXPECT_EQ(state->sync_calls, 1u);
}

// Test: one callback per chunk, strictly increasing, ending at size
TEST_F(ChunkWriterTest, MultipleChunks_CallbackAfterEachWrite) {
    auto [state, device] = MakeDevice(1'000);

    auto result =
        writer.write_pattern(device, 1'000, PassPattern::one(), 64, CreateCapturingCallback());

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(state->write_calls, 16u);
    ASSERT_EQ(calls.size(), 16u);
    for (size_t i = 1; i < calls.size(); ++i) {
        EXPECT_GT(calls[i].written, calls[i - 1].written);
    }
    EXPECT_EQ(calls.back().written, 1'000u);
    EXPECT_TRUE(AllBytesEqual(state->data, 0xFF));
}

// Test: multi-byte patterns keep their phase across chunk boundaries
TEST_F(ChunkWriterTest, MultiBytePattern_StaysInPhaseAcrossChunks) {
    const std::vector<uint8_t> sequence{0x92, 0x49, 0x24};
    auto [state, device] = MakeDevice(100);

    auto result = writer.write_pattern(device, 100, PassPattern::fixed(sequence), 4, nullptr);

    ASSERT_TRUE(result.has_value());
    for (size_t i = 0; i < state->data.size(); ++i) {
        ASSERT_EQ(state->data[i], sequence[i % 3]) << "offset " << i;
    }
}

// Test: the last partial chunk is truncated, nothing past size is touched
TEST_F(ChunkWriterTest, PartialLastChunk_DoesNotWritePastSize) {
    auto [state, device] = MakeDevice(32);

    auto result = writer.write_pattern(device, 10, PassPattern::fixed({0x55}), 4, nullptr);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(state->write_calls, 3u);
    EXPECT_TRUE(AllBytesEqual(std::span(state->data).first(10), 0x55));
    EXPECT_TRUE(AllBytesEqual(std::span(state->data).subspan(10), 0xA5));
}

// Test: random passes draw fresh entropy for every chunk
TEST_F(ChunkWriterTest, RandomPattern_RefreshesEveryChunk) {
    auto [state, device] = MakeDevice(256, 0x00);

    auto result = writer.write_pattern(device, 256, PassPattern::random(), 64, nullptr);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(entropy.calls, 4);
    EXPECT_FALSE(std::equal(state->data.begin(), state->data.begin() + 64,
                            state->data.begin() + 64));
    EXPECT_EQ(std::count(state->data.begin(), state->data.end(), 0x00), 0);
}

TEST_F(ChunkWriterTest, ZeroSize_NoWritesNoCallbacks) {
    auto [state, device] = MakeDevice(16);

    auto result = writer.write_pattern(device, 0, PassPattern::zero(), 4, CreateCapturingCallback());

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(state->write_calls, 0u);
    EXPECT_EQ(state->sync_calls, 0u);
    EXPECT_TRUE(calls.empty());
}

TEST_F(ChunkWriterTest, ZeroChunkSize_ConfigurationError) {
    auto [state, device] = MakeDevice(16);

    auto result = writer.write_pattern(device, 16, PassPattern::zero(), 0, nullptr);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, WipeErrorKind::CONFIGURATION);
    EXPECT_EQ(state->write_calls, 0u);
}

TEST_F(ChunkWriterTest, OversizedFixedPattern_ConfigurationError) {
    auto [state, device] = MakeDevice(16);

    auto result = writer.write_pattern(device, 16, PassPattern::fixed({1, 2, 3, 4, 5}), 4, nullptr);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, WipeErrorKind::CONFIGURATION);
}

// Test: a write failure stops the pass and reports the offset reached
TEST_F(ChunkWriterTest, WriteFailure_ReportsOffsetAndSkipsSync) {
    auto [state, device] = MakeDevice(1'000);
    state->fail_at_offset = 150;

    auto result =
        writer.write_pattern(device, 1'000, PassPattern::zero(), 64, CreateCapturingCallback());

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, WipeErrorKind::IO);
    ASSERT_TRUE(result.error().offset.has_value());
    EXPECT_EQ(*result.error().offset, 150u);
    EXPECT_EQ(calls.size(), 2u);
    EXPECT_EQ(state->sync_calls, 0u);
    EXPECT_TRUE(AllBytesEqual(std::span(state->data).first(150), 0x00));
    EXPECT_TRUE(AllBytesEqual(std::span(state->data).subspan(150), 0xA5));
}

TEST_F(ChunkWriterTest, SyncFailure_ReturnsIoError) {
    auto [state, device] = MakeDevice(64);
    state->sync_error = WipeError::io("fsync failed", EIO, 64);

    auto result = writer.write_pattern(device, 64, PassPattern::zero(), 16, nullptr);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, WipeErrorKind::IO);
}

// Test: entropy failure aborts before the chunk is written
TEST(ChunkWriterEntropyTest, EntropyFailure_ReturnsEntropyError) {
    testing::StrictMock<MockEntropySource> entropy;
    ChunkWriter writer(entropy);

    auto state = std::make_shared<MemoryDeviceState>();
    state->data.assign(128, 0xA5);
    MemoryDevice device("/dev/test", state);

    EXPECT_CALL(entropy, fill(testing::_))
        .WillOnce(testing::Return(WipeResult<void>{}))
        .WillOnce(testing::Return(
            WipeResult<void>{std::unexpect, WipeError::entropy("read failed", EIO)}));

    auto result = writer.write_pattern(device, 128, PassPattern::random(), 64, nullptr);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, WipeErrorKind::ENTROPY_SOURCE);
    ASSERT_TRUE(result.error().offset.has_value());
    EXPECT_EQ(*result.error().offset, 64u);
    EXPECT_EQ(state->write_calls, 1u);
}
