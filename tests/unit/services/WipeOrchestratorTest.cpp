/**
 * @file WipeOrchestratorTest.cpp
 * @brief Unit tests for WipeOrchestrator
 */

#include "services/WipeOrchestrator.hpp"

#include "fixtures/TestFixtures.hpp"
#include "mocks/MockEntropySource.hpp"
#include "mocks/MockProgressSink.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

class WipeOrchestratorTest : public ::testing::Test {
protected:
    static constexpr uint64_t MIB = 1'024 * 1'024;

    std::shared_ptr<MemoryDeviceOpener> opener;
    std::shared_ptr<CountingEntropySource> entropy;
    std::unique_ptr<WipeOrchestrator> orchestrator;
    CapturingProgressSink sink;
    WipeOptions options;

    void CreateOrchestrator(uint64_t device_size) {
        opener = std::make_shared<MemoryDeviceOpener>(device_size);
        entropy = std::make_shared<CountingEntropySource>();
        orchestrator = std::make_unique<WipeOrchestrator>(opener, entropy);
    }

    void SetUp() override { CreateOrchestrator(64 * 1'024); }
};

// Test: 10 MiB, one zero pass, one progress event per chunk
TEST_F(WipeOrchestratorTest, SingleZeroPass_ProgressPerChunkAndDeviceZeroed) {
    CreateOrchestrator(10 * MIB);

    auto result = orchestrator->wipe("/dev/test", SinglePass{SinglePassFill::ZERO}, 1, sink,
                                     options);

    ASSERT_TRUE(result.has_value());
    const size_t expected_chunks = (10 * MIB + options.chunk_size - 1) / options.chunk_size;
    ASSERT_EQ(sink.events.size(), expected_chunks);
    for (size_t i = 1; i < sink.events.size(); ++i) {
        EXPECT_GT(sink.events[i].bytes_written, sink.events[i - 1].bytes_written);
    }
    EXPECT_EQ(sink.events.back().bytes_written, 10 * MIB);
    EXPECT_DOUBLE_EQ(sink.events.back().percentage, 100.0);
    EXPECT_EQ(sink.events.back().pass_index, 1);
    EXPECT_EQ(sink.events.back().total_passes, 1);
    EXPECT_TRUE(AllBytesEqual(opener->state->data, 0x00));
    EXPECT_EQ(orchestrator->get_state(), WipeState::COMPLETE);
}

TEST_F(WipeOrchestratorTest, Progress_CarriesPassLabel) {
    options.chunk_size = 16 * 1'024;

    auto result = orchestrator->wipe("/dev/test", Dod5220{}, std::nullopt, sink, options);

    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(sink.events.size(), 12u);
    EXPECT_EQ(sink.events.front().label, "Pass 1/3: 0x00");
    EXPECT_EQ(sink.events[4].label, "Pass 2/3: 0xFF");
    EXPECT_EQ(sink.events.back().label, "Pass 3/3: random");
    EXPECT_EQ(sink.events.back().pass_size_bytes, 64u * 1'024u);
}

// Test: passes run in order and each pass is synced before the next
TEST_F(WipeOrchestratorTest, Dod_ThreePassesInOrderEachSynced) {
    std::vector<int> pass_order;
    CallbackProgressSink callback_sink([&pass_order](const WipeProgress& progress) {
        if (pass_order.empty() || pass_order.back() != progress.pass_index) {
            pass_order.push_back(progress.pass_index);
        }
    });

    auto result = orchestrator->wipe("/dev/test", Dod5220{}, std::nullopt, callback_sink, options);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(pass_order, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(opener->state->sync_calls, 3u);
    EXPECT_EQ(opener->write_opens, 1);
}

TEST_F(WipeOrchestratorTest, Dod_OverrideIgnored) {
    auto result = orchestrator->wipe("/dev/test", Dod5220{}, 10, sink, options);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(sink.events.back().total_passes, 3);
    EXPECT_EQ(orchestrator->get_current_pass(), 3);
}

TEST_F(WipeOrchestratorTest, Gutmann_RunsThirtyFivePasses) {
    CreateOrchestrator(4'096);

    auto result = orchestrator->wipe("/dev/test", Gutmann{}, std::nullopt, sink, options);

    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(sink.events.size(), 35u);
    EXPECT_EQ(sink.events.back().pass_index, 35);
    EXPECT_EQ(opener->state->sync_calls, 35u);
}

TEST_F(WipeOrchestratorTest, SinglePassRandom_OverrideRepeatsPasses) {
    auto result = orchestrator->wipe("/dev/test", SinglePass{SinglePassFill::RANDOM}, 2, sink,
                                     options);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(sink.events.size(), 2u);
    EXPECT_EQ(opener->state->sync_calls, 2u);
    EXPECT_EQ(entropy->calls, 2);
}

// Test: an empty device completes without progress events or syncs
TEST_F(WipeOrchestratorTest, ZeroSizeDevice_CompletesWithoutWrites) {
    CreateOrchestrator(0);
    testing::StrictMock<MockProgressSink> strict_sink;

    auto result = orchestrator->wipe("/dev/test", Dod5220{}, std::nullopt, strict_sink, options);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(opener->state->write_calls, 0u);
    EXPECT_EQ(opener->state->sync_calls, 0u);
}

// Test: failure in pass 2 stops the wipe with the failing offset
TEST_F(WipeOrchestratorTest, WriteFailureInPassTwo_StopsWithOffset) {
    options.chunk_size = 4'096;
    opener->state->fail_after_syncs = 1;
    opener->state->fail_at_offset = 10'000;

    auto result = orchestrator->wipe("/dev/test", Dod5220{}, std::nullopt, sink, options);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, WipeErrorKind::IO);
    ASSERT_TRUE(result.error().offset.has_value());
    EXPECT_EQ(*result.error().offset, 10'000u);

    for (const auto& event : sink.events) {
        EXPECT_LE(event.pass_index, 2);
    }
    EXPECT_EQ(opener->state->sync_calls, 1u);
    EXPECT_EQ(orchestrator->get_state(), WipeState::FAILED);
    EXPECT_EQ(orchestrator->get_current_pass(), 2);

    // Pass 2 reached the failing offset, the rest still holds pass 1 zeros
    const auto& data = opener->state->data;
    EXPECT_TRUE(AllBytesEqual(std::span(data).first(10'000), 0xFF));
    EXPECT_TRUE(AllBytesEqual(std::span(data).subspan(10'000), 0x00));
}

// Test: invalid pass count is rejected before the device is opened
TEST_F(WipeOrchestratorTest, ZeroPassOverride_ConfigurationErrorBeforeOpen) {
    auto result = orchestrator->wipe("/dev/test", SinglePass{SinglePassFill::ZERO}, 0, sink,
                                     options);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, WipeErrorKind::CONFIGURATION);
    EXPECT_EQ(opener->write_opens, 0);
    EXPECT_EQ(orchestrator->get_state(), WipeState::FAILED);
}

TEST_F(WipeOrchestratorTest, ZeroChunkSize_ConfigurationErrorBeforeOpen) {
    options.chunk_size = 0;

    auto result = orchestrator->wipe("/dev/test", Gutmann{}, std::nullopt, sink, options);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, WipeErrorKind::CONFIGURATION);
    EXPECT_EQ(opener->write_opens, 0);
}

TEST_F(WipeOrchestratorTest, OpenFailure_DeviceOpenError) {
    opener->open_error = WipeError::device_open("Permission denied", EACCES);

    auto result = orchestrator->wipe("/dev/test", Dod5220{}, std::nullopt, sink, options);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, WipeErrorKind::DEVICE_OPEN);
    EXPECT_EQ(result.error().code, EACCES);
    EXPECT_TRUE(sink.events.empty());
}

TEST_F(WipeOrchestratorTest, EntropyFailure_StopsRandomPass) {
    auto failing = std::make_shared<testing::NiceMock<MockEntropySource>>();
    ON_CALL(*failing, fill(testing::_))
        .WillByDefault(testing::Return(
            WipeResult<void>{std::unexpect, WipeError::entropy("source closed", EIO)}));
    WipeOrchestrator with_failing_entropy(opener, failing);

    auto result = with_failing_entropy.wipe("/dev/test", Dod5220{}, std::nullopt, sink, options);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, WipeErrorKind::ENTROPY_SOURCE);
    EXPECT_EQ(with_failing_entropy.get_current_pass(), 3);
    EXPECT_EQ(opener->state->sync_calls, 2u);
}

TEST_F(WipeOrchestratorTest, MissingCollaborators_ConfigurationError) {
    WipeOrchestrator empty(nullptr, nullptr);

    auto result = empty.wipe("/dev/test", Dod5220{}, std::nullopt, sink, options);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, WipeErrorKind::CONFIGURATION);
}

// Test: a wiped device verifies clean
TEST_F(WipeOrchestratorTest, VerifyAfterZeroWipe_AppearsWiped) {
    opener->state->data[510] = 0x55;
    opener->state->data[511] = 0xAA;

    auto before = orchestrator->verify("/dev/test", options);
    ASSERT_TRUE(before.has_value());
    EXPECT_FALSE(*before);

    ASSERT_TRUE(orchestrator
                    ->wipe("/dev/test", SinglePass{SinglePassFill::ZERO}, std::nullopt, sink,
                           options)
                    .has_value());

    auto after = orchestrator->verify("/dev/test", options);
    ASSERT_TRUE(after.has_value());
    EXPECT_TRUE(*after);
}

TEST_F(WipeOrchestratorTest, Scan_ReportsFindings) {
    const char gpt[] = "EFI PART";
    std::copy(gpt, gpt + 8, opener->state->data.begin() + 512);

    auto report = orchestrator->scan("/dev/test", options);

    ASSERT_TRUE(report.has_value());
    EXPECT_FALSE(report->appears_wiped);
    ASSERT_EQ(report->findings.size(), 1u);
    EXPECT_EQ(report->findings[0].name, "GPT");
    EXPECT_EQ(opener->write_opens, 0);
}

TEST_F(WipeOrchestratorTest, Verify_OpenFailurePropagates) {
    opener->open_error = WipeError::device_open("No such device", ENXIO);

    auto result = orchestrator->verify("/dev/test", options);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, WipeErrorKind::DEVICE_OPEN);
}

// Test: quick wipe zeroes only the head and tail regions
TEST_F(WipeOrchestratorTest, QuickWipe_ZeroesHeadAndTail) {
    CreateOrchestrator(4 * MIB);

    auto result = orchestrator->quick_wipe("/dev/test", options);

    ASSERT_TRUE(result.has_value());
    const auto& data = opener->state->data;
    EXPECT_TRUE(AllBytesEqual(std::span(data).first(MIB), 0x00));
    EXPECT_TRUE(AllBytesEqual(std::span(data).subspan(MIB, 2 * MIB), 0xA5));
    EXPECT_TRUE(AllBytesEqual(std::span(data).last(MIB), 0x00));
    EXPECT_EQ(opener->state->sync_calls, 1u);
}

TEST_F(WipeOrchestratorTest, QuickWipe_SmallDeviceZeroedOnce) {
    auto result = orchestrator->quick_wipe("/dev/test", options);

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(AllBytesEqual(opener->state->data, 0x00));
    EXPECT_EQ(opener->state->write_calls, 1u);
}

TEST_F(WipeOrchestratorTest, QuickWipe_ZeroRegion_ConfigurationError) {
    options.quick_wipe_region_bytes = 0;

    auto result = orchestrator->quick_wipe("/dev/test", options);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, WipeErrorKind::CONFIGURATION);
    EXPECT_EQ(opener->write_opens, 0);
}
