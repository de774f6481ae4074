/**
 * @file GutmannAlgorithmTest.cpp
 * @brief Unit tests for GutmannAlgorithm
 */

#include "algorithms/GutmannAlgorithm.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

class GutmannAlgorithmTest : public ::testing::Test {
protected:
    GutmannAlgorithm algorithm;
};

// Test: algorithm metadata
TEST_F(GutmannAlgorithmTest, GetName_ReturnsGutmann) {
    EXPECT_EQ(algorithm.get_name(), "Gutmann");
}

TEST_F(GutmannAlgorithmTest, GetDescription_ReturnsNonEmpty) {
    EXPECT_NE(algorithm.get_description().find("Gutmann"), std::string::npos);
}

TEST_F(GutmannAlgorithmTest, GetPassCount_ReturnsThirtyFive) {
    EXPECT_EQ(algorithm.get_pass_count(), 35);
    EXPECT_TRUE(algorithm.has_fixed_pass_count());
}

TEST_F(GutmannAlgorithmTest, IsSsdCompatible_ReturnsFalse) {
    // Designed for older magnetic encodings
    EXPECT_FALSE(algorithm.is_ssd_compatible());
}

// Test: first and last four passes are random
TEST_F(GutmannAlgorithmTest, Schedule_RandomBookends) {
    auto passes = algorithm.schedule(std::nullopt, 1);
    ASSERT_TRUE(passes.has_value());
    ASSERT_EQ(passes->size(), 35u);

    for (int i : {0, 1, 2, 3, 31, 32, 33, 34}) {
        EXPECT_TRUE((*passes)[i].pattern.is_random()) << "pass " << i + 1;
    }
    for (int i = 4; i < 31; ++i) {
        EXPECT_EQ((*passes)[i].pattern.kind, PatternKind::FIXED_BYTES) << "pass " << i + 1;
    }
}

// Test: the deterministic middle of the table, passes 5-31
TEST_F(GutmannAlgorithmTest, Schedule_MiddlePassesMatchTable) {
    const std::vector<std::vector<uint8_t>> expected = {
        {0x55}, {0xAA}, {0x92, 0x49, 0x24}, {0x49, 0x24, 0x92}, {0x24, 0x92, 0x49},
        {0x00}, {0x11}, {0x22}, {0x33}, {0x44}, {0x55}, {0x66}, {0x77}, {0x88},
        {0x99}, {0xAA}, {0xBB}, {0xCC}, {0xDD}, {0xEE}, {0xFF},
        {0x92, 0x49, 0x24}, {0x49, 0x24, 0x92}, {0x24, 0x92, 0x49},
        {0x6D, 0xB6, 0xDB}, {0xB6, 0xDB, 0x6D}, {0xDB, 0x6D, 0xB6},
    };

    auto passes = algorithm.schedule(std::nullopt, 1);
    ASSERT_TRUE(passes.has_value());

    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ((*passes)[i + 4].pattern.bytes, expected[i]) << "pass " << i + 5;
    }
}

TEST_F(GutmannAlgorithmTest, Schedule_IgnoresOverride) {
    auto passes = algorithm.schedule(3, 1);
    ASSERT_TRUE(passes.has_value());
    EXPECT_EQ(passes->size(), 35u);
    EXPECT_EQ(passes->back().index, 35);
    EXPECT_EQ(passes->back().total_passes, 35);
}

TEST_F(GutmannAlgorithmTest, Schedule_LabelShowsMultiBytePattern) {
    auto passes = algorithm.schedule(std::nullopt, 1);
    ASSERT_TRUE(passes.has_value());
    EXPECT_EQ((*passes)[6].label(), "Pass 7/35: 0x92 0x49 0x24");
}
