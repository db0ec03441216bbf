#include "sigflow/bars/Resampler.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace sigflow;
using namespace sigflow::bars;

namespace {
constexpr int64_t kMin = 60'000;
constexpr int64_t kT0  = 1'700'000'100'000;   // multiple of 5 minutes

std::vector<Bar> minuteBars(int n, int64_t start = kT0) {
    std::vector<Bar> out;
    for (int i = 0; i < n; ++i) {
        const double c = 1.0 + i;
        out.push_back(makeBar(start + i * kMin, c, c, c, c, 1.0));
    }
    return out;
}
}

TEST(ResamplerTest, BaseIntervalIsIdentity) {
    auto bars = minuteBars(7);
    auto out = resample(bars, kMin, kMin);
    ASSERT_EQ(out.size(), bars.size());
    for (size_t i = 0; i < bars.size(); ++i) {
        EXPECT_EQ(out[i].timestamp, bars[i].timestamp);
        EXPECT_DOUBLE_EQ(out[i].close, bars[i].close);
    }
}

TEST(ResamplerTest, FiveOneMinuteBarsFoldIntoOne) {
    auto out = resample(minuteBars(5), 5 * kMin, kMin);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].timestamp, kT0);
    EXPECT_DOUBLE_EQ(out[0].open, 1.0);
    EXPECT_DOUBLE_EQ(out[0].high, 5.0);
    EXPECT_DOUBLE_EQ(out[0].low, 1.0);
    EXPECT_DOUBLE_EQ(out[0].close, 5.0);
    EXPECT_DOUBLE_EQ(out[0].volume, 5.0);
}

TEST(ResamplerTest, BucketsAlignToIntervalGrid) {
    // Starts two minutes into a 5m bucket: 3 + 5 + 2 bars.
    auto out = resample(minuteBars(10, kT0 + 2 * kMin), 5 * kMin, kMin);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].timestamp, kT0);
    EXPECT_EQ(out[1].timestamp, kT0 + 5 * kMin);
    EXPECT_EQ(out[2].timestamp, kT0 + 10 * kMin);
    EXPECT_DOUBLE_EQ(out[0].volume, 3.0);
    EXPECT_DOUBLE_EQ(out[1].open, 4.0);
    EXPECT_DOUBLE_EQ(out[1].close, 8.0);
    EXPECT_DOUBLE_EQ(out[2].volume, 2.0);
}

TEST(ResamplerTest, MissingMinutesLeaveNoEmptyBuckets) {
    std::vector<Bar> bars{
        makeBar(kT0, 1, 2, 0.5, 1.5),
        makeBar(kT0 + 20 * kMin, 2, 3, 1.5, 2.5),
    };
    auto out = resample(bars, 5 * kMin, kMin);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[1].timestamp, kT0 + 20 * kMin);
}

TEST(ResamplerTest, OutputStaysWellFormed) {
    std::vector<Bar> bars{
        makeBar(kT0,            1.0, 1.3, 0.9, 1.2),
        makeBar(kT0 + kMin,     1.2, 1.25, 0.8, 0.85),
        makeBar(kT0 + 2 * kMin, 0.85, 1.4, 0.85, 1.35),
    };
    auto out = resample(bars, 15 * kMin, kMin);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_TRUE(out[0].wellFormed());
    EXPECT_DOUBLE_EQ(out[0].high, 1.4);
    EXPECT_DOUBLE_EQ(out[0].low, 0.8);
}

TEST(ResamplerTest, EmptyInput) {
    EXPECT_TRUE(resample({}, 5 * kMin, kMin).empty());
}

TEST(ResamplerTest, RejectsNonMultipleInterval) {
    auto bars = minuteBars(3);
    EXPECT_THROW(resample(bars, 90'000, kMin), std::invalid_argument);
    EXPECT_THROW(resample(bars, 0, kMin), std::invalid_argument);
    EXPECT_THROW(resample(bars, kMin, 0), std::invalid_argument);
}
