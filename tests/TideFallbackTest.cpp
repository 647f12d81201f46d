#include <gtest/gtest.h>

#include <math.h>
#include <algorithm>

#include "TideFallback.h"
#include "TestSupport.h"

TEST(TideFallback, ProducesWellFormedFallbackSeries)
{
    const TideSeries s = TideFallbackGenerate(TEST_NOW);

    EXPECT_EQ(s.source, SeriesSource::Fallback);
    ASSERT_TRUE(TideSeriesIsWellFormed(s));
    EXPECT_EQ(s.samples[0].offsetMinutes, -720);
    EXPECT_EQ(s.samples[TideSeries::NOW_INDEX].offsetMinutes, 0);
    EXPECT_EQ(s.samples[TideSeries::SAMPLE_COUNT - 1].offsetMinutes, 720);
}

TEST(TideFallback, StaysWithinAmplitudeOfMean)
{
    const TideSeries s = TideFallbackGenerate(TEST_NOW);

    float mn = s.samples[0].heightFt;
    float mx = s.samples[0].heightFt;
    for (const TideSample& sample : s.samples) {
        EXPECT_GE(sample.heightFt, 5.0f - 2.8f - 1e-4f);
        EXPECT_LE(sample.heightFt, 5.0f + 2.8f + 1e-4f);
        mn = std::min(mn, sample.heightFt);
        mx = std::max(mx, sample.heightFt);
    }
    EXPECT_LE(mx - mn, 5.6f + 1e-4f);
    EXPECT_LE(mx - mn, 6.0f);
    // 24 h spans nearly two cycles, so both extremes are reached
    EXPECT_GT(mx - mn, 5.0f);
}

TEST(TideFallback, IsDeterministicForSameInstant)
{
    const TideSeries a = TideFallbackGenerate(TEST_NOW);
    const TideSeries b = TideFallbackGenerate(TEST_NOW);

    for (size_t i = 0; i < TideSeries::SAMPLE_COUNT; ++i) {
        EXPECT_EQ(a.samples[i].heightFt, b.samples[i].heightFt);
    }
}

TEST(TideFallback, AdvancesWithTheClock)
{
    const TideSeries a = TideFallbackGenerate(TEST_NOW);
    const TideSeries b = TideFallbackGenerate(TEST_NOW + 10 * 60);

    // Ten minutes later the curve has slid one sample to the left
    for (size_t i = 0; i + 1 < TideSeries::SAMPLE_COUNT; ++i) {
        EXPECT_NEAR(b.samples[i].heightFt, a.samples[i + 1].heightFt, 1e-3);
    }
    EXPECT_NE(a.samples[TideSeries::NOW_INDEX].heightFt, b.samples[TideSeries::NOW_INDEX].heightFt);
}

TEST(TideFallback, RepeatsAfterOnePeriod)
{
    const time_t periodSec = static_cast<time_t>(lround(TideFallbackModel::PERIOD_HOURS * 3600.0));
    const TideSeries a = TideFallbackGenerate(TEST_NOW);
    const TideSeries b = TideFallbackGenerate(TEST_NOW + periodSec);

    for (size_t i = 0; i < TideSeries::SAMPLE_COUNT; ++i) {
        EXPECT_NEAR(a.samples[i].heightFt, b.samples[i].heightFt, 1e-3);
    }
}

TEST(TideFallback, HandlesInstantsBeforeEpoch)
{
    const TideSeries s = TideFallbackGenerate(static_cast<time_t>(-1000));
    EXPECT_TRUE(TideSeriesIsWellFormed(s));
}
