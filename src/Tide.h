// tide.h
#pragma once
#include <time.h>
#include <stddef.h>
#include <stdint.h>

#include <array>
#include <vector>

enum class SeriesSource : uint8_t {
    Live,
    Cached,
    Fallback
};

struct TideSample {
    int16_t offsetMinutes;   // minutes relative to "now", -720..720
    float   heightFt;        // feet
};

// 24 h of 10-minute samples centred on "now".
// samples[i].offsetMinutes == FIRST_OFFSET_MIN + i * STEP_MIN always holds
// for a series handed out by any component.
struct TideSeries {
    static constexpr size_t  SAMPLE_COUNT     = 145;
    static constexpr int16_t STEP_MIN         = 10;
    static constexpr int16_t FIRST_OFFSET_MIN = -720;
    static constexpr int16_t LAST_OFFSET_MIN  = 720;
    static constexpr size_t  NOW_INDEX        = 72;

    std::array<TideSample, SAMPLE_COUNT> samples{};
    SeriesSource source = SeriesSource::Fallback;
};

// One irregularly timed height from a remote station.
struct TideRawSample {
    time_t timeUtc;
    float  height;   // feet
};

using TideRawSamples = std::vector<TideRawSample>;

enum class ResampleResult {
    Ok,
    RangeError
};

int16_t TideOffsetAt(size_t index);

// Structural check: canonical offsets, finite heights.
bool TideSeriesIsWellFormed(const TideSeries& series);

const char* TideSourceName(SeriesSource source);

// Linear interpolation of raw samples onto the 145 canonical offsets around nowUtc.
//  - Fails with RangeError if any target falls outside [raw.front(), raw.back()];
//    nothing is extrapolated.
//  - A target that lands exactly on a raw timestamp takes that raw height as-is.
//  - out.source is left for the caller to tag.
ResampleResult TideResample(const TideRawSamples& raw,
                            time_t                nowUtc,
                            TideSeries&           out);

// Shift MLLW heights to mean sea level when showMsl is set.
void TideApplyDatum(TideSeries& series, float mslOffsetFt, bool showMsl);
