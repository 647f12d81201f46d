#include "TideFallback.h"

#include <math.h>

static constexpr double TWO_PI = 6.283185307179586;

TideSeries TideFallbackGenerate(time_t nowUtc)
{
    const double periodSec    = TideFallbackModel::PERIOD_HOURS * 3600.0;
    const double lunitidalSec = TideFallbackModel::LUNITIDAL_OFFSET_HOURS * 3600.0;

    // Phase of "now" within the current tidal cycle, kept in [0, periodSec)
    double cyclePos = fmod(static_cast<double>(nowUtc) + lunitidalSec, periodSec);
    if (cyclePos < 0.0) cyclePos += periodSec;
    const double phaseNow = cyclePos / periodSec * TWO_PI;

    TideSeries series;
    for (size_t i = 0; i < TideSeries::SAMPLE_COUNT; ++i) {
        const int16_t offset = TideOffsetAt(i);
        const double  theta  = phaseNow + (offset * 60.0) / periodSec * TWO_PI;

        series.samples[i].offsetMinutes = offset;
        series.samples[i].heightFt = static_cast<float>(
            TideFallbackModel::MEAN_LEVEL_FT + TideFallbackModel::AMPLITUDE_FT * sin(theta));
    }
    series.source = SeriesSource::Fallback;
    return series;
}
