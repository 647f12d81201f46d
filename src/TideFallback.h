#pragma once

#include <time.h>
#include "Tide.h"

// Offline approximation: a single semidiurnal sinusoid whose phase follows
// the wall clock. Pure function of nowUtc; always returns a well-formed
// series tagged SeriesSource::Fallback.
TideSeries TideFallbackGenerate(time_t nowUtc);

struct TideFallbackModel {
    static constexpr double PERIOD_HOURS           = 12.42;
    static constexpr double MEAN_LEVEL_FT          = 5.0;
    static constexpr double AMPLITUDE_FT           = 2.8;
    static constexpr double LUNITIDAL_OFFSET_HOURS = 3.59;  // moon transit -> local high water
};
