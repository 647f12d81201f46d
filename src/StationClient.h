#pragma once

#include <time.h>
#include <string>

#include "Tide.h"

enum class FetchResult {
    Ok,
    NetworkError,      // transport failure, timeout or non-200 status
    ParseError,        // body is not the expected prediction document
    InsufficientData   // parsed fine but does not bracket the display window
};

const char* FetchResultName(FetchResult result);

// Source of raw height predictions for one station.
// One attempt per call; retry policy belongs to whoever schedules us.
class StationClient {
public:
    virtual ~StationClient() = default;

    // On Ok, out is sorted by time, free of duplicate timestamps, and covers
    // [nowUtc - 720 min, nowUtc + 720 min].
    virtual FetchResult fetch(const std::string& stationId,
                              time_t             nowUtc,
                              TideRawSamples&    out) = 0;
};
