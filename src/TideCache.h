#pragma once

#include <time.h>
#include <stdint.h>
#include <string>

#include "Tide.h"

// What a cached series was fetched for. An entry written under a different
// station or datum is a miss.
struct TideCacheKey {
    std::string stationId;
    bool        showMsl   = false;
    float       mslOffset = 0.0f;   // only compared when showMsl is set
};

// Single-slot, TTL-gated snapshot of the last live series.
//
// Contract: invocations of the tracker do not overlap (the external timer
// spaces them). put() still writes to a private temp file and renames it
// over the slot, so a concurrent reader sees either the old or the new
// file, never a partial one.
class TideCache {
public:
    static constexpr uint32_t DEFAULT_TTL_SEC = 30 * 60;

    TideCache(std::string path, uint32_t ttlSec = DEFAULT_TTL_SEC);

    // True only for a readable, well-formed entry written under key with
    // 0 <= age < TTL. On a hit, out holds the series tagged SeriesSource::Cached.
    bool get(time_t nowUtc, const TideCacheKey& key, TideSeries& out) const;

    // Overwrites the slot. Returns false (and logs) if the write failed.
    bool put(const TideSeries& series, time_t nowUtc, const TideCacheKey& key);

private:
    std::string _path;
    uint32_t    _ttlSec;
};
