#pragma once

#include <time.h>
#include <string>

#include "Tide.h"
#include "StationClient.h"
#include "TideCache.h"

struct SettingsData;

// Picks the series to display: cache, then one live fetch, then the offline model.
// getCurrentSeries() never fails; every acquisition error is logged and absorbed
// here, and the result's source tag says which branch produced it.
class TideService {
public:
    enum class State {
        TryCache,
        TryLive,
        Fallback,
        Done
    };

    // cache and client must outlive the service.
    TideService(TideCache& cache, StationClient& client, const SettingsData& settings);

    TideSeries getCurrentSeries(time_t nowUtc);

    // Outcome of the most recent live attempt (Ok if none was made).
    FetchResult lastFetchResult() const { return _lastFetch; }

private:
    TideCache&     _cache;
    StationClient& _client;

    std::string _stationId;
    float       _mslOffset;
    bool        _showMsl;
    TideCacheKey _cacheKey;

    FetchResult _lastFetch = FetchResult::Ok;

    bool tryLive(time_t nowUtc, TideSeries& out);
};
