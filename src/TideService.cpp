#include "TideService.h"

#include "Log.h"
#include "SettingsManager.h"
#include "TideFallback.h"

TideService::TideService(TideCache& cache, StationClient& client, const SettingsData& settings)
: _cache(cache),
  _client(client),
  _stationId(settings.station_id),
  _mslOffset(settings.msl_offset),
  _showMsl(settings.show_msl),
  _cacheKey{settings.station_id, settings.show_msl, settings.msl_offset} {}


// One live attempt: fetch, resample, datum shift, cache. No retry.
bool TideService::tryLive(time_t nowUtc, TideSeries& out)
{
    TideRawSamples raw;
    _lastFetch = _client.fetch(_stationId, nowUtc, raw);
    if (_lastFetch != FetchResult::Ok) {
        Log.printf("[TideService] fetch(%s) failed: %s\n",
                   _stationId.c_str(), FetchResultName(_lastFetch));
        return false;
    }

    TideSeries series;
    if (TideResample(raw, nowUtc, series) != ResampleResult::Ok) {
        Log.println("[TideService] resample failed: RangeError");
        return false;
    }

    TideApplyDatum(series, _mslOffset, _showMsl);
    series.source = SeriesSource::Live;

    // Cached copy is stored already converted; a failed write only costs a refetch next run.
    if (!_cache.put(series, nowUtc, _cacheKey)) {
        Log.println("[TideService] Warning: failed to persist tide series to cache");
    }

    out = series;
    return true;
}


TideSeries TideService::getCurrentSeries(time_t nowUtc)
{
    Log.printf("[TideService] getCurrentSeries() called at %ld (UTC), station=%s\n",
               static_cast<long>(nowUtc), _stationId.c_str());

    _lastFetch = FetchResult::Ok;

    TideSeries series;
    State state = State::TryCache;

    while (state != State::Done) {
        switch (state) {
            case State::TryCache:
                if (_cache.get(nowUtc, _cacheKey, series)) {
                    state = State::Done;
                } else {
                    Log.println("[TideService] cache miss");
                    state = State::TryLive;
                }
                break;

            case State::TryLive:
                state = tryLive(nowUtc, series) ? State::Done : State::Fallback;
                break;

            case State::Fallback:
                Log.println("[TideService] falling back to offline model");
                series = TideFallbackGenerate(nowUtc);
                TideApplyDatum(series, _mslOffset, _showMsl);
                state = State::Done;
                break;

            case State::Done:
                break;
        }
    }

    Log.printf("[TideService] series source=%s, now=%.2f ft\n",
               TideSourceName(series.source),
               static_cast<double>(series.samples[TideSeries::NOW_INDEX].heightFt));
    return series;
}
