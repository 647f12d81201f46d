#include "TideCache.h"
#include "Log.h"

#include <ArduinoJson.h>

#include <errno.h>
#include <fcntl.h>
#include <math.h>
#include <stdio.h>
#include <string.h>
#include <unistd.h>

#include <fstream>
#include <utility>

// 145 two-member objects plus the envelope, with room for copied key strings
static constexpr size_t CACHE_JSON_CAPACITY = 16 * 1024;

TideCache::TideCache(std::string path, uint32_t ttlSec)
: _path(std::move(path)), _ttlSec(ttlSec) {}

// -----------------------------------------------------------------------------
// Read side
// -----------------------------------------------------------------------------

static bool keyMatches(JsonDocument& doc, const TideCacheKey& key)
{
    const char* stationId = doc["station_id"];
    if (!stationId || key.stationId != stationId) {
        Log.printf("[TideCache] loadSeriesFromFile: entry is for station %s, want %s\n",
                   stationId ? stationId : "(none)", key.stationId.c_str());
        return false;
    }

    JsonVariant showMsl   = doc["show_msl"];
    JsonVariant mslOffset = doc["msl_offset"];
    if (!showMsl.is<bool>() || !mslOffset.is<float>()) {
        Log.println("[TideCache] loadSeriesFromFile: missing datum fields");
        return false;
    }
    if (showMsl.as<bool>() != key.showMsl ||
        (key.showMsl && fabsf(mslOffset.as<float>() - key.mslOffset) > 1e-4f)) {
        Log.printf("[TideCache] loadSeriesFromFile: entry datum (show_msl=%d, offset=%.2f) does not match\n",
                   showMsl.as<bool>() ? 1 : 0, static_cast<double>(mslOffset.as<float>()));
        return false;
    }
    return true;
}

static bool loadSeriesFromFile(const std::string& path, const TideCacheKey& key,
                               TideSeries& series, time_t& capturedAt)
{
    std::ifstream file(path);
    if (!file) {
        Log.printf("[TideCache] loadSeriesFromFile: no cache at %s\n", path.c_str());
        return false;
    }

    DynamicJsonDocument doc(CACHE_JSON_CAPACITY);
    DeserializationError err = deserializeJson(doc, file);
    if (err) {
        Log.printf("[TideCache] loadSeriesFromFile: JSON error: %s\n", err.c_str());
        return false;
    }

    if (!keyMatches(doc, key)) {
        return false;
    }

    JsonVariant captured = doc["captured_at"];
    if (!captured.is<long long>()) {
        Log.println("[TideCache] loadSeriesFromFile: missing captured_at");
        return false;
    }
    capturedAt = static_cast<time_t>(captured.as<long long>());

    // Only live data is ever cached; an offline snapshot means someone else wrote this file.
    if (doc["offline"] | true) {
        Log.println("[TideCache] loadSeriesFromFile: entry is marked offline");
        return false;
    }

    JsonArray arr = doc["samples"].as<JsonArray>();
    if (arr.isNull()) {
        Log.println("[TideCache] loadSeriesFromFile: no samples[] array");
        return false;
    }
    if (arr.size() != TideSeries::SAMPLE_COUNT) {
        Log.printf("[TideCache] loadSeriesFromFile: %u samples, expected %u\n",
                   static_cast<unsigned>(arr.size()),
                   static_cast<unsigned>(TideSeries::SAMPLE_COUNT));
        return false;
    }

    size_t i = 0;
    for (JsonObject obj : arr) {
        JsonVariant offset = obj["offset_minutes"];
        JsonVariant height = obj["tide_ft"];
        if (!offset.is<int>() || !height.is<float>()) {
            Log.printf("[TideCache] loadSeriesFromFile: bad sample at index %u\n",
                       static_cast<unsigned>(i));
            return false;
        }
        if (offset.as<int>() != TideOffsetAt(i)) {
            Log.printf("[TideCache] loadSeriesFromFile: offset %d at index %u is not canonical\n",
                       offset.as<int>(), static_cast<unsigned>(i));
            return false;
        }

        series.samples[i].offsetMinutes = TideOffsetAt(i);
        series.samples[i].heightFt      = height.as<float>();
        ++i;
    }

    return TideSeriesIsWellFormed(series);
}

bool TideCache::get(time_t nowUtc, const TideCacheKey& key, TideSeries& out) const
{
    TideSeries loaded;
    time_t capturedAt = 0;
    if (!loadSeriesFromFile(_path, key, loaded, capturedAt)) {
        return false;
    }

    if (capturedAt > nowUtc) {
        Log.printf("[TideCache] get: captured_at=%ld is in the future (now=%ld), ignoring\n",
                   static_cast<long>(capturedAt), static_cast<long>(nowUtc));
        return false;
    }

    const double age = difftime(nowUtc, capturedAt);
    if (age >= static_cast<double>(_ttlSec)) {
        Log.printf("[TideCache] get: stale, age=%.0f s, ttl=%u s\n",
                   age, static_cast<unsigned>(_ttlSec));
        return false;
    }

    loaded.source = SeriesSource::Cached;
    out = loaded;

    Log.printf("[TideCache] get: hit, age=%.0f s\n", age);
    return true;
}

// -----------------------------------------------------------------------------
// Write side
// -----------------------------------------------------------------------------

static bool writeAll(int fd, const char* data, size_t len)
{
    while (len > 0) {
        ssize_t n = ::write(fd, data, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        len  -= static_cast<size_t>(n);
    }
    return true;
}

bool TideCache::put(const TideSeries& series, time_t nowUtc, const TideCacheKey& key)
{
    if (!TideSeriesIsWellFormed(series)) {
        Log.println("[TideCache] put: refusing to cache a malformed series");
        return false;
    }

    DynamicJsonDocument doc(CACHE_JSON_CAPACITY);
    doc["station_id"]  = key.stationId;
    doc["show_msl"]    = key.showMsl;
    doc["msl_offset"]  = key.mslOffset;
    doc["captured_at"] = static_cast<long long>(nowUtc);
    doc["offline"]     = (series.source == SeriesSource::Fallback);

    JsonArray arr = doc.createNestedArray("samples");
    for (const TideSample& s : series.samples) {
        JsonObject obj = arr.createNestedObject();
        obj["offset_minutes"] = s.offsetMinutes;
        obj["tide_ft"]        = s.heightFt;
    }

    if (doc.overflowed()) {
        Log.println("[TideCache] put: JSON document overflowed");
        return false;
    }

    std::string payload;
    if (serializeJson(doc, payload) == 0) {
        Log.println("[TideCache] put: serializeJson wrote 0 bytes");
        return false;
    }

    const std::string tmpPath = _path + ".tmp." + std::to_string(static_cast<long>(getpid()));

    int fd = ::open(tmpPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        Log.printf("[TideCache] put: failed to open %s: %s\n", tmpPath.c_str(), strerror(errno));
        return false;
    }

    bool ok = writeAll(fd, payload.data(), payload.size()) && (::fsync(fd) == 0);
    if (!ok) {
        Log.printf("[TideCache] put: write to %s failed: %s\n", tmpPath.c_str(), strerror(errno));
    }
    if (::close(fd) != 0) {
        ok = false;
    }

    if (ok && ::rename(tmpPath.c_str(), _path.c_str()) != 0) {
        Log.printf("[TideCache] put: rename to %s failed: %s\n", _path.c_str(), strerror(errno));
        ok = false;
    }

    if (!ok) {
        ::unlink(tmpPath.c_str());
        return false;
    }

    Log.printf("[TideCache] put: wrote %u samples to %s\n",
               static_cast<unsigned>(TideSeries::SAMPLE_COUNT), _path.c_str());
    return true;
}
