#include "NoaaClient.h"
#include "Log.h"

#include <ArduinoJson.h>
#include <curl/curl.h>

#include <math.h>
#include <stdio.h>
#include <stdlib.h>
#include <time.h>

#include <algorithm>
#include <memory>

static constexpr const char* NOAA_DATAGETTER_URL =
    "https://api.tidesandcurrents.noaa.gov/api/prod/datagetter";
static constexpr const char* NOAA_APPLICATION = "tide_tracker";
static constexpr const char* USER_AGENT       = "tide-tracker/1.0";

// ~26 h of 6-minute predictions, string values copied into the pool
static constexpr size_t PREDICTIONS_JSON_CAPACITY = 64 * 1024;

NoaaClient::NoaaClient(uint16_t windowHours, long timeoutSec)
: _windowHours(windowHours), _timeoutSec(timeoutSec) {}

std::string NoaaClient::buildRequestUrl(const std::string& stationId,
                                        time_t             nowUtc,
                                        uint16_t           windowHours)
{
    // One spare hour on each side so the first and last targets are bracketed.
    const time_t beginUtc = nowUtc - (static_cast<time_t>(windowHours) + 1) * 3600;
    const unsigned rangeHours = 2U * windowHours + 2U;

    struct tm t = {};
    gmtime_r(&beginUtc, &t);

    char beginDate[32];
    strftime(beginDate, sizeof(beginDate), "%Y%m%d%%20%H:%M", &t);

    std::string url = NOAA_DATAGETTER_URL;
    url += "?product=predictions";
    url += "&application=";
    url += NOAA_APPLICATION;
    url += "&begin_date=";
    url += beginDate;
    url += "&range=";
    url += std::to_string(rangeHours);
    url += "&datum=MLLW";
    url += "&station=";
    url += stationId;
    url += "&time_zone=gmt";
    url += "&units=english";
    url += "&interval=6";
    url += "&format=json";
    return url;
}

static bool parseNoaaTime(const char* timeStr, time_t& out)
{
    struct tm t = {};
    if (sscanf(timeStr, "%4d-%2d-%2d %2d:%2d",
               &t.tm_year, &t.tm_mon, &t.tm_mday,
               &t.tm_hour, &t.tm_min) != 5) {
        return false;
    }
    if (t.tm_mon < 1 || t.tm_mon > 12 || t.tm_mday < 1 || t.tm_mday > 31 ||
        t.tm_hour < 0 || t.tm_hour > 23 || t.tm_min < 0 || t.tm_min > 59) {
        return false;
    }
    t.tm_year -= 1900;
    t.tm_mon  -= 1;

    // Requested with time_zone=gmt, so no local TZ juggling needed.
    time_t ts = timegm(&t);
    if (ts <= 0) return false;

    out = ts;
    return true;
}

static bool parseNoaaHeight(const char* valueStr, float& out)
{
    if (!valueStr || !*valueStr) return false;

    char* end = nullptr;
    float v = strtof(valueStr, &end);
    if (end == valueStr || *end != '\0' || !isfinite(v)) return false;

    out = v;
    return true;
}

FetchResult NoaaClient::parsePredictions(const std::string& payload,
                                         time_t             nowUtc,
                                         TideRawSamples&    out)
{
    StaticJsonDocument<128> filter;
    filter["predictions"][0]["t"] = true;
    filter["predictions"][0]["v"] = true;
    filter["error"]               = true;

    DynamicJsonDocument doc(PREDICTIONS_JSON_CAPACITY);
    DeserializationError err = deserializeJson(doc, payload,
                                               DeserializationOption::Filter(filter));
    if (err) {
        Log.printf("[NoaaClient] JSON parse error: %s\n", err.c_str());
        return FetchResult::ParseError;
    }

    if (!doc["error"].isNull()) {
        const char* msg = doc["error"]["message"] | "(no message)";
        Log.printf("[NoaaClient] API error: %s\n", msg);
        return FetchResult::ParseError;
    }

    JsonArray data = doc["predictions"].as<JsonArray>();
    if (data.isNull()) {
        Log.println("[NoaaClient] No predictions[] array in JSON");
        return FetchResult::ParseError;
    }

    Log.printf("[NoaaClient] JSON predictions[] size: %u\n",
               static_cast<unsigned>(data.size()));

    TideRawSamples parsed;
    parsed.reserve(data.size());

    size_t skippedBadTime       = 0;
    size_t skippedBadHeight     = 0;
    size_t skippedMissingFields = 0;

    for (JsonObject obj : data) {
        const char* timeStr  = obj["t"];
        const char* valueStr = obj["v"];

        if (!timeStr || !valueStr) {
            ++skippedMissingFields;
            continue;
        }

        time_t ts = 0;
        if (!parseNoaaTime(timeStr, ts)) {
            ++skippedBadTime;
            continue;
        }

        float height = 0.0f;
        if (!parseNoaaHeight(valueStr, height)) {
            ++skippedBadHeight;
            continue;
        }

        parsed.push_back(TideRawSample{ts, height});
    }

    std::stable_sort(parsed.begin(), parsed.end(),
                     [](const TideRawSample& a, const TideRawSample& b) {
                         return a.timeUtc < b.timeUtc;
                     });
    parsed.erase(std::unique(parsed.begin(), parsed.end(),
                             [](const TideRawSample& a, const TideRawSample& b) {
                                 return a.timeUtc == b.timeUtc;
                             }),
                 parsed.end());

    Log.printf("[NoaaClient] Parsed %u points (skipped: badTime=%u, badHeight=%u, missing=%u)\n",
               static_cast<unsigned>(parsed.size()),
               static_cast<unsigned>(skippedBadTime),
               static_cast<unsigned>(skippedBadHeight),
               static_cast<unsigned>(skippedMissingFields));

    if (parsed.size() < MIN_RAW_SAMPLES) {
        Log.printf("[NoaaClient] Not enough points to be useful (need >= %u)\n",
                   static_cast<unsigned>(MIN_RAW_SAMPLES));
        return FetchResult::InsufficientData;
    }

    const time_t needStart = nowUtc + static_cast<time_t>(TideSeries::FIRST_OFFSET_MIN) * 60;
    const time_t needEnd   = nowUtc + static_cast<time_t>(TideSeries::LAST_OFFSET_MIN) * 60;
    if (parsed.front().timeUtc > needStart || parsed.back().timeUtc < needEnd) {
        Log.printf("[NoaaClient] Points [%ld, %ld] do not bracket window [%ld, %ld]\n",
                   static_cast<long>(parsed.front().timeUtc),
                   static_cast<long>(parsed.back().timeUtc),
                   static_cast<long>(needStart),
                   static_cast<long>(needEnd));
        return FetchResult::InsufficientData;
    }

    out.swap(parsed);
    return FetchResult::Ok;
}

static size_t appendToString(char* ptr, size_t size, size_t nmemb, void* userdata)
{
    std::string* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

struct CurlEasyDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

FetchResult NoaaClient::httpGet(const std::string& url, std::string& payload) const
{
    std::unique_ptr<CURL, CurlEasyDeleter> curl(curl_easy_init());
    if (!curl) {
        Log.println("[NoaaClient] curl_easy_init() failed");
        return FetchResult::NetworkError;
    }

    payload.clear();
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, USER_AGENT);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, _timeoutSec);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, appendToString);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &payload);

    CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        Log.printf("[NoaaClient] HTTP GET failed: %s\n", curl_easy_strerror(rc));
        return FetchResult::NetworkError;
    }

    long httpCode = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &httpCode);
    Log.printf("[NoaaClient] HTTP GET returned: %ld\n", httpCode);

    if (httpCode != 200) {
        Log.printf("[NoaaClient] HTTP error: %ld\n", httpCode);
        return FetchResult::NetworkError;
    }

    Log.printf("[NoaaClient] Payload size: %u bytes\n",
               static_cast<unsigned>(payload.size()));
    return FetchResult::Ok;
}

FetchResult NoaaClient::fetch(const std::string& stationId,
                              time_t             nowUtc,
                              TideRawSamples&    out)
{
    const std::string url = buildRequestUrl(stationId, nowUtc, _windowHours);
    Log.printf("[NoaaClient] Requesting URL: %s\n", url.c_str());

    std::string payload;
    FetchResult fr = httpGet(url, payload);
    if (fr != FetchResult::Ok) {
        return fr;
    }

    return parsePredictions(payload, nowUtc, out);
}
