#pragma once

#include <stdint.h>
#include <time.h>
#include <string>

#include "StationClient.h"

// NOAA CO-OPS "datagetter" predictions client (6-minute MLLW heights in feet).
class NoaaClient : public StationClient {
public:
    static constexpr long     DEFAULT_TIMEOUT_SEC = 20;
    static constexpr size_t   MIN_RAW_SAMPLES     = 25;
    static constexpr uint16_t DEFAULT_WINDOW_H    = 12;

    explicit NoaaClient(uint16_t windowHours = DEFAULT_WINDOW_H,
                        long     timeoutSec  = DEFAULT_TIMEOUT_SEC);

    FetchResult fetch(const std::string& stationId,
                      time_t             nowUtc,
                      TideRawSamples&    out) override;

    // Request covers [now - window - 1h, now + window + 1h] in GMT.
    static std::string buildRequestUrl(const std::string& stationId,
                                       time_t             nowUtc,
                                       uint16_t           windowHours);

    // Parses a datagetter JSON body and checks coverage of the display window.
    static FetchResult parsePredictions(const std::string& payload,
                                        time_t             nowUtc,
                                        TideRawSamples&    out);

private:
    uint16_t _windowHours;
    long     _timeoutSec;

    FetchResult httpGet(const std::string& url, std::string& payload) const;
};
