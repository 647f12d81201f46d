#include "Tide.h"
#include "Log.h"

#include <math.h>
#include <algorithm>

int16_t TideOffsetAt(size_t index) {
    return static_cast<int16_t>(TideSeries::FIRST_OFFSET_MIN +
                                static_cast<int>(index) * TideSeries::STEP_MIN);
}

bool TideSeriesIsWellFormed(const TideSeries& series) {
    for (size_t i = 0; i < TideSeries::SAMPLE_COUNT; ++i) {
        const TideSample& s = series.samples[i];
        if (s.offsetMinutes != TideOffsetAt(i)) return false;
        if (!isfinite(s.heightFt)) return false;
    }
    return true;
}

const char* TideSourceName(SeriesSource source) {
    switch (source) {
        case SeriesSource::Live:     return "live";
        case SeriesSource::Cached:   return "cached";
        case SeriesSource::Fallback: return "fallback";
    }
    return "?";
}

static bool rawTimeLess(const TideRawSample& a, const TideRawSample& b) {
    return a.timeUtc < b.timeUtc;
}

ResampleResult TideResample(const TideRawSamples& raw,
                            time_t                nowUtc,
                            TideSeries&           out)
{
    if (raw.size() < 2) {
        Log.printf("[Resample] TideResample: raw.size()=%u (<2)\n",
                   static_cast<unsigned>(raw.size()));
        return ResampleResult::RangeError;
    }

    // Callers normally hand us sorted data; sort a copy only if they didn't.
    TideRawSamples sortedCopy;
    const TideRawSamples* src = &raw;
    if (!std::is_sorted(raw.begin(), raw.end(), rawTimeLess)) {
        sortedCopy = raw;
        std::stable_sort(sortedCopy.begin(), sortedCopy.end(), rawTimeLess);
        src = &sortedCopy;
    }
    const TideRawSamples& pts = *src;

    const time_t first    = pts.front().timeUtc;
    const time_t last     = pts.back().timeUtc;
    const time_t winStart = nowUtc + static_cast<time_t>(TideSeries::FIRST_OFFSET_MIN) * 60;
    const time_t winEnd   = nowUtc + static_cast<time_t>(TideSeries::LAST_OFFSET_MIN) * 60;

    if (winStart < first || winEnd > last) {
        Log.printf("[Resample] TideResample: window [%ld, %ld] not covered by raw [%ld, %ld]\n",
                   static_cast<long>(winStart), static_cast<long>(winEnd),
                   static_cast<long>(first), static_cast<long>(last));
        return ResampleResult::RangeError;
    }

    size_t seg = 0;
    for (size_t i = 0; i < TideSeries::SAMPLE_COUNT; ++i) {
        const int16_t offset = TideOffsetAt(i);
        const time_t  t      = nowUtc + static_cast<time_t>(offset) * 60;

        // Find the segment [pts[seg], pts[seg+1]] that covers t
        while (seg + 1 < pts.size() && pts[seg + 1].timeUtc < t) {
            ++seg;
        }
        if (seg + 1 >= pts.size()) {
            // Only reachable if t > last, which the window check rules out.
            return ResampleResult::RangeError;
        }

        const TideRawSample& e0 = pts[seg];
        const TideRawSample& e1 = pts[seg + 1];

        float h;
        if (t == e0.timeUtc || e1.timeUtc == e0.timeUtc) {
            h = e0.height;
        } else if (t == e1.timeUtc) {
            h = e1.height;
        } else {
            double alpha = static_cast<double>(t - e0.timeUtc) /
                           static_cast<double>(e1.timeUtc - e0.timeUtc);
            h = static_cast<float>(e0.height + alpha * (e1.height - e0.height));
        }

        out.samples[i].offsetMinutes = offset;
        out.samples[i].heightFt      = h;
    }

    Log.printf("[Resample] TideResample: %u raw points -> %u samples\n",
               static_cast<unsigned>(pts.size()),
               static_cast<unsigned>(TideSeries::SAMPLE_COUNT));
    return ResampleResult::Ok;
}

void TideApplyDatum(TideSeries& series, float mslOffsetFt, bool showMsl) {
    if (!showMsl) return;
    for (TideSample& s : series.samples) {
        s.heightFt -= mslOffsetFt;
    }
}
