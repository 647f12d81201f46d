#include "TideRenderer.h"
#include "Log.h"

#include <math.h>
#include <stdio.h>

void TideComputeRange(const TideSeries& series, float& outMin, float& outMax)
{
    float mn = series.samples[0].heightFt;
    float mx = series.samples[0].heightFt;
    for (size_t i = 1; i < TideSeries::SAMPLE_COUNT; ++i) {
        float v = series.samples[i].heightFt;
        if (v < mn) mn = v;
        if (v > mx) mx = v;
    }

    // Avoid zero-span
    if (mx == mn) {
        mx = mn + TIDE_MIN_RANGE_FT;
    }

    outMin = mn;
    outMax = mx;
}

int TideMapX(size_t index, int width)
{
    return static_cast<int>(index) * (width - 1) /
           static_cast<int>(TideSeries::SAMPLE_COUNT - 1);
}

int TideMapY(float heightFt, float heightMin, float heightMax, const ChartLayout& layout)
{
    float span = heightMax - heightMin;
    if (span <= 0.0f) span = TIDE_MIN_RANGE_FT;

    float norm = (heightFt - heightMin) / span;
    if (norm < 0.0f) norm = 0.0f;
    if (norm > 1.0f) norm = 1.0f;

    // Inverted: higher water sits nearer the top.
    const float rows = static_cast<float>(layout.usableHeight - 1);
    return layout.topMargin + static_cast<int>(lroundf((1.0f - norm) * rows));
}

float TideScaleHeight(int tick, float heightMin, float heightMax)
{
    const float step = static_cast<float>(tick) / static_cast<float>(TIDE_SCALE_TICKS - 1);
    return heightMax - step * (heightMax - heightMin);
}

static int clampInt(int v, int lo, int hi)
{
    if (hi < lo) return lo;
    if (v < lo) return lo;
    if (v > hi) return hi;
    return v;
}

RenderCommand TideBuildRenderCommand(const TideSeries& series,
                                     const ChartLayout& layout,
                                     const PixelSink&   sink)
{
    RenderCommand cmd(series);
    TideComputeRange(series, cmd.heightMin, cmd.heightMax);

    cmd.points.reserve(TideSeries::SAMPLE_COUNT);
    for (size_t i = 0; i < TideSeries::SAMPLE_COUNT; ++i) {
        const TideSample& s = series.samples[i];
        ChartPoint p{TideMapX(i, layout.width),
                     TideMapY(s.heightFt, cmd.heightMin, cmd.heightMax, layout)};
        cmd.points.push_back(p);

        if (s.offsetMinutes == 0) {
            cmd.marker    = p;
            cmd.hasMarker = true;
        }
    }

    cmd.segments.reserve(TideSeries::SAMPLE_COUNT - 1);
    for (size_t i = 1; i < cmd.points.size(); ++i) {
        cmd.segments.push_back(ChartSegment{cmd.points[i - 1], cmd.points[i]});
    }

    // Guides: axes along the plot's left and bottom edges, height scale, "now" line
    const int plotTop    = layout.topMargin;
    const int plotBottom = layout.topMargin + layout.usableHeight - 1;
    const int nowX       = TideMapX(TideSeries::NOW_INDEX, layout.width);

    cmd.axes.push_back(ChartSegment{ChartPoint{0, plotTop}, ChartPoint{0, plotBottom}});
    cmd.axes.push_back(ChartSegment{ChartPoint{0, plotBottom}, ChartPoint{layout.width - 1, plotBottom}});
    cmd.nowLine = ChartSegment{ChartPoint{nowX, plotTop}, ChartPoint{nowX, plotBottom}};

    const int tickLen = layout.markerRadius + 1;
    const int scaleX  = tickLen + 1;
    cmd.scaleTicks.reserve(TIDE_SCALE_TICKS);
    for (int i = 0; i < TIDE_SCALE_TICKS; ++i) {
        const float h = TideScaleHeight(i, cmd.heightMin, cmd.heightMax);
        const int   y = TideMapY(h, cmd.heightMin, cmd.heightMax, layout);
        cmd.scaleTicks.push_back(ChartSegment{ChartPoint{0, y}, ChartPoint{tickLen, y}});

        char buf[16];
        snprintf(buf, sizeof(buf), "%.0f", static_cast<double>(h));

        // Scale text stays clear of the status line and the axis label line
        int ty = y - layout.lineHeight / 2;
        ty = clampInt(ty, 0, layout.labelY - layout.lineHeight);
        cmd.labels.push_back(ChartLabel{ChartPoint{scaleX, ty}, buf});

        const char* extreme = (i == 0) ? TIDE_LABEL_HIGH
                            : (i == TIDE_SCALE_TICKS - 1) ? TIDE_LABEL_LOW : nullptr;
        if (extreme) {
            const int ex = scaleX + sink.textWidth(buf) + sink.textWidth(" ");
            cmd.labels.push_back(ChartLabel{ChartPoint{ex, ty}, extreme});
        }
    }

    // Height readout beside the marker; flips left if it would run off the edge.
    if (cmd.hasMarker) {
        char buf[24];
        snprintf(buf, sizeof(buf), "%.1f ft",
                 static_cast<double>(series.samples[TideSeries::NOW_INDEX].heightFt));

        const int textW = sink.textWidth(buf);
        const int gap   = layout.markerRadius + 2;

        int tx = cmd.marker.x + gap;
        if (tx + textW > layout.width) {
            tx = cmd.marker.x - gap - textW;
        }
        int ty = cmd.marker.y - layout.lineHeight / 2;
        ty = clampInt(ty, 0, layout.height - layout.lineHeight);

        cmd.labels.push_back(ChartLabel{ChartPoint{tx, ty}, buf});
    }

    // Axis labels scaled to the target width
    cmd.labels.push_back(ChartLabel{ChartPoint{0, layout.labelY}, TIDE_LABEL_PAST});
    cmd.labels.push_back(ChartLabel{
        ChartPoint{nowX - sink.textWidth(TIDE_LABEL_NOW) / 2, layout.labelY}, TIDE_LABEL_NOW});
    cmd.labels.push_back(ChartLabel{
        ChartPoint{layout.width - sink.textWidth(TIDE_LABEL_FUTURE), layout.labelY},
        TIDE_LABEL_FUTURE});

    if (series.source == SeriesSource::Fallback) {
        cmd.labels.push_back(ChartLabel{
            ChartPoint{layout.width - sink.textWidth(TIDE_OFFLINE_LABEL), 0},
            TIDE_OFFLINE_LABEL});
    }

    return cmd;
}

bool TideRender(const TideSeries& series, PixelSink& sink)
{
    if (!TideSeriesIsWellFormed(series)) {
        Log.println("[Renderer] TideRender: malformed series, nothing drawn");
        return false;
    }

    const ChartLayout layout = sink.layout();
    if (layout.width < 2 || layout.usableHeight < 1) {
        Log.printf("[Renderer] TideRender: unusable layout %dx%d (plot rows %d)\n",
                   layout.width, layout.height, layout.usableHeight);
        return false;
    }

    const RenderCommand cmd = TideBuildRenderCommand(series, layout, sink);

    size_t segmentsDrawn = 0;
    size_t failures      = 0;

    for (const ChartSegment& axis : cmd.axes) {
        if (!sink.drawGuide(axis.from, axis.to, GuideStyle::Solid)) ++failures;
    }
    for (const ChartSegment& tick : cmd.scaleTicks) {
        if (!sink.drawGuide(tick.from, tick.to, GuideStyle::Solid)) ++failures;
    }
    if (!sink.drawGuide(cmd.nowLine.from, cmd.nowLine.to, GuideStyle::Dotted)) {
        Log.printf("[Renderer] now line at x=%d not drawn\n", cmd.nowLine.from.x);
        ++failures;
    }

    for (const ChartSegment& seg : cmd.segments) {
        if (sink.drawLine(seg.from, seg.to)) {
            ++segmentsDrawn;
        } else {
            ++failures;
        }
    }

    if (cmd.hasMarker && !sink.drawPoint(cmd.marker)) {
        Log.printf("[Renderer] marker at (%d,%d) not drawn\n", cmd.marker.x, cmd.marker.y);
        ++failures;
    }

    for (const ChartLabel& label : cmd.labels) {
        if (!sink.drawText(label.at, label.text.c_str())) {
            Log.printf("[Renderer] label \"%s\" at (%d,%d) not drawn\n",
                       label.text.c_str(), label.at.x, label.at.y);
            ++failures;
        }
    }

    Log.printf("[Renderer] source=%s range=[%.2f, %.2f] ft, segments=%u/%u, failures=%u\n",
               TideSourceName(series.source),
               static_cast<double>(cmd.heightMin), static_cast<double>(cmd.heightMax),
               static_cast<unsigned>(segmentsDrawn),
               static_cast<unsigned>(cmd.segments.size()),
               static_cast<unsigned>(failures));

    if (segmentsDrawn == 0) {
        Log.println("[Renderer] TideRender: curve could not be drawn");
        return false;
    }

    if (!sink.flush()) {
        Log.println("[Renderer] TideRender: flush failed");
        return false;
    }
    return true;
}
