#pragma once

#include <stddef.h>
#include <string>
#include <vector>

#include "Tide.h"

struct ChartPoint {
    int x;
    int y;
};

// Geometry a target exposes to the mapping. Units are the target's own
// (pixels for the bitmap, character cells for the text grid).
struct ChartLayout {
    int width;          // x range is [0, width-1]
    int height;
    int topMargin;      // first row/pixel of the plot area
    int usableHeight;   // plot area rows/pixels
    int labelY;         // top of the axis label line
    int lineHeight;     // text line height
    int markerRadius;   // 0 on targets without sub-cell resolution
};

enum class GuideStyle {
    Solid,      // axes and scale ticks
    Dotted      // "now" line
};

// Capability set shared by both render targets.
// Coordinates outside the target are clipped; a primitive returns false
// only if nothing of it could be drawn.
class PixelSink {
public:
    virtual ~PixelSink() = default;

    virtual ChartLayout layout() const = 0;
    virtual int textWidth(const char* text) const = 0;

    virtual bool drawLine(ChartPoint from, ChartPoint to) = 0;
    // Thin reference line drawn under the curve.
    virtual bool drawGuide(ChartPoint from, ChartPoint to, GuideStyle style) = 0;
    virtual bool drawPoint(ChartPoint at) = 0;     // emphasised "now" marker
    virtual bool drawText(ChartPoint topLeft, const char* text) = 0;

    // Hands the finished frame to its destination.
    virtual bool flush() = 0;
};

struct ChartSegment {
    ChartPoint from;
    ChartPoint to;
};

struct ChartLabel {
    ChartPoint  at;
    std::string text;
};

// Everything one draw() puts on a target. Built per call, never stored;
// holds the series by reference only.
struct RenderCommand {
    explicit RenderCommand(const TideSeries& s) : series(s) {}

    const TideSeries&         series;
    float                     heightMin = 0.0f;
    float                     heightMax = 0.0f;
    std::vector<ChartPoint>   points;     // one per sample
    std::vector<ChartSegment> segments;   // points[i] -> points[i+1]
    std::vector<ChartSegment> axes;       // Y axis at x = 0, X axis on the bottom plot row
    std::vector<ChartSegment> scaleTicks; // TIDE_SCALE_TICKS, top to bottom
    ChartSegment              nowLine{};  // dotted, full plot height at the "now" column
    ChartPoint                marker{0, 0};
    bool                      hasMarker = false;
    std::vector<ChartLabel>   labels;     // axis and scale labels, Hi/Lo, height readout, OFFLINE
};

static constexpr float       TIDE_MIN_RANGE_FT  = 1.0f;
static constexpr const char* TIDE_OFFLINE_LABEL = "OFFLINE";
static constexpr const char* TIDE_LABEL_PAST    = "-12h";
static constexpr const char* TIDE_LABEL_NOW     = "Now";
static constexpr const char* TIDE_LABEL_FUTURE  = "+12h";
static constexpr const char* TIDE_LABEL_HIGH    = "Hi";
static constexpr const char* TIDE_LABEL_LOW     = "Lo";
static constexpr int         TIDE_SCALE_TICKS   = 5;

// Min/max over all samples; a flat series gets max = min + TIDE_MIN_RANGE_FT.
void TideComputeRange(const TideSeries& series, float& outMin, float& outMax);

int TideMapX(size_t index, int width);
int TideMapY(float heightFt, float heightMin, float heightMax, const ChartLayout& layout);

// Height at scale tick i (0 = top): heightMax - i/(TIDE_SCALE_TICKS-1) * range.
float TideScaleHeight(int tick, float heightMin, float heightMax);

RenderCommand TideBuildRenderCommand(const TideSeries& series,
                                     const ChartLayout& layout,
                                     const PixelSink&   sink);

// Draws series onto sink (guides, curve, marker, then text) and flushes it.
// Primitive failures are logged and skipped; returns false if the series is
// malformed, no curve segment could be drawn, or the flush failed.
bool TideRender(const TideSeries& series, PixelSink& sink);
