#include <gtest/gtest.h>

#include <string.h>

#include <algorithm>
#include <string>
#include <vector>

#include "TideRenderer.h"
#include "TestSupport.h"

// Records every primitive; fixed-width glyphs.
class RecordingSink : public PixelSink {
public:
    static constexpr int GLYPH_WIDTH = 6;

    ChartLayout l{400, 300, 24, 250, 280, 20, 4};
    bool flushResult = true;
    bool lineResult  = true;

    struct Guide {
        ChartSegment segment;
        GuideStyle   style;
        size_t       linesBefore;   // curve segments already drawn
    };

    std::vector<ChartSegment> lines;
    std::vector<Guide>        guides;
    std::vector<ChartPoint>   points;
    std::vector<ChartLabel>   texts;
    int flushes = 0;

    ChartLayout layout() const override { return l; }
    int textWidth(const char* text) const override
    {
        return static_cast<int>(strlen(text)) * GLYPH_WIDTH;
    }

    bool drawLine(ChartPoint from, ChartPoint to) override
    {
        lines.push_back(ChartSegment{from, to});
        return lineResult;
    }
    bool drawGuide(ChartPoint from, ChartPoint to, GuideStyle style) override
    {
        guides.push_back(Guide{ChartSegment{from, to}, style, lines.size()});
        return true;
    }
    bool drawPoint(ChartPoint at) override
    {
        points.push_back(at);
        return true;
    }
    bool drawText(ChartPoint topLeft, const char* text) override
    {
        texts.push_back(ChartLabel{topLeft, text});
        return true;
    }
    bool flush() override
    {
        ++flushes;
        return flushResult;
    }

    const ChartLabel* findText(const std::string& text) const
    {
        for (const ChartLabel& t : texts) {
            if (t.text == text) return &t;
        }
        return nullptr;
    }
};

// Hourly points over the window: 9.2 ft at -3 h, 0.3 ft at +5 h, 4.0 ft elsewhere.
static TideSeries extremesSeries()
{
    const TideRawSamples raw = testRawSamples(TEST_NOW, -720, 720, 60, [](int m) {
        if (m == -180) return 9.2f;
        if (m == 300)  return 0.3f;
        return 4.0f;
    });

    TideSeries s;
    EXPECT_EQ(raw.size(), 25u);
    EXPECT_EQ(TideResample(raw, TEST_NOW, s), ResampleResult::Ok);
    s.source = SeriesSource::Live;
    return s;
}

TEST(TideMapping, XSpansTheFullWidth)
{
    EXPECT_EQ(TideMapX(0, 400), 0);
    EXPECT_EQ(TideMapX(TideSeries::SAMPLE_COUNT - 1, 400), 399);
    EXPECT_EQ(TideMapX(TideSeries::NOW_INDEX, 145), 72);

    int prev = -1;
    for (size_t i = 0; i < TideSeries::SAMPLE_COUNT; ++i) {
        const int x = TideMapX(i, 400);
        EXPECT_GE(x, prev);
        prev = x;
    }
}

TEST(TideMapping, YIsInvertedAndClamped)
{
    const ChartLayout l{400, 300, 24, 250, 280, 20, 4};
    EXPECT_EQ(TideMapY(10.0f, 0.0f, 10.0f, l), 24);
    EXPECT_EQ(TideMapY(0.0f, 0.0f, 10.0f, l), 24 + 249);
    EXPECT_EQ(TideMapY(20.0f, 0.0f, 10.0f, l), 24);
    EXPECT_EQ(TideMapY(-5.0f, 0.0f, 10.0f, l), 24 + 249);
}

TEST(TideRender, ExtremesLandOnPlotEdges)
{
    const TideSeries s = extremesSeries();
    EXPECT_FLOAT_EQ(s.samples[54].heightFt, 9.2f);    // -180 min
    EXPECT_FLOAT_EQ(s.samples[102].heightFt, 0.3f);   // +300 min

    RecordingSink sink;
    ASSERT_TRUE(TideRender(s, sink));

    const RenderCommand cmd = TideBuildRenderCommand(s, sink.l, sink);
    EXPECT_FLOAT_EQ(cmd.heightMin, 0.3f);
    EXPECT_FLOAT_EQ(cmd.heightMax, 9.2f);
    EXPECT_EQ(cmd.points[54].y, sink.l.topMargin);
    EXPECT_EQ(cmd.points[102].y, sink.l.topMargin + sink.l.usableHeight - 1);

    int minY = cmd.points[0].y;
    int maxY = cmd.points[0].y;
    for (const ChartPoint& p : cmd.points) {
        minY = std::min(minY, p.y);
        maxY = std::max(maxY, p.y);
    }
    EXPECT_EQ(minY, sink.l.topMargin);
    EXPECT_EQ(maxY, sink.l.topMargin + sink.l.usableHeight - 1);

    ASSERT_EQ(sink.lines.size(), TideSeries::SAMPLE_COUNT - 1);
    EXPECT_EQ(sink.lines.front().from.x, 0);
    EXPECT_EQ(sink.lines.back().to.x, sink.l.width - 1);

    ASSERT_EQ(sink.points.size(), 1u);
    EXPECT_EQ(sink.points[0].x, TideMapX(TideSeries::NOW_INDEX, sink.l.width));
    EXPECT_EQ(sink.points[0].y, cmd.points[TideSeries::NOW_INDEX].y);
    EXPECT_EQ(sink.flushes, 1);
}

TEST(TideRender, FlatSeriesGetsMinimumRange)
{
    const TideSeries s = testSeries([](size_t) { return 3.0f; }, SeriesSource::Live);

    float mn = 0.0f;
    float mx = 0.0f;
    TideComputeRange(s, mn, mx);
    EXPECT_FLOAT_EQ(mn, 3.0f);
    EXPECT_FLOAT_EQ(mx, 3.0f + TIDE_MIN_RANGE_FT);

    RecordingSink sink;
    ASSERT_TRUE(TideRender(s, sink));
    for (const ChartSegment& seg : sink.lines) {
        EXPECT_EQ(seg.from.y, sink.l.topMargin + sink.l.usableHeight - 1);
        EXPECT_EQ(seg.to.y, seg.from.y);
    }
    ASSERT_EQ(sink.points.size(), 1u);
}

TEST(TideRender, AxisLabelsAndReadoutArePlaced)
{
    const TideSeries s = extremesSeries();
    RecordingSink sink;
    ASSERT_TRUE(TideRender(s, sink));

    const ChartLabel* past = sink.findText("-12h");
    const ChartLabel* now  = sink.findText("Now");
    const ChartLabel* fut  = sink.findText("+12h");
    ASSERT_NE(past, nullptr);
    ASSERT_NE(now, nullptr);
    ASSERT_NE(fut, nullptr);

    EXPECT_EQ(past->at.x, 0);
    EXPECT_EQ(past->at.y, sink.l.labelY);
    EXPECT_EQ(now->at.x, TideMapX(TideSeries::NOW_INDEX, 400) - 9);
    EXPECT_EQ(fut->at.x, 400 - 4 * RecordingSink::GLYPH_WIDTH);

    const ChartLabel* readout = sink.findText("4.0 ft");
    ASSERT_NE(readout, nullptr);
    EXPECT_EQ(readout->at.x, sink.points[0].x + sink.l.markerRadius + 2);

    EXPECT_EQ(sink.findText(TIDE_OFFLINE_LABEL), nullptr);
}

TEST(TideRender, FallbackShowsOfflineTopRight)
{
    TideSeries s = extremesSeries();
    s.source = SeriesSource::Fallback;

    RecordingSink sink;
    ASSERT_TRUE(TideRender(s, sink));

    const ChartLabel* offline = sink.findText(TIDE_OFFLINE_LABEL);
    ASSERT_NE(offline, nullptr);
    EXPECT_EQ(offline->at.y, 0);
    EXPECT_EQ(offline->at.x, 400 - 7 * RecordingSink::GLYPH_WIDTH);
}

TEST(TideRender, ReadoutFlipsLeftNearRightEdge)
{
    const TideSeries s = extremesSeries();
    RecordingSink sink;
    // Marker sits at x = 72 * 59 / 144 = 29; "4.0 ft" is 36 wide
    sink.l = ChartLayout{60, 100, 10, 70, 85, 10, 4};

    const RenderCommand cmd = TideBuildRenderCommand(s, sink.l, sink);
    const ChartLabel* readout = nullptr;
    for (const ChartLabel& label : cmd.labels) {
        if (label.text == "4.0 ft") readout = &label;
    }
    ASSERT_NE(readout, nullptr);
    EXPECT_EQ(readout->at.x, cmd.marker.x - (sink.l.markerRadius + 2) - 36);
}

TEST(TideRender, CommandHoldsSeriesByReference)
{
    const TideSeries s = extremesSeries();
    RecordingSink sink;
    const RenderCommand cmd = TideBuildRenderCommand(s, sink.l, sink);
    EXPECT_EQ(&cmd.series, &s);
    EXPECT_TRUE(cmd.hasMarker);
    EXPECT_EQ(cmd.points.size(), TideSeries::SAMPLE_COUNT);
    EXPECT_EQ(cmd.segments.size(), TideSeries::SAMPLE_COUNT - 1);
}

TEST(TideRender, FlushFailureIsRenderError)
{
    RecordingSink sink;
    sink.flushResult = false;
    EXPECT_FALSE(TideRender(extremesSeries(), sink));
    EXPECT_EQ(sink.flushes, 1);
}

TEST(TideRender, NoDrawableSegmentIsRenderError)
{
    RecordingSink sink;
    sink.lineResult = false;
    EXPECT_FALSE(TideRender(extremesSeries(), sink));
    EXPECT_EQ(sink.flushes, 0);
}

TEST(TideRender, MalformedSeriesDrawsNothing)
{
    TideSeries bad = extremesSeries();
    bad.samples[7].offsetMinutes = 1;

    RecordingSink sink;
    EXPECT_FALSE(TideRender(bad, sink));
    EXPECT_TRUE(sink.lines.empty());
    EXPECT_TRUE(sink.points.empty());
    EXPECT_EQ(sink.flushes, 0);
}

TEST(TideRender, HeightScaleHasFiveTicksFromMaxToMin)
{
    const TideSeries s = extremesSeries();
    RecordingSink sink;
    const RenderCommand cmd = TideBuildRenderCommand(s, sink.l, sink);

    ASSERT_EQ(cmd.scaleTicks.size(), static_cast<size_t>(TIDE_SCALE_TICKS));
    EXPECT_EQ(cmd.scaleTicks.front().from.y, sink.l.topMargin);
    EXPECT_EQ(cmd.scaleTicks.back().from.y, sink.l.topMargin + sink.l.usableHeight - 1);
    for (const ChartSegment& tick : cmd.scaleTicks) {
        EXPECT_EQ(tick.from.x, 0);
        EXPECT_EQ(tick.to.y, tick.from.y);
        EXPECT_GT(tick.to.x, tick.from.x);
    }

    EXPECT_NEAR(TideScaleHeight(0, 0.3f, 9.2f), 9.2f, 1e-5);
    EXPECT_NEAR(TideScaleHeight(2, 0.3f, 9.2f), 4.75f, 1e-5);
    EXPECT_NEAR(TideScaleHeight(4, 0.3f, 9.2f), 0.3f, 1e-5);

    ASSERT_TRUE(TideRender(s, sink));
    const char* expected[] = {"9", "7", "5", "3", "0"};
    int prevY = -1;
    for (const char* text : expected) {
        const ChartLabel* label = sink.findText(text);
        ASSERT_NE(label, nullptr) << text;
        EXPECT_EQ(label->at.x, sink.l.markerRadius + 2);
        EXPECT_GT(label->at.y, prevY) << text;
        EXPECT_LE(label->at.y, sink.l.labelY - sink.l.lineHeight) << text;
        prevY = label->at.y;
    }
}

TEST(TideRender, HiAndLoFollowTheScaleEnds)
{
    RecordingSink sink;
    ASSERT_TRUE(TideRender(extremesSeries(), sink));

    const ChartLabel* top    = sink.findText("9");
    const ChartLabel* bottom = sink.findText("0");
    const ChartLabel* hi     = sink.findText(TIDE_LABEL_HIGH);
    const ChartLabel* lo     = sink.findText(TIDE_LABEL_LOW);
    ASSERT_NE(top, nullptr);
    ASSERT_NE(bottom, nullptr);
    ASSERT_NE(hi, nullptr);
    ASSERT_NE(lo, nullptr);

    EXPECT_EQ(hi->at.y, top->at.y);
    EXPECT_EQ(hi->at.x, top->at.x + 2 * RecordingSink::GLYPH_WIDTH);
    EXPECT_EQ(lo->at.y, bottom->at.y);
    EXPECT_LT(hi->at.y, lo->at.y);
}

TEST(TideRender, AxesAndDottedNowLineAreDrawnUnderTheCurve)
{
    RecordingSink sink;
    ASSERT_TRUE(TideRender(extremesSeries(), sink));

    const int top    = sink.l.topMargin;
    const int bottom = sink.l.topMargin + sink.l.usableHeight - 1;
    const int nowX   = TideMapX(TideSeries::NOW_INDEX, sink.l.width);

    ASSERT_EQ(sink.guides.size(), 2u + TIDE_SCALE_TICKS + 1u);

    bool yAxis = false;
    bool xAxis = false;
    int dotted = 0;
    for (const RecordingSink::Guide& g : sink.guides) {
        EXPECT_EQ(g.linesBefore, 0u);
        const ChartSegment& seg = g.segment;
        if (g.style == GuideStyle::Dotted) {
            ++dotted;
            EXPECT_EQ(seg.from.x, nowX);
            EXPECT_EQ(seg.to.x, nowX);
            EXPECT_EQ(seg.from.y, top);
            EXPECT_EQ(seg.to.y, bottom);
            continue;
        }
        if (seg.from.x == 0 && seg.to.x == 0 && seg.from.y == top && seg.to.y == bottom) yAxis = true;
        if (seg.from.y == bottom && seg.to.y == bottom &&
            seg.from.x == 0 && seg.to.x == sink.l.width - 1) xAxis = true;
    }
    EXPECT_TRUE(yAxis);
    EXPECT_TRUE(xAxis);
    EXPECT_EQ(dotted, 1);

    // Guides do not count as curve segments
    EXPECT_EQ(sink.lines.size(), TideSeries::SAMPLE_COUNT - 1);
}

TEST(TideRender, FlatSeriesScaleStaysOrdered)
{
    const TideSeries s = testSeries([](size_t) { return 2.0f; }, SeriesSource::Live);
    RecordingSink sink;
    const RenderCommand cmd = TideBuildRenderCommand(s, sink.l, sink);

    ASSERT_EQ(cmd.scaleTicks.size(), static_cast<size_t>(TIDE_SCALE_TICKS));
    for (size_t i = 1; i < cmd.scaleTicks.size(); ++i) {
        EXPECT_GT(cmd.scaleTicks[i].from.y, cmd.scaleTicks[i - 1].from.y);
    }
}
