#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "TideRenderer.h"

// Character-grid target. Row 0 carries the status line, the chart sits
// below it, then an hour-tick row and the axis label row. flush() writes
// the grid to the stream, one line per row.
class TextGridSink : public PixelSink {
public:
    static constexpr int DEFAULT_COLUMNS = 145;   // one column per sample
    static constexpr int DEFAULT_ROWS    = 27;    // status + 24 chart + ticks + labels

    static constexpr const char* CURVE_GLYPH  = "•";
    static constexpr const char* MARKER_GLYPH = "●";
    static constexpr const char* TICK_GLYPH   = "|";
    static constexpr const char* HGUIDE_GLYPH = "-";
    static constexpr const char* VGUIDE_GLYPH = "|";
    static constexpr const char* DOT_GLYPH    = ":";

    TextGridSink(std::ostream& out,
                 int columns = DEFAULT_COLUMNS,
                 int rows    = DEFAULT_ROWS);

    ChartLayout layout() const override;
    int textWidth(const char* text) const override;

    bool drawLine(ChartPoint from, ChartPoint to) override;
    bool drawGuide(ChartPoint from, ChartPoint to, GuideStyle style) override;
    bool drawPoint(ChartPoint at) override;
    bool drawText(ChartPoint topLeft, const char* text) override;
    bool flush() override;

    const std::string& cell(int x, int y) const;
    std::string rowText(int y) const;   // trailing blanks trimmed

private:
    std::ostream& out_;
    int columns_;
    int rows_;
    std::vector<std::string> cells_;    // row-major, one glyph per cell

    bool inBounds(int x, int y) const;
    void put(int x, int y, const char* glyph);
    bool plotLine(ChartPoint from, ChartPoint to, const char* glyph);
    void drawHourTicks();
};
