#include "TextGridSink.h"

#include <stdlib.h>
#include <string.h>

static const std::string BLANK_CELL = " ";

TextGridSink::TextGridSink(std::ostream& out, int columns, int rows)
: out_(out),
  columns_(columns > 0 ? columns : 1),
  rows_(rows > 3 ? rows : 4),
  cells_(static_cast<size_t>(columns_) * static_cast<size_t>(rows_), BLANK_CELL)
{
}

ChartLayout TextGridSink::layout() const
{
    ChartLayout l;
    l.width        = columns_;
    l.height       = rows_;
    l.topMargin    = 1;
    l.usableHeight = rows_ - 3;
    l.labelY       = rows_ - 1;
    l.lineHeight   = 1;
    l.markerRadius = 0;
    return l;
}

int TextGridSink::textWidth(const char* text) const
{
    return text ? static_cast<int>(strlen(text)) : 0;
}

bool TextGridSink::inBounds(int x, int y) const
{
    return x >= 0 && x < columns_ && y >= 0 && y < rows_;
}

void TextGridSink::put(int x, int y, const char* glyph)
{
    cells_[static_cast<size_t>(y) * columns_ + x] = glyph;
}

bool TextGridSink::plotLine(ChartPoint from, ChartPoint to, const char* glyph)
{
    // Bresenham over cells
    int x0 = from.x, y0 = from.y;
    const int x1 = to.x, y1 = to.y;
    const int dx = abs(x1 - x0);
    const int sx = (x0 < x1) ? 1 : -1;
    const int dy = -abs(y1 - y0);
    const int sy = (y0 < y1) ? 1 : -1;
    int err = dx + dy;

    bool any = false;
    for (;;) {
        if (inBounds(x0, y0)) {
            // never paint over the marker
            if (cell(x0, y0) != MARKER_GLYPH) put(x0, y0, glyph);
            any = true;
        }
        if (x0 == x1 && y0 == y1) break;
        int e2 = 2 * err;
        if (e2 >= dy) { err += dy; x0 += sx; }
        if (e2 <= dx) { err += dx; y0 += sy; }
    }
    return any;
}

bool TextGridSink::drawLine(ChartPoint from, ChartPoint to)
{
    return plotLine(from, to, CURVE_GLYPH);
}

bool TextGridSink::drawGuide(ChartPoint from, ChartPoint to, GuideStyle style)
{
    if (style == GuideStyle::Dotted) return plotLine(from, to, DOT_GLYPH);
    return plotLine(from, to, (from.y == to.y) ? HGUIDE_GLYPH : VGUIDE_GLYPH);
}

bool TextGridSink::drawPoint(ChartPoint at)
{
    if (!inBounds(at.x, at.y)) return false;
    put(at.x, at.y, MARKER_GLYPH);
    return true;
}

bool TextGridSink::drawText(ChartPoint topLeft, const char* text)
{
    if (!text || topLeft.y < 0 || topLeft.y >= rows_) return false;

    bool any = false;
    int x = topLeft.x;
    for (const char* p = text; *p; ++p, ++x) {
        if (x < 0 || x >= columns_) continue;
        const char glyph[2] = {*p, '\0'};
        put(x, topLeft.y, glyph);
        any = true;
    }
    return any;
}

void TextGridSink::drawHourTicks()
{
    const int tickRow = rows_ - 2;
    for (int x = 0; x < columns_; x += 6) {
        if (cell(x, tickRow) == BLANK_CELL) put(x, tickRow, TICK_GLYPH);
    }
}

const std::string& TextGridSink::cell(int x, int y) const
{
    if (!inBounds(x, y)) return BLANK_CELL;
    return cells_[static_cast<size_t>(y) * columns_ + x];
}

std::string TextGridSink::rowText(int y) const
{
    int last = columns_ - 1;
    while (last >= 0 && cell(last, y) == BLANK_CELL) --last;

    std::string line;
    for (int x = 0; x <= last; ++x) {
        line += cell(x, y);
    }
    return line;
}

bool TextGridSink::flush()
{
    drawHourTicks();
    for (int y = 0; y < rows_; ++y) {
        out_ << rowText(y) << '\n';
    }
    out_.flush();
    return static_cast<bool>(out_);
}
