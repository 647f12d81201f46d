#pragma once

#include <stdint.h>
#include <functional>
#include <vector>

#include <lvgl.h>

#include "TideRenderer.h"

// Packed 1 bpp frame as e-paper panels take it: rows of (width+7)/8 bytes,
// MSB is the leftmost pixel, bit set = ink.
struct MonoFrame {
    uint16_t width  = 0;
    uint16_t height = 0;
    std::vector<uint8_t> bits;

    size_t stride() const { return (width + 7u) / 8u; }
    bool isInk(int x, int y) const;
    size_t inkCount() const;
};

// Destination of a finished frame (panel driver, file, test capture).
using FrameWriter = std::function<bool(const MonoFrame&)>;

// Writes frame as a binary PBM (P4) image.
bool writeMonoFramePbm(const char* path, const MonoFrame& frame);

// Bitmap target: draws onto an lvgl canvas with the software renderer and
// thresholds the result into a MonoFrame on flush().
class CanvasSink : public PixelSink {
public:
    static constexpr int LINE_WIDTH    = 2;
    static constexpr int GUIDE_WIDTH   = 1;
    static constexpr int MARKER_RADIUS = 4;
    static constexpr int MIN_PLOT_ROWS = 8;
    static constexpr int DOT_LENGTH    = 4;   // dotted guides: 4 px ink, 4 px gap

    CanvasSink(uint16_t width, uint16_t height, uint16_t fontHeight, FrameWriter writer);
    ~CanvasSink() override;

    CanvasSink(const CanvasSink&) = delete;
    CanvasSink& operator=(const CanvasSink&) = delete;

    bool isReady() const { return canvas_ != nullptr; }

    ChartLayout layout() const override;
    int textWidth(const char* text) const override;

    bool drawLine(ChartPoint from, ChartPoint to) override;
    bool drawGuide(ChartPoint from, ChartPoint to, GuideStyle style) override;
    bool drawPoint(ChartPoint at) override;
    bool drawText(ChartPoint topLeft, const char* text) override;
    bool flush() override;

    // Last frame produced by flush().
    const MonoFrame& frame() const { return frame_; }

private:
    uint16_t width_;
    uint16_t height_;
    const lv_font_t* font_;
    FrameWriter writer_;

    lv_display_t*  disp_   = nullptr;
    lv_obj_t*      canvas_ = nullptr;
    lv_draw_buf_t* buf_    = nullptr;

    MonoFrame frame_;

    bool intersects(int x1, int y1, int x2, int y2) const;
    void clear();
};

// Font used for a configured text height.
const lv_font_t* canvasFontForHeight(uint16_t fontHeight);

// Smallest canvas height whose layout keeps MIN_PLOT_ROWS of plot between
// the status line and the axis labels for this font.
int canvasMinimumHeight(uint16_t fontHeight);
