#include "CanvasSink.h"
#include "Log.h"

#include <stdio.h>
#include <string.h>

#include <utility>

// -----------------------------------------------------------------------------
// MonoFrame
// -----------------------------------------------------------------------------

bool MonoFrame::isInk(int x, int y) const
{
    if (x < 0 || y < 0 || x >= width || y >= height) return false;
    const uint8_t byte = bits[static_cast<size_t>(y) * stride() + static_cast<size_t>(x) / 8];
    return (byte & (0x80u >> (x & 7))) != 0;
}

size_t MonoFrame::inkCount() const
{
    size_t n = 0;
    for (int y = 0; y < height; ++y)
        for (int x = 0; x < width; ++x)
            if (isInk(x, y)) ++n;
    return n;
}

bool writeMonoFramePbm(const char* path, const MonoFrame& frame)
{
    FILE* f = fopen(path, "wb");
    if (!f) {
        Log.printf("[CanvasSink] writeMonoFramePbm: failed to open %s\n", path);
        return false;
    }

    bool ok = fprintf(f, "P4\n%u %u\n",
                      static_cast<unsigned>(frame.width),
                      static_cast<unsigned>(frame.height)) > 0;
    if (ok) {
        ok = fwrite(frame.bits.data(), 1, frame.bits.size(), f) == frame.bits.size();
    }
    if (fclose(f) != 0) ok = false;

    if (!ok) {
        Log.printf("[CanvasSink] writeMonoFramePbm: write to %s failed\n", path);
        return false;
    }

    Log.printf("[CanvasSink] wrote %ux%u frame to %s\n",
               static_cast<unsigned>(frame.width),
               static_cast<unsigned>(frame.height), path);
    return true;
}

// -----------------------------------------------------------------------------
// CanvasSink
// -----------------------------------------------------------------------------

const lv_font_t* canvasFontForHeight(uint16_t fontHeight)
{
    if (fontHeight < 16) return &lv_font_unscii_8;
    if (fontHeight < 20) return &lv_font_unscii_16;
    return &lv_font_montserrat_20;
}

int canvasMinimumHeight(uint16_t fontHeight)
{
    const int lineH = lv_font_get_line_height(canvasFontForHeight(fontHeight));
    return 2 * (lineH + CanvasSink::MARKER_RADIUS) + CanvasSink::MIN_PLOT_ROWS;
}

CanvasSink::CanvasSink(uint16_t width, uint16_t height, uint16_t fontHeight, FrameWriter writer)
: width_(width),
  height_(height),
  font_(canvasFontForHeight(fontHeight)),
  writer_(std::move(writer))
{
    if (!lv_is_initialized()) {
        lv_init();
    }

    // Canvases need a display to hang off; it is never refreshed.
    disp_ = lv_display_create(width_, height_);
    if (!disp_) {
        Log.println("[CanvasSink] lv_display_create() failed");
        return;
    }

    buf_ = lv_draw_buf_create(width_, height_, LV_COLOR_FORMAT_RGB565, LV_STRIDE_AUTO);
    if (!buf_) {
        Log.printf("[CanvasSink] lv_draw_buf_create(%u x %u) failed\n",
                   static_cast<unsigned>(width_), static_cast<unsigned>(height_));
        return;
    }

    canvas_ = lv_canvas_create(lv_display_get_screen_active(disp_));
    if (!canvas_) {
        Log.println("[CanvasSink] lv_canvas_create() failed");
        return;
    }
    lv_canvas_set_draw_buf(canvas_, buf_);
    clear();

    Log.printf("[CanvasSink] %ux%u canvas ready, font_height %u -> line height %d\n",
               static_cast<unsigned>(width_), static_cast<unsigned>(height_),
               static_cast<unsigned>(fontHeight),
               static_cast<int>(lv_font_get_line_height(font_)));
}

CanvasSink::~CanvasSink()
{
    if (canvas_) lv_obj_delete(canvas_);
    if (disp_)   lv_display_delete(disp_);
    if (buf_)    lv_draw_buf_destroy(buf_);
}

void CanvasSink::clear()
{
    // RGB565 white is 0xFFFF
    memset(buf_->data, 0xFF, static_cast<size_t>(buf_->header.stride) * height_);
}

ChartLayout CanvasSink::layout() const
{
    const int lineH = lv_font_get_line_height(font_);

    ChartLayout l;
    l.width        = width_;
    l.height       = height_;
    l.topMargin    = lineH + MARKER_RADIUS;                // OFFLINE line above the plot
    l.labelY       = height_ - lineH;
    l.usableHeight = l.labelY - MARKER_RADIUS - l.topMargin;
    l.lineHeight   = lineH;
    l.markerRadius = MARKER_RADIUS;
    return l;
}

int CanvasSink::textWidth(const char* text) const
{
    if (!text) return 0;
    return static_cast<int>(lv_text_get_width(text, static_cast<uint32_t>(strlen(text)), font_, 0));
}

bool CanvasSink::intersects(int x1, int y1, int x2, int y2) const
{
    return x2 >= 0 && y2 >= 0 && x1 < width_ && y1 < height_;
}

bool CanvasSink::drawLine(ChartPoint from, ChartPoint to)
{
    if (!canvas_) return false;

    const int minX = (from.x < to.x) ? from.x : to.x;
    const int maxX = (from.x < to.x) ? to.x : from.x;
    const int minY = (from.y < to.y) ? from.y : to.y;
    const int maxY = (from.y < to.y) ? to.y : from.y;
    if (!intersects(minX - LINE_WIDTH, minY - LINE_WIDTH, maxX + LINE_WIDTH, maxY + LINE_WIDTH)) {
        return false;
    }

    lv_layer_t layer;
    lv_canvas_init_layer(canvas_, &layer);

    lv_draw_line_dsc_t dsc;
    lv_draw_line_dsc_init(&dsc);
    dsc.color       = lv_color_black();
    dsc.width       = LINE_WIDTH;
    dsc.round_start = 1;
    dsc.round_end   = 1;
    dsc.p1.x = from.x;
    dsc.p1.y = from.y;
    dsc.p2.x = to.x;
    dsc.p2.y = to.y;
    lv_draw_line(&layer, &dsc);

    lv_canvas_finish_layer(canvas_, &layer);
    return true;
}

bool CanvasSink::drawGuide(ChartPoint from, ChartPoint to, GuideStyle style)
{
    if (!canvas_) return false;

    const int minX = (from.x < to.x) ? from.x : to.x;
    const int maxX = (from.x < to.x) ? to.x : from.x;
    const int minY = (from.y < to.y) ? from.y : to.y;
    const int maxY = (from.y < to.y) ? to.y : from.y;
    if (!intersects(minX, minY, maxX, maxY)) return false;

    lv_layer_t layer;
    lv_canvas_init_layer(canvas_, &layer);

    lv_draw_line_dsc_t dsc;
    lv_draw_line_dsc_init(&dsc);
    dsc.color = lv_color_black();
    dsc.width = GUIDE_WIDTH;
    if (style == GuideStyle::Dotted) {
        // software renderer dashes horizontal and vertical lines only
        dsc.dash_width = DOT_LENGTH;
        dsc.dash_gap   = DOT_LENGTH;
    }
    dsc.p1.x = from.x;
    dsc.p1.y = from.y;
    dsc.p2.x = to.x;
    dsc.p2.y = to.y;
    lv_draw_line(&layer, &dsc);

    lv_canvas_finish_layer(canvas_, &layer);
    return true;
}

bool CanvasSink::drawPoint(ChartPoint at)
{
    if (!canvas_) return false;

    lv_area_t area;
    area.x1 = at.x - MARKER_RADIUS;
    area.y1 = at.y - MARKER_RADIUS;
    area.x2 = at.x + MARKER_RADIUS;
    area.y2 = at.y + MARKER_RADIUS;
    if (!intersects(area.x1, area.y1, area.x2, area.y2)) return false;

    lv_layer_t layer;
    lv_canvas_init_layer(canvas_, &layer);

    lv_draw_rect_dsc_t dsc;
    lv_draw_rect_dsc_init(&dsc);
    dsc.radius       = LV_RADIUS_CIRCLE;
    dsc.bg_color     = lv_color_black();
    dsc.bg_opa       = LV_OPA_COVER;
    dsc.border_width = 0;
    lv_draw_rect(&layer, &dsc, &area);

    lv_canvas_finish_layer(canvas_, &layer);
    return true;
}

bool CanvasSink::drawText(ChartPoint topLeft, const char* text)
{
    if (!canvas_ || !text || !*text) return false;

    lv_area_t area;
    area.x1 = topLeft.x;
    area.y1 = topLeft.y;
    area.x2 = topLeft.x + textWidth(text) - 1;
    area.y2 = topLeft.y + lv_font_get_line_height(font_) - 1;
    if (!intersects(area.x1, area.y1, area.x2, area.y2)) return false;

    lv_layer_t layer;
    lv_canvas_init_layer(canvas_, &layer);

    lv_draw_label_dsc_t dsc;
    lv_draw_label_dsc_init(&dsc);
    dsc.text  = text;
    dsc.font  = font_;
    dsc.color = lv_color_black();
    lv_draw_label(&layer, &dsc, &area);

    // Finishing here keeps `text` alive for the whole draw task.
    lv_canvas_finish_layer(canvas_, &layer);
    return true;
}

bool CanvasSink::flush()
{
    if (!canvas_) {
        Log.println("[CanvasSink] flush: canvas not initialised");
        return false;
    }

    frame_.width  = width_;
    frame_.height = height_;
    frame_.bits.assign(frame_.stride() * height_, 0);

    const uint32_t stride = buf_->header.stride;
    for (int y = 0; y < height_; ++y) {
        const uint16_t* row = reinterpret_cast<const uint16_t*>(buf_->data + static_cast<size_t>(y) * stride);
        uint8_t* out = frame_.bits.data() + static_cast<size_t>(y) * frame_.stride();
        for (int x = 0; x < width_; ++x) {
            const uint16_t px = row[x];
            const unsigned r = ((px >> 11) & 0x1F) << 3;
            const unsigned g = ((px >> 5)  & 0x3F) << 2;
            const unsigned b = (px & 0x1F) << 3;
            const unsigned luma = (r * 299u + g * 587u + b * 114u) / 1000u;
            if (luma < 128u) {
                out[x / 8] |= static_cast<uint8_t>(0x80u >> (x & 7));
            }
        }
    }

    Log.printf("[CanvasSink] flush: %u ink pixels\n", static_cast<unsigned>(frame_.inkCount()));

    if (!writer_) return true;
    return writer_(frame_);
}
