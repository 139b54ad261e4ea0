#pragma once
#include <verso/paint/display_list.h>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace verso::paint {

class SoftwareRenderer;

// Rasterizes one DrawText command into the target. Coordinates in `cmd`
// are logical; multiply by `scale` for device pixels.
using GlyphRasterFn = std::function<void(const PaintCommand& cmd, float scale,
                                         SoftwareRenderer& target)>;

class SoftwareRenderer {
public:
    SoftwareRenderer(int width, int height, float scale = 1.0f);

    // Clears the whole buffer, then replays the display list scaled by the
    // device scale factor.
    void render(const DisplayList& list);

    // Reallocates the buffer; contents are cleared.
    void resize(int width, int height);

    void set_scale(float scale) { scale_ = scale > 0 ? scale : 1.0f; }
    float scale() const { return scale_; }

    void set_clear_color(const Color& color) { clear_color_ = color; }
    const Color& clear_color() const { return clear_color_; }

    // Without a rasterizer, text is drawn as a greeked bar.
    void set_glyph_rasterizer(GlyphRasterFn fn) { glyph_rasterizer_ = std::move(fn); }

    // Clear with a color
    void clear(const Color& color);

    // Get pixel at position
    Color get_pixel(int x, int y) const;

    // Set pixel at position (with alpha blending)
    void set_pixel(int x, int y, const Color& color);

    // Fill a device-pixel rectangle (with alpha blending)
    void fill_device_rect(int x0, int y0, int x1, int y1, const Color& color);

    int width() const { return width_; }
    int height() const { return height_; }

    // Save as binary PPM (P6); returns false on I/O failure
    bool save_ppm(const std::string& filename) const;

    // Get raw pixel buffer (RGBA)
    const std::vector<uint8_t>& pixels() const { return pixels_; }

private:
    int width_, height_;
    float scale_;
    Color clear_color_ = {255, 255, 255, 255};
    std::vector<uint8_t> pixels_;  // RGBA, row-major
    GlyphRasterFn glyph_rasterizer_;

    void draw_filled_rect(const Rect& rect, const Color& color);
    void draw_border(const PaintCommand& cmd);
    void draw_text(const PaintCommand& cmd);
    void draw_placeholder(const PaintCommand& cmd);
    void draw_stroke(int x0, int y0, int x1, int y1, bool horizontal, int thickness,
                     StrokeStyle style, const Color& color);
};

} // namespace verso::paint
