#include <verso/paint/software_renderer.h>
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace verso::paint {

namespace {

constexpr uint32_t kPlaceholderOutline = 0xFF999999;

int to_device(float v, float scale) {
    return static_cast<int>(std::lround(v * scale));
}

} // namespace

SoftwareRenderer::SoftwareRenderer(int width, int height, float scale)
    : width_(std::max(0, width)), height_(std::max(0, height)), scale_(scale > 0 ? scale : 1.0f),
      pixels_(static_cast<size_t>(width_) * static_cast<size_t>(height_) * 4, 0) {
}

void SoftwareRenderer::resize(int width, int height) {
    width_ = std::max(0, width);
    height_ = std::max(0, height);
    pixels_.assign(static_cast<size_t>(width_) * static_cast<size_t>(height_) * 4, 0);
}

void SoftwareRenderer::render(const DisplayList& list) {
    // Nothing from a previous frame survives
    clear(clear_color_);
    for (const auto& cmd : list.commands()) {
        switch (cmd.type) {
            case PaintCommand::FillRect:
                draw_filled_rect(cmd.bounds, cmd.color);
                break;
            case PaintCommand::DrawBorder:
                draw_border(cmd);
                break;
            case PaintCommand::DrawText:
                draw_text(cmd);
                break;
            case PaintCommand::DrawPlaceholder:
                draw_placeholder(cmd);
                break;
        }
    }
}

void SoftwareRenderer::clear(const Color& color) {
    for (int i = 0; i < width_ * height_; i++) {
        pixels_[i * 4 + 0] = color.r;
        pixels_[i * 4 + 1] = color.g;
        pixels_[i * 4 + 2] = color.b;
        pixels_[i * 4 + 3] = color.a;
    }
}

Color SoftwareRenderer::get_pixel(int x, int y) const {
    if (x < 0 || x >= width_ || y < 0 || y >= height_) {
        return {0, 0, 0, 0};
    }
    int idx = (y * width_ + x) * 4;
    return {pixels_[idx], pixels_[idx + 1], pixels_[idx + 2], pixels_[idx + 3]};
}

void SoftwareRenderer::set_pixel(int x, int y, const Color& color) {
    if (x < 0 || x >= width_ || y < 0 || y >= height_) return;

    int idx = (y * width_ + x) * 4;

    if (color.a == 255) {
        // Fully opaque: direct write
        pixels_[idx + 0] = color.r;
        pixels_[idx + 1] = color.g;
        pixels_[idx + 2] = color.b;
        pixels_[idx + 3] = 255;
    } else if (color.a == 0) {
        return;
    } else {
        // Alpha blending: result = (src * src_a + dst * (255 - src_a)) / 255
        uint8_t dst_r = pixels_[idx + 0];
        uint8_t dst_g = pixels_[idx + 1];
        uint8_t dst_b = pixels_[idx + 2];
        uint8_t dst_a = pixels_[idx + 3];

        uint16_t src_a = color.a;
        uint16_t inv_a = 255 - src_a;

        pixels_[idx + 0] = static_cast<uint8_t>((color.r * src_a + dst_r * inv_a) / 255);
        pixels_[idx + 1] = static_cast<uint8_t>((color.g * src_a + dst_g * inv_a) / 255);
        pixels_[idx + 2] = static_cast<uint8_t>((color.b * src_a + dst_b * inv_a) / 255);
        pixels_[idx + 3] = static_cast<uint8_t>(std::min(255u, static_cast<unsigned>(src_a) + dst_a));
    }
}

void SoftwareRenderer::fill_device_rect(int x0, int y0, int x1, int y1, const Color& color) {
    x0 = std::max(x0, 0);
    y0 = std::max(y0, 0);
    x1 = std::min(x1, width_);
    y1 = std::min(y1, height_);
    for (int y = y0; y < y1; ++y) {
        for (int x = x0; x < x1; ++x) {
            set_pixel(x, y, color);
        }
    }
}

bool SoftwareRenderer::save_ppm(const std::string& filename) const {
    FILE* f = std::fopen(filename.c_str(), "wb");
    if (!f) return false;

    bool ok = std::fprintf(f, "P6\n%d %d\n255\n", width_, height_) > 0;
    for (int i = 0; ok && i < width_ * height_; i++) {
        uint8_t rgb[3] = {pixels_[i * 4], pixels_[i * 4 + 1], pixels_[i * 4 + 2]};
        ok = std::fwrite(rgb, 1, 3, f) == 3;
    }

    return std::fclose(f) == 0 && ok;
}

void SoftwareRenderer::draw_filled_rect(const Rect& rect, const Color& color) {
    fill_device_rect(to_device(rect.x, scale_), to_device(rect.y, scale_),
                     to_device(rect.x + rect.width, scale_), to_device(rect.y + rect.height, scale_),
                     color);
}

void SoftwareRenderer::draw_stroke(int x0, int y0, int x1, int y1, bool horizontal,
                                   int thickness, StrokeStyle style, const Color& color) {
    if (style == StrokeStyle::None || thickness <= 0) return;

    if (style == StrokeStyle::Double && thickness >= 3) {
        // Two stripes of a third each, separated by a gap
        int stripe = std::max(1, thickness / 3);
        if (horizontal) {
            fill_device_rect(x0, y0, x1, y0 + stripe, color);
            fill_device_rect(x0, y1 - stripe, x1, y1, color);
        } else {
            fill_device_rect(x0, y0, x0 + stripe, y1, color);
            fill_device_rect(x1 - stripe, y0, x1, y1, color);
        }
        return;
    }

    int dash = 0;
    if (style == StrokeStyle::Dashed) dash = thickness * 3;
    else if (style == StrokeStyle::Dotted) dash = thickness;
    if (dash <= 0) {
        fill_device_rect(x0, y0, x1, y1, color);
        return;
    }

    // Alternate painted and skipped segments along the stroke
    if (horizontal) {
        for (int x = x0; x < x1; x += dash * 2) {
            fill_device_rect(x, y0, std::min(x + dash, x1), y1, color);
        }
    } else {
        for (int y = y0; y < y1; y += dash * 2) {
            fill_device_rect(x0, y, x1, std::min(y + dash, y1), color);
        }
    }
}

void SoftwareRenderer::draw_border(const PaintCommand& cmd) {
    const Rect& r = cmd.bounds;
    int left = to_device(r.x, scale_);
    int top = to_device(r.y, scale_);
    int right = to_device(r.x + r.width, scale_);
    int bottom = to_device(r.y + r.height, scale_);

    int bt = to_device(cmd.border_widths[0], scale_);
    int br = to_device(cmd.border_widths[1], scale_);
    int bb = to_device(cmd.border_widths[2], scale_);
    int bl = to_device(cmd.border_widths[3], scale_);

    draw_stroke(left, top, right, top + bt, true, bt, cmd.border_styles[0], cmd.border_colors[0]);
    draw_stroke(right - br, top + bt, right, bottom - bb, false, br, cmd.border_styles[1],
                cmd.border_colors[1]);
    draw_stroke(left, bottom - bb, right, bottom, true, bb, cmd.border_styles[2], cmd.border_colors[2]);
    draw_stroke(left, top + bt, left + bl, bottom - bb, false, bl, cmd.border_styles[3],
                cmd.border_colors[3]);
}

void SoftwareRenderer::draw_text(const PaintCommand& cmd) {
    if (glyph_rasterizer_) {
        glyph_rasterizer_(cmd, scale_, *this);
        return;
    }
    // Greeked text: a bar over the x-height band of the run
    Color bar = cmd.color;
    bar.a = static_cast<uint8_t>(bar.a / 2);
    int x0 = to_device(cmd.bounds.x, scale_);
    int x1 = to_device(cmd.bounds.x + cmd.bounds.width, scale_);
    int y0 = to_device(cmd.baseline - cmd.font_size * 0.5f, scale_);
    int y1 = to_device(cmd.baseline, scale_);
    fill_device_rect(x0, y0, x1, y1, bar);
}

void SoftwareRenderer::draw_placeholder(const PaintCommand& cmd) {
    draw_filled_rect(cmd.bounds, cmd.color);
    PaintCommand outline;
    outline.type = PaintCommand::DrawBorder;
    outline.bounds = cmd.bounds;
    for (int i = 0; i < 4; ++i) {
        outline.border_widths[i] = 1;
        outline.border_colors[i] = Color::from_argb(kPlaceholderOutline);
        outline.border_styles[i] = StrokeStyle::Solid;
    }
    draw_border(outline);
}

} // namespace verso::paint
