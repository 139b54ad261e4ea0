#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace verso::paint {

struct Rect {
    float x = 0, y = 0, width = 0, height = 0;
    bool operator==(const Rect& o) const {
        return x == o.x && y == o.y && width == o.width && height == o.height;
    }
};

struct Color {
    uint8_t r = 0, g = 0, b = 0, a = 255;
    static Color from_argb(uint32_t argb) {
        return {
            static_cast<uint8_t>((argb >> 16) & 0xFF),
            static_cast<uint8_t>((argb >> 8) & 0xFF),
            static_cast<uint8_t>(argb & 0xFF),
            static_cast<uint8_t>((argb >> 24) & 0xFF)
        };
    }
    uint32_t to_argb() const {
        return (static_cast<uint32_t>(a) << 24) | (static_cast<uint32_t>(r) << 16) |
               (static_cast<uint32_t>(g) << 8) | b;
    }
    bool operator==(const Color& o) const { return r == o.r && g == o.g && b == o.b && a == o.a; }
    bool operator!=(const Color& o) const { return !(*this == o); }
};

// Per-side stroke style of a DrawBorder command
enum class StrokeStyle { None, Solid, Dashed, Dotted, Double };

struct PaintCommand {
    enum Type { FillRect, DrawBorder, DrawText, DrawPlaceholder };
    Type type;
    Rect bounds;            // absolute logical pixels
    Color color;

    // DrawText
    std::string text;
    float baseline = 0;     // absolute y of the alphabetic baseline
    float font_size = 16.0f;
    int font_weight = 400;
    bool font_italic = false;
    std::string font_family;

    // DrawBorder: top, right, bottom, left
    float border_widths[4] = {0, 0, 0, 0};
    Color border_colors[4];
    StrokeStyle border_styles[4] = {StrokeStyle::None, StrokeStyle::None,
                                    StrokeStyle::None, StrokeStyle::None};

    // DrawPlaceholder: element label, e.g. the tag name
    std::string label;
};

// Ordered paint commands; built once by the Painter, then only read.
class DisplayList {
public:
    void fill_rect(const Rect& rect, const Color& color);
    void draw_border(const Rect& rect, const float widths[4], const Color colors[4],
                     const StrokeStyle styles[4]);
    void draw_text(const std::string& text, const Rect& bounds, float baseline, float font_size,
                   const Color& color, const std::string& font_family = "",
                   int font_weight = 400, bool font_italic = false);
    void draw_placeholder(const Rect& rect, const std::string& label, const Color& color);

    const std::vector<PaintCommand>& commands() const { return commands_; }
    size_t size() const { return commands_.size(); }
    bool empty() const { return commands_.empty(); }
    void clear() { commands_.clear(); }

    // Commands of one type, in paint order
    std::vector<const PaintCommand*> commands_of(PaintCommand::Type type) const;

private:
    std::vector<PaintCommand> commands_;
};

const char* command_type_name(PaintCommand::Type type);

// One line per command, for deterministic comparison in tests and dumps.
std::string serialize_display_list(const DisplayList& list);

} // namespace verso::paint
