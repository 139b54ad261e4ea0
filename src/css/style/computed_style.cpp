#include <verso/css/style/computed_style.h>
#include <verso/core/config.h>
#include <unordered_set>

namespace verso::css {

float Length::to_px(float percent_base, float viewport_width, float viewport_height,
                    float font_size, float root_font_size) const {
    switch (unit) {
        case Unit::Px:
            return value;
        case Unit::Em:
            return value * font_size;
        case Unit::Rem:
            return value * root_font_size;
        case Unit::Percent:
            return (value / 100.0f) * percent_base;
        case Unit::Vw:
            return (value / 100.0f) * viewport_width;
        case Unit::Vh:
            return (value / 100.0f) * viewport_height;
        case Unit::Auto:
            return 0;
        case Unit::Zero:
            return 0;
    }
    return 0;
}

bool ComputedStyle::operator==(const ComputedStyle& o) const {
    return display == o.display && position == o.position &&
           top == o.top && right_pos == o.right_pos && bottom == o.bottom &&
           left_pos == o.left_pos && z_index == o.z_index &&
           width == o.width && height == o.height &&
           min_width == o.min_width && max_width == o.max_width &&
           min_height == o.min_height && max_height == o.max_height &&
           margin == o.margin && padding == o.padding &&
           border_top == o.border_top && border_right == o.border_right &&
           border_bottom == o.border_bottom && border_left == o.border_left &&
           color == o.color && background_color == o.background_color &&
           font_family == o.font_family && font_size == o.font_size &&
           font_weight == o.font_weight && font_style == o.font_style &&
           line_height == o.line_height && text_align == o.text_align &&
           text_transform == o.text_transform && white_space == o.white_space &&
           visibility == o.visibility && list_style_type == o.list_style_type &&
           extra_properties == o.extra_properties;
}

ComputedStyle initial_style() {
    ComputedStyle style;
    style.font_size = core::config::kDefaultFontSize;
    style.font_family = core::config::kDefaultFontFamily;
    return style;
}

void inherit_from(ComputedStyle& style, const ComputedStyle& parent) {
    style.color = parent.color;
    style.font_family = parent.font_family;
    style.font_size = parent.font_size;
    style.font_weight = parent.font_weight;
    style.font_style = parent.font_style;
    style.line_height = parent.line_height;
    style.text_align = parent.text_align;
    style.text_transform = parent.text_transform;
    style.white_space = parent.white_space;
    style.visibility = parent.visibility;
    style.list_style_type = parent.list_style_type;
}

bool is_inherited_property(const std::string& property) {
    static const std::unordered_set<std::string> inherited = {
        "color", "font-family", "font-size", "font-weight", "font-style",
        "line-height", "text-align", "text-transform", "white-space",
        "visibility", "list-style-type"
    };
    return inherited.count(property) > 0;
}

const char* display_name(Display display) {
    switch (display) {
        case Display::Block: return "block";
        case Display::Inline: return "inline";
        case Display::InlineBlock: return "inline-block";
        case Display::ListItem: return "list-item";
        case Display::None: return "none";
    }
    return "unknown";
}

const char* position_name(Position position) {
    switch (position) {
        case Position::Static: return "static";
        case Position::Relative: return "relative";
        case Position::Absolute: return "absolute";
        case Position::Fixed: return "fixed";
    }
    return "unknown";
}

} // namespace verso::css
