#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace verso::css {

// Open enumeration: flex/grid can be added without touching existing cases.
enum class Display { Block, Inline, InlineBlock, ListItem, None };

enum class Position { Static, Relative, Absolute, Fixed };
enum class TextAlign { Left, Right, Center };
enum class TextTransform { None, Capitalize, Uppercase, Lowercase };
enum class FontStyle { Normal, Italic, Oblique };
enum class WhiteSpace { Normal, NoWrap, Pre, PreWrap, PreLine };
enum class Visibility { Visible, Hidden };
enum class ListStyleType { Disc, Circle, Square, Decimal, None };
enum class BorderStyle { None, Solid, Dashed, Dotted, Double };

struct Color {
    uint8_t r = 0, g = 0, b = 0, a = 255;

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }

    bool operator!=(const Color& other) const {
        return !(*this == other);
    }

    bool is_transparent() const { return a == 0; }

    static Color black() { return {0, 0, 0, 255}; }
    static Color white() { return {255, 255, 255, 255}; }
    static Color transparent() { return {0, 0, 0, 0}; }
};

struct Length {
    enum class Unit { Px, Em, Rem, Percent, Vw, Vh, Auto, Zero };
    float value = 0;
    Unit unit = Unit::Px;

    static Length px(float v) { return {v, Unit::Px}; }
    static Length em(float v) { return {v, Unit::Em}; }
    static Length rem(float v) { return {v, Unit::Rem}; }
    static Length percent(float v) { return {v, Unit::Percent}; }
    static Length vw(float v) { return {v, Unit::Vw}; }
    static Length vh(float v) { return {v, Unit::Vh}; }
    static Length auto_val() { return {0, Unit::Auto}; }
    static Length zero() { return {0, Unit::Zero}; }

    bool is_auto() const { return unit == Unit::Auto; }
    bool is_zero() const { return unit == Unit::Zero || (value == 0 && unit != Unit::Auto); }
    bool is_percent() const { return unit == Unit::Percent; }

    bool operator==(const Length& other) const {
        return unit == other.unit && value == other.value;
    }
    bool operator!=(const Length& other) const { return !(*this == other); }

    // Resolves to pixels. `percent_base` is the containing block dimension,
    // `font_size` the element's computed font size. Auto resolves to 0.
    float to_px(float percent_base, float viewport_width, float viewport_height,
                float font_size = 16, float root_font_size = 16) const;
};

struct EdgeSizes {
    Length top, right, bottom, left;

    bool operator==(const EdgeSizes& o) const {
        return top == o.top && right == o.right && bottom == o.bottom && left == o.left;
    }
};

struct BorderEdge {
    Length width = Length::px(3);  // "medium"
    BorderStyle style = BorderStyle::None;
    Color color = Color::black();

    // Used width: a side without a style has no width.
    bool is_visible() const { return style != BorderStyle::None; }

    bool operator==(const BorderEdge& o) const {
        return width == o.width && style == o.style && color == o.color;
    }
};

// line-height: `normal` defers to the measurement provider; a unitless
// number is inherited as the number, a length as the absolute px value.
struct LineHeight {
    enum class Kind { Normal, Number, Px };
    Kind kind = Kind::Normal;
    float value = 0;

    static LineHeight normal() { return {Kind::Normal, 0}; }
    static LineHeight number(float v) { return {Kind::Number, v}; }
    static LineHeight px(float v) { return {Kind::Px, v}; }

    bool operator==(const LineHeight& o) const { return kind == o.kind && value == o.value; }
};

struct ComputedStyle {
    // Display & Position
    Display display = Display::Inline;
    Position position = Position::Static;
    Length top = Length::auto_val();
    Length right_pos = Length::auto_val();
    Length bottom = Length::auto_val();
    Length left_pos = Length::auto_val();
    std::optional<int> z_index;  // nullopt = auto

    // Sizing. Auto for max-width/max-height means "none".
    Length width = Length::auto_val();
    Length height = Length::auto_val();
    Length min_width = Length::zero();
    Length max_width = Length::auto_val();
    Length min_height = Length::zero();
    Length max_height = Length::auto_val();

    // Margin, Padding
    EdgeSizes margin = {Length::zero(), Length::zero(), Length::zero(), Length::zero()};
    EdgeSizes padding = {Length::zero(), Length::zero(), Length::zero(), Length::zero()};

    // Border
    BorderEdge border_top, border_right, border_bottom, border_left;

    // Visual
    Color color = Color::black();
    Color background_color = Color::transparent();

    // Text
    std::string font_family = "sans-serif";
    float font_size = 16;   // absolute px after cascade
    int font_weight = 400;
    FontStyle font_style = FontStyle::Normal;
    LineHeight line_height;
    TextAlign text_align = TextAlign::Left;
    TextTransform text_transform = TextTransform::None;
    WhiteSpace white_space = WhiteSpace::Normal;
    Visibility visibility = Visibility::Visible;
    ListStyleType list_style_type = ListStyleType::Disc;

    // Declarations for properties outside the typed record, last value wins.
    std::map<std::string, std::string> extra_properties;

    bool operator==(const ComputedStyle& other) const;
    bool operator!=(const ComputedStyle& other) const { return !(*this == other); }

    bool is_positioned() const { return position != Position::Static; }
    bool is_out_of_flow() const {
        return position == Position::Absolute || position == Position::Fixed;
    }
    bool is_block_level() const {
        return display == Display::Block || display == Display::ListItem;
    }
};

// Initial values for every property; the style of the document root.
ComputedStyle initial_style();

// Copies the inherited properties of `parent` into `style`.
void inherit_from(ComputedStyle& style, const ComputedStyle& parent);

bool is_inherited_property(const std::string& property);

const char* display_name(Display display);
const char* position_name(Position position);

} // namespace verso::css
