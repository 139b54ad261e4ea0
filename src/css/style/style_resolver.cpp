#include <verso/css/style/style_resolver.h>
#include <verso/core/diagnostics.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <unordered_map>

namespace verso::css {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\n\r\f");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r\f");
    return s.substr(start, end - start + 1);
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// Splits on whitespace outside parentheses, so "rgb(1, 2, 3)" stays one token.
std::vector<std::string> split_value_tokens(const std::string& value) {
    std::vector<std::string> tokens;
    std::string current;
    int depth = 0;
    for (char c : value) {
        if (c == '(') depth++;
        if (c == ')' && depth > 0) depth--;
        if (depth == 0 && std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) {
                tokens.push_back(current);
                current.clear();
            }
            continue;
        }
        current += c;
    }
    if (!current.empty()) tokens.push_back(current);
    return tokens;
}

// Expands a 1-4 value shorthand to (top, right, bottom, left).
bool expand_edges(const std::vector<std::string>& tokens, std::string out[4]) {
    switch (tokens.size()) {
        case 1:
            out[0] = out[1] = out[2] = out[3] = tokens[0];
            return true;
        case 2:
            out[0] = out[2] = tokens[0];
            out[1] = out[3] = tokens[1];
            return true;
        case 3:
            out[0] = tokens[0];
            out[1] = out[3] = tokens[1];
            out[2] = tokens[2];
            return true;
        case 4:
            for (int i = 0; i < 4; ++i) out[i] = tokens[static_cast<size_t>(i)];
            return true;
        default:
            return false;
    }
}

// em/rem become px; percentages and viewport units stay symbolic for layout.
Length absolutize(Length length, float font_size) {
    if (length.unit == Length::Unit::Em) {
        return Length::px(length.value * font_size);
    }
    if (length.unit == Length::Unit::Rem) {
        return Length::px(length.value * core::config::kRootFontSize);
    }
    return length;
}

std::optional<Length> parse_box_length(const std::string& value, float font_size,
                                       bool allow_negative, bool allow_auto) {
    auto length = parse_length(value);
    if (!length) return std::nullopt;
    if (length->is_auto() && !allow_auto) return std::nullopt;
    if (!allow_negative && length->value < 0) return std::nullopt;
    return absolutize(*length, font_size);
}

std::optional<Length> parse_border_width(const std::string& value, float font_size) {
    std::string v = to_lower(value);
    if (v == "thin") return Length::px(1);
    if (v == "medium") return Length::px(3);
    if (v == "thick") return Length::px(5);
    auto length = parse_length(v);
    if (!length || length->is_auto() || length->is_percent() || length->value < 0) {
        return std::nullopt;
    }
    return absolutize(*length, font_size);
}

std::optional<BorderStyle> parse_border_style(const std::string& value) {
    std::string v = to_lower(value);
    if (v == "none" || v == "hidden") return BorderStyle::None;
    if (v == "solid") return BorderStyle::Solid;
    if (v == "dashed") return BorderStyle::Dashed;
    if (v == "dotted") return BorderStyle::Dotted;
    if (v == "double") return BorderStyle::Double;
    if (v == "groove" || v == "ridge" || v == "inset" || v == "outset") {
        return BorderStyle::Solid;
    }
    return std::nullopt;
}

std::optional<Color> parse_color_with_current(const std::string& value, const Color& current) {
    if (to_lower(value) == "currentcolor") return current;
    return parse_color(value);
}

// Parses "<width> || <style> || <color>" in any order. Missing parts take
// their initial values, color defaulting to currentColor.
std::optional<BorderEdge> parse_border_shorthand(const std::string& value,
                                                 const ComputedStyle& style) {
    BorderEdge edge;
    edge.color = style.color;
    bool has_width = false, has_style = false, has_color = false;
    for (const auto& token : split_value_tokens(value)) {
        if (!has_style) {
            if (auto bs = parse_border_style(token)) {
                edge.style = *bs;
                has_style = true;
                continue;
            }
        }
        if (!has_width) {
            if (auto bw = parse_border_width(token, style.font_size)) {
                edge.width = *bw;
                has_width = true;
                continue;
            }
        }
        if (!has_color) {
            if (auto c = parse_color_with_current(token, style.color)) {
                edge.color = *c;
                has_color = true;
                continue;
            }
        }
        return std::nullopt;
    }
    if (!has_width && !has_style && !has_color) return std::nullopt;
    return edge;
}

BorderEdge* border_side(ComputedStyle& style, const std::string& side) {
    if (side == "top") return &style.border_top;
    if (side == "right") return &style.border_right;
    if (side == "bottom") return &style.border_bottom;
    if (side == "left") return &style.border_left;
    return nullptr;
}

const BorderEdge* border_side(const ComputedStyle& style, const std::string& side) {
    if (side == "top") return &style.border_top;
    if (side == "right") return &style.border_right;
    if (side == "bottom") return &style.border_bottom;
    if (side == "left") return &style.border_left;
    return nullptr;
}

Length* edge_side(EdgeSizes& edges, const std::string& side) {
    if (side == "top") return &edges.top;
    if (side == "right") return &edges.right;
    if (side == "bottom") return &edges.bottom;
    if (side == "left") return &edges.left;
    return nullptr;
}

const Length* edge_side(const EdgeSizes& edges, const std::string& side) {
    if (side == "top") return &edges.top;
    if (side == "right") return &edges.right;
    if (side == "bottom") return &edges.bottom;
    if (side == "left") return &edges.left;
    return nullptr;
}

std::optional<float> parse_number(const std::string& value) {
    if (value.empty()) return std::nullopt;
    char* end = nullptr;
    float num = std::strtof(value.c_str(), &end);
    if (end != value.c_str() + value.size() || !std::isfinite(num)) return std::nullopt;
    return num;
}

std::optional<int> parse_integer(const std::string& value) {
    if (value.empty()) return std::nullopt;
    char* end = nullptr;
    long num = std::strtol(value.c_str(), &end, 10);
    if (end != value.c_str() + value.size()) return std::nullopt;
    // Out of range values (including strtol's ERANGE saturation) clamp to int
    num = std::clamp<long>(num, std::numeric_limits<int>::min(), std::numeric_limits<int>::max());
    return static_cast<int>(num);
}

std::optional<float> parse_font_size(const std::string& value, float parent_size,
                                     float viewport_width, float viewport_height) {
    static const std::unordered_map<std::string, float> keywords = {
        {"xx-small", 9.0f}, {"x-small", 10.0f}, {"small", 13.0f},
        {"medium", 16.0f}, {"large", 18.0f}, {"x-large", 24.0f},
        {"xx-large", 32.0f}, {"xxx-large", 48.0f},
    };
    auto it = keywords.find(value);
    if (it != keywords.end()) return it->second;
    if (value == "smaller") return parent_size / 1.2f;
    if (value == "larger") return parent_size * 1.2f;

    auto length = parse_length(value);
    if (!length || length->is_auto() || length->value < 0) return std::nullopt;
    // em and % refer to the parent's font size here
    return length->to_px(parent_size, viewport_width, viewport_height,
                         parent_size, core::config::kRootFontSize);
}

std::optional<int> parse_font_weight(const std::string& value, int parent_weight) {
    if (value == "normal") return 400;
    if (value == "bold") return 700;
    if (value == "bolder") {
        if (parent_weight < 350) return 400;
        if (parent_weight < 550) return 700;
        return 900;
    }
    if (value == "lighter") {
        if (parent_weight < 550) return 100;
        if (parent_weight < 750) return 400;
        return 700;
    }
    auto num = parse_integer(value);
    if (!num || *num < 1 || *num > 1000) return std::nullopt;
    return *num;
}

std::optional<ListStyleType> parse_list_style_type(const std::string& value) {
    if (value == "disc") return ListStyleType::Disc;
    if (value == "circle") return ListStyleType::Circle;
    if (value == "square") return ListStyleType::Square;
    if (value == "decimal") return ListStyleType::Decimal;
    if (value == "none") return ListStyleType::None;
    return std::nullopt;
}

// Copies one property (longhand or shorthand group) from `src`.
// Returns false for properties outside the typed record.
bool copy_property(ComputedStyle& dst, const ComputedStyle& src, const std::string& prop) {
    if (prop == "display") { dst.display = src.display; return true; }
    if (prop == "position") { dst.position = src.position; return true; }
    if (prop == "top") { dst.top = src.top; return true; }
    if (prop == "right") { dst.right_pos = src.right_pos; return true; }
    if (prop == "bottom") { dst.bottom = src.bottom; return true; }
    if (prop == "left") { dst.left_pos = src.left_pos; return true; }
    if (prop == "z-index") { dst.z_index = src.z_index; return true; }
    if (prop == "width") { dst.width = src.width; return true; }
    if (prop == "height") { dst.height = src.height; return true; }
    if (prop == "min-width") { dst.min_width = src.min_width; return true; }
    if (prop == "max-width") { dst.max_width = src.max_width; return true; }
    if (prop == "min-height") { dst.min_height = src.min_height; return true; }
    if (prop == "max-height") { dst.max_height = src.max_height; return true; }
    if (prop == "margin") { dst.margin = src.margin; return true; }
    if (prop == "padding") { dst.padding = src.padding; return true; }
    if (prop.rfind("margin-", 0) == 0) {
        Length* d = edge_side(dst.margin, prop.substr(7));
        const Length* s = edge_side(src.margin, prop.substr(7));
        if (!d || !s) return false;
        *d = *s;
        return true;
    }
    if (prop.rfind("padding-", 0) == 0) {
        Length* d = edge_side(dst.padding, prop.substr(8));
        const Length* s = edge_side(src.padding, prop.substr(8));
        if (!d || !s) return false;
        *d = *s;
        return true;
    }
    if (prop == "border") {
        dst.border_top = src.border_top;
        dst.border_right = src.border_right;
        dst.border_bottom = src.border_bottom;
        dst.border_left = src.border_left;
        return true;
    }
    if (prop == "border-width" || prop == "border-style" || prop == "border-color") {
        const std::string part = prop.substr(7);
        for (const char* side : {"top", "right", "bottom", "left"}) {
            BorderEdge* d = border_side(dst, side);
            const BorderEdge* s = border_side(src, side);
            if (part == "width") d->width = s->width;
            else if (part == "style") d->style = s->style;
            else d->color = s->color;
        }
        return true;
    }
    if (prop.rfind("border-", 0) == 0) {
        // border-<side> or border-<side>-<part>
        std::string rest = prop.substr(7);
        auto dash = rest.find('-');
        std::string side = rest.substr(0, dash);
        BorderEdge* d = border_side(dst, side);
        const BorderEdge* s = border_side(src, side);
        if (!d || !s) return false;
        if (dash == std::string::npos) { *d = *s; return true; }
        std::string part = rest.substr(dash + 1);
        if (part == "width") { d->width = s->width; return true; }
        if (part == "style") { d->style = s->style; return true; }
        if (part == "color") { d->color = s->color; return true; }
        return false;
    }
    if (prop == "color") { dst.color = src.color; return true; }
    if (prop == "background-color" || prop == "background") {
        dst.background_color = src.background_color;
        return true;
    }
    if (prop == "font-family") { dst.font_family = src.font_family; return true; }
    if (prop == "font-size") { dst.font_size = src.font_size; return true; }
    if (prop == "font-weight") { dst.font_weight = src.font_weight; return true; }
    if (prop == "font-style") { dst.font_style = src.font_style; return true; }
    if (prop == "line-height") { dst.line_height = src.line_height; return true; }
    if (prop == "text-align") { dst.text_align = src.text_align; return true; }
    if (prop == "text-transform") { dst.text_transform = src.text_transform; return true; }
    if (prop == "white-space") { dst.white_space = src.white_space; return true; }
    if (prop == "visibility") { dst.visibility = src.visibility; return true; }
    if (prop == "list-style-type" || prop == "list-style") {
        dst.list_style_type = src.list_style_type;
        return true;
    }
    return false;
}

std::string px_value(float v) {
    std::ostringstream out;
    out << v << "px";
    return out.str();
}

std::unordered_map<std::string, std::vector<Declaration>> build_user_agent_table() {
    std::unordered_map<std::string, std::vector<Declaration>> table;
    auto add = [&table](std::initializer_list<const char*> tags, const std::string& css) {
        auto decls = parse_declaration_block(css);
        for (const char* tag : tags) {
            auto& list = table[tag];
            list.insert(list.end(), decls.begin(), decls.end());
        }
    };

    add({"html", "body", "div", "section", "article", "aside", "nav", "header",
         "footer", "main", "p", "blockquote", "pre", "figure", "figcaption",
         "address", "details", "summary", "dialog", "dd", "dt", "dl",
         "fieldset", "form", "hr", "menu", "center",
         "h1", "h2", "h3", "h4", "h5", "h6", "ul", "ol",
         "table", "thead", "tbody", "tfoot", "tr", "caption"},
        "display: block");
    add({"td", "th"}, "display: inline-block");
    add({"li"}, "display: list-item");

    // Elements that never render
    add({"head", "title", "meta", "link", "style", "script", "base",
         "noscript", "template"},
        "display: none");

    add({"h1"}, "font-size: 2em; font-weight: bold");
    add({"h2"}, "font-size: 1.5em; font-weight: bold");
    add({"h3"}, "font-size: 1.17em; font-weight: bold");
    add({"h4"}, "font-weight: bold");
    add({"h5"}, "font-size: 0.83em; font-weight: bold");
    add({"h6"}, "font-size: 0.67em; font-weight: bold");
    add({"b", "strong", "th"}, "font-weight: bold");
    add({"em", "i", "cite", "var", "dfn"}, "font-style: italic");
    add({"small"}, "font-size: smaller");
    add({"code", "kbd", "samp", "pre"}, "font-family: monospace");
    add({"pre"}, "white-space: pre");
    add({"a"}, "color: #0000ee");
    add({"center"}, "text-align: center");
    add({"hr"}, "border-top: 1px solid gray");

    const std::string indent = "padding-left: " + px_value(core::config::kListIndent);
    add({"ul", "menu"}, indent + "; list-style-type: disc");
    add({"ol"}, indent + "; list-style-type: decimal");
    return table;
}

} // namespace

// ---------------------------------------------------------------------------
// User-agent defaults
// ---------------------------------------------------------------------------

const std::vector<Declaration>& user_agent_declarations(const std::string& tag) {
    static const auto table = build_user_agent_table();
    static const std::vector<Declaration> empty;
    auto it = table.find(tag);
    return it != table.end() ? it->second : empty;
}

// ---------------------------------------------------------------------------
// PropertyCascade
// ---------------------------------------------------------------------------

ComputedStyle PropertyCascade::cascade(
    const std::vector<MatchedRule>& matched_rules,
    const std::vector<Declaration>& user_agent,
    const std::vector<Declaration>& inline_style,
    const ComputedStyle& parent_style,
    core::DiagnosticEmitter* diagnostics) const {

    // Start with initial values, then inherited properties from parent
    ComputedStyle style = initial_style();
    inherit_from(style, parent_style);

    // Build a list of all declarations with their priority
    struct PrioritizedDecl {
        const Declaration* decl;
        Specificity specificity;
        size_t source_order;
        bool important;
        int origin;  // 0 = user agent, 1 = author rule, 2 = inline style
    };

    std::vector<PrioritizedDecl> all_decls;

    for (const auto& decl : user_agent) {
        all_decls.push_back({&decl, Specificity{}, 0, false, 0});
    }
    for (const auto& matched : matched_rules) {
        for (const auto& decl : matched.rule->declarations) {
            all_decls.push_back({
                &decl,
                matched.specificity,
                matched.source_order,
                decl.important,
                1
            });
        }
    }
    for (const auto& decl : inline_style) {
        all_decls.push_back({&decl, Specificity{}, 0, decl.important, 2});
    }

    // Sort by cascade order:
    // 1. !important declarations win over normal
    // 2. Inline style wins over rules, rules over user-agent defaults
    // 3. Higher specificity wins
    // 4. Later source order wins
    std::stable_sort(all_decls.begin(), all_decls.end(),
        [](const PrioritizedDecl& a, const PrioritizedDecl& b) {
            // Sort so that "winning" declarations come LAST
            if (a.important != b.important) {
                return !a.important;  // non-important before important
            }
            if (a.origin != b.origin) {
                return a.origin < b.origin;
            }
            if (!(a.specificity == b.specificity)) {
                return a.specificity < b.specificity;  // lower specificity first
            }
            return a.source_order < b.source_order;  // earlier source first
        });

    auto apply = [&](const PrioritizedDecl& pd) {
        if (!apply_declaration(style, *pd.decl, parent_style) && diagnostics) {
            diagnostics->warn(core::DiagnosticCode::ParseFallback, "css", "cascade",
                              "invalid value \"" + pd.decl->value + "\" for property " +
                                  pd.decl->property + ", declaration ignored");
        }
    };

    // font-size goes first so em lengths resolve against the final font size,
    // then color so currentColor sees the final color
    for (const auto& pd : all_decls) {
        if (pd.decl->property == "font-size") apply(pd);
    }
    for (const auto& pd : all_decls) {
        if (pd.decl->property == "color") apply(pd);
    }
    for (const auto& pd : all_decls) {
        if (pd.decl->property != "font-size" && pd.decl->property != "color") apply(pd);
    }

    return style;
}

bool PropertyCascade::apply_declaration(
    ComputedStyle& style,
    const Declaration& decl,
    const ComputedStyle& parent) const {

    const std::string& prop = decl.property;
    const std::string value_str = trim(decl.value);
    const std::string value_lower = to_lower(value_str);
    if (value_str.empty()) return false;

    // CSS-wide keywords
    if (value_lower == "inherit" || value_lower == "initial" || value_lower == "unset") {
        bool use_parent = value_lower == "inherit" ||
                          (value_lower == "unset" && is_inherited_property(prop));
        static const ComputedStyle initial = initial_style();
        const ComputedStyle& source = use_parent ? parent : initial;
        if (!copy_property(style, source, prop)) {
            auto it = source.extra_properties.find(prop);
            if (it != source.extra_properties.end()) {
                style.extra_properties[prop] = it->second;
            } else {
                style.extra_properties.erase(prop);
            }
        }
        return true;
    }

    // Display & Position
    if (prop == "display") {
        if (value_lower == "block" || value_lower == "flow-root" || value_lower == "flex" ||
            value_lower == "grid" || value_lower == "table") {
            style.display = Display::Block;
        } else if (value_lower == "inline") {
            style.display = Display::Inline;
        } else if (value_lower == "inline-block" || value_lower == "inline-flex" ||
                   value_lower == "inline-grid" || value_lower == "inline-table") {
            style.display = Display::InlineBlock;
        } else if (value_lower == "list-item") {
            style.display = Display::ListItem;
        } else if (value_lower == "none") {
            style.display = Display::None;
        } else {
            return false;
        }
        return true;
    }
    if (prop == "position") {
        if (value_lower == "static") style.position = Position::Static;
        else if (value_lower == "relative") style.position = Position::Relative;
        else if (value_lower == "absolute") style.position = Position::Absolute;
        else if (value_lower == "fixed") style.position = Position::Fixed;
        else return false;
        return true;
    }
    if (prop == "top" || prop == "right" || prop == "bottom" || prop == "left") {
        auto l = parse_box_length(value_lower, style.font_size, true, true);
        if (!l) return false;
        if (prop == "top") style.top = *l;
        else if (prop == "right") style.right_pos = *l;
        else if (prop == "bottom") style.bottom = *l;
        else style.left_pos = *l;
        return true;
    }
    if (prop == "z-index") {
        if (value_lower == "auto") {
            style.z_index.reset();
            return true;
        }
        auto z = parse_integer(value_lower);
        if (!z) return false;
        style.z_index = *z;
        return true;
    }

    // Sizing
    if (prop == "width" || prop == "height") {
        auto l = parse_box_length(value_lower, style.font_size, false, true);
        if (!l) return false;
        (prop == "width" ? style.width : style.height) = *l;
        return true;
    }
    if (prop == "min-width" || prop == "min-height") {
        Length l = Length::zero();
        if (value_lower != "auto") {
            auto parsed = parse_box_length(value_lower, style.font_size, false, false);
            if (!parsed) return false;
            l = *parsed;
        }
        (prop == "min-width" ? style.min_width : style.min_height) = l;
        return true;
    }
    if (prop == "max-width" || prop == "max-height") {
        Length l = Length::auto_val();
        if (value_lower != "none") {
            auto parsed = parse_box_length(value_lower, style.font_size, false, false);
            if (!parsed) return false;
            l = *parsed;
        }
        (prop == "max-width" ? style.max_width : style.max_height) = l;
        return true;
    }

    // Margin, Padding
    if (prop == "margin" || prop == "padding") {
        bool is_margin = prop == "margin";
        std::string parts[4];
        if (!expand_edges(split_value_tokens(value_lower), parts)) return false;
        Length values[4];
        for (int i = 0; i < 4; ++i) {
            auto l = parse_box_length(parts[i], style.font_size, is_margin, is_margin);
            if (!l) return false;
            values[i] = *l;
        }
        EdgeSizes& edges = is_margin ? style.margin : style.padding;
        edges = {values[0], values[1], values[2], values[3]};
        return true;
    }
    if (prop.rfind("margin-", 0) == 0 || prop.rfind("padding-", 0) == 0) {
        bool is_margin = prop[0] == 'm';
        Length* target = edge_side(is_margin ? style.margin : style.padding,
                                   prop.substr(is_margin ? 7 : 8));
        if (!target) {
            style.extra_properties[prop] = value_str;
            return true;
        }
        auto l = parse_box_length(value_lower, style.font_size, is_margin, is_margin);
        if (!l) return false;
        *target = *l;
        return true;
    }

    // Border
    if (prop == "border") {
        auto edge = parse_border_shorthand(value_str, style);
        if (!edge) return false;
        style.border_top = style.border_right = style.border_bottom = style.border_left = *edge;
        return true;
    }
    if (prop == "border-width" || prop == "border-style" || prop == "border-color") {
        std::string parts[4];
        if (!expand_edges(split_value_tokens(value_str), parts)) return false;
        BorderEdge* sides[4] = {&style.border_top, &style.border_right,
                                &style.border_bottom, &style.border_left};
        if (prop == "border-width") {
            Length widths[4];
            for (int i = 0; i < 4; ++i) {
                auto w = parse_border_width(parts[i], style.font_size);
                if (!w) return false;
                widths[i] = *w;
            }
            for (int i = 0; i < 4; ++i) sides[i]->width = widths[i];
        } else if (prop == "border-style") {
            BorderStyle styles[4];
            for (int i = 0; i < 4; ++i) {
                auto s = parse_border_style(parts[i]);
                if (!s) return false;
                styles[i] = *s;
            }
            for (int i = 0; i < 4; ++i) sides[i]->style = styles[i];
        } else {
            Color colors[4];
            for (int i = 0; i < 4; ++i) {
                auto c = parse_color_with_current(parts[i], style.color);
                if (!c) return false;
                colors[i] = *c;
            }
            for (int i = 0; i < 4; ++i) sides[i]->color = colors[i];
        }
        return true;
    }
    if (prop.rfind("border-", 0) == 0) {
        std::string rest = prop.substr(7);
        auto dash = rest.find('-');
        BorderEdge* edge = border_side(style, rest.substr(0, dash));
        if (!edge) {
            // border-radius, border-collapse and friends are not modeled
            style.extra_properties[prop] = value_str;
            return true;
        }
        if (dash == std::string::npos) {
            auto parsed = parse_border_shorthand(value_str, style);
            if (!parsed) return false;
            *edge = *parsed;
            return true;
        }
        std::string part = rest.substr(dash + 1);
        if (part == "width") {
            auto w = parse_border_width(value_lower, style.font_size);
            if (!w) return false;
            edge->width = *w;
            return true;
        }
        if (part == "style") {
            auto s = parse_border_style(value_lower);
            if (!s) return false;
            edge->style = *s;
            return true;
        }
        if (part == "color") {
            auto c = parse_color_with_current(value_lower, style.color);
            if (!c) return false;
            edge->color = *c;
            return true;
        }
        style.extra_properties[prop] = value_str;
        return true;
    }

    // Visual
    if (prop == "color") {
        auto c = parse_color_with_current(value_lower, parent.color);
        if (!c) return false;
        style.color = *c;
        return true;
    }
    if (prop == "background-color") {
        auto c = parse_color_with_current(value_lower, style.color);
        if (!c) return false;
        style.background_color = *c;
        return true;
    }
    if (prop == "background") {
        // Only the color component is modeled; the rest is kept verbatim.
        Color bg = Color::transparent();
        for (const auto& token : split_value_tokens(value_lower)) {
            if (auto c = parse_color_with_current(token, style.color)) bg = *c;
        }
        style.background_color = bg;
        style.extra_properties[prop] = value_str;
        return true;
    }

    // Text
    if (prop == "font-family") {
        style.font_family = value_str;
        return true;
    }
    if (prop == "font-size") {
        auto size = parse_font_size(value_lower, parent.font_size,
                                    viewport_width_, viewport_height_);
        if (!size) return false;
        style.font_size = *size;
        return true;
    }
    if (prop == "font-weight") {
        auto w = parse_font_weight(value_lower, parent.font_weight);
        if (!w) return false;
        style.font_weight = *w;
        return true;
    }
    if (prop == "font-style") {
        if (value_lower == "normal") style.font_style = FontStyle::Normal;
        else if (value_lower == "italic") style.font_style = FontStyle::Italic;
        else if (value_lower.rfind("oblique", 0) == 0) style.font_style = FontStyle::Oblique;
        else return false;
        return true;
    }
    if (prop == "line-height") {
        if (value_lower == "normal") {
            style.line_height = LineHeight::normal();
            return true;
        }
        if (auto n = parse_number(value_lower)) {
            if (*n < 0) return false;
            style.line_height = LineHeight::number(*n);
            return true;
        }
        auto l = parse_length(value_lower);
        if (!l || l->is_auto() || l->value < 0) return false;
        style.line_height = LineHeight::px(
            l->to_px(style.font_size, viewport_width_, viewport_height_,
                     style.font_size, core::config::kRootFontSize));
        return true;
    }
    if (prop == "text-align") {
        if (value_lower == "left" || value_lower == "start" || value_lower == "justify") {
            style.text_align = TextAlign::Left;
        } else if (value_lower == "right" || value_lower == "end") {
            style.text_align = TextAlign::Right;
        } else if (value_lower == "center") {
            style.text_align = TextAlign::Center;
        } else {
            return false;
        }
        return true;
    }
    if (prop == "text-transform") {
        if (value_lower == "none") style.text_transform = TextTransform::None;
        else if (value_lower == "capitalize") style.text_transform = TextTransform::Capitalize;
        else if (value_lower == "uppercase") style.text_transform = TextTransform::Uppercase;
        else if (value_lower == "lowercase") style.text_transform = TextTransform::Lowercase;
        else return false;
        return true;
    }
    if (prop == "white-space") {
        if (value_lower == "normal") style.white_space = WhiteSpace::Normal;
        else if (value_lower == "nowrap") style.white_space = WhiteSpace::NoWrap;
        else if (value_lower == "pre") style.white_space = WhiteSpace::Pre;
        else if (value_lower == "pre-wrap") style.white_space = WhiteSpace::PreWrap;
        else if (value_lower == "pre-line") style.white_space = WhiteSpace::PreLine;
        else return false;
        return true;
    }
    if (prop == "visibility") {
        if (value_lower == "visible") style.visibility = Visibility::Visible;
        else if (value_lower == "hidden" || value_lower == "collapse") {
            style.visibility = Visibility::Hidden;
        } else {
            return false;
        }
        return true;
    }
    if (prop == "list-style-type") {
        auto t = parse_list_style_type(value_lower);
        if (!t) return false;
        style.list_style_type = *t;
        return true;
    }
    if (prop == "list-style") {
        for (const auto& token : split_value_tokens(value_lower)) {
            if (auto t = parse_list_style_type(token)) {
                style.list_style_type = *t;
                return true;
            }
        }
        style.extra_properties[prop] = value_str;
        return true;
    }

    // Everything else (font shorthand, opacity, transforms...) is kept verbatim
    style.extra_properties[prop] = value_str;
    return true;
}

// ---------------------------------------------------------------------------
// StyleResolver
// ---------------------------------------------------------------------------

void StyleResolver::add_stylesheet(const StyleSheet& sheet) {
    size_t total = sheet.rules.size();
    for (const auto& media : sheet.media_rules) total += media.rules.size();
    stylesheets_.push_back({sheet, next_order_base_});
    next_order_base_ += std::max(total, sheet.rule_count());
}

void StyleResolver::clear_stylesheets() {
    stylesheets_.clear();
    next_order_base_ = 0;
}

void StyleResolver::set_viewport(float width, float height) {
    viewport_width_ = width;
    viewport_height_ = height;
    cascade_.set_viewport(width, height);
}

ComputedStyle StyleResolver::resolve(const dom::Document& doc, dom::NodeId node,
                                     const ComputedStyle& parent_style,
                                     core::DiagnosticEmitter* diagnostics) const {
    if (doc.type(node) == dom::NodeType::Document) {
        ComputedStyle root = initial_style();
        root.display = Display::Block;
        return root;
    }
    if (doc.is_text(node)) {
        ComputedStyle text_style = initial_style();
        inherit_from(text_style, parent_style);
        return text_style;
    }

    std::vector<Declaration> inline_decls;
    if (auto style_attr = doc.attribute(node, "style")) {
        inline_decls = parse_declaration_block(*style_attr, diagnostics);
    }
    return cascade_.cascade(collect_matching_rules(doc, node),
                            user_agent_declarations(doc.tag_name(node)),
                            inline_decls, parent_style, diagnostics);
}

std::vector<MatchedRule> StyleResolver::collect_matching_rules(const dom::Document& doc,
                                                               dom::NodeId element) const {
    std::vector<MatchedRule> result;
    if (!doc.is_element(element)) return result;

    for (const auto& entry : stylesheets_) {
        collect_from_rules(entry.sheet.rules, doc, element, entry.order_base, result);
        for (const auto& media : entry.sheet.media_rules) {
            auto active = evaluate_media_condition(media.condition);
            if (active && *active) {
                collect_from_rules(media.rules, doc, element, entry.order_base, result);
            }
        }
    }
    return result;
}

void StyleResolver::collect_from_rules(const std::vector<StyleRule>& rules,
                                       const dom::Document& doc, dom::NodeId element,
                                       size_t order_base,
                                       std::vector<MatchedRule>& result) const {
    for (const auto& rule : rules) {
        bool matched = false;
        Specificity best;
        for (const auto& selector : rule.selectors.selectors) {
            if (!matcher_.matches(doc, element, selector)) continue;
            Specificity spec = compute_specificity(selector);
            if (!matched || best < spec) best = spec;
            matched = true;
        }
        if (matched) {
            result.push_back({&rule, best, order_base + rule.source_order});
        }
    }
}

namespace {

std::optional<float> parse_media_length(const std::string& value) {
    auto length = parse_length(value);
    if (!length || length->is_auto()) return std::nullopt;
    switch (length->unit) {
        case Length::Unit::Px:
        case Length::Unit::Zero:
            return length->value;
        case Length::Unit::Em:
        case Length::Unit::Rem:
            return length->value * core::config::kRootFontSize;
        default:
            return std::nullopt;
    }
}

// One "and"-joined term: a media type or a parenthesized feature.
std::optional<bool> evaluate_media_term(const std::string& term, float width, float height) {
    if (term == "all" || term == "screen") return true;
    if (term == "print" || term == "speech") return false;
    if (term.size() < 2 || term.front() != '(' || term.back() != ')') return std::nullopt;

    std::string inner = trim(term.substr(1, term.size() - 2));
    auto colon = inner.find(':');
    if (colon == std::string::npos) return std::nullopt;
    std::string feature = trim(inner.substr(0, colon));
    auto px = parse_media_length(trim(inner.substr(colon + 1)));
    if (!px) return std::nullopt;

    if (feature == "min-width") return width >= *px;
    if (feature == "max-width") return width <= *px;
    if (feature == "min-height") return height >= *px;
    if (feature == "max-height") return height <= *px;
    return std::nullopt;
}

} // namespace

std::optional<bool> StyleResolver::evaluate_media_condition(const std::string& condition) const {
    std::string cond = trim(to_lower(condition));
    if (cond.empty()) return true;

    // Comma separated queries: any may match
    bool any_true = false;
    std::stringstream queries(cond);
    std::string query;
    while (std::getline(queries, query, ',')) {
        std::string q = trim(query);
        if (q.rfind("only ", 0) == 0) q = trim(q.substr(5));
        if (q.empty()) return std::nullopt;

        bool all_true = true;
        size_t pos = 0;
        while (pos <= q.size()) {
            size_t next = q.find(" and ", pos);
            std::string term = trim(q.substr(pos, next == std::string::npos ? std::string::npos
                                                                            : next - pos));
            auto result = evaluate_media_term(term, viewport_width_, viewport_height_);
            if (!result) return std::nullopt;
            all_true = all_true && *result;
            if (next == std::string::npos) break;
            pos = next + 5;
        }
        any_true = any_true || all_true;
    }
    return any_true;
}

void StyleResolver::report_invalid_media(core::DiagnosticEmitter& diagnostics) const {
    for (const auto& entry : stylesheets_) {
        for (const auto& media : entry.sheet.media_rules) {
            if (!evaluate_media_condition(media.condition)) {
                diagnostics.warn(core::DiagnosticCode::InvalidSelector, "css", "media",
                                 "unsupported media condition \"" + media.condition +
                                     "\", block ignored");
            }
        }
    }
}

// ---------------------------------------------------------------------------
// Whole-document resolution
// ---------------------------------------------------------------------------

StyledTree resolve_tree(const dom::Document& doc, const StyleResolver& resolver,
                        core::DiagnosticEmitter* diagnostics) {
    StyledTree tree;
    tree.styles.resize(doc.size(), initial_style());
    if (diagnostics) resolver.report_invalid_media(*diagnostics);

    const ComputedStyle root_parent = initial_style();
    for (dom::NodeId id : doc.preorder()) {
        dom::NodeId parent = doc.parent(id);
        const ComputedStyle& parent_style =
            parent == dom::kInvalidNode ? root_parent : tree.styles[parent];
        tree.styles[id] = resolver.resolve(doc, id, parent_style, diagnostics);
    }
    return tree;
}

} // namespace verso::css
