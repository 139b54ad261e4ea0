#include <verso/paint/painter.h>
#include <verso/core/config.h>
#include <verso/layout/box.h>
#include <algorithm>

namespace verso::paint {

namespace {

// Replaced elements are drawn as labelled placeholders
constexpr uint32_t kPlaceholderColor = 0xFFDDDDDD;

Rect to_paint_rect(const layout::Rect& r) {
    return {r.x, r.y, r.width, r.height};
}

StrokeStyle to_stroke_style(css::BorderStyle style) {
    switch (style) {
        case css::BorderStyle::None: return StrokeStyle::None;
        case css::BorderStyle::Solid: return StrokeStyle::Solid;
        case css::BorderStyle::Dashed: return StrokeStyle::Dashed;
        case css::BorderStyle::Dotted: return StrokeStyle::Dotted;
        case css::BorderStyle::Double: return StrokeStyle::Double;
    }
    return StrokeStyle::None;
}

bool is_visible(const css::ComputedStyle* style) {
    return style && style->visibility == css::Visibility::Visible;
}

// Boxes that draw their own background and borders
bool has_own_decorations(const layout::LayoutBox& box) {
    return !box.is_anonymous && !box.is_text && !box.is_root && box.style;
}

bool has_explicit_z_index(const layout::LayoutBox& box) {
    return !box.is_anonymous && box.style && box.style->is_positioned() &&
           box.style->z_index.has_value();
}

} // namespace

Color to_paint_color(const css::Color& color) {
    return {color.r, color.g, color.b, color.a};
}

DisplayList Painter::paint(const layout::LayoutBox& root) {
    DisplayList list;
    paint_box(root, list, 0);
    return list;
}

void Painter::paint_box(const layout::LayoutBox& box, DisplayList& list, int depth) {
    if (depth > core::config::kMaxTreeDepth) return;
    if (box.kind == layout::BoxKind::None) return;

    // visibility:hidden only suppresses the box's own output
    const bool visible = is_visible(box.style);
    if (visible && has_own_decorations(box)) {
        paint_background(box, list);
        paint_borders(box, list);
    }
    if (visible && box.is_replaced) paint_replaced_placeholder(box, list);

    if (!box.lines.empty()) {
        // Inline children decorate below the text of the line boxes
        paint_children(box, list, depth);
        paint_text(box, list);
        if (visible) paint_list_marker(box, list);
        return;
    }

    if (visible) paint_list_marker(box, list);
    paint_children(box, list, depth);
}

void Painter::paint_background(const layout::LayoutBox& box, DisplayList& list) {
    const css::Color& bg = box.style->background_color;
    if (bg.is_transparent()) return;
    if (box.border_rect.empty()) return;
    list.fill_rect(to_paint_rect(box.border_rect), to_paint_color(bg));
}

void Painter::paint_borders(const layout::LayoutBox& box, DisplayList& list) {
    const auto& g = box.geometry;
    const float widths[4] = {g.border.top, g.border.right, g.border.bottom, g.border.left};
    if (widths[0] <= 0 && widths[1] <= 0 && widths[2] <= 0 && widths[3] <= 0) return;

    const css::ComputedStyle& s = *box.style;
    const Color colors[4] = {to_paint_color(s.border_top.color), to_paint_color(s.border_right.color),
                             to_paint_color(s.border_bottom.color), to_paint_color(s.border_left.color)};
    const StrokeStyle styles[4] = {to_stroke_style(s.border_top.style),
                                   to_stroke_style(s.border_right.style),
                                   to_stroke_style(s.border_bottom.style),
                                   to_stroke_style(s.border_left.style)};
    list.draw_border(to_paint_rect(box.border_rect), widths, colors, styles);
}

void Painter::paint_text(const layout::LayoutBox& box, DisplayList& list) {
    for (const auto& line : box.lines) {
        for (const auto& run : line.runs) {
            if (run.kind != layout::RunKind::Word) continue;
            if (!is_visible(run.style)) continue;
            const css::ComputedStyle& s = *run.style;
            list.draw_text(run.text, to_paint_rect(run.rect), run.baseline, s.font_size,
                           to_paint_color(s.color), s.font_family, s.font_weight,
                           s.font_style != css::FontStyle::Normal);
        }
    }
}

void Painter::paint_list_marker(const layout::LayoutBox& box, DisplayList& list) {
    if (!box.marker || !box.marker->style) return;
    const layout::TextRun& marker = *box.marker;
    const css::ComputedStyle& s = *marker.style;
    list.draw_text(marker.text, to_paint_rect(marker.rect), marker.baseline, s.font_size,
                   to_paint_color(s.color), s.font_family, s.font_weight,
                   s.font_style != css::FontStyle::Normal);
}

void Painter::paint_replaced_placeholder(const layout::LayoutBox& box, DisplayList& list) {
    if (box.content_rect.empty()) return;
    list.draw_placeholder(to_paint_rect(box.content_rect), box.tag_name,
                          Color::from_argb(kPlaceholderColor));
}

void Painter::paint_children(const layout::LayoutBox& box, DisplayList& list, int depth) {
    // Separate children into z-ordered layers and normal flow
    std::vector<const layout::LayoutBox*> stacking_negative;     // z-index < 0
    std::vector<const layout::LayoutBox*> stacking_non_negative; // z-index >= 0
    std::vector<const layout::LayoutBox*> normal_flow;           // document order

    for (const auto& child : box.children) {
        const layout::LayoutBox* c = child.get();
        if (has_explicit_z_index(*c)) {
            if (*c->style->z_index < 0) stacking_negative.push_back(c);
            else stacking_non_negative.push_back(c);
        } else {
            normal_flow.push_back(c);
        }
    }

    // Stable sort preserves document order for ties
    auto by_z = [](const layout::LayoutBox* a, const layout::LayoutBox* b) {
        return *a->style->z_index < *b->style->z_index;
    };
    std::stable_sort(stacking_negative.begin(), stacking_negative.end(), by_z);
    std::stable_sort(stacking_non_negative.begin(), stacking_non_negative.end(), by_z);

    for (const auto* c : stacking_negative) paint_box(*c, list, depth + 1);
    for (const auto* c : normal_flow) paint_box(*c, list, depth + 1);
    for (const auto* c : stacking_non_negative) paint_box(*c, list, depth + 1);
}

} // namespace verso::paint
