#include <verso/layout/layout_engine.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <functional>
#include <iomanip>
#include <sstream>
#include <verso/core/config.h>

namespace verso::layout {

namespace cfg = core::config;

namespace {

constexpr float kMarginCollapseEpsilon = 0.0001f;

// Available width for the first shrink-to-fit pass; wide enough that
// nothing wraps.
constexpr float kShrinkMeasureWidth = 100000.0f;

float collapse_vertical_margins(float first, float second) {
    // Two positive margins keep the larger, two negative ones the more
    // negative, mixed signs add up.
    if (first >= 0 && second >= 0) return std::max(first, second);
    if (first < 0 && second < 0) return std::min(first, second);
    return first + second;
}

bool is_replaced_tag(const std::string& tag) {
    return tag == "img" || tag == "video" || tag == "canvas" || tag == "iframe" ||
           tag == "object" || tag == "embed";
}

BoxKind kind_for_display(css::Display display) {
    switch (display) {
        case css::Display::Block: return BoxKind::Block;
        case css::Display::Inline: return BoxKind::Inline;
        case css::Display::InlineBlock: return BoxKind::InlineBlock;
        case css::Display::ListItem: return BoxKind::ListItem;
        case css::Display::None: return BoxKind::None;
    }
    return BoxKind::Block;
}

// Inline element and text boxes do not shift the coordinates of their
// children; their content lives on the lines of the enclosing block.
bool is_transparent_inline(const LayoutBox& box) {
    return box.is_text || (box.kind == BoxKind::Inline && !box.is_replaced);
}

bool establishes_bfc(const LayoutBox& box) {
    return box.is_root || box.kind == BoxKind::InlineBlock || box.is_replaced ||
           box.is_out_of_flow();
}

bool has_inline_content(const LayoutBox& box) {
    for (const auto& child : box.children) {
        if (child->is_out_of_flow()) continue;
        if (child->is_inline_level()) return true;
    }
    return false;
}

bool is_collapsible_whitespace(const LayoutBox& box, const dom::Document& doc) {
    if (!box.is_text || !box.style) return false;
    if (box.style->white_space != css::WhiteSpace::Normal &&
        box.style->white_space != css::WhiteSpace::NoWrap) {
        return false;
    }
    for (char c : doc.text(box.node)) {
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r' && c != '\f') return false;
    }
    return true;
}

bool is_empty_block_for_margin_collapse(const LayoutBox& box) {
    if (!box.is_block_level() || establishes_bfc(box)) return false;
    const BoxGeometry& g = box.geometry;
    if (g.border.top != 0 || g.border.bottom != 0 || g.padding.top != 0 || g.padding.bottom != 0) {
        return false;
    }
    if (has_inline_content(box)) {
        if (!box.lines.empty()) return false;
    } else {
        for (const auto& child : box.children) {
            if (!child->is_out_of_flow()) return false;
        }
    }
    // The effective box height must be exactly zero before margins can merge.
    return std::abs(g.height) < kMarginCollapseEpsilon;
}

float vertical_extras(const BoxGeometry& g) {
    return g.border.top + g.padding.top + g.padding.bottom + g.border.bottom;
}

std::optional<float> parse_dimension_attribute(const std::optional<std::string>& value) {
    if (!value || value->empty()) return std::nullopt;
    char* end = nullptr;
    float v = std::strtof(value->c_str(), &end);
    if (end == value->c_str() || v < 0) return std::nullopt;
    return v;
}

std::string list_marker_text(css::ListStyleType type, int ordinal) {
    switch (type) {
        case css::ListStyleType::Disc: return "\xE2\x80\xA2";     // U+2022
        case css::ListStyleType::Circle: return "\xE2\x97\xA6";   // U+25E6
        case css::ListStyleType::Square: return "\xE2\x96\xAA";   // U+25AA
        case css::ListStyleType::Decimal: return std::to_string(ordinal) + ".";
        case css::ListStyleType::None: break;
    }
    return {};
}

// Baseline of the first line inside `box`, relative to its content box.
std::optional<float> first_baseline(const LayoutBox& box) {
    if (!box.lines.empty()) return box.lines.front().baseline;
    for (const auto& child : box.children) {
        if (child->is_out_of_flow() || !child->is_block_level()) continue;
        if (auto b = first_baseline(*child)) {
            const BoxGeometry& g = child->geometry;
            return g.y + g.border.top + g.padding.top + *b;
        }
    }
    return std::nullopt;
}

Rect inflate(const Rect& r, const EdgeSizes& e) {
    return {r.x - e.left, r.y - e.top, r.width + e.left + e.right, r.height + e.top + e.bottom};
}

void offset_run(TextRun& run, float dx, float dy) {
    run.rect.x += dx;
    run.rect.y += dy;
    run.baseline += dy;
}

} // namespace

// ---------------------------------------------------------------------------
// Entry point
// ---------------------------------------------------------------------------

LayoutResult LayoutEngine::layout(const dom::Document& doc, const css::StyledTree& styles,
                                  float containing_width, const MeasurementProvider& measurement,
                                  const LayoutOptions& options) {
    LayoutResult result;
    MetricResolver metrics(measurement, &result.diagnostics);

    containing_width = std::max(0.0f, containing_width);
    doc_ = &doc;
    styles_ = &styles;
    metrics_ = &metrics;
    diagnostics_ = &result.diagnostics;
    depth_reported_ = false;
    viewport_width_ = options.viewport_width > 0 ? options.viewport_width : containing_width;
    viewport_height_ = options.viewport_height > 0
        ? options.viewport_height
        : static_cast<float>(cfg::kDefaultViewportHeight);

    result.root = build_box(doc.root(), 0);
    if (!result.root) {
        // Styles that do not cover the document; lay out an empty root.
        report(core::DiagnosticCode::ParseFallback, "build",
               "styled tree does not cover the document root");
        result.root = std::make_unique<LayoutBox>();
        result.root->is_root = true;
        result.root->node = doc.root();
    }

    // The root box is the initial containing block.
    BlockInput input;
    input.containing_width = containing_width;
    input.containing_height = viewport_height_;
    input.width = containing_width;
    input.height = viewport_height_;
    layout_block(*result.root, input);
    position_fixed_boxes(*result.root, 0, 0);
    finalize(*result.root, 0, 0, nullptr);

    doc_ = nullptr;
    styles_ = nullptr;
    metrics_ = nullptr;
    diagnostics_ = nullptr;
    return result;
}

void LayoutEngine::report(core::DiagnosticCode code, const std::string& stage,
                          const std::string& message) {
    if (diagnostics_) diagnostics_->warn(code, "layout", stage, message);
}

float LayoutEngine::resolve(const css::Length& length, float percent_base,
                            const css::ComputedStyle& style, const char* what) {
    if (length.is_percent() && percent_base < 0) {
        std::ostringstream msg;
        msg << what << ": " << length.value << "% has no definite base, using 0";
        report(core::DiagnosticCode::UnresolvedDimension, what, msg.str());
        return 0;
    }
    return length.to_px(percent_base, viewport_width_, viewport_height_, style.font_size,
                        cfg::kRootFontSize);
}

// ---------------------------------------------------------------------------
// Box tree construction
// ---------------------------------------------------------------------------

std::unique_ptr<LayoutBox> LayoutEngine::build_box(dom::NodeId node, int depth) {
    if (depth > cfg::kMaxTreeDepth) {
        if (!depth_reported_) {
            depth_reported_ = true;
            report(core::DiagnosticCode::ParseFallback, "build",
                   "document deeper than " + std::to_string(cfg::kMaxTreeDepth) +
                   " levels, deeper nodes are not rendered");
        }
        return nullptr;
    }
    if (node >= styles_->size()) return nullptr;

    const css::ComputedStyle& style = styles_->style(node);
    auto box = std::make_unique<LayoutBox>();
    box->node = node;
    box->style = &style;

    switch (doc_->type(node)) {
        case dom::NodeType::Document:
            box->kind = BoxKind::Block;
            box->is_root = true;
            break;
        case dom::NodeType::Text:
            box->kind = BoxKind::Inline;
            box->is_text = true;
            return box;
        case dom::NodeType::Element:
            if (style.display == css::Display::None) return nullptr;
            box->tag_name = doc_->tag_name(node);
            box->kind = kind_for_display(style.display);
            box->is_replaced = is_replaced_tag(box->tag_name);
            // Out-of-flow boxes are blockified
            if (style.is_out_of_flow() &&
                (box->kind == BoxKind::Inline || box->kind == BoxKind::InlineBlock)) {
                box->kind = BoxKind::Block;
            }
            break;
    }

    // Replaced content is opaque
    if (box->is_replaced) return box;

    int ordinal = 1;
    if (box->tag_name == "ol") {
        if (auto start = doc_->attribute(node, "start")) {
            char* end = nullptr;
            long v = std::strtol(start->c_str(), &end, 10);
            if (end != start->c_str()) ordinal = static_cast<int>(v);
        }
    }

    for (dom::NodeId child = doc_->first_child(node); child != dom::kInvalidNode;
         child = doc_->next_sibling(child)) {
        auto child_box = build_box(child, depth + 1);
        if (!child_box) continue;
        if (child_box->kind == BoxKind::ListItem) child_box->list_ordinal = ordinal++;
        child_box->parent = box.get();
        box->children.push_back(std::move(child_box));
    }

    normalize_children(*box);
    return box;
}

void LayoutEngine::normalize_children(LayoutBox& box) {
    if (box.is_text || box.is_replaced) return;

    bool has_block = false;
    bool has_inline = false;
    for (const auto& child : box.children) {
        if (child->is_out_of_flow()) continue;
        if (child->is_block_level()) has_block = true;
        else has_inline = true;
    }

    if (box.kind == BoxKind::Inline) {
        if (!has_block) return;
        // An inline element holding blocks is laid out as a block container.
        box.kind = BoxKind::Block;
    }
    if (!has_block || !has_inline) return;

    // Wrap consecutive runs of inline children into anonymous block boxes so
    // that the container only has block-level children.
    std::vector<std::unique_ptr<LayoutBox>> new_children;
    std::vector<std::unique_ptr<LayoutBox>> inline_run;

    auto flush_inline_run = [&]() {
        if (inline_run.empty()) return;
        bool whitespace_only = std::all_of(
            inline_run.begin(), inline_run.end(),
            [this](const std::unique_ptr<LayoutBox>& b) { return is_collapsible_whitespace(*b, *doc_); });
        if (whitespace_only) {
            inline_run.clear();
            return;
        }
        auto anon = std::make_unique<LayoutBox>();
        anon->kind = BoxKind::Block;
        anon->is_anonymous = true;
        anon->style = box.style;
        anon->parent = &box;
        for (auto& ic : inline_run) {
            ic->parent = anon.get();
            anon->children.push_back(std::move(ic));
        }
        inline_run.clear();
        new_children.push_back(std::move(anon));
    };

    for (auto& child : box.children) {
        if (child->is_out_of_flow()) {
            // Out of flow; keep in place
            new_children.push_back(std::move(child));
        } else if (child->is_block_level()) {
            flush_inline_run();
            new_children.push_back(std::move(child));
        } else {
            inline_run.push_back(std::move(child));
        }
    }
    flush_inline_run();
    box.children = std::move(new_children);
}

// ---------------------------------------------------------------------------
// Sizing
// ---------------------------------------------------------------------------

void LayoutEngine::resolve_edges(LayoutBox& box, float containing_width) {
    BoxGeometry& g = box.geometry;
    g.x = 0;
    g.y = 0;
    g.margin = {};
    g.border = {};
    g.padding = {};
    if (box.is_anonymous || box.is_text || !box.style) return;

    const css::ComputedStyle& s = *box.style;
    auto margin = [&](const css::Length& l) {
        return l.is_auto() ? 0.0f : resolve(l, containing_width, s, "margin");
    };
    auto padding = [&](const css::Length& l) {
        return std::max(0.0f, resolve(l, containing_width, s, "padding"));
    };
    auto border = [&](const css::BorderEdge& e) {
        return e.is_visible() ? std::max(0.0f, resolve(e.width, containing_width, s, "border"))
                              : 0.0f;
    };

    g.margin = {margin(s.margin.top), margin(s.margin.right), margin(s.margin.bottom),
                margin(s.margin.left)};
    g.padding = {padding(s.padding.top), padding(s.padding.right), padding(s.padding.bottom),
                 padding(s.padding.left)};
    g.border = {border(s.border_top), border(s.border_right), border(s.border_bottom),
                border(s.border_left)};
}

float LayoutEngine::clamp_width(const LayoutBox& box, float width, float containing_width) {
    if (box.is_anonymous || !box.style) return width;
    const css::ComputedStyle& s = *box.style;
    if (!s.max_width.is_auto()) {
        width = std::min(width, resolve(s.max_width, containing_width, s, "max-width"));
    }
    width = std::max(width, resolve(s.min_width, containing_width, s, "min-width"));
    return width;
}

float LayoutEngine::clamp_height(const LayoutBox& box, float height, float containing_height) {
    if (box.is_anonymous || !box.style) return height;
    const css::ComputedStyle& s = *box.style;
    // A percentage max-height without a definite base behaves as none
    if (!s.max_height.is_auto() && !(s.max_height.is_percent() && containing_height < 0)) {
        height = std::min(height, resolve(s.max_height, containing_height, s, "max-height"));
    }
    height = std::max(height, resolve(s.min_height, containing_height, s, "min-height"));
    return height;
}

float LayoutEngine::compute_width(LayoutBox& box, float containing_width) {
    BoxGeometry& g = box.geometry;
    const float extras = g.horizontal_extras();
    if (box.is_anonymous || !box.style) {
        return std::max(0.0f, containing_width - extras);
    }

    const css::ComputedStyle& s = *box.style;
    float w;
    if (s.width.is_auto()) {
        // Fill the containing block
        w = containing_width - g.margin.left - g.margin.right - extras;
    } else {
        w = resolve(s.width, containing_width, s, "width");
    }
    w = std::max(0.0f, clamp_width(box, w, containing_width));

    // Auto horizontal margins take up the remaining space
    if (box.is_block_level() && !box.is_out_of_flow()) {
        float remaining = containing_width - w - extras - g.margin.left - g.margin.right;
        if (remaining > 0) {
            bool left_auto = s.margin.left.is_auto();
            bool right_auto = s.margin.right.is_auto();
            if (left_auto && right_auto) {
                g.margin.left += remaining / 2.0f;
                g.margin.right += remaining / 2.0f;
            } else if (left_auto) {
                g.margin.left += remaining;
            } else if (right_auto) {
                g.margin.right += remaining;
            }
        }
    }
    return w;
}

std::optional<float> LayoutEngine::definite_height(const LayoutBox& box, const BlockInput& input) {
    if (input.height) return *input.height;
    if (box.is_anonymous || box.is_root || !box.style) return std::nullopt;

    const css::ComputedStyle& s = *box.style;
    if (s.height.is_auto()) return std::nullopt;
    if (s.height.is_percent() && input.containing_height < 0) {
        // Falls back to auto
        std::ostringstream msg;
        msg << "height: " << s.height.value << "% without a definite containing height, using auto";
        report(core::DiagnosticCode::UnresolvedDimension, "height", msg.str());
        return std::nullopt;
    }
    float h = resolve(s.height, input.containing_height, s, "height");
    return std::max(0.0f, clamp_height(box, h, input.containing_height));
}

float LayoutEngine::replaced_width(const LayoutBox& box, float containing_width) {
    float w = cfg::kReplacedPlaceholderWidth;
    if (box.style && !box.style->width.is_auto()) {
        w = resolve(box.style->width, containing_width, *box.style, "width");
    } else if (auto attr = parse_dimension_attribute(doc_->attribute(box.node, "width"))) {
        w = *attr;
    }
    return std::max(0.0f, clamp_width(box, w, containing_width));
}

float LayoutEngine::replaced_height(const LayoutBox& box, float containing_height) {
    float h = cfg::kReplacedPlaceholderHeight;
    if (auto attr = parse_dimension_attribute(doc_->attribute(box.node, "height"))) {
        h = *attr;
    }
    return std::max(0.0f, clamp_height(box, h, containing_height));
}

// ---------------------------------------------------------------------------
// Block layout
// ---------------------------------------------------------------------------

void LayoutEngine::layout_block(LayoutBox& box, const BlockInput& input) {
    box.lines.clear();
    box.marker.reset();

    resolve_edges(box, input.containing_width);

    float width;
    if (input.width) {
        width = *input.width;
    } else if (box.is_replaced) {
        width = replaced_width(box, input.containing_width);
    } else {
        width = compute_width(box, input.containing_width);
    }
    box.geometry.width = std::max(0.0f, width);

    std::optional<float> fixed_height = definite_height(box, input);
    const float child_containing_height = fixed_height ? *fixed_height : -1.0f;

    float content_height;
    if (box.is_replaced) {
        content_height = replaced_height(box, input.containing_height);
    } else if (has_inline_content(box)) {
        content_height = layout_inline_content(box, child_containing_height);
    } else {
        content_height = position_block_children(box, child_containing_height, !fixed_height);
    }

    float height = fixed_height ? *fixed_height
                                : clamp_height(box, content_height, input.containing_height);
    box.geometry.height = std::max(0.0f, height);

    if (box.is_root || (!box.is_anonymous && box.style && box.style->is_positioned())) {
        position_absolute_children(box);
    }
    if (box.kind == BoxKind::ListItem) place_marker(box);
}

void LayoutEngine::layout_shrink_to_fit(LayoutBox& box, const BlockInput& input, float available) {
    // First pass at an unconstrained width measures the preferred width.
    core::DiagnosticEmitter* saved = diagnostics_;
    diagnostics_ = nullptr;
    metrics_->set_diagnostics(nullptr);
    BlockInput unconstrained = input;
    unconstrained.width = kShrinkMeasureWidth;
    layout_block(box, unconstrained);
    diagnostics_ = saved;
    metrics_->set_diagnostics(saved);

    const BoxGeometry& g = box.geometry;
    float avail = std::max(0.0f, available - g.margin.left - g.margin.right - g.horizontal_extras());
    float w = std::min(max_content_width(box), avail);
    w = std::max(0.0f, clamp_width(box, w, input.containing_width));

    BlockInput final_input = input;
    final_input.width = w;
    layout_block(box, final_input);
}

void LayoutEngine::layout_atomic(LayoutBox& box, float containing_width, float containing_height) {
    BlockInput input;
    input.containing_width = containing_width;
    input.containing_height = containing_height;
    if (box.is_replaced || (box.style && !box.style->width.is_auto())) {
        layout_block(box, input);
    } else {
        layout_shrink_to_fit(box, input, containing_width);
    }
}

float LayoutEngine::position_block_children(LayoutBox& box, float containing_height,
                                            bool height_auto) {
    const float content_w = box.geometry.width;

    float cursor_y = 0;
    float prev_margin_bottom = 0; // Track previous sibling's bottom margin for collapsing
    bool first_child = true;
    for (auto& child_ptr : box.children) {
        LayoutBox& child = *child_ptr;
        if (child.is_out_of_flow()) {
            child.static_x = 0;
            child.static_y = cursor_y;
            continue;
        }

        BlockInput input;
        input.containing_width = content_w;
        input.containing_height = containing_height;
        layout_block(child, input);

        float top_margin = child.geometry.margin.top;
        float bottom_margin = child.geometry.margin.bottom;

        bool child_is_empty = is_empty_block_for_margin_collapse(child);

        // Empty blocks collapse their own top and bottom margins into one.
        if (child_is_empty) {
            top_margin = collapse_vertical_margins(top_margin, bottom_margin);
        }

        // Parent-child top margin collapsing applies only to the first in-flow
        // child and only when no BFC boundary exists between them.
        bool collapse_with_parent = first_child && !establishes_bfc(box) &&
            box.geometry.border.top == 0 && box.geometry.padding.top == 0;
        float carried_margin = top_margin;

        if (collapse_with_parent) {
            // The child's top margin escapes to the parent margin.
            box.geometry.margin.top = collapse_vertical_margins(box.geometry.margin.top, top_margin);
            child.geometry.y = cursor_y;
        } else if (!first_child) {
            // Adjacent siblings collapse to a single margin, replacing the
            // prior cursor advance by the collapsed value.
            float collapsed = collapse_vertical_margins(prev_margin_bottom, top_margin);
            cursor_y -= prev_margin_bottom;
            child.geometry.y = cursor_y + collapsed;
            carried_margin = collapsed;
        } else {
            child.geometry.y = cursor_y + top_margin;
        }
        child.geometry.x = child.geometry.margin.left;

        if (child_is_empty && collapse_with_parent) {
            // Its margins already joined the parent's; the next child still
            // adjoins the parent's top edge.
            cursor_y = child.geometry.y;
            apply_positioning(child, content_w, containing_height);
            continue;
        }
        if (child_is_empty) {
            // Empty block contributes only its collapsed own margin
            // to the next in-flow block.
            prev_margin_bottom = carried_margin;
            cursor_y = child.geometry.y;
        } else {
            cursor_y = child.geometry.y + child.geometry.border_box_height() + bottom_margin;
            prev_margin_bottom = bottom_margin;
        }
        first_child = false;

        apply_positioning(child, content_w, containing_height);
    }

    // Parent-child bottom margin collapsing: the last child's bottom margin
    // joins the parent's when nothing separates them.
    float content_height = cursor_y;
    if (!first_child && height_auto && !establishes_bfc(box) &&
        box.geometry.border.bottom == 0 && box.geometry.padding.bottom == 0) {
        box.geometry.margin.bottom =
            collapse_vertical_margins(box.geometry.margin.bottom, prev_margin_bottom);
        content_height = cursor_y - prev_margin_bottom;
    }
    return std::max(0.0f, content_height);
}

// ---------------------------------------------------------------------------
// Inline formatting context
// ---------------------------------------------------------------------------

void LayoutEngine::collect_inline_items(LayoutBox& parent, float containing_width,
                                        float containing_height,
                                        std::vector<InlineItem>& items,
                                        std::vector<LayoutBox*>& atomics) {
    for (auto& child_ptr : parent.children) {
        LayoutBox& child = *child_ptr;
        if (child.is_out_of_flow()) {
            child.static_x = 0;
            child.static_y = 0;
            continue;
        }

        InlineItem item;
        item.node = child.node;
        item.style = child.style;

        if (child.is_text) {
            item.kind = InlineItem::Kind::Text;
            item.text = doc_->text(child.node);
            items.push_back(std::move(item));
            continue;
        }
        if (child.is_atomic_inline()) {
            layout_atomic(child, containing_width, containing_height);
            item.kind = InlineItem::Kind::Atomic;
            item.atomic = &child;
            items.push_back(std::move(item));
            atomics.push_back(&child);
            continue;
        }

        child.lines.clear();
        if (child.tag_name == "br") {
            child.geometry = BoxGeometry{};
            item.kind = InlineItem::Kind::ForcedBreak;
            items.push_back(std::move(item));
            continue;
        }

        // Vertical edges only paint; horizontal ones also take line space
        resolve_edges(child, containing_width);
        const BoxGeometry& g = child.geometry;
        const float start = g.margin.left + g.border.left + g.padding.left;
        const float end = g.padding.right + g.border.right + g.margin.right;
        if (start != 0) {
            InlineItem edge = item;
            edge.kind = InlineItem::Kind::Edge;
            edge.width = start;
            items.push_back(std::move(edge));
        }
        collect_inline_items(child, containing_width, containing_height, items, atomics);
        if (end != 0) {
            item.kind = InlineItem::Kind::Edge;
            item.width = end;
            items.push_back(std::move(item));
        }
    }
}

float LayoutEngine::layout_inline_content(LayoutBox& box, float containing_height) {
    std::vector<InlineItem> items;
    std::vector<LayoutBox*> atomics;
    collect_inline_items(box, box.geometry.width, containing_height, items, atomics);

    std::vector<InlineToken> tokens = tokenize_inline(items, *metrics_);

    LineBreakOptions options;
    options.available_width = box.geometry.width;
    if (box.style) {
        options.text_align = box.style->text_align;
        LineMetrics strut = metrics_->line_metrics(FontDescriptor::from_style(*box.style));
        options.strut_ascent = strut.ascent;
        options.strut_descent = strut.descent;
        options.strut_line_height = metrics_->line_height(*box.style);
    }
    LineLayout laid_out = break_lines(tokens, options);

    // Atomic inlines take the position of their run
    for (const auto& line : laid_out.lines) {
        for (const auto& run : line.runs) {
            if (run.kind != RunKind::Atomic || !run.atomic) continue;
            auto it = std::find(atomics.begin(), atomics.end(), run.atomic);
            if (it == atomics.end()) continue;
            LayoutBox& atomic = **it;
            atomic.geometry.x = run.rect.x + atomic.geometry.margin.left;
            atomic.geometry.y = run.rect.y + atomic.geometry.margin.top;
            apply_positioning(atomic, box.geometry.width, containing_height);
        }
    }

    box.lines = std::move(laid_out.lines);
    return laid_out.height;
}

// ---------------------------------------------------------------------------
// Positioning
// ---------------------------------------------------------------------------

void LayoutEngine::apply_positioning(LayoutBox& box, float containing_width,
                                     float containing_height) {
    if (box.is_anonymous || !box.style || box.style->position != css::Position::Relative) return;
    const css::ComputedStyle& s = *box.style;
    if (!s.top.is_auto()) box.geometry.y += resolve(s.top, containing_height, s, "top");
    else if (!s.bottom.is_auto()) box.geometry.y -= resolve(s.bottom, containing_height, s, "bottom");
    if (!s.left_pos.is_auto()) box.geometry.x += resolve(s.left_pos, containing_width, s, "left");
    else if (!s.right_pos.is_auto()) box.geometry.x -= resolve(s.right_pos, containing_width, s, "right");
}

void LayoutEngine::position_absolute_children(LayoutBox& box) {
    struct AbsInfo {
        LayoutBox* child;
        float parent_offset_x;
        float parent_offset_y;
    };
    std::vector<AbsInfo> abs_children;

    std::function<void(LayoutBox&, float, float)> collect_abs =
        [&](LayoutBox& parent, float offset_x, float offset_y) {
        for (auto& c : parent.children) {
            if (c->is_out_of_flow()) {
                // Fixed boxes are handled against the viewport
                if (c->style->position == css::Position::Absolute) {
                    abs_children.push_back({c.get(), offset_x, offset_y});
                }
                continue;
            }
            if (is_transparent_inline(*c)) {
                collect_abs(*c, offset_x, offset_y);
                continue;
            }
            // Positioned descendants establish their own containing block.
            if (!c->is_anonymous && c->style && c->style->is_positioned()) continue;
            const BoxGeometry& g = c->geometry;
            collect_abs(*c, offset_x + g.x + g.border.left + g.padding.left,
                        offset_y + g.y + g.border.top + g.padding.top);
        }
    };
    collect_abs(box, 0, 0);

    // The containing block is the padding box
    const BoxGeometry& g = box.geometry;
    for (const auto& info : abs_children) {
        Rect reference{-info.parent_offset_x - g.padding.left,
                       -info.parent_offset_y - g.padding.top,
                       g.width + g.padding.left + g.padding.right,
                       g.height + g.padding.top + g.padding.bottom};
        layout_out_of_flow(*info.child, reference);
    }
}

void LayoutEngine::layout_out_of_flow(LayoutBox& box, const Rect& reference) {
    const css::ComputedStyle& s = *box.style;
    auto inset = [&](const css::Length& l, float base, const char* what) -> std::optional<float> {
        if (l.is_auto()) return std::nullopt;
        return resolve(l, base, s, what);
    };
    std::optional<float> left = inset(s.left_pos, reference.width, "left");
    std::optional<float> right = inset(s.right_pos, reference.width, "right");
    std::optional<float> top = inset(s.top, reference.height, "top");
    std::optional<float> bottom = inset(s.bottom, reference.height, "bottom");

    BlockInput input;
    input.containing_width = reference.width;
    input.containing_height = reference.height;

    resolve_edges(box, reference.width);
    const BoxGeometry& g = box.geometry;
    if (s.height.is_auto() && top && bottom) {
        input.height = std::max(0.0f, reference.height - *top - *bottom - g.margin.top -
                                          g.margin.bottom - vertical_extras(g));
    }

    if (!box.is_replaced && s.width.is_auto()) {
        if (left && right) {
            float w = reference.width - *left - *right - g.margin.left - g.margin.right -
                      g.horizontal_extras();
            input.width = std::max(0.0f, clamp_width(box, w, reference.width));
            layout_block(box, input);
        } else {
            layout_shrink_to_fit(box, input,
                                 reference.width - left.value_or(0) - right.value_or(0));
        }
    } else {
        layout_block(box, input);
    }

    BoxGeometry& out = box.geometry;
    if (left) {
        out.x = reference.x + *left + out.margin.left;
    } else if (right) {
        out.x = reference.x + reference.width - *right - out.margin.right - out.border_box_width();
    } else {
        out.x = box.static_x + out.margin.left;
    }

    if (top) {
        out.y = reference.y + *top + out.margin.top;
    } else if (bottom) {
        out.y = reference.y + reference.height - *bottom - out.margin.bottom - out.border_box_height();
    } else {
        out.y = box.static_y + out.margin.top;
    }
}

void LayoutEngine::position_fixed_boxes(LayoutBox& box, float origin_x, float origin_y) {
    for (auto& c : box.children) {
        LayoutBox& child = *c;
        if (!child.is_anonymous && child.style && child.style->position == css::Position::Fixed) {
            Rect viewport{-origin_x, -origin_y, viewport_width_, viewport_height_};
            layout_out_of_flow(child, viewport);
        }
        if (is_transparent_inline(child)) {
            position_fixed_boxes(child, origin_x, origin_y);
            continue;
        }
        const BoxGeometry& g = child.geometry;
        position_fixed_boxes(child, origin_x + g.x + g.border.left + g.padding.left,
                             origin_y + g.y + g.border.top + g.padding.top);
    }
}

// ---------------------------------------------------------------------------
// List markers
// ---------------------------------------------------------------------------

void LayoutEngine::place_marker(LayoutBox& box) {
    if (!box.style || box.style->list_style_type == css::ListStyleType::None) return;

    const css::ComputedStyle& s = *box.style;
    std::string text = list_marker_text(s.list_style_type, box.list_ordinal);
    FontDescriptor font = FontDescriptor::from_style(s);
    float width = metrics_->word_advance(font, text);
    LineMetrics lm = metrics_->line_metrics(font);
    float gap = font.size * cfg::kListMarkerGapRatio;
    float baseline = first_baseline(box).value_or(lm.ascent);

    TextRun marker;
    marker.kind = RunKind::Marker;
    marker.text = std::move(text);
    marker.node = box.node;
    marker.style = box.style;
    marker.baseline = baseline;
    marker.rect = {-(gap + width), baseline - lm.ascent, width, lm.ascent + lm.descent};
    box.marker = std::move(marker);
}

// ---------------------------------------------------------------------------
// Absolute rectangles
// ---------------------------------------------------------------------------

void LayoutEngine::finalize(LayoutBox& box, float origin_x, float origin_y, const LayoutBox* ifc) {
    if (is_transparent_inline(box)) {
        for (auto& child : box.children) {
            finalize(*child, origin_x, origin_y, ifc);
        }
        Rect bounds{origin_x, origin_y, 0, 0};
        if (box.is_text) {
            if (ifc) {
                for (const auto& line : ifc->lines) {
                    for (const auto& run : line.runs) {
                        if (run.node == box.node) bounds = bounds.united(run.rect);
                    }
                }
            }
            box.content_rect = box.padding_rect = box.border_rect = box.margin_rect = bounds;
            return;
        }
        for (const auto& child : box.children) bounds = bounds.united(child->margin_rect);
        box.content_rect = box.padding_rect = box.border_rect = box.margin_rect = bounds;
        if (bounds.empty()) return;

        // Inline element: edges wrap the union of its content
        const BoxGeometry& g = box.geometry;
        box.padding_rect = inflate(box.content_rect, g.padding);
        box.border_rect = inflate(box.padding_rect, g.border);
        box.margin_rect = inflate(box.border_rect, {0, g.margin.right, 0, g.margin.left});
        return;
    }

    const BoxGeometry& g = box.geometry;
    box.border_rect = {origin_x + g.x, origin_y + g.y, g.border_box_width(), g.border_box_height()};
    box.padding_rect = {box.border_rect.x + g.border.left, box.border_rect.y + g.border.top,
                        g.width + g.padding.left + g.padding.right,
                        g.height + g.padding.top + g.padding.bottom};
    box.content_rect = {box.padding_rect.x + g.padding.left, box.padding_rect.y + g.padding.top,
                        g.width, g.height};
    box.margin_rect = {box.border_rect.x - g.margin.left, box.border_rect.y - g.margin.top,
                       g.margin_box_width(), g.margin_box_height()};

    const float cx = box.content_rect.x;
    const float cy = box.content_rect.y;
    for (auto& line : box.lines) {
        line.rect.x += cx;
        line.rect.y += cy;
        line.baseline += cy;
        for (auto& run : line.runs) offset_run(run, cx, cy);
    }
    if (box.marker) offset_run(*box.marker, cx, cy);

    for (auto& child : box.children) {
        finalize(*child, cx, cy, &box);
    }
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

float max_content_width(const LayoutBox& box) {
    if (box.is_replaced) return box.geometry.width;

    float w = 0;
    for (const auto& line : box.lines) w = std::max(w, line.content_width);
    for (const auto& child : box.children) {
        if (child->is_out_of_flow() || !child->is_block_level()) continue;
        const BoxGeometry& g = child->geometry;
        bool intrinsic = child->is_anonymous || !child->style ||
                         child->style->width.is_auto() || child->style->width.is_percent();
        float inner = intrinsic && !child->is_replaced ? max_content_width(*child) : g.width;
        float margins = 0;
        if (!child->is_anonymous && child->style) {
            if (!child->style->margin.left.is_auto()) margins += g.margin.left;
            if (!child->style->margin.right.is_auto()) margins += g.margin.right;
        }
        w = std::max(w, inner + g.horizontal_extras() + margins);
    }
    return w;
}

const LayoutBox* find_box(const LayoutBox& root, dom::NodeId node) {
    if (!root.is_anonymous && root.node == node) return &root;
    for (const auto& child : root.children) {
        if (const LayoutBox* found = find_box(*child, node)) return found;
    }
    return nullptr;
}

const char* box_kind_name(BoxKind kind) {
    switch (kind) {
        case BoxKind::Block: return "block";
        case BoxKind::Inline: return "inline";
        case BoxKind::InlineBlock: return "inline-block";
        case BoxKind::ListItem: return "list-item";
        case BoxKind::None: return "none";
    }
    return "block";
}

namespace {

const char* run_kind_name(RunKind kind) {
    switch (kind) {
        case RunKind::Word: return "word";
        case RunKind::Space: return "space";
        case RunKind::Atomic: return "atomic";
        case RunKind::Marker: return "marker";
    }
    return "word";
}

void write_rect(std::ostringstream& out, const Rect& r) {
    out << "x=" << r.x << " y=" << r.y << " w=" << r.width << " h=" << r.height;
}

void write_run(std::ostringstream& out, const std::string& indent, const TextRun& run) {
    out << indent << run_kind_name(run.kind) << " \"" << run.text << "\" ";
    write_rect(out, run.rect);
    out << " baseline=" << run.baseline << '\n';
}

void serialize_box(std::ostringstream& out, const LayoutBox& box, int depth) {
    const std::string indent(static_cast<size_t>(depth) * 2, ' ');
    out << indent << box_kind_name(box.kind);
    if (box.is_root) out << " root";
    else if (box.is_anonymous) out << " anonymous";
    else if (box.is_text) out << " text";
    else out << " <" << box.tag_name << ">";
    if (box.node != dom::kInvalidNode) out << " node=" << box.node;
    out << ' ';
    write_rect(out, box.border_rect);
    out << '\n';

    for (const auto& line : box.lines) {
        out << indent << "  line ";
        write_rect(out, line.rect);
        out << " baseline=" << line.baseline << '\n';
        for (const auto& run : line.runs) write_run(out, indent + "    ", run);
    }
    if (box.marker) write_run(out, indent + "  ", *box.marker);
    for (const auto& child : box.children) serialize_box(out, *child, depth + 1);
}

} // namespace

std::string serialize_layout(const LayoutBox& root) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2);
    serialize_box(out, root, 0);
    return out.str();
}

} // namespace verso::layout
