#pragma once
#include <verso/css/style/computed_style.h>
#include <verso/dom/document.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace verso::layout {

struct Rect {
    float x = 0, y = 0, width = 0, height = 0;

    float right() const { return x + width; }
    float bottom() const { return y + height; }
    bool empty() const { return width <= 0 || height <= 0; }

    bool operator==(const Rect& o) const {
        return x == o.x && y == o.y && width == o.width && height == o.height;
    }
    bool operator!=(const Rect& o) const { return !(*this == o); }

    // Smallest rect containing both; an empty rect is the identity.
    Rect united(const Rect& other) const {
        if (other.empty()) return *this;
        if (empty()) return other;
        float l = x < other.x ? x : other.x;
        float t = y < other.y ? y : other.y;
        float r = right() > other.right() ? right() : other.right();
        float b = bottom() > other.bottom() ? bottom() : other.bottom();
        return {l, t, r - l, b - t};
    }
};

struct EdgeSizes {
    float top = 0, right = 0, bottom = 0, left = 0;
};

// Geometry produced during layout. (x, y) is the border-box origin relative
// to the parent's content box; width/height is the content box size.
struct BoxGeometry {
    float x = 0, y = 0;
    float width = 0, height = 0;
    EdgeSizes margin, border, padding;

    float margin_box_width() const {
        return margin.left + border.left + padding.left + width + padding.right + border.right + margin.right;
    }
    float margin_box_height() const {
        return margin.top + border.top + padding.top + height + padding.bottom + border.bottom + margin.bottom;
    }
    float border_box_width() const { return border.left + padding.left + width + padding.right + border.right; }
    float border_box_height() const { return border.top + padding.top + height + padding.bottom + border.bottom; }
    float horizontal_extras() const {
        return border.left + padding.left + padding.right + border.right;
    }
};

// Open enumeration: flex/grid containers would add their own kinds.
enum class BoxKind { Block, Inline, InlineBlock, ListItem, None };

enum class RunKind { Word, Space, Atomic, Marker };

struct LayoutBox;

// One positioned piece of inline content on a line.
struct TextRun {
    RunKind kind = RunKind::Word;
    std::string text;                 // after white-space processing and text-transform
    Rect rect;                        // absolute after layout completes
    float baseline = 0;               // absolute y of the alphabetic baseline
    dom::NodeId node = dom::kInvalidNode;   // text node, atomic element or list item
    const css::ComputedStyle* style = nullptr;
    const LayoutBox* atomic = nullptr;      // RunKind::Atomic only
};

struct LineBox {
    Rect rect;                 // line box, spans the container's content width
    float baseline = 0;
    float content_width = 0;   // sum of run advances, before alignment
    std::vector<TextRun> runs;
};

// Layout tree node. `style` points into the StyledTree the tree was built
// from (anonymous boxes share their parent's style and ignore its
// non-inherited properties), so that tree must outlive the layout.
struct LayoutBox {
    BoxKind kind = BoxKind::Block;
    dom::NodeId node = dom::kInvalidNode;
    std::string tag_name;      // empty for anonymous and text boxes
    const css::ComputedStyle* style = nullptr;

    bool is_anonymous = false;
    bool is_text = false;
    bool is_replaced = false;  // img, video, canvas, iframe, object, embed
    bool is_root = false;
    int list_ordinal = 0;      // 1-based index among list-item siblings

    BoxGeometry geometry;

    // Static position of the margin box relative to the parent's content
    // box, used by out-of-flow boxes without insets.
    float static_x = 0, static_y = 0;

    // Absolute rectangles, filled once layout completes.
    Rect content_rect;
    Rect padding_rect;
    Rect border_rect;
    Rect margin_rect;

    std::vector<std::unique_ptr<LayoutBox>> children;
    LayoutBox* parent = nullptr;

    // Inline formatting context content, when this box holds one.
    std::vector<LineBox> lines;
    std::optional<TextRun> marker;   // list item marker

    bool is_block_level() const {
        return kind == BoxKind::Block || kind == BoxKind::ListItem;
    }
    bool is_atomic_inline() const {
        return kind == BoxKind::InlineBlock || (kind == BoxKind::Inline && is_replaced);
    }
    bool is_inline_level() const { return kind == BoxKind::Inline || kind == BoxKind::InlineBlock; }
    bool is_out_of_flow() const { return !is_anonymous && style && style->is_out_of_flow(); }
};

} // namespace verso::layout
