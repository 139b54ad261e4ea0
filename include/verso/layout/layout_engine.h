#pragma once
#include <verso/core/diagnostics.h>
#include <verso/css/style/style_resolver.h>
#include <verso/dom/document.h>
#include <verso/layout/box.h>
#include <verso/layout/line_breaker.h>
#include <verso/layout/measurement.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace verso::layout {

struct LayoutOptions {
    // Viewport used for vw/vh and fixed positioning. 0 means "same as the
    // containing width" for the width and the configured default for the height.
    float viewport_width = 0;
    float viewport_height = 0;
};

struct LayoutResult {
    std::unique_ptr<LayoutBox> root;
    core::DiagnosticEmitter diagnostics;
};

class LayoutEngine {
public:
    // Builds and lays out the box tree of `doc`. `styles` must outlive the
    // returned tree. Identical inputs produce identical geometry.
    LayoutResult layout(const dom::Document& doc, const css::StyledTree& styles,
                        float containing_width, const MeasurementProvider& measurement,
                        const LayoutOptions& options = {});

private:
    struct BlockInput {
        float containing_width = 0;
        float containing_height = -1;      // < 0: indefinite
        std::optional<float> width;        // used content width decided by the caller
        std::optional<float> height;       // used content height decided by the caller
    };

    // Box tree construction
    std::unique_ptr<LayoutBox> build_box(dom::NodeId node, int depth);
    void normalize_children(LayoutBox& box);

    // Layout
    void layout_block(LayoutBox& box, const BlockInput& input);
    void layout_shrink_to_fit(LayoutBox& box, const BlockInput& input, float available);
    void layout_atomic(LayoutBox& box, float containing_width, float containing_height);

    void resolve_edges(LayoutBox& box, float containing_width);
    float compute_width(LayoutBox& box, float containing_width);
    std::optional<float> definite_height(const LayoutBox& box, const BlockInput& input);
    float clamp_width(const LayoutBox& box, float width, float containing_width);
    float clamp_height(const LayoutBox& box, float height, float containing_height);
    float replaced_width(const LayoutBox& box, float containing_width);
    float replaced_height(const LayoutBox& box, float containing_height);

    // Block flow: stacks block-level children and collapses margins.
    // Returns the content height.
    float position_block_children(LayoutBox& box, float containing_height, bool height_auto);

    // Inline formatting context. Returns the content height.
    float layout_inline_content(LayoutBox& box, float containing_height);
    void collect_inline_items(LayoutBox& parent, float containing_width, float containing_height,
                              std::vector<InlineItem>& items,
                              std::vector<LayoutBox*>& atomics);

    // Relative offsets on an in-flow box
    void apply_positioning(LayoutBox& box, float containing_width, float containing_height);

    // Absolute descendants of a positioned box (or the root)
    void position_absolute_children(LayoutBox& box);
    void layout_out_of_flow(LayoutBox& box, const Rect& reference);

    // Fixed boxes, positioned against the viewport once the flow is final
    void position_fixed_boxes(LayoutBox& box, float origin_x, float origin_y);

    void place_marker(LayoutBox& box);

    // Converts relative geometry into absolute rectangles
    void finalize(LayoutBox& box, float origin_x, float origin_y, const LayoutBox* ifc);

    float resolve(const css::Length& length, float percent_base,
                  const css::ComputedStyle& style, const char* what);
    void report(core::DiagnosticCode code, const std::string& stage, const std::string& message);

    const dom::Document* doc_ = nullptr;
    const css::StyledTree* styles_ = nullptr;
    MetricResolver* metrics_ = nullptr;
    core::DiagnosticEmitter* diagnostics_ = nullptr;
    float viewport_width_ = 0;
    float viewport_height_ = 0;
    bool depth_reported_ = false;
};

// Widest content of a laid out box, used for shrink-to-fit sizing.
float max_content_width(const LayoutBox& box);

// Layout box of `node`, or nullptr when the node produced none.
const LayoutBox* find_box(const LayoutBox& root, dom::NodeId node);

const char* box_kind_name(BoxKind kind);

// Canonical text dump of a laid out tree, two decimals per coordinate.
std::string serialize_layout(const LayoutBox& root);

} // namespace verso::layout
