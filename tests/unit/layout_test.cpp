#include <gtest/gtest.h>
#include <verso/core/diagnostics.h>
#include <verso/css/parser/stylesheet.h>
#include <verso/css/style/style_resolver.h>
#include <verso/dom/document.h>
#include <verso/layout/box.h>
#include <verso/layout/layout_engine.h>
#include <verso/layout/measurement.h>

#include <memory>
#include <string>

using namespace verso::layout;
using verso::core::DiagnosticCode;
using verso::dom::Document;
using verso::dom::NodeId;

namespace {

// Resolves and lays out `doc` with the fixed-advance metrics: 16px glyphs
// advance 9.6 and spaces 4.8.
struct Laid {
    verso::css::StyledTree styles;
    LayoutResult result;

    const LayoutBox& root() const { return *result.root; }
    const LayoutBox& box(NodeId node) const {
        const LayoutBox* b = find_box(*result.root, node);
        EXPECT_NE(b, nullptr);
        return *b;
    }
};

std::unique_ptr<Laid> lay_out(const Document& doc, const std::string& css,
                              float width = 1200, float height = 800) {
    auto laid = std::make_unique<Laid>();
    verso::css::StyleResolver resolver;
    resolver.set_viewport(width, height);
    resolver.add_stylesheet(verso::css::parse_stylesheet(css));
    laid->styles = verso::css::resolve_tree(doc, resolver);

    FixedAdvanceMeasurement measurement;
    LayoutOptions options;
    options.viewport_width = width;
    options.viewport_height = height;
    LayoutEngine engine;
    laid->result = engine.layout(doc, laid->styles, width, measurement, options);
    return laid;
}

} // namespace

// ---------------------------------------------------------------------------
// Block flow
// ---------------------------------------------------------------------------

TEST(LayoutEngineTest, RootIsInitialContainingBlock) {
    Document doc;
    doc.append_element(doc.root(), "body");
    auto laid = lay_out(doc, "");
    EXPECT_TRUE(laid->root().is_root);
    EXPECT_FLOAT_EQ(laid->root().geometry.width, 1200.0f);
    EXPECT_FLOAT_EQ(laid->root().geometry.height, 800.0f);
}

TEST(LayoutEngineTest, ViewportWidthResolvesAgainstViewport) {
    Document doc;
    NodeId body = doc.append_element(doc.root(), "body");
    auto laid = lay_out(doc, "body { width: 60vw }");
    EXPECT_FLOAT_EQ(laid->box(body).geometry.width, 720.0f);
}

TEST(LayoutEngineTest, BlockFillsContainerAndChildrenStack) {
    Document doc;
    NodeId body = doc.append_element(doc.root(), "body");
    NodeId a = doc.append_element(body, "div", {{"class", "a"}});
    NodeId b = doc.append_element(body, "div", {{"class", "b"}});
    auto laid = lay_out(doc,
        "body { padding: 10px } .a { height: 30px } .b { height: 20px; border: 2px solid }");

    EXPECT_FLOAT_EQ(laid->box(a).geometry.width, 1180.0f);
    EXPECT_EQ(laid->box(a).border_rect, (Rect{10, 10, 1180, 30}));
    EXPECT_EQ(laid->box(b).border_rect, (Rect{10, 40, 1180, 24}));
    EXPECT_EQ(laid->box(b).content_rect, (Rect{12, 42, 1176, 20}));
    EXPECT_FLOAT_EQ(laid->box(body).geometry.height, 54.0f);
}

TEST(LayoutEngineTest, SiblingMarginsCollapseToLarger) {
    Document doc;
    NodeId body = doc.append_element(doc.root(), "body");
    NodeId div = doc.append_element(body, "div");
    NodeId p = doc.append_element(body, "p");
    auto laid = lay_out(doc,
        "div { height: 50px; margin-bottom: 20px } p { height: 10px; margin-top: 10px }");

    const Rect& first = laid->box(div).border_rect;
    const Rect& second = laid->box(p).border_rect;
    EXPECT_FLOAT_EQ(second.y - first.bottom(), 20.0f);
}

TEST(LayoutEngineTest, NegativeMarginsCombine) {
    Document doc;
    NodeId body = doc.append_element(doc.root(), "body");
    NodeId a = doc.append_element(body, "div", {{"class", "a"}});
    NodeId b = doc.append_element(body, "div", {{"class", "b"}});
    auto laid = lay_out(doc,
        ".a { height: 50px; margin-bottom: 20px } .b { height: 10px; margin-top: -5px }");
    EXPECT_FLOAT_EQ(laid->box(b).border_rect.y - laid->box(a).border_rect.bottom(), 15.0f);
}

TEST(LayoutEngineTest, FirstChildMarginEscapesParent) {
    Document doc;
    NodeId body = doc.append_element(doc.root(), "body");
    NodeId outer = doc.append_element(body, "div", {{"class", "outer"}});
    NodeId inner = doc.append_element(outer, "div", {{"class", "inner"}});
    auto laid = lay_out(doc, ".inner { margin-top: 30px; height: 10px }");

    EXPECT_FLOAT_EQ(laid->box(body).border_rect.y, 30.0f);
    EXPECT_FLOAT_EQ(laid->box(outer).border_rect.y, 30.0f);
    EXPECT_FLOAT_EQ(laid->box(inner).border_rect.y, 30.0f);
    EXPECT_FLOAT_EQ(laid->box(outer).geometry.height, 10.0f);
}

TEST(LayoutEngineTest, EmptyFirstChildLetsNextMarginEscape) {
    Document doc;
    NodeId body = doc.append_element(doc.root(), "body");
    NodeId outer = doc.append_element(body, "div");
    NodeId empty = doc.append_element(outer, "div", {{"class", "empty"}});
    NodeId para = doc.append_element(outer, "div", {{"class", "para"}});
    auto laid = lay_out(doc,
        ".empty { margin: 10px } .para { margin-top: 20px; height: 10px }");

    // 10px and 20px collapse through the empty block into one 20px margin
    EXPECT_FLOAT_EQ(laid->box(body).border_rect.y, 20.0f);
    EXPECT_FLOAT_EQ(laid->box(outer).border_rect.y, 20.0f);
    EXPECT_FLOAT_EQ(laid->box(empty).border_rect.y, 20.0f);
    EXPECT_FLOAT_EQ(laid->box(para).border_rect.y, 20.0f);
    EXPECT_FLOAT_EQ(laid->box(outer).geometry.height, 10.0f);
}

TEST(LayoutEngineTest, PaddingPreventsParentChildCollapse) {
    Document doc;
    NodeId body = doc.append_element(doc.root(), "body");
    NodeId outer = doc.append_element(body, "div", {{"class", "outer"}});
    NodeId inner = doc.append_element(outer, "div", {{"class", "inner"}});
    auto laid = lay_out(doc,
        ".outer { padding-top: 1px } .inner { margin-top: 30px; height: 10px }");

    EXPECT_FLOAT_EQ(laid->box(outer).border_rect.y, 0.0f);
    EXPECT_FLOAT_EQ(laid->box(inner).border_rect.y, 31.0f);
    EXPECT_FLOAT_EQ(laid->box(outer).geometry.height, 40.0f);
}

TEST(LayoutEngineTest, AutoMarginsCenterBlock) {
    Document doc;
    NodeId body = doc.append_element(doc.root(), "body");
    NodeId div = doc.append_element(body, "div");
    auto laid = lay_out(doc, "div { width: 200px; margin: 0 auto }", 1000);
    EXPECT_FLOAT_EQ(laid->box(div).border_rect.x, 400.0f);
}

TEST(LayoutEngineTest, MinAndMaxWidthClamp) {
    Document doc;
    NodeId body = doc.append_element(doc.root(), "body");
    NodeId capped = doc.append_element(body, "div", {{"class", "capped"}});
    NodeId raised = doc.append_element(body, "div", {{"class", "raised"}});
    auto laid = lay_out(doc,
        ".capped { width: 500px; max-width: 300px } .raised { width: 100px; min-width: 400px }");
    EXPECT_FLOAT_EQ(laid->box(capped).geometry.width, 300.0f);
    EXPECT_FLOAT_EQ(laid->box(raised).geometry.width, 400.0f);
}

TEST(LayoutEngineTest, PercentHeightNeedsDefiniteBase) {
    Document doc;
    NodeId body = doc.append_element(doc.root(), "body");
    NodeId sized = doc.append_element(body, "section");
    NodeId child = doc.append_element(sized, "div");
    auto laid = lay_out(doc, "section { height: 400px } div { height: 50% }");
    EXPECT_FLOAT_EQ(laid->box(child).geometry.height, 200.0f);
    EXPECT_FALSE(laid->result.diagnostics.has_code(DiagnosticCode::UnresolvedDimension));

    Document loose;
    NodeId loose_body = loose.append_element(loose.root(), "body");
    NodeId loose_div = loose.append_element(loose_body, "div");
    loose.append_text(loose_div, "x");
    auto fallback = lay_out(loose, "div { height: 50% }");
    EXPECT_FLOAT_EQ(fallback->box(loose_div).geometry.height, 19.2f);
    EXPECT_TRUE(fallback->result.diagnostics.has_code(DiagnosticCode::UnresolvedDimension));
}

TEST(LayoutEngineTest, DisplayNoneProducesNoBox) {
    Document doc;
    NodeId body = doc.append_element(doc.root(), "body");
    NodeId hidden = doc.append_element(body, "div", {{"style", "display: none; height: 50px"}});
    doc.append_element(hidden, "p");
    auto laid = lay_out(doc, "");
    EXPECT_EQ(find_box(laid->root(), hidden), nullptr);
    EXPECT_FLOAT_EQ(laid->box(body).geometry.height, 0.0f);
}

// ---------------------------------------------------------------------------
// Inline content
// ---------------------------------------------------------------------------

TEST(LayoutEngineTest, TextRunsArePositionedOnLines) {
    Document doc;
    NodeId body = doc.append_element(doc.root(), "body");
    NodeId p = doc.append_element(body, "p");
    doc.append_text(p, "This is text");
    auto laid = lay_out(doc, "body { width: 60vw } p { font-size: 24px }");

    const LayoutBox& pb = laid->box(p);
    ASSERT_EQ(pb.lines.size(), 1u);
    const auto& runs = pb.lines[0].runs;
    ASSERT_EQ(runs.size(), 5u);
    EXPECT_EQ(runs[2].text, "is");
    EXPECT_FLOAT_EQ(runs[2].rect.x, 57.6f + 7.2f);
    // line-height normal at 24px is 28.8, ascent 19.2
    EXPECT_FLOAT_EQ(pb.lines[0].baseline, 2.4f + 19.2f);
    EXPECT_FLOAT_EQ(pb.geometry.height, 28.8f);
}

TEST(LayoutEngineTest, NarrowContainerWrapsText) {
    Document doc;
    NodeId body = doc.append_element(doc.root(), "body");
    NodeId div = doc.append_element(body, "div");
    doc.append_text(div, "aaa bbb ccc");
    auto laid = lay_out(doc, "div { width: 70px }");
    EXPECT_EQ(laid->box(div).lines.size(), 2u);
    EXPECT_FLOAT_EQ(laid->box(div).geometry.height, 38.4f);
}

TEST(LayoutEngineTest, InlineSpansShareTheLine) {
    Document doc;
    NodeId body = doc.append_element(doc.root(), "body");
    NodeId p = doc.append_element(body, "p");
    doc.append_text(p, "one ");
    NodeId em = doc.append_element(p, "em");
    doc.append_text(em, "two");
    auto laid = lay_out(doc, "");

    const LayoutBox& pb = laid->box(p);
    ASSERT_EQ(pb.lines.size(), 1u);
    const TextRun& last = pb.lines[0].runs.back();
    EXPECT_EQ(last.text, "two");
    EXPECT_FLOAT_EQ(last.rect.x, 3 * 9.6f + 4.8f);
    EXPECT_TRUE(last.style->font_style == verso::css::FontStyle::Italic);
    // The span's rectangle covers its runs
    EXPECT_FLOAT_EQ(laid->box(em).border_rect.x, last.rect.x);
    EXPECT_FLOAT_EQ(laid->box(em).border_rect.width, 3 * 9.6f);
}

TEST(LayoutEngineTest, InlineEdgesTakeLineSpace) {
    Document doc;
    NodeId body = doc.append_element(doc.root(), "body");
    NodeId p = doc.append_element(body, "div");
    doc.append_text(p, "a");
    NodeId span = doc.append_element(p, "span");
    doc.append_text(span, "b");
    doc.append_text(p, "c");
    auto laid = lay_out(doc, "span { border: 2px solid black; padding: 5px; margin: 0 3px }");

    const LayoutBox& pb = laid->box(p);
    ASSERT_EQ(pb.lines.size(), 1u);
    const auto& runs = pb.lines[0].runs;
    ASSERT_EQ(runs.size(), 3u);
    EXPECT_FLOAT_EQ(runs[1].rect.x, 9.6f + 10.0f);
    EXPECT_FLOAT_EQ(runs[2].rect.x, 2 * 9.6f + 20.0f);
    // Vertical edges do not change the line height
    EXPECT_FLOAT_EQ(pb.lines[0].rect.height, 19.2f);

    const LayoutBox& sb = laid->box(span);
    EXPECT_FLOAT_EQ(sb.content_rect.x, runs[1].rect.x);
    EXPECT_FLOAT_EQ(sb.border_rect.x, runs[1].rect.x - 7.0f);
    EXPECT_FLOAT_EQ(sb.border_rect.width, 9.6f + 14.0f);
    EXPECT_FLOAT_EQ(sb.border_rect.y, runs[1].rect.y - 7.0f);
    EXPECT_FLOAT_EQ(sb.border_rect.height, 16.0f + 14.0f);
    EXPECT_FLOAT_EQ(sb.margin_rect.x, 9.6f);
    EXPECT_FLOAT_EQ(sb.margin_rect.width, 9.6f + 20.0f);
}

TEST(LayoutEngineTest, BreakElementForcesNewLine) {
    Document doc;
    NodeId body = doc.append_element(doc.root(), "body");
    NodeId p = doc.append_element(body, "p");
    doc.append_text(p, "a");
    doc.append_element(p, "br");
    doc.append_text(p, "b");
    auto laid = lay_out(doc, "");
    EXPECT_EQ(laid->box(p).lines.size(), 2u);
}

TEST(LayoutEngineTest, InlineBlockShrinksToContent) {
    Document doc;
    NodeId body = doc.append_element(doc.root(), "body");
    NodeId span = doc.append_element(body, "span");
    doc.append_text(span, "abc");
    auto laid = lay_out(doc, "span { display: inline-block; padding: 2px }");

    const LayoutBox& sb = laid->box(span);
    EXPECT_EQ(sb.kind, BoxKind::InlineBlock);
    EXPECT_FLOAT_EQ(sb.geometry.width, 3 * 9.6f);
    EXPECT_FLOAT_EQ(sb.border_rect.width, 3 * 9.6f + 4);
}

TEST(LayoutEngineTest, AtomicInlineSitsOnBaseline) {
    Document doc;
    NodeId body = doc.append_element(doc.root(), "body");
    NodeId span = doc.append_element(body, "span");
    auto laid = lay_out(doc, "span { display: inline-block; width: 50px; height: 40px }");

    const LayoutBox& bb = laid->box(body);
    ASSERT_EQ(bb.lines.size(), 1u);
    EXPECT_FLOAT_EQ(bb.lines[0].rect.height, 40.0f);
    EXPECT_FLOAT_EQ(bb.lines[0].baseline, 40.0f);
    EXPECT_EQ(laid->box(span).border_rect, (Rect{0, 0, 50, 40}));
}

TEST(LayoutEngineTest, ReplacedElementsUseAttributesOrPlaceholder) {
    Document doc;
    NodeId body = doc.append_element(doc.root(), "body");
    NodeId sized = doc.append_element(body, "img", {{"width", "50"}, {"height", "30"}});
    NodeId bare = doc.append_element(body, "img");
    auto laid = lay_out(doc, "");

    const LayoutBox& a = laid->box(sized);
    EXPECT_TRUE(a.is_replaced);
    EXPECT_FLOAT_EQ(a.geometry.width, 50.0f);
    EXPECT_FLOAT_EQ(a.geometry.height, 30.0f);
    EXPECT_FLOAT_EQ(laid->box(bare).geometry.width, 100.0f);
    EXPECT_FLOAT_EQ(laid->box(bare).geometry.height, 80.0f);
}

TEST(LayoutEngineTest, MixedContentIsWrappedInAnonymousBlocks) {
    Document doc;
    NodeId body = doc.append_element(doc.root(), "body");
    NodeId div = doc.append_element(body, "div");
    doc.append_text(div, "loose text");
    NodeId p = doc.append_element(div, "p");
    doc.append_text(p, "para");
    doc.append_text(div, "   ");
    auto laid = lay_out(doc, "");

    const LayoutBox& db = laid->box(div);
    ASSERT_EQ(db.children.size(), 2u);
    EXPECT_TRUE(db.children[0]->is_anonymous);
    EXPECT_EQ(db.children[0]->lines.size(), 1u);
    EXPECT_EQ(db.children[1]->node, p);
    EXPECT_FLOAT_EQ(laid->box(p).border_rect.y, 19.2f);
}

TEST(LayoutEngineTest, InlineHoldingBlockBecomesBlock) {
    Document doc;
    NodeId body = doc.append_element(doc.root(), "body");
    NodeId span = doc.append_element(body, "span");
    NodeId div = doc.append_element(span, "div");
    doc.append_text(div, "x");
    auto laid = lay_out(doc, "");
    EXPECT_EQ(laid->box(span).kind, BoxKind::Block);
    EXPECT_FLOAT_EQ(laid->box(span).geometry.width, 1200.0f);
}

// ---------------------------------------------------------------------------
// Positioning
// ---------------------------------------------------------------------------

TEST(LayoutEngineTest, RelativeOffsetsShiftBox) {
    Document doc;
    NodeId body = doc.append_element(doc.root(), "body");
    NodeId p = doc.append_element(body, "p");
    NodeId after = doc.append_element(body, "div");
    auto laid = lay_out(doc,
        "p { position: relative; top: 5px; left: 7px; height: 10px } div { height: 10px }");
    EXPECT_EQ(laid->box(p).border_rect, (Rect{7, 5, 1200, 10}));
    // Following content is laid out as if the box had not moved
    EXPECT_FLOAT_EQ(laid->box(after).border_rect.y, 10.0f);
}

TEST(LayoutEngineTest, AbsoluteUsesPaddingBoxOfPositionedAncestor) {
    Document doc;
    NodeId body = doc.append_element(doc.root(), "body");
    NodeId rel = doc.append_element(body, "div", {{"class", "rel"}});
    NodeId wrapper = doc.append_element(rel, "div");
    NodeId abs = doc.append_element(wrapper, "div", {{"class", "abs"}});
    auto laid = lay_out(doc,
        ".rel { position: relative; margin-left: 10px; padding: 5px; border: 3px solid; height: 100px }"
        ".abs { position: absolute; top: 1px; left: 2px; width: 20px; height: 20px }");

    const LayoutBox& rb = laid->box(rel);
    EXPECT_EQ(laid->box(abs).border_rect,
              (Rect{rb.padding_rect.x + 2, rb.padding_rect.y + 1, 20, 20}));
    // Out-of-flow boxes take no space
    EXPECT_FLOAT_EQ(laid->box(wrapper).geometry.height, 0.0f);
}

TEST(LayoutEngineTest, AbsoluteRightBottomInsets) {
    Document doc;
    NodeId body = doc.append_element(doc.root(), "body");
    NodeId rel = doc.append_element(body, "div", {{"class", "rel"}});
    NodeId abs = doc.append_element(rel, "div", {{"class", "abs"}});
    auto laid = lay_out(doc,
        ".rel { position: relative; width: 300px; height: 200px }"
        ".abs { position: absolute; right: 10px; bottom: 20px; width: 50px; height: 40px }");
    EXPECT_EQ(laid->box(abs).border_rect, (Rect{240, 140, 50, 40}));
}

TEST(LayoutEngineTest, AbsoluteWithoutInsetsKeepsStaticPosition) {
    Document doc;
    NodeId body = doc.append_element(doc.root(), "body");
    doc.append_element(body, "div", {{"class", "first"}});
    NodeId abs = doc.append_element(body, "div", {{"class", "abs"}});
    auto laid = lay_out(doc,
        ".first { height: 35px } .abs { position: absolute; width: 10px; height: 10px }");
    EXPECT_FLOAT_EQ(laid->box(abs).border_rect.x, 0.0f);
    EXPECT_FLOAT_EQ(laid->box(abs).border_rect.y, 35.0f);
}

TEST(LayoutEngineTest, AbsoluteAutoWidthShrinksToFit) {
    Document doc;
    NodeId body = doc.append_element(doc.root(), "body");
    NodeId abs = doc.append_element(body, "div");
    doc.append_text(abs, "abcd");
    auto laid = lay_out(doc, "div { position: absolute; top: 0; left: 0 }");
    EXPECT_FLOAT_EQ(laid->box(abs).geometry.width, 4 * 9.6f);
}

TEST(LayoutEngineTest, FixedUsesViewport) {
    Document doc;
    NodeId body = doc.append_element(doc.root(), "body");
    NodeId rel = doc.append_element(body, "div", {{"class", "rel"}});
    NodeId fixed = doc.append_element(rel, "div", {{"class", "fixed"}});
    auto laid = lay_out(doc,
        ".rel { position: relative; margin: 50px; height: 10px }"
        ".fixed { position: fixed; right: 0; bottom: 0; width: 10px; height: 10px }");
    EXPECT_EQ(laid->box(fixed).border_rect, (Rect{1190, 790, 10, 10}));
}

// ---------------------------------------------------------------------------
// Lists
// ---------------------------------------------------------------------------

TEST(LayoutEngineTest, ListItemsGetMarkers) {
    Document doc;
    NodeId body = doc.append_element(doc.root(), "body");
    NodeId ul = doc.append_element(body, "ul");
    NodeId li = doc.append_element(ul, "li");
    doc.append_text(li, "item");
    NodeId ol = doc.append_element(body, "ol", {{"start", "3"}});
    doc.append_element(ol, "li");
    NodeId second = doc.append_element(ol, "li");
    doc.append_text(second, "x");
    auto laid = lay_out(doc, "");

    const LayoutBox& lb = laid->box(li);
    ASSERT_TRUE(lb.marker.has_value());
    EXPECT_EQ(lb.marker->text, "\xE2\x80\xA2");
    EXPECT_FLOAT_EQ(lb.content_rect.x, 40.0f);
    EXPECT_FLOAT_EQ(lb.marker->rect.x, 40.0f - 8.0f - 9.6f);
    EXPECT_FLOAT_EQ(lb.marker->baseline, lb.lines[0].baseline);

    const LayoutBox& sb = laid->box(second);
    ASSERT_TRUE(sb.marker.has_value());
    EXPECT_EQ(sb.marker->text, "4.");
}

TEST(LayoutEngineTest, ListStyleNoneHasNoMarker) {
    Document doc;
    NodeId body = doc.append_element(doc.root(), "body");
    NodeId ul = doc.append_element(body, "ul");
    NodeId li = doc.append_element(ul, "li");
    auto laid = lay_out(doc, "ul { list-style-type: none }");
    EXPECT_FALSE(laid->box(li).marker.has_value());
}

// ---------------------------------------------------------------------------
// Robustness and determinism
// ---------------------------------------------------------------------------

TEST(LayoutEngineTest, ExcessiveDepthIsReportedNotFatal) {
    Document doc;
    NodeId parent = doc.append_element(doc.root(), "body");
    for (int i = 0; i < 300; ++i) parent = doc.append_element(parent, "div");
    auto laid = lay_out(doc, "");
    EXPECT_TRUE(laid->result.diagnostics.has_code(DiagnosticCode::ParseFallback));
    EXPECT_EQ(find_box(laid->root(), parent), nullptr);
}

TEST(LayoutEngineTest, RelayoutAfterResizeIsIdentical) {
    Document doc;
    NodeId body = doc.append_element(doc.root(), "body");
    NodeId p = doc.append_element(body, "p");
    doc.append_text(p, "Some text that wraps differently at narrower widths");
    NodeId abs = doc.append_element(body, "div");
    doc.append_text(abs, "overlay");

    verso::css::StyleResolver resolver;
    resolver.add_stylesheet(verso::css::parse_stylesheet(
        "p { width: 50%; margin: 10px auto } div { position: absolute; right: 0; top: 0 }"));
    auto styles = verso::css::resolve_tree(doc, resolver);
    FixedAdvanceMeasurement measurement;
    LayoutEngine engine;

    auto wide = engine.layout(doc, styles, 1200, measurement);
    auto narrow = engine.layout(doc, styles, 800, measurement);
    auto again = engine.layout(doc, styles, 1200, measurement);

    EXPECT_NE(serialize_layout(*wide.root), serialize_layout(*narrow.root));
    EXPECT_EQ(serialize_layout(*wide.root), serialize_layout(*again.root));
}

TEST(LayoutEngineTest, SerializeNamesBoxesAndRuns) {
    Document doc;
    NodeId body = doc.append_element(doc.root(), "body");
    doc.append_text(body, "Hi");
    auto laid = lay_out(doc, "");
    std::string dump = serialize_layout(laid->root());
    EXPECT_NE(dump.find("block root node=0 x=0.00 y=0.00 w=1200.00 h=800.00"), std::string::npos);
    EXPECT_NE(dump.find("block <body> node=1"), std::string::npos);
    EXPECT_NE(dump.find("word \"Hi\" x=0.00 y=1.60 w=19.20 h=16.00"), std::string::npos);
}

TEST(LayoutEngineTest, MaxContentWidthOfLaidOutTree) {
    Document doc;
    NodeId body = doc.append_element(doc.root(), "body");
    NodeId p = doc.append_element(body, "p");
    doc.append_text(p, "ab cd");
    auto laid = lay_out(doc, "p { margin-left: 5px }");
    EXPECT_FLOAT_EQ(max_content_width(laid->box(body)), 5 + 4 * 9.6f + 4.8f);
}
