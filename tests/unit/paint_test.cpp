#include <gtest/gtest.h>
#include <verso/css/parser/stylesheet.h>
#include <verso/css/style/style_resolver.h>
#include <verso/dom/document.h>
#include <verso/layout/layout_engine.h>
#include <verso/layout/measurement.h>
#include <verso/paint/display_list.h>
#include <verso/paint/painter.h>
#include <verso/paint/software_renderer.h>

#include <cstdio>
#include <fstream>
#include <memory>
#include <string>

using namespace verso::paint;
using verso::dom::Document;
using verso::dom::NodeId;

namespace {

struct Painted {
    verso::css::StyledTree styles;
    verso::layout::LayoutResult layout;
    DisplayList list;
};

std::unique_ptr<Painted> paint_document(const Document& doc, const std::string& css,
                                        float width = 400, float height = 300) {
    auto out = std::make_unique<Painted>();
    verso::css::StyleResolver resolver;
    resolver.set_viewport(width, height);
    resolver.add_stylesheet(verso::css::parse_stylesheet(css));
    out->styles = verso::css::resolve_tree(doc, resolver);

    verso::layout::FixedAdvanceMeasurement measurement;
    verso::layout::LayoutOptions options;
    options.viewport_height = height;
    verso::layout::LayoutEngine engine;
    out->layout = engine.layout(doc, out->styles, width, measurement, options);

    Painter painter;
    out->list = painter.paint(*out->layout.root);
    return out;
}

const Color kRed{255, 0, 0, 255};
const Color kGreen{0, 128, 0, 255};
const Color kBlue{0, 0, 255, 255};
const Color kWhite{255, 255, 255, 255};

} // namespace

// ---------------------------------------------------------------------------
// Display list
// ---------------------------------------------------------------------------

TEST(DisplayListTest, RecordsCommandsInOrder) {
    DisplayList list;
    list.fill_rect({0, 0, 10, 10}, kRed);
    list.draw_text("hi", {0, 0, 10, 16}, 12, 16, kBlue, "serif", 700, true);
    list.draw_placeholder({0, 0, 5, 5}, "img", kWhite);

    ASSERT_EQ(list.size(), 3u);
    EXPECT_EQ(list.commands()[0].type, PaintCommand::FillRect);
    EXPECT_EQ(list.commands()[1].type, PaintCommand::DrawText);
    EXPECT_EQ(list.commands()[1].font_weight, 700);
    EXPECT_TRUE(list.commands()[1].font_italic);
    EXPECT_EQ(list.commands()[2].label, "img");
    EXPECT_EQ(list.commands_of(PaintCommand::DrawText).size(), 1u);

    list.clear();
    EXPECT_TRUE(list.empty());
}

TEST(DisplayListTest, ColorArgbRoundTrip) {
    Color c = Color::from_argb(0x80112233);
    EXPECT_EQ(c, (Color{0x11, 0x22, 0x33, 0x80}));
    EXPECT_EQ(c.to_argb(), 0x80112233u);
}

// ---------------------------------------------------------------------------
// Painter
// ---------------------------------------------------------------------------

TEST(PainterTest, BackgroundBorderThenText) {
    Document doc;
    NodeId body = doc.append_element(doc.root(), "body");
    NodeId div = doc.append_element(body, "div");
    doc.append_text(div, "Hello world");
    auto painted = paint_document(doc,
        "div { background-color: red; border: 2px solid blue; color: green }");

    const auto& cmds = painted->list.commands();
    ASSERT_EQ(cmds.size(), 4u);
    EXPECT_EQ(cmds[0].type, PaintCommand::FillRect);
    EXPECT_EQ(cmds[0].color, kRed);
    EXPECT_FLOAT_EQ(cmds[0].bounds.width, 400.0f);
    EXPECT_FLOAT_EQ(cmds[0].bounds.height, 19.2f + 4.0f);
    EXPECT_EQ(cmds[1].type, PaintCommand::DrawBorder);
    EXPECT_FLOAT_EQ(cmds[1].border_widths[3], 2.0f);
    EXPECT_EQ(cmds[1].border_colors[0], kBlue);
    EXPECT_EQ(cmds[1].border_styles[0], StrokeStyle::Solid);
    EXPECT_EQ(cmds[2].type, PaintCommand::DrawText);
    EXPECT_EQ(cmds[2].text, "Hello");
    EXPECT_EQ(cmds[2].color, kGreen);
    EXPECT_FLOAT_EQ(cmds[2].bounds.x, 2.0f);
    EXPECT_EQ(cmds[3].text, "world");
}

TEST(PainterTest, TransparentBoxesEmitNothing) {
    Document doc;
    NodeId body = doc.append_element(doc.root(), "body");
    doc.append_element(body, "div");
    auto painted = paint_document(doc, "");
    EXPECT_TRUE(painted->list.empty());
}

TEST(PainterTest, ParentsPaintBeforeChildren) {
    Document doc;
    NodeId body = doc.append_element(doc.root(), "body");
    NodeId outer = doc.append_element(body, "div", {{"class", "outer"}});
    doc.append_element(outer, "div", {{"class", "inner"}});
    auto painted = paint_document(doc,
        ".outer { background-color: red; padding: 5px } .inner { background-color: blue; height: 10px }");
    const auto fills = painted->list.commands_of(PaintCommand::FillRect);
    ASSERT_EQ(fills.size(), 2u);
    EXPECT_EQ(fills[0]->color, kRed);
    EXPECT_EQ(fills[1]->color, kBlue);
    EXPECT_EQ(fills[1]->bounds, (Rect{5, 5, 390, 10}));
}

TEST(PainterTest, ZIndexOrdersPositionedSiblings) {
    Document doc;
    NodeId body = doc.append_element(doc.root(), "body");
    doc.append_element(body, "div", {{"class", "flow"}});
    doc.append_element(body, "div", {{"class", "below"}});
    doc.append_element(body, "div", {{"class", "above"}});
    doc.append_element(body, "div", {{"class", "auto"}});
    auto painted = paint_document(doc,
        "div { height: 10px } .flow { background-color: red }"
        ".below { position: relative; z-index: -1; background-color: blue }"
        ".above { position: relative; z-index: 1; background-color: green }"
        ".auto { position: relative; background-color: white }");

    const auto fills = painted->list.commands_of(PaintCommand::FillRect);
    ASSERT_EQ(fills.size(), 4u);
    EXPECT_EQ(fills[0]->color, kBlue);
    EXPECT_EQ(fills[1]->color, kRed);
    EXPECT_EQ(fills[2]->color, kWhite);
    EXPECT_EQ(fills[3]->color, kGreen);
}

TEST(PainterTest, EqualZIndexKeepsDocumentOrder) {
    Document doc;
    NodeId body = doc.append_element(doc.root(), "body");
    doc.append_element(body, "div", {{"class", "a"}});
    doc.append_element(body, "div", {{"class", "b"}});
    auto painted = paint_document(doc,
        "div { position: relative; z-index: 2; height: 5px }"
        ".a { background-color: red } .b { background-color: blue }");
    const auto fills = painted->list.commands_of(PaintCommand::FillRect);
    ASSERT_EQ(fills.size(), 2u);
    EXPECT_EQ(fills[0]->color, kRed);
    EXPECT_EQ(fills[1]->color, kBlue);
}

TEST(PainterTest, HiddenBoxStillPaintsVisibleDescendants) {
    Document doc;
    NodeId body = doc.append_element(doc.root(), "body");
    NodeId hidden = doc.append_element(body, "div", {{"class", "hidden"}});
    doc.append_text(hidden, "secret");
    NodeId shown = doc.append_element(hidden, "p");
    doc.append_text(shown, "shown");
    auto painted = paint_document(doc,
        ".hidden { visibility: hidden; background-color: red } p { visibility: visible }");

    EXPECT_TRUE(painted->list.commands_of(PaintCommand::FillRect).empty());
    const auto texts = painted->list.commands_of(PaintCommand::DrawText);
    ASSERT_EQ(texts.size(), 1u);
    EXPECT_EQ(texts[0]->text, "shown");
}

TEST(PainterTest, InlineBackgroundsPaintUnderText) {
    Document doc;
    NodeId body = doc.append_element(doc.root(), "body");
    NodeId p = doc.append_element(body, "p");
    doc.append_text(p, "a ");
    NodeId span = doc.append_element(p, "span");
    doc.append_text(span, "b");
    auto painted = paint_document(doc, "span { background-color: blue }");

    const auto& cmds = painted->list.commands();
    ASSERT_EQ(cmds.size(), 3u);
    EXPECT_EQ(cmds[0].type, PaintCommand::FillRect);
    EXPECT_FLOAT_EQ(cmds[0].bounds.x, 9.6f + 4.8f);
    EXPECT_FLOAT_EQ(cmds[0].bounds.y, 1.6f);
    EXPECT_FLOAT_EQ(cmds[0].bounds.width, 9.6f);
    EXPECT_FLOAT_EQ(cmds[0].bounds.height, 16.0f);
    EXPECT_EQ(cmds[1].text, "a");
    EXPECT_EQ(cmds[2].text, "b");
}

TEST(PainterTest, InlineBordersWrapPaddedContent) {
    Document doc;
    NodeId body = doc.append_element(doc.root(), "body");
    NodeId p = doc.append_element(body, "p");
    doc.append_text(p, "a");
    NodeId span = doc.append_element(p, "span");
    doc.append_text(span, "b");
    doc.append_text(p, "c");
    auto painted = paint_document(doc, "span { border: 2px solid black; padding: 5px }");

    const auto& cmds = painted->list.commands();
    ASSERT_EQ(cmds.size(), 4u);
    EXPECT_EQ(cmds[0].type, PaintCommand::DrawBorder);
    EXPECT_FLOAT_EQ(cmds[0].bounds.x, 9.6f);
    EXPECT_FLOAT_EQ(cmds[0].bounds.y, 1.6f - 7.0f);
    EXPECT_FLOAT_EQ(cmds[0].bounds.width, 9.6f + 14.0f);
    EXPECT_FLOAT_EQ(cmds[0].bounds.height, 16.0f + 14.0f);
    EXPECT_EQ(cmds[1].text, "a");
    EXPECT_EQ(cmds[2].text, "b");
    EXPECT_FLOAT_EQ(cmds[2].bounds.x, 9.6f + 7.0f);
    EXPECT_EQ(cmds[3].text, "c");
    EXPECT_FLOAT_EQ(cmds[3].bounds.x, 2 * 9.6f + 14.0f);
}

TEST(PainterTest, ReplacedElementsBecomePlaceholders) {
    Document doc;
    NodeId body = doc.append_element(doc.root(), "body");
    doc.append_element(body, "img", {{"width", "40"}, {"height", "20"}});
    auto painted = paint_document(doc, "");
    const auto placeholders = painted->list.commands_of(PaintCommand::DrawPlaceholder);
    ASSERT_EQ(placeholders.size(), 1u);
    EXPECT_EQ(placeholders[0]->label, "img");
    EXPECT_EQ(placeholders[0]->bounds, (Rect{0, 0, 40, 20}));
}

TEST(PainterTest, ListMarkersAreDrawn) {
    Document doc;
    NodeId body = doc.append_element(doc.root(), "body");
    NodeId ol = doc.append_element(body, "ol");
    NodeId li = doc.append_element(ol, "li");
    doc.append_text(li, "first");
    auto painted = paint_document(doc, "");
    const auto texts = painted->list.commands_of(PaintCommand::DrawText);
    ASSERT_EQ(texts.size(), 2u);
    EXPECT_EQ(texts[0]->text, "first");
    EXPECT_EQ(texts[1]->text, "1.");
    EXPECT_LT(texts[1]->bounds.x, texts[0]->bounds.x);
    EXPECT_FLOAT_EQ(texts[1]->baseline, texts[0]->baseline);
}

TEST(PainterTest, PaintingIsDeterministic) {
    Document doc;
    NodeId body = doc.append_element(doc.root(), "body");
    NodeId div = doc.append_element(body, "div");
    doc.append_text(div, "Same every time");
    auto painted = paint_document(doc, "div { background-color: #abc; border: 1px dotted red }");

    Painter painter;
    DisplayList again = painter.paint(*painted->layout.root);
    EXPECT_EQ(serialize_display_list(painted->list), serialize_display_list(again));
}

// ---------------------------------------------------------------------------
// Software renderer
// ---------------------------------------------------------------------------

TEST(SoftwareRendererTest, FillsRectangles) {
    SoftwareRenderer renderer(20, 20);
    DisplayList list;
    list.fill_rect({5, 5, 10, 10}, kRed);
    renderer.render(list);
    EXPECT_EQ(renderer.get_pixel(5, 5), kRed);
    EXPECT_EQ(renderer.get_pixel(14, 14), kRed);
    EXPECT_EQ(renderer.get_pixel(15, 15), kWhite);
    EXPECT_EQ(renderer.get_pixel(4, 10), kWhite);
}

TEST(SoftwareRendererTest, EveryRenderStartsFromClearColor) {
    SoftwareRenderer renderer(10, 10);
    DisplayList red;
    red.fill_rect({0, 0, 10, 10}, kRed);
    renderer.render(red);
    ASSERT_EQ(renderer.get_pixel(3, 3), kRed);

    DisplayList empty;
    renderer.render(empty);
    for (int y = 0; y < 10; ++y) {
        for (int x = 0; x < 10; ++x) {
            ASSERT_EQ(renderer.get_pixel(x, y), kWhite) << x << "," << y;
        }
    }

    renderer.set_clear_color(kBlue);
    renderer.render(empty);
    EXPECT_EQ(renderer.get_pixel(9, 9), kBlue);
}

TEST(SoftwareRendererTest, AppliesDeviceScale) {
    SoftwareRenderer renderer(40, 40, 2.0f);
    DisplayList list;
    list.fill_rect({5, 5, 10, 10}, kRed);
    renderer.render(list);
    EXPECT_EQ(renderer.get_pixel(9, 9), kWhite);
    EXPECT_EQ(renderer.get_pixel(10, 10), kRed);
    EXPECT_EQ(renderer.get_pixel(29, 29), kRed);
    EXPECT_EQ(renderer.get_pixel(30, 30), kWhite);
}

TEST(SoftwareRendererTest, BlendsTranslucentColors) {
    SoftwareRenderer renderer(4, 4);
    DisplayList list;
    list.fill_rect({0, 0, 4, 4}, Color{255, 0, 0, 128});
    renderer.render(list);
    EXPECT_EQ(renderer.get_pixel(1, 1), (Color{255, 127, 127, 255}));
}

TEST(SoftwareRendererTest, DrawsSolidAndDashedBorders) {
    SoftwareRenderer renderer(40, 20);
    DisplayList list;
    const float widths[4] = {2, 2, 2, 2};
    const Color colors[4] = {kRed, kRed, kRed, kRed};
    const StrokeStyle styles[4] = {StrokeStyle::Dashed, StrokeStyle::Solid,
                                   StrokeStyle::Solid, StrokeStyle::Solid};
    list.draw_border({0, 0, 40, 20}, widths, colors, styles);
    renderer.render(list);

    EXPECT_EQ(renderer.get_pixel(0, 10), kRed);
    EXPECT_EQ(renderer.get_pixel(39, 10), kRed);
    EXPECT_EQ(renderer.get_pixel(20, 19), kRed);
    EXPECT_EQ(renderer.get_pixel(20, 10), kWhite);
    // Top side: 6px dashes separated by 6px gaps
    EXPECT_EQ(renderer.get_pixel(2, 0), kRed);
    EXPECT_EQ(renderer.get_pixel(8, 0), kWhite);
    EXPECT_EQ(renderer.get_pixel(14, 0), kRed);
}

TEST(SoftwareRendererTest, GreeksTextWithoutRasterizer) {
    SoftwareRenderer renderer(60, 30);
    DisplayList list;
    list.draw_text("abc", {10, 10, 30, 16}, 22, 16, Color{0, 0, 0, 255});
    renderer.render(list);
    EXPECT_EQ(renderer.get_pixel(15, 20), (Color{128, 128, 128, 255}));
    EXPECT_EQ(renderer.get_pixel(15, 24), kWhite);
    EXPECT_EQ(renderer.get_pixel(45, 20), kWhite);
}

TEST(SoftwareRendererTest, UsesGlyphRasterizerWhenSet) {
    SoftwareRenderer renderer(20, 20, 2.0f);
    int calls = 0;
    float seen_scale = 0;
    renderer.set_glyph_rasterizer([&](const PaintCommand& cmd, float scale, SoftwareRenderer& target) {
        ++calls;
        seen_scale = scale;
        EXPECT_EQ(cmd.text, "x");
        target.set_pixel(0, 0, kGreen);
    });
    DisplayList list;
    list.draw_text("x", {0, 0, 5, 5}, 4, 5, kRed);
    renderer.render(list);
    EXPECT_EQ(calls, 1);
    EXPECT_FLOAT_EQ(seen_scale, 2.0f);
    EXPECT_EQ(renderer.get_pixel(0, 0), kGreen);
}

TEST(SoftwareRendererTest, PlaceholderHasOutline) {
    SoftwareRenderer renderer(20, 20);
    DisplayList list;
    list.draw_placeholder({0, 0, 20, 20}, "img", Color::from_argb(0xFFDDDDDD));
    renderer.render(list);
    EXPECT_EQ(renderer.get_pixel(0, 5), Color::from_argb(0xFF999999));
    EXPECT_EQ(renderer.get_pixel(10, 10), Color::from_argb(0xFFDDDDDD));
}

TEST(SoftwareRendererTest, OutOfBoundsPixelsAreIgnored) {
    SoftwareRenderer renderer(4, 4);
    renderer.set_pixel(-1, 2, kRed);
    renderer.set_pixel(4, 2, kRed);
    EXPECT_EQ(renderer.get_pixel(10, 10), (Color{0, 0, 0, 0}));
}

TEST(SoftwareRendererTest, SavesPpm) {
    SoftwareRenderer renderer(4, 3);
    renderer.render(DisplayList{});
    const std::string path = ::testing::TempDir() + "verso_paint_test.ppm";
    ASSERT_TRUE(renderer.save_ppm(path));

    std::ifstream in(path, std::ios::binary);
    std::string magic, size_w, size_h, max;
    in >> magic >> size_w >> size_h >> max;
    EXPECT_EQ(magic, "P6");
    EXPECT_EQ(size_w, "4");
    EXPECT_EQ(size_h, "3");
    EXPECT_EQ(max, "255");
    in.close();
    std::remove(path.c_str());

    EXPECT_FALSE(renderer.save_ppm("/nonexistent-verso-dir/out.ppm"));
}
