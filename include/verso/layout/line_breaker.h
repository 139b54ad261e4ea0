#pragma once
#include <verso/css/style/computed_style.h>
#include <verso/dom/document.h>
#include <verso/layout/box.h>
#include <verso/layout/measurement.h>
#include <string>
#include <vector>

namespace verso::layout {

// Flattened inline content of one block container, in document order.
struct InlineItem {
    // Edge: margin, border and padding at the start or end of an inline
    // element, advancing the line without producing a run.
    enum class Kind { Text, Atomic, ForcedBreak, Edge };
    Kind kind = Kind::Text;
    std::string text;                           // Text only
    float width = 0;                            // Edge only
    dom::NodeId node = dom::kInvalidNode;
    const css::ComputedStyle* style = nullptr;
    const LayoutBox* atomic = nullptr;          // Atomic only, already laid out
};

struct InlineToken {
    enum class Kind { Word, Space, Atomic, ForcedBreak, Edge };
    Kind kind = Kind::Word;
    std::string text;
    float width = 0;
    float ascent = 0;
    float descent = 0;
    float line_height = 0;
    bool breakable = true;    // Space: a break opportunity. Atomic: opportunities around it.
    bool preserved = false;   // Space under white-space: pre / pre-wrap
    dom::NodeId node = dom::kInvalidNode;
    const css::ComputedStyle* style = nullptr;
    const LayoutBox* atomic = nullptr;
};

// Applies text-transform. `at_word_start` carries capitalization state
// across consecutive text pieces.
std::string apply_text_transform(const std::string& text, css::TextTransform transform,
                                 bool& at_word_start);

// Splits inline items into words, spaces, atomic tokens and forced breaks,
// collapsing white space per each item's white-space value, and measures
// every token.
std::vector<InlineToken> tokenize_inline(const std::vector<InlineItem>& items,
                                         MetricResolver& metrics);

struct LineBreakOptions {
    float available_width = 0;
    css::TextAlign text_align = css::TextAlign::Left;
    // Strut of the container, used for lines without content.
    float strut_ascent = 0;
    float strut_descent = 0;
    float strut_line_height = 0;
};

struct LineLayout {
    std::vector<LineBox> lines;
    float height = 0;
    float max_line_width = 0;   // widest line content, for shrink-to-fit
};

// Greedy line breaking. Coordinates are relative to the container's content
// box. A line always receives at least one unit, so content wider than the
// container overflows instead of being dropped.
LineLayout break_lines(const std::vector<InlineToken>& tokens, const LineBreakOptions& options);

} // namespace verso::layout
