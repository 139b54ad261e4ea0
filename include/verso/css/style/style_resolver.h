#pragma once
#include <verso/core/config.h>
#include <verso/css/parser/stylesheet.h>
#include <verso/css/style/computed_style.h>
#include <verso/css/style/selector_matcher.h>
#include <verso/dom/document.h>
#include <optional>
#include <string>
#include <vector>

namespace verso::core {
class DiagnosticEmitter;
}

namespace verso::css {

struct MatchedRule {
    const StyleRule* rule;
    Specificity specificity;   // of the most specific matching selector
    size_t source_order;
};

class PropertyCascade {
public:
    // Builds the style of one element: inherited values from `parent_style`,
    // then user-agent declarations, then matched rules and the inline style
    // ordered by (importance, origin, specificity, source order).
    ComputedStyle cascade(
        const std::vector<MatchedRule>& matched_rules,
        const std::vector<Declaration>& user_agent,
        const std::vector<Declaration>& inline_style,
        const ComputedStyle& parent_style,
        core::DiagnosticEmitter* diagnostics = nullptr) const;

    // Returns false when the value is malformed; `style` is left untouched.
    bool apply_declaration(ComputedStyle& style, const Declaration& decl,
                           const ComputedStyle& parent) const;

    void set_viewport(float width, float height) {
        viewport_width_ = width;
        viewport_height_ = height;
    }

private:
    float viewport_width_ = static_cast<float>(core::config::kDefaultViewportWidth);
    float viewport_height_ = static_cast<float>(core::config::kDefaultViewportHeight);
};

class StyleResolver {
public:
    void add_stylesheet(const StyleSheet& sheet);
    void clear_stylesheets();
    size_t stylesheet_count() const { return stylesheets_.size(); }

    ComputedStyle resolve(const dom::Document& doc, dom::NodeId node,
                          const ComputedStyle& parent_style,
                          core::DiagnosticEmitter* diagnostics = nullptr) const;

    std::vector<MatchedRule> collect_matching_rules(const dom::Document& doc,
                                                    dom::NodeId element) const;

    // Set viewport dimensions for @media query evaluation and font-size vw/vh
    void set_viewport(float width, float height);
    float viewport_width() const { return viewport_width_; }
    float viewport_height() const { return viewport_height_; }

    // Evaluate a @media condition string against the current viewport.
    // Returns nullopt when the condition uses an unsupported feature.
    std::optional<bool> evaluate_media_condition(const std::string& condition) const;

    // Records an InvalidSelector diagnostic for every unsupported @media condition.
    void report_invalid_media(core::DiagnosticEmitter& diagnostics) const;

private:
    // Helper: collect rules from a rule list into matched results
    void collect_from_rules(const std::vector<StyleRule>& rules,
                            const dom::Document& doc, dom::NodeId element,
                            size_t order_base,
                            std::vector<MatchedRule>& result) const;

    struct SheetEntry {
        StyleSheet sheet;
        size_t order_base;
    };

    SelectorMatcher matcher_;
    PropertyCascade cascade_;
    std::vector<SheetEntry> stylesheets_;
    size_t next_order_base_ = 0;
    float viewport_width_ = static_cast<float>(core::config::kDefaultViewportWidth);
    float viewport_height_ = static_cast<float>(core::config::kDefaultViewportHeight);
};

// Computed styles of a whole document, indexed by NodeId.
struct StyledTree {
    std::vector<ComputedStyle> styles;

    const ComputedStyle& style(dom::NodeId id) const { return styles[id]; }
    size_t size() const { return styles.size(); }
};

// Resolves every node, parents before children. Text nodes carry their
// parent's inherited values.
StyledTree resolve_tree(const dom::Document& doc, const StyleResolver& resolver,
                        core::DiagnosticEmitter* diagnostics = nullptr);

// Built-in defaults for an element, applied before author rules.
const std::vector<Declaration>& user_agent_declarations(const std::string& tag);

// Parse a CSS color value string to Color
std::optional<Color> parse_color(const std::string& value);

// Parse a CSS length value (px, em, rem, %, vw, vh, auto, unitless 0)
std::optional<Length> parse_length(const std::string& value);

} // namespace verso::css
