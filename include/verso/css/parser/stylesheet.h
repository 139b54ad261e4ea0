#pragma once
#include <verso/css/parser/selector.h>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace verso::core {
class DiagnosticEmitter;
}

namespace verso::css {

struct Declaration {
    std::string property;   // lower-case
    std::string value;      // raw value text, trimmed, without !important
    bool important = false;
};

struct StyleRule {
    SelectorList selectors;
    std::vector<Declaration> declarations;
    std::string selector_text;  // original selector text
    size_t source_order = 0;    // position in the sheet, @media contents included
};

struct MediaRule {
    std::string condition;
    std::vector<StyleRule> rules;
};

struct StyleSheet {
    std::vector<StyleRule> rules;
    std::vector<MediaRule> media_rules;
    size_t next_source_order = 0;

    // Appends a host-constructed rule, stamping its source order.
    void add_rule(StyleRule rule);
    void add_media_rule(MediaRule media);

    size_t rule_count() const { return next_source_order; }
};

// Parse functions. Malformed rules are skipped and reported through
// `diagnostics` when one is supplied.
StyleSheet parse_stylesheet(std::string_view css,
                            core::DiagnosticEmitter* diagnostics = nullptr);
std::vector<Declaration> parse_declaration_block(std::string_view css,
                                                 core::DiagnosticEmitter* diagnostics = nullptr);

} // namespace verso::css
