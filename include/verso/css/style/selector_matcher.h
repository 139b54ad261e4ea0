#pragma once
#include <verso/css/parser/selector.h>
#include <verso/dom/document.h>

namespace verso::css {

// Matches selectors against element nodes of a dom::Document. Ancestors
// are reached through the arena's parent indices.
class SelectorMatcher {
public:
    bool matches(const dom::Document& doc, dom::NodeId element,
                 const ComplexSelector& selector) const;
    bool matches_compound(const dom::Document& doc, dom::NodeId element,
                          const CompoundSelector& compound) const;
    bool matches_simple(const dom::Document& doc, dom::NodeId element,
                        const SimpleSelector& simple) const;

private:
    bool matches_from(const dom::Document& doc, dom::NodeId element,
                      const ComplexSelector& selector, size_t part_index) const;
};

} // namespace verso::css
