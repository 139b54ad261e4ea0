#include <verso/css/style/selector_matcher.h>

namespace verso::css {

bool SelectorMatcher::matches_simple(const dom::Document& doc, dom::NodeId element,
                                     const SimpleSelector& simple) const {
    switch (simple.type) {
        case SimpleSelectorType::Universal:
            return true;
        case SimpleSelectorType::Type:
            return doc.tag_name(element) == simple.value;
        case SimpleSelectorType::Class:
            return doc.has_class(element, simple.value);
        case SimpleSelectorType::Id:
            return !simple.value.empty() && doc.element_id(element) == simple.value;
        case SimpleSelectorType::Attribute: {
            auto value = doc.attribute(element, simple.attr_name);
            if (!value) return false;
            if (simple.attr_match == AttributeMatch::Exists) return true;
            return *value == simple.attr_value;
        }
    }
    return false;
}

bool SelectorMatcher::matches_compound(const dom::Document& doc, dom::NodeId element,
                                       const CompoundSelector& compound) const {
    if (!doc.contains(element) || !doc.is_element(element)) return false;
    for (const auto& simple : compound.simple_selectors) {
        if (!matches_simple(doc, element, simple)) return false;
    }
    return true;
}

bool SelectorMatcher::matches(const dom::Document& doc, dom::NodeId element,
                              const ComplexSelector& selector) const {
    if (selector.parts.empty()) {
        return false;
    }
    // The last part is the subject element (rightmost in CSS selector text)
    return matches_from(doc, element, selector, selector.parts.size() - 1);
}

// Matches parts[0..part_index] with parts[part_index] anchored at `element`.
// Descendant combinators try every ancestor, so `a > b c` is matched correctly
// even when the nearest `b` is not the one under an `a`.
bool SelectorMatcher::matches_from(const dom::Document& doc, dom::NodeId element,
                                   const ComplexSelector& selector, size_t part_index) const {
    const auto& part = selector.parts[part_index];
    if (!matches_compound(doc, element, part.compound)) return false;
    if (part_index == 0) return true;

    Combinator combinator = part.combinator.value_or(Combinator::Descendant);
    dom::NodeId ancestor = doc.parent(element);

    if (combinator == Combinator::Child) {
        return ancestor != dom::kInvalidNode &&
               matches_from(doc, ancestor, selector, part_index - 1);
    }

    while (ancestor != dom::kInvalidNode) {
        if (matches_from(doc, ancestor, selector, part_index - 1)) return true;
        ancestor = doc.parent(ancestor);
    }
    return false;
}

} // namespace verso::css
