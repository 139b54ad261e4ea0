#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace verso::css {

enum class SimpleSelectorType {
    Type,        // div, p, span
    Class,       // .foo
    Id,          // #bar
    Universal,   // *
    Attribute    // [attr], [attr=val]
};

enum class AttributeMatch {
    Exists,     // [attr]
    Exact       // [attr=val]
};

struct SimpleSelector {
    SimpleSelectorType type = SimpleSelectorType::Universal;
    std::string value;

    AttributeMatch attr_match = AttributeMatch::Exists;
    std::string attr_name;
    std::string attr_value;
};

enum class Combinator {
    Descendant,   // space
    Child         // >
};

struct CompoundSelector {
    std::vector<SimpleSelector> simple_selectors;
};

struct ComplexSelector {
    struct Part {
        CompoundSelector compound;
        std::optional<Combinator> combinator;  // combinator BEFORE this compound
    };
    std::vector<Part> parts;
};

struct SelectorList {
    std::vector<ComplexSelector> selectors;
};

// (id_count, class_attr_count, type_count), compared lexicographically.
struct Specificity {
    int a = 0;  // ID selectors
    int b = 0;  // class and attribute selectors
    int c = 0;  // type selectors

    bool operator<(const Specificity& other) const;
    bool operator==(const Specificity& other) const;
    bool operator!=(const Specificity& other) const { return !(*this == other); }
    bool operator>(const Specificity& other) const { return other < *this; }
};

Specificity compute_specificity(const ComplexSelector& selector);

// Parses a comma separated selector list. Returns nullopt when any selector
// in the list uses syntax outside the supported grammar, in which case the
// whole rule must be dropped.
std::optional<SelectorList> parse_selector_list(std::string_view input);

} // namespace verso::css
