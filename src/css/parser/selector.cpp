#include <verso/css/parser/selector.h>
#include <algorithm>
#include <cctype>

namespace verso::css {

namespace {

std::string ascii_lower(std::string value) {
    std::transform(
        value.begin(),
        value.end(),
        value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool is_ident_char(char c) {
    unsigned char uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) || c == '-' || c == '_' || uc >= 0x80;
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

// Character-level parser for the supported selector grammar:
//   complex  := compound ( ( ws+ | ws* '>' ws* ) compound )*
//   compound := ( type | '*' )? ( '.' ident | '#' ident | '[' attr ']' )*
class SelectorParser {
public:
    explicit SelectorParser(std::string_view input) : input_(input) {}

    std::optional<ComplexSelector> parse_complex();

private:
    std::string_view input_;
    size_t pos_ = 0;

    bool at_end() const { return pos_ >= input_.size(); }
    char current() const { return at_end() ? '\0' : input_[pos_]; }
    void skip_whitespace() { while (!at_end() && is_space(input_[pos_])) ++pos_; }

    std::string parse_ident();
    std::optional<CompoundSelector> parse_compound();
    std::optional<SimpleSelector> parse_attribute();
};

std::string SelectorParser::parse_ident() {
    size_t start = pos_;
    while (!at_end() && is_ident_char(input_[pos_])) ++pos_;
    return std::string(input_.substr(start, pos_ - start));
}

std::optional<SimpleSelector> SelectorParser::parse_attribute() {
    // current() == '['
    ++pos_;
    skip_whitespace();
    SimpleSelector ss;
    ss.type = SimpleSelectorType::Attribute;
    ss.attr_name = ascii_lower(parse_ident());
    if (ss.attr_name.empty()) return std::nullopt;
    skip_whitespace();
    if (current() == ']') {
        ++pos_;
        ss.attr_match = AttributeMatch::Exists;
        ss.value = ss.attr_name;
        return ss;
    }
    if (current() != '=') return std::nullopt;
    ++pos_;
    skip_whitespace();
    if (current() == '"' || current() == '\'') {
        char quote = current();
        ++pos_;
        size_t start = pos_;
        while (!at_end() && input_[pos_] != quote) ++pos_;
        if (at_end()) return std::nullopt;
        ss.attr_value = std::string(input_.substr(start, pos_ - start));
        ++pos_;
    } else {
        ss.attr_value = parse_ident();
        if (ss.attr_value.empty()) return std::nullopt;
    }
    skip_whitespace();
    if (current() != ']') return std::nullopt;
    ++pos_;
    ss.attr_match = AttributeMatch::Exact;
    ss.value = ss.attr_name;
    return ss;
}

std::optional<CompoundSelector> SelectorParser::parse_compound() {
    CompoundSelector compound;

    if (current() == '*') {
        ++pos_;
        SimpleSelector ss;
        ss.type = SimpleSelectorType::Universal;
        ss.value = "*";
        compound.simple_selectors.push_back(ss);
    } else if (is_ident_char(current())) {
        SimpleSelector ss;
        ss.type = SimpleSelectorType::Type;
        ss.value = ascii_lower(parse_ident());
        compound.simple_selectors.push_back(ss);
    }

    while (!at_end()) {
        char c = current();
        if (c == '.' || c == '#') {
            ++pos_;
            std::string name = parse_ident();
            if (name.empty()) return std::nullopt;
            SimpleSelector ss;
            ss.type = (c == '.') ? SimpleSelectorType::Class : SimpleSelectorType::Id;
            ss.value = name;
            compound.simple_selectors.push_back(ss);
        } else if (c == '[') {
            auto attr = parse_attribute();
            if (!attr) return std::nullopt;
            compound.simple_selectors.push_back(*attr);
        } else {
            break;
        }
    }

    if (compound.simple_selectors.empty()) return std::nullopt;
    return compound;
}

std::optional<ComplexSelector> SelectorParser::parse_complex() {
    ComplexSelector complex;
    skip_whitespace();
    std::optional<Combinator> pending;

    while (true) {
        auto compound = parse_compound();
        if (!compound) return std::nullopt;
        complex.parts.push_back({*compound, pending});

        bool saw_space = !at_end() && is_space(current());
        skip_whitespace();
        if (at_end()) break;

        if (current() == '>') {
            ++pos_;
            skip_whitespace();
            pending = Combinator::Child;
        } else if (saw_space) {
            pending = Combinator::Descendant;
        } else {
            // Pseudo-classes, sibling combinators and other syntax are unsupported.
            return std::nullopt;
        }
        if (at_end()) return std::nullopt;
    }

    return complex;
}

} // namespace

// ---------------------------------------------------------------------------
// Specificity
// ---------------------------------------------------------------------------

bool Specificity::operator<(const Specificity& other) const {
    if (a != other.a) return a < other.a;
    if (b != other.b) return b < other.b;
    return c < other.c;
}

bool Specificity::operator==(const Specificity& other) const {
    return a == other.a && b == other.b && c == other.c;
}

Specificity compute_specificity(const ComplexSelector& selector) {
    Specificity spec;
    for (auto& part : selector.parts) {
        for (auto& ss : part.compound.simple_selectors) {
            switch (ss.type) {
                case SimpleSelectorType::Id:
                    spec.a++;
                    break;
                case SimpleSelectorType::Class:
                case SimpleSelectorType::Attribute:
                    spec.b++;
                    break;
                case SimpleSelectorType::Type:
                    spec.c++;
                    break;
                case SimpleSelectorType::Universal:
                    // Universal selector does not contribute to specificity
                    break;
            }
        }
    }
    return spec;
}

// ---------------------------------------------------------------------------
// Selector list
// ---------------------------------------------------------------------------

std::optional<SelectorList> parse_selector_list(std::string_view input) {
    SelectorList list;
    size_t start = 0;
    int bracket_depth = 0;
    for (size_t i = 0; i <= input.size(); ++i) {
        if (i < input.size()) {
            char c = input[i];
            if (c == '[') bracket_depth++;
            else if (c == ']' && bracket_depth > 0) bracket_depth--;
            if (c != ',' || bracket_depth > 0) continue;
        }
        std::string_view piece = input.substr(start, i - start);
        SelectorParser parser(piece);
        auto complex = parser.parse_complex();
        if (!complex) return std::nullopt;
        list.selectors.push_back(std::move(*complex));
        start = i + 1;
    }
    if (list.selectors.empty()) return std::nullopt;
    return list;
}

} // namespace verso::css
