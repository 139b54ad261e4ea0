#include <verso/css/parser/stylesheet.h>
#include <verso/core/diagnostics.h>
#include <algorithm>
#include <cctype>

namespace verso::css {

namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

std::string trim(std::string_view s) {
    size_t start = 0;
    while (start < s.size() && is_space(s[start])) ++start;
    size_t end = s.size();
    while (end > start && is_space(s[end - 1])) --end;
    return std::string(s.substr(start, end - start));
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Removes /* ... */ comments, leaving string contents untouched.
std::string strip_comments(std::string_view css) {
    std::string out;
    out.reserve(css.size());
    char quote = 0;
    for (size_t i = 0; i < css.size(); ++i) {
        char c = css[i];
        if (quote) {
            out += c;
            if (c == '\\' && i + 1 < css.size()) {
                out += css[++i];
            } else if (c == quote) {
                quote = 0;
            }
            continue;
        }
        if (c == '"' || c == '\'') {
            quote = c;
            out += c;
            continue;
        }
        if (c == '/' && i + 1 < css.size() && css[i + 1] == '*') {
            size_t end = css.find("*/", i + 2);
            if (end == std::string_view::npos) break;
            i = end + 1;
            out += ' ';
            continue;
        }
        out += c;
    }
    return out;
}

} // namespace

// ---------------------------------------------------------------------------
// Internal stylesheet parser
// ---------------------------------------------------------------------------

class StyleSheetParser {
public:
    StyleSheetParser(std::string text, core::DiagnosticEmitter* diagnostics)
        : text_(std::move(text)), diagnostics_(diagnostics) {}

    StyleSheet parse();
    std::vector<Declaration> parse_declarations();

private:
    std::string text_;
    size_t pos_ = 0;
    core::DiagnosticEmitter* diagnostics_;

    bool at_end() const { return pos_ >= text_.size(); }
    char current() const { return at_end() ? '\0' : text_[pos_]; }
    void skip_whitespace();

    // Top-level parsing
    void parse_at_rule(StyleSheet& sheet);
    void parse_media_rule(StyleSheet& sheet, const std::string& condition);
    std::optional<StyleRule> parse_style_rule();

    // Declarations
    std::optional<Declaration> parse_declaration(std::string_view text) const;

    // Utilities
    std::string consume_until(char stop1, char stop2);
    std::string consume_block();
    void skip_block();
    void report(const std::string& message) const;
};

void StyleSheetParser::skip_whitespace() {
    while (!at_end() && is_space(text_[pos_])) ++pos_;
}

std::string StyleSheetParser::consume_until(char stop1, char stop2) {
    size_t start = pos_;
    char quote = 0;
    int bracket_depth = 0;
    while (!at_end()) {
        char c = text_[pos_];
        if (quote) {
            if (c == quote) quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '(' || c == '[') {
            bracket_depth++;
        } else if ((c == ')' || c == ']') && bracket_depth > 0) {
            bracket_depth--;
        } else if (bracket_depth == 0 && (c == stop1 || c == stop2)) {
            break;
        }
        ++pos_;
    }
    return text_.substr(start, pos_ - start);
}

// Consumes a balanced {...} block (current() == '{') and returns its body.
std::string StyleSheetParser::consume_block() {
    ++pos_;
    size_t start = pos_;
    int depth = 1;
    char quote = 0;
    while (!at_end()) {
        char c = text_[pos_];
        if (quote) {
            if (c == quote) quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '{') {
            depth++;
        } else if (c == '}') {
            if (--depth == 0) break;
        }
        ++pos_;
    }
    std::string body = text_.substr(start, pos_ - start);
    if (!at_end()) ++pos_;  // closing brace
    return body;
}

void StyleSheetParser::skip_block() {
    consume_block();
}

void StyleSheetParser::report(const std::string& message) const {
    if (diagnostics_) {
        diagnostics_->warn(core::DiagnosticCode::InvalidSelector, "css", "parse", message);
    }
}

StyleSheet StyleSheetParser::parse() {
    StyleSheet sheet;
    while (true) {
        skip_whitespace();
        if (at_end()) break;
        char c = current();
        if (c == '@') {
            parse_at_rule(sheet);
        } else if (c == '}' || c == ';') {
            // Stray token at top level
            ++pos_;
        } else {
            auto rule = parse_style_rule();
            if (rule) sheet.add_rule(std::move(*rule));
        }
    }
    return sheet;
}

void StyleSheetParser::parse_at_rule(StyleSheet& sheet) {
    ++pos_;  // '@'
    size_t name_start = pos_;
    while (!at_end() && (std::isalnum(static_cast<unsigned char>(current())) || current() == '-')) {
        ++pos_;
    }
    std::string name = to_lower(text_.substr(name_start, pos_ - name_start));
    std::string prelude = trim(consume_until('{', ';'));

    if (at_end()) return;
    if (current() == ';') {
        // Statement at-rules (@import, @charset) carry nothing we model.
        ++pos_;
        return;
    }
    if (name == "media") {
        parse_media_rule(sheet, prelude);
        return;
    }
    report("unsupported at-rule @" + name + " ignored");
    skip_block();
}

void StyleSheetParser::parse_media_rule(StyleSheet& sheet, const std::string& condition) {
    StyleSheetParser inner(consume_block(), diagnostics_);
    MediaRule media;
    media.condition = condition;
    while (true) {
        inner.skip_whitespace();
        if (inner.at_end()) break;
        if (inner.current() == '@') {
            // Nested at-rules are not supported inside @media.
            inner.consume_until('{', ';');
            if (inner.at_end()) break;
            if (inner.current() == ';') {
                ++inner.pos_;
            } else {
                inner.skip_block();
            }
            report("nested at-rule inside @media ignored");
            continue;
        }
        if (inner.current() == '}' || inner.current() == ';') {
            ++inner.pos_;
            continue;
        }
        auto rule = inner.parse_style_rule();
        if (rule) media.rules.push_back(std::move(*rule));
    }
    sheet.add_media_rule(std::move(media));
}

std::optional<StyleRule> StyleSheetParser::parse_style_rule() {
    std::string selector_text = trim(consume_until('{', '}'));
    if (at_end() || current() == '}') {
        if (!at_end()) ++pos_;
        report("rule without declaration block ignored: " + selector_text);
        return std::nullopt;
    }
    std::string body = consume_block();

    auto selectors = parse_selector_list(selector_text);
    if (!selectors) {
        report("invalid selector \"" + selector_text + "\", rule ignored");
        return std::nullopt;
    }

    StyleRule rule;
    rule.selectors = std::move(*selectors);
    rule.selector_text = selector_text;
    rule.declarations = StyleSheetParser(body, diagnostics_).parse_declarations();
    return rule;
}

std::optional<Declaration> StyleSheetParser::parse_declaration(std::string_view text) const {
    auto colon = text.find(':');
    if (colon == std::string_view::npos) return std::nullopt;

    Declaration decl;
    decl.property = to_lower(trim(text.substr(0, colon)));
    if (decl.property.empty()) return std::nullopt;

    std::string value = trim(text.substr(colon + 1));
    auto bang = value.rfind('!');
    if (bang != std::string::npos && to_lower(trim(value.substr(bang + 1))) == "important") {
        decl.important = true;
        value = trim(value.substr(0, bang));
    }
    if (value.empty()) return std::nullopt;
    decl.value = std::move(value);
    return decl;
}

std::vector<Declaration> StyleSheetParser::parse_declarations() {
    std::vector<Declaration> decls;
    while (true) {
        skip_whitespace();
        if (at_end()) break;
        std::string piece = consume_until(';', '\0');
        if (!at_end()) ++pos_;  // ';'
        auto decl = parse_declaration(piece);
        if (decl) {
            decls.push_back(std::move(*decl));
        } else if (diagnostics_ && !trim(piece).empty()) {
            diagnostics_->warn(core::DiagnosticCode::ParseFallback, "css", "parse",
                               "malformed declaration \"" + trim(piece) + "\" ignored");
        }
    }
    return decls;
}

// ---------------------------------------------------------------------------
// StyleSheet
// ---------------------------------------------------------------------------

void StyleSheet::add_rule(StyleRule rule) {
    rule.source_order = next_source_order++;
    rules.push_back(std::move(rule));
}

void StyleSheet::add_media_rule(MediaRule media) {
    for (auto& rule : media.rules) {
        rule.source_order = next_source_order++;
    }
    media_rules.push_back(std::move(media));
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

StyleSheet parse_stylesheet(std::string_view css, core::DiagnosticEmitter* diagnostics) {
    StyleSheetParser parser(strip_comments(css), diagnostics);
    return parser.parse();
}

std::vector<Declaration> parse_declaration_block(std::string_view css,
                                                 core::DiagnosticEmitter* diagnostics) {
    StyleSheetParser parser(strip_comments(css), diagnostics);
    return parser.parse_declarations();
}

} // namespace verso::css
