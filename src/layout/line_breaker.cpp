#include <verso/layout/line_breaker.h>
#include <algorithm>
#include <cctype>

namespace verso::layout {

namespace {

constexpr float kFitEpsilon = 0.001f;

bool is_collapsible_mode(css::WhiteSpace ws) {
    return ws == css::WhiteSpace::Normal || ws == css::WhiteSpace::NoWrap ||
           ws == css::WhiteSpace::PreLine;
}

bool allows_wrap(css::WhiteSpace ws) {
    return ws == css::WhiteSpace::Normal || ws == css::WhiteSpace::PreWrap ||
           ws == css::WhiteSpace::PreLine;
}

bool honours_newlines(css::WhiteSpace ws) {
    return ws == css::WhiteSpace::Pre || ws == css::WhiteSpace::PreWrap ||
           ws == css::WhiteSpace::PreLine;
}

bool is_space_char(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\f';
}

void assign_metrics(InlineToken& token, const css::ComputedStyle& style, MetricResolver& metrics) {
    LineMetrics lm = metrics.line_metrics(FontDescriptor::from_style(style));
    token.ascent = lm.ascent;
    token.descent = lm.descent;
    token.line_height = metrics.line_height(style);
}

} // namespace

std::string apply_text_transform(const std::string& text, css::TextTransform transform,
                                 bool& at_word_start) {
    std::string out = text;
    for (auto& ch : out) {
        unsigned char c = static_cast<unsigned char>(ch);
        bool space = std::isspace(c) != 0;
        switch (transform) {
            case css::TextTransform::Uppercase:
                ch = static_cast<char>(std::toupper(c));
                break;
            case css::TextTransform::Lowercase:
                ch = static_cast<char>(std::tolower(c));
                break;
            case css::TextTransform::Capitalize:
                if (at_word_start && !space) ch = static_cast<char>(std::toupper(c));
                break;
            case css::TextTransform::None:
                break;
        }
        at_word_start = space;
    }
    return out;
}

std::vector<InlineToken> tokenize_inline(const std::vector<InlineItem>& items,
                                         MetricResolver& metrics) {
    std::vector<InlineToken> tokens;
    bool last_was_collapsible_space = false;
    bool at_word_start = true;

    for (const auto& item : items) {
        if (item.kind == InlineItem::Kind::ForcedBreak) {
            InlineToken t;
            t.kind = InlineToken::Kind::ForcedBreak;
            t.node = item.node;
            t.style = item.style;
            tokens.push_back(std::move(t));
            last_was_collapsible_space = false;
            at_word_start = true;
            continue;
        }

        if (item.kind == InlineItem::Kind::Edge) {
            // Glued to the neighbouring content; white-space state carries over
            InlineToken t;
            t.kind = InlineToken::Kind::Edge;
            t.width = item.width;
            t.breakable = false;
            t.node = item.node;
            t.style = item.style;
            tokens.push_back(std::move(t));
            continue;
        }

        if (item.kind == InlineItem::Kind::Atomic) {
            InlineToken t;
            t.kind = InlineToken::Kind::Atomic;
            t.node = item.node;
            t.style = item.style;
            t.atomic = item.atomic;
            if (item.atomic) {
                t.width = item.atomic->geometry.margin_box_width();
                t.ascent = item.atomic->geometry.margin_box_height();
                t.line_height = t.ascent;
            }
            t.breakable = !item.style || allows_wrap(item.style->white_space);
            tokens.push_back(std::move(t));
            last_was_collapsible_space = false;
            at_word_start = false;
            continue;
        }

        if (!item.style) continue;
        const css::ComputedStyle& style = *item.style;
        const css::WhiteSpace ws = style.white_space;
        const bool collapse = is_collapsible_mode(ws);
        const bool wrap = allows_wrap(ws);
        const FontDescriptor font = FontDescriptor::from_style(style);
        const std::string text = apply_text_transform(item.text, style.text_transform, at_word_start);

        auto push_space = [&](size_t count) {
            InlineToken t;
            t.kind = InlineToken::Kind::Space;
            t.text = std::string(count, ' ');
            t.width = metrics.space_advance(font) * static_cast<float>(count);
            t.breakable = wrap;
            t.preserved = !collapse;
            t.node = item.node;
            t.style = item.style;
            assign_metrics(t, style, metrics);
            tokens.push_back(std::move(t));
        };

        size_t i = 0;
        while (i < text.size()) {
            char c = text[i];
            if (c == '\n') {
                if (honours_newlines(ws)) {
                    InlineToken t;
                    t.kind = InlineToken::Kind::ForcedBreak;
                    t.node = item.node;
                    t.style = item.style;
                    tokens.push_back(std::move(t));
                    last_was_collapsible_space = false;
                } else if (!last_was_collapsible_space) {
                    push_space(1);
                    last_was_collapsible_space = true;
                }
                ++i;
                continue;
            }
            if (is_space_char(c)) {
                size_t start = i;
                while (i < text.size() && is_space_char(text[i])) ++i;
                if (collapse) {
                    if (!last_was_collapsible_space) {
                        push_space(1);
                        last_was_collapsible_space = true;
                    }
                } else {
                    push_space(i - start);
                }
                continue;
            }

            size_t start = i;
            while (i < text.size() && !is_space_char(text[i]) && text[i] != '\n') ++i;
            InlineToken t;
            t.kind = InlineToken::Kind::Word;
            t.text = text.substr(start, i - start);
            t.width = metrics.word_advance(font, t.text);
            t.node = item.node;
            t.style = item.style;
            assign_metrics(t, style, metrics);
            tokens.push_back(std::move(t));
            last_was_collapsible_space = false;
        }
    }
    return tokens;
}

// ---------------------------------------------------------------------------
// Line breaking
// ---------------------------------------------------------------------------

namespace {

class LineBuilder {
public:
    explicit LineBuilder(const LineBreakOptions& options) : options_(options) {}

    void add(const InlineToken& token);
    LineLayout finish();

private:
    struct Placed {
        const InlineToken* token;
        float x;
    };

    const LineBreakOptions& options_;
    LineLayout result_;

    std::vector<const InlineToken*> unit_;
    std::vector<const InlineToken*> pending_spaces_;
    std::vector<Placed> placed_;
    float cursor_x_ = 0;
    float cursor_y_ = 0;
    bool soft_wrapped_ = false;   // current line started at a soft wrap

    bool line_has_content() const;
    float unit_width() const;
    void flush_unit();
    void place(const InlineToken& token);
    void end_line(bool forced);
};

bool is_line_content(const InlineToken& token) {
    switch (token.kind) {
        case InlineToken::Kind::Space: return token.preserved;
        case InlineToken::Kind::Edge: return false;
        default: return true;
    }
}

bool LineBuilder::line_has_content() const {
    for (const auto& p : placed_) {
        if (is_line_content(*p.token)) return true;
    }
    return false;
}

float LineBuilder::unit_width() const {
    float w = 0;
    for (const auto* t : unit_) w += t->width;
    return w;
}

void LineBuilder::place(const InlineToken& token) {
    placed_.push_back({&token, cursor_x_});
    cursor_x_ += token.width;
}

void LineBuilder::add(const InlineToken& token) {
    switch (token.kind) {
        case InlineToken::Kind::Word:
            unit_.push_back(&token);
            break;
        case InlineToken::Kind::Space:
            if (token.breakable) {
                flush_unit();
                pending_spaces_.push_back(&token);
            } else {
                unit_.push_back(&token);
            }
            break;
        case InlineToken::Kind::Atomic:
            if (token.breakable) {
                flush_unit();
                unit_.push_back(&token);
                flush_unit();
            } else {
                unit_.push_back(&token);
            }
            break;
        case InlineToken::Kind::Edge:
            unit_.push_back(&token);
            break;
        case InlineToken::Kind::ForcedBreak:
            flush_unit();
            pending_spaces_.clear();
            end_line(true);
            break;
    }
}

void LineBuilder::flush_unit() {
    if (unit_.empty()) return;

    const bool has_content = line_has_content();

    // Spaces before the unit: kept between content, dropped at a soft wrap,
    // kept at the start of a line only when white space is preserved.
    std::vector<const InlineToken*> lead;
    for (const auto* s : pending_spaces_) {
        if (has_content || (s->preserved && !soft_wrapped_)) lead.push_back(s);
    }
    float lead_width = 0;
    for (const auto* s : lead) lead_width += s->width;

    if (has_content &&
        cursor_x_ + lead_width + unit_width() > options_.available_width + kFitEpsilon) {
        // Break before the unit; the trailing spaces stay on no line.
        end_line(false);
        lead.clear();
    }

    for (const auto* s : lead) place(*s);
    bool line_empty = !line_has_content();
    for (const auto* t : unit_) {
        // Collapsible spaces never start a line
        if (line_empty && t->kind == InlineToken::Kind::Space && !t->preserved) continue;
        place(*t);
        if (is_line_content(*t)) line_empty = false;
    }
    unit_.clear();
    pending_spaces_.clear();
}

void LineBuilder::end_line(bool forced) {
    // Trailing collapsible spaces are dropped from the line
    while (!placed_.empty() && placed_.back().token->kind == InlineToken::Kind::Space &&
           !placed_.back().token->preserved) {
        cursor_x_ = placed_.back().x;
        placed_.pop_back();
    }
    if (placed_.empty() && !forced) {
        soft_wrapped_ = true;
        return;
    }

    float max_ascent = 0, max_descent = 0, max_line_height = 0;
    if (placed_.empty()) {
        max_ascent = options_.strut_ascent;
        max_descent = options_.strut_descent;
        max_line_height = options_.strut_line_height;
    }
    for (const auto& p : placed_) {
        max_ascent = std::max(max_ascent, p.token->ascent);
        max_descent = std::max(max_descent, p.token->descent);
        max_line_height = std::max(max_line_height, p.token->line_height);
    }
    float height = std::max(max_line_height, max_ascent + max_descent);
    float half_leading = (height - (max_ascent + max_descent)) / 2.0f;

    LineBox line;
    line.rect = {0, cursor_y_, options_.available_width, height};
    line.baseline = cursor_y_ + half_leading + max_ascent;
    line.content_width = cursor_x_;

    float offset = 0;
    float extra = options_.available_width - cursor_x_;
    if (extra > 0) {
        if (options_.text_align == css::TextAlign::Center) offset = extra / 2.0f;
        else if (options_.text_align == css::TextAlign::Right) offset = extra;
    }

    for (const auto& p : placed_) {
        const InlineToken& t = *p.token;
        if (t.kind == InlineToken::Kind::Edge) continue;
        TextRun run;
        run.text = t.text;
        run.node = t.node;
        run.style = t.style;
        run.atomic = t.atomic;
        run.baseline = line.baseline;
        switch (t.kind) {
            case InlineToken::Kind::Space: run.kind = RunKind::Space; break;
            case InlineToken::Kind::Atomic: run.kind = RunKind::Atomic; break;
            default: run.kind = RunKind::Word; break;
        }
        if (t.kind == InlineToken::Kind::Atomic) {
            // Bottom margin edge sits on the baseline
            run.rect = {p.x + offset, line.baseline - t.ascent, t.width, t.ascent};
        } else {
            run.rect = {p.x + offset, line.baseline - t.ascent, t.width, t.ascent + t.descent};
        }
        line.runs.push_back(std::move(run));
    }

    result_.max_line_width = std::max(result_.max_line_width, cursor_x_);
    result_.lines.push_back(std::move(line));
    cursor_y_ += height;
    placed_.clear();
    cursor_x_ = 0;
    soft_wrapped_ = !forced;
}

LineLayout LineBuilder::finish() {
    flush_unit();
    pending_spaces_.clear();
    if (!placed_.empty()) end_line(false);
    result_.height = cursor_y_;
    return std::move(result_);
}

} // namespace

LineLayout break_lines(const std::vector<InlineToken>& tokens, const LineBreakOptions& options) {
    LineBuilder builder(options);
    for (const auto& token : tokens) {
        builder.add(token);
    }
    return builder.finish();
}

} // namespace verso::layout
