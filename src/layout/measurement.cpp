#include <verso/layout/measurement.h>
#include <verso/core/config.h>
#include <verso/core/diagnostics.h>
#include <verso/css/style/computed_style.h>
#include <cmath>
#include <sstream>

namespace verso::layout {

namespace cfg = core::config;

namespace {

// Negative or non-finite provider answers count as unavailable
bool is_usable(float value) {
    return std::isfinite(value) && value >= 0;
}

bool is_usable(const LineMetrics& m) {
    return is_usable(m.ascent) && is_usable(m.descent) && is_usable(m.line_height);
}

} // namespace

FontDescriptor FontDescriptor::from_style(const css::ComputedStyle& style) {
    FontDescriptor font;
    font.family = style.font_family;
    font.size = style.font_size;
    font.weight = style.font_weight;
    font.italic = style.font_style != css::FontStyle::Normal;
    return font;
}

size_t utf8_length(const std::string& text) {
    size_t count = 0;
    for (unsigned char c : text) {
        // Count every byte that is not a continuation byte
        if ((c & 0xC0) != 0x80) ++count;
    }
    return count;
}

// ---------------------------------------------------------------------------
// FixedAdvanceMeasurement
// ---------------------------------------------------------------------------

FixedAdvanceMeasurement::FixedAdvanceMeasurement()
    : FixedAdvanceMeasurement(cfg::kFallbackAdvanceRatio, cfg::kFallbackSpaceRatio) {}

FixedAdvanceMeasurement::FixedAdvanceMeasurement(float advance_ratio, float space_ratio)
    : advance_ratio_(advance_ratio), space_ratio_(space_ratio) {}

std::optional<float> FixedAdvanceMeasurement::space_advance(const FontDescriptor& font) const {
    return space_ratio_ * font.size;
}

std::optional<float> FixedAdvanceMeasurement::word_advance(const FontDescriptor& font,
                                                           const std::string& text) const {
    return static_cast<float>(utf8_length(text)) * advance_ratio_ * font.size;
}

std::optional<LineMetrics> FixedAdvanceMeasurement::line_metrics(const FontDescriptor& font) const {
    LineMetrics m;
    m.ascent = cfg::kFallbackAscentRatio * font.size;
    m.descent = cfg::kFallbackDescentRatio * font.size;
    m.line_height = cfg::kFallbackLineHeightRatio * font.size;
    return m;
}

// ---------------------------------------------------------------------------
// CallbackMeasurement
// ---------------------------------------------------------------------------

CallbackMeasurement::CallbackMeasurement(TextMeasureFn measure, LineMetricsFn metrics)
    : measure_(std::move(measure)), metrics_(std::move(metrics)) {}

std::optional<float> CallbackMeasurement::space_advance(const FontDescriptor& font) const {
    return word_advance(font, " ");
}

std::optional<float> CallbackMeasurement::word_advance(const FontDescriptor& font,
                                                       const std::string& text) const {
    if (!measure_) return std::nullopt;
    float width = measure_(text, font.size, font.family, font.weight, font.italic);
    if (width < 0) return std::nullopt;
    return width;
}

std::optional<LineMetrics> CallbackMeasurement::line_metrics(const FontDescriptor& font) const {
    if (!metrics_) return std::nullopt;
    return metrics_(font);
}

// ---------------------------------------------------------------------------
// MetricResolver
// ---------------------------------------------------------------------------

MetricResolver::MetricResolver(const MeasurementProvider& provider,
                               core::DiagnosticEmitter* diagnostics)
    : provider_(provider), diagnostics_(diagnostics) {}

void MetricResolver::report_missing(const FontDescriptor& font, const char* metric) {
    if (!diagnostics_) return;
    std::ostringstream key;
    key << metric << '|' << font.family << '|' << font.size << '|' << font.weight << '|' << font.italic;
    if (!reported_.insert(key.str()).second) return;

    std::ostringstream msg;
    msg << metric << " unavailable for " << font.family << ' ' << font.size
        << "px, using fallback metrics";
    diagnostics_->warn(core::DiagnosticCode::MissingGlyphMetric, "layout", "measure", msg.str());
}

float MetricResolver::space_advance(const FontDescriptor& font) {
    auto v = provider_.space_advance(font);
    if (v && is_usable(*v)) return *v;
    report_missing(font, "space advance");
    return cfg::kFallbackSpaceRatio * font.size;
}

float MetricResolver::word_advance(const FontDescriptor& font, const std::string& text) {
    auto v = provider_.word_advance(font, text);
    if (v && is_usable(*v)) return *v;
    report_missing(font, "word advance");
    return static_cast<float>(utf8_length(text)) * cfg::kFallbackAdvanceRatio * font.size;
}

LineMetrics MetricResolver::line_metrics(const FontDescriptor& font) {
    auto provided = provider_.line_metrics(font);
    if (provided && is_usable(*provided)) return *provided;
    report_missing(font, "line metrics");
    LineMetrics m;
    m.ascent = cfg::kFallbackAscentRatio * font.size;
    m.descent = cfg::kFallbackDescentRatio * font.size;
    m.line_height = cfg::kFallbackLineHeightRatio * font.size;
    return m;
}

float MetricResolver::line_height(const css::ComputedStyle& style) {
    switch (style.line_height.kind) {
        case css::LineHeight::Kind::Number:
            return style.line_height.value * style.font_size;
        case css::LineHeight::Kind::Px:
            return style.line_height.value;
        case css::LineHeight::Kind::Normal:
            break;
    }
    return line_metrics(FontDescriptor::from_style(style)).line_height;
}

} // namespace verso::layout
