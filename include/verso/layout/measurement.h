#pragma once
#include <functional>
#include <optional>
#include <set>
#include <string>

namespace verso::core {
class DiagnosticEmitter;
}

namespace verso::css {
struct ComputedStyle;
}

namespace verso::layout {

struct FontDescriptor {
    std::string family;
    float size = 16;
    int weight = 400;
    bool italic = false;

    bool operator==(const FontDescriptor& o) const {
        return family == o.family && size == o.size && weight == o.weight && italic == o.italic;
    }

    static FontDescriptor from_style(const css::ComputedStyle& style);
};

struct LineMetrics {
    float ascent = 0;
    float descent = 0;
    float line_height = 0;   // recommended, used for line-height: normal
};

// Read-only capability passed into every layout call. std::nullopt means
// the metric is unavailable; the layout engine falls back to defaults.
class MeasurementProvider {
public:
    virtual ~MeasurementProvider() = default;

    virtual std::optional<float> space_advance(const FontDescriptor& font) const = 0;
    virtual std::optional<float> word_advance(const FontDescriptor& font,
                                              const std::string& text) const = 0;
    virtual std::optional<LineMetrics> line_metrics(const FontDescriptor& font) const = 0;
};

// Deterministic metrics: every code point advances `advance_ratio * size`.
class FixedAdvanceMeasurement : public MeasurementProvider {
public:
    FixedAdvanceMeasurement();
    FixedAdvanceMeasurement(float advance_ratio, float space_ratio);

    std::optional<float> space_advance(const FontDescriptor& font) const override;
    std::optional<float> word_advance(const FontDescriptor& font,
                                      const std::string& text) const override;
    std::optional<LineMetrics> line_metrics(const FontDescriptor& font) const override;

private:
    float advance_ratio_;
    float space_ratio_;
};

// Callback type for measuring text width using platform font APIs.
// Parameters: text, font_size, font_family, font_weight, is_italic
// Returns: width in pixels, negative when the text cannot be measured
using TextMeasureFn = std::function<float(const std::string& text, float font_size,
                                          const std::string& font_family, int font_weight,
                                          bool is_italic)>;
using LineMetricsFn = std::function<std::optional<LineMetrics>(const FontDescriptor& font)>;

// Adapts host callbacks. Without a LineMetricsFn, line metrics are reported
// unavailable.
class CallbackMeasurement : public MeasurementProvider {
public:
    explicit CallbackMeasurement(TextMeasureFn measure, LineMetricsFn metrics = nullptr);

    std::optional<float> space_advance(const FontDescriptor& font) const override;
    std::optional<float> word_advance(const FontDescriptor& font,
                                      const std::string& text) const override;
    std::optional<LineMetrics> line_metrics(const FontDescriptor& font) const override;

private:
    TextMeasureFn measure_;
    LineMetricsFn metrics_;
};

// Number of UTF-8 code points in `text`.
size_t utf8_length(const std::string& text);

// Wraps a provider for one layout run: applies the fallback metrics when
// the provider has no answer and records one MissingGlyphMetric diagnostic
// per font and metric kind.
class MetricResolver {
public:
    MetricResolver(const MeasurementProvider& provider, core::DiagnosticEmitter* diagnostics);

    float space_advance(const FontDescriptor& font);
    float word_advance(const FontDescriptor& font, const std::string& text);
    LineMetrics line_metrics(const FontDescriptor& font);

    // Used line height for a style: line-height normal defers to the
    // provider's recommendation.
    float line_height(const css::ComputedStyle& style);

    void set_diagnostics(core::DiagnosticEmitter* diagnostics) { diagnostics_ = diagnostics; }
    core::DiagnosticEmitter* diagnostics() const { return diagnostics_; }

private:
    void report_missing(const FontDescriptor& font, const char* metric);

    const MeasurementProvider& provider_;
    core::DiagnosticEmitter* diagnostics_;
    std::set<std::string> reported_;
};

} // namespace verso::layout
