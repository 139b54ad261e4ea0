#pragma once

#include <verso/core/config.h>
#include <verso/core/diagnostics.h>
#include <verso/css/parser/stylesheet.h>
#include <verso/css/style/style_resolver.h>
#include <verso/dom/document.h>
#include <verso/layout/box.h>
#include <verso/layout/measurement.h>
#include <verso/paint/display_list.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace verso::engine {

struct PipelineInput {
    const dom::Document* document = nullptr;
    std::vector<css::StyleSheet> stylesheets;
    float viewport_width = static_cast<float>(core::config::kDefaultViewportWidth);
    float viewport_height = static_cast<float>(core::config::kDefaultViewportHeight);
    // nullptr selects the deterministic fixed-advance metrics
    const layout::MeasurementProvider* measurement = nullptr;
};

// Result of one run. `layout` points into `styles`; both move together, so
// the output may be moved but never split.
struct PipelineOutput {
    bool ok = false;
    std::string message;
    css::StyledTree styles;
    std::unique_ptr<layout::LayoutBox> layout;
    paint::DisplayList display_list;
    core::DiagnosticEmitter diagnostics;
};

// Called after each stage ("style", "layout", "paint") completes.
using StageObserver = std::function<void(const std::string& stage)>;

// Style -> layout -> paint over complete inputs. Pure apart from the observer.
PipelineOutput run_pipeline(const PipelineInput& input, const StageObserver& observer = nullptr);

struct RerenderResult {
    bool ok = false;
    bool published = false;
    std::string message;
    int render_count = 0;
    std::uint64_t generation = 0;
};

// Keeps the latest published snapshot of a document. Every change bumps
// the generation; a run that finishes under an outdated generation is
// discarded. rerender() may run on a worker thread while the host calls the
// setters and invalidate() from another; the document itself must not be
// mutated during a run.
class RenderPipeline {
public:
    RenderPipeline(const dom::Document& document, std::vector<css::StyleSheet> stylesheets,
                   float viewport_width, float viewport_height);

    const dom::Document& document() const { return document_; }

    void set_viewport(float width, float height);
    void add_stylesheet(css::StyleSheet sheet);
    void set_measurement(const layout::MeasurementProvider* measurement);
    void set_stage_observer(StageObserver observer);

    // Marks the current snapshot stale; returns the new generation.
    std::uint64_t invalidate();
    std::uint64_t generation() const { return generation_.load(); }

    RerenderResult rerender();

    // Latest published output, or nullptr before the first publication.
    std::shared_ptr<const PipelineOutput> snapshot() const;

    int render_count() const;
    int discarded_count() const;

private:
    mutable std::mutex mutex_;
    const dom::Document& document_;
    std::vector<css::StyleSheet> stylesheets_;
    float viewport_width_;
    float viewport_height_;
    const layout::MeasurementProvider* measurement_ = nullptr;
    StageObserver observer_;
    std::shared_ptr<const PipelineOutput> snapshot_;
    std::atomic<std::uint64_t> generation_{0};
    int render_count_ = 0;
    int discarded_count_ = 0;
};

} // namespace verso::engine
