#include <verso/engine/render_pipeline.h>

#include <verso/layout/layout_engine.h>
#include <verso/paint/painter.h>

namespace verso::engine {

PipelineOutput run_pipeline(const PipelineInput& input, const StageObserver& observer) {
    PipelineOutput output;
    if (!input.document) {
        output.message = "No document";
        return output;
    }
    const dom::Document& doc = *input.document;

    css::StyleResolver resolver;
    resolver.set_viewport(input.viewport_width, input.viewport_height);
    for (const auto& sheet : input.stylesheets) {
        resolver.add_stylesheet(sheet);
    }
    output.styles = css::resolve_tree(doc, resolver, &output.diagnostics);
    if (observer) observer("style");

    layout::FixedAdvanceMeasurement fallback_measurement;
    const layout::MeasurementProvider& measurement =
        input.measurement ? *input.measurement : fallback_measurement;

    layout::LayoutOptions options;
    options.viewport_width = input.viewport_width;
    options.viewport_height = input.viewport_height;
    layout::LayoutEngine engine;
    layout::LayoutResult laid_out =
        engine.layout(doc, output.styles, input.viewport_width, measurement, options);
    output.layout = std::move(laid_out.root);
    output.diagnostics.merge(laid_out.diagnostics);
    if (observer) observer("layout");

    paint::Painter painter;
    output.display_list = painter.paint(*output.layout);
    if (observer) observer("paint");

    output.ok = true;
    output.message = "OK";
    return output;
}

RenderPipeline::RenderPipeline(const dom::Document& document,
                               std::vector<css::StyleSheet> stylesheets,
                               float viewport_width, float viewport_height)
    : document_(document),
      stylesheets_(std::move(stylesheets)),
      viewport_width_(viewport_width),
      viewport_height_(viewport_height) {
}

void RenderPipeline::set_viewport(float width, float height) {
    std::lock_guard<std::mutex> lock(mutex_);
    viewport_width_ = width;
    viewport_height_ = height;
    ++generation_;
}

void RenderPipeline::add_stylesheet(css::StyleSheet sheet) {
    std::lock_guard<std::mutex> lock(mutex_);
    stylesheets_.push_back(std::move(sheet));
    ++generation_;
}

void RenderPipeline::set_measurement(const layout::MeasurementProvider* measurement) {
    std::lock_guard<std::mutex> lock(mutex_);
    measurement_ = measurement;
    ++generation_;
}

void RenderPipeline::set_stage_observer(StageObserver observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    observer_ = std::move(observer);
}

std::uint64_t RenderPipeline::invalidate() {
    std::lock_guard<std::mutex> lock(mutex_);
    return ++generation_;
}

std::shared_ptr<const PipelineOutput> RenderPipeline::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_;
}

int RenderPipeline::render_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return render_count_;
}

int RenderPipeline::discarded_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return discarded_count_;
}

RerenderResult RenderPipeline::rerender() {
    // Inputs are copied so the run itself holds no lock
    PipelineInput input;
    StageObserver observer;
    std::uint64_t started_at = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        started_at = generation_;
        input.document = &document_;
        input.stylesheets = stylesheets_;
        input.viewport_width = viewport_width_;
        input.viewport_height = viewport_height_;
        input.measurement = measurement_;
        observer = observer_;
    }

    auto output = std::make_shared<PipelineOutput>(run_pipeline(input, observer));

    std::lock_guard<std::mutex> lock(mutex_);
    if (!output->ok) {
        return {false, false, output->message, render_count_, started_at};
    }

    // Checked and published under the same lock invalidate() takes
    if (generation_ != started_at) {
        // Invalidated while running; the previous snapshot stays current.
        ++discarded_count_;
        return {true, false, "Discarded stale render", render_count_, started_at};
    }

    snapshot_ = std::move(output);
    ++render_count_;
    return {true, true, "OK", render_count_, started_at};
}

} // namespace verso::engine
