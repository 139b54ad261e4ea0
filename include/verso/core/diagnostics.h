#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace verso::core {

enum class Severity {
    Info,
    Warning,
    Error,
};

// Degradations a stage may record. None of them stops the pipeline.
enum class DiagnosticCode {
    None,
    ParseFallback,        // malformed declaration value, initial value used
    UnresolvedDimension,  // percentage without a definite base, resolved to 0
    MissingGlyphMetric,   // measurement gap, fallback metric used
    InvalidSelector,      // unparseable rule or media condition, rule ignored
};

const char* severity_name(Severity severity);
const char* diagnostic_code_name(DiagnosticCode code);

struct DiagnosticEvent {
    Severity severity = Severity::Info;
    DiagnosticCode code = DiagnosticCode::None;
    std::string module;
    std::string stage;
    std::string message;
    std::uint64_t correlation_id = 0;
};

std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

class DiagnosticEmitter {
public:
    void emit(Severity severity, DiagnosticCode code, const std::string& module,
              const std::string& stage, const std::string& message);

    // Shorthand for the common case: a recoverable degradation.
    void warn(DiagnosticCode code, const std::string& module,
              const std::string& stage, const std::string& message) {
        emit(Severity::Warning, code, module, stage, message);
    }

    void set_correlation_id(std::uint64_t id);
    std::uint64_t correlation_id() const;

    void set_min_severity(Severity min);
    Severity min_severity() const;

    void add_observer(DiagnosticObserver observer);

    // Appends every event of `other`, notifying observers.
    void merge(const DiagnosticEmitter& other);

    const std::vector<DiagnosticEvent>& events() const;
    std::vector<DiagnosticEvent> events_by_severity(Severity severity) const;
    std::vector<DiagnosticEvent> events_by_module(const std::string& module) const;
    std::vector<DiagnosticEvent> events_by_code(DiagnosticCode code) const;
    bool has_code(DiagnosticCode code) const;

    void clear();
    std::size_t size() const;
    bool empty() const { return events_.empty(); }

private:
    void record(DiagnosticEvent event);

    std::vector<DiagnosticEvent> events_;
    std::vector<DiagnosticObserver> observers_;
    std::uint64_t correlation_id_ = 0;
    Severity min_severity_ = Severity::Info;
};

} // namespace verso::core
