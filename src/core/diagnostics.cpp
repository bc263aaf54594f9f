#include <cellflow/core/diagnostics.h>

#include <sstream>

namespace cellflow::core {

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Info:    return "info";
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
    }
    return "unknown";
}

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::LayoutCalculation:   return "layout-calculation";
        case ErrorKind::MalformedStyle:      return "malformed-style";
        case ErrorKind::InvalidScrollTarget: return "invalid-scroll-target";
    }
    return "unknown";
}

std::string format_diagnostic(const DiagnosticEvent& event) {
    std::ostringstream oss;
    oss << "[" << severity_name(event.severity) << "]";
    if (!event.module.empty()) {
        oss << " " << event.module;
    }
    if (!event.stage.empty()) {
        oss << "/" << event.stage;
    }
    if (event.correlation_id != 0) {
        oss << " (pass:" << event.correlation_id << ")";
    }
    oss << ": " << event.message;
    return oss.str();
}

void DiagnosticEmitter::emit(Severity severity, const std::string& module,
                             const std::string& stage, const std::string& message) {
    if (severity < min_severity_) {
        return;
    }

    DiagnosticEvent event;
    event.timestamp = std::chrono::steady_clock::now();
    event.severity = severity;
    event.module = module;
    event.stage = stage;
    event.message = message;
    event.correlation_id = correlation_id_;

    events_.push_back(event);

    for (const auto& observer : observers_) {
        observer(event);
    }
}

void DiagnosticEmitter::add_observer(DiagnosticObserver observer) {
    observers_.push_back(std::move(observer));
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_severity(Severity severity) const {
    std::vector<DiagnosticEvent> result;
    for (const auto& e : events_) {
        if (e.severity == severity) {
            result.push_back(e);
        }
    }
    return result;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_module(const std::string& module) const {
    std::vector<DiagnosticEvent> result;
    for (const auto& e : events_) {
        if (e.module == module) {
            result.push_back(e);
        }
    }
    return result;
}

void FailureTrace::add_snapshot(const std::string& key, const std::string& value) {
    snapshots.push_back({key, value});
}

const std::string* FailureTrace::snapshot(const std::string& key) const {
    for (const auto& s : snapshots) {
        if (s.key == key) return &s.value;
    }
    return nullptr;
}

std::string FailureTrace::format() const {
    std::ostringstream oss;
    oss << "FailureTrace [" << error_kind_name(kind) << "]";
    if (correlation_id != 0) {
        oss << " (pass:" << correlation_id << ")";
    }
    oss << "\n";
    oss << "  module: " << module << "\n";
    oss << "  stage: " << stage << "\n";
    oss << "  error: " << error_message << "\n";
    if (!snapshots.empty()) {
        oss << "  snapshots:\n";
        for (const auto& s : snapshots) {
            oss << "    " << s.key << "=" << s.value << "\n";
        }
    }
    if (!context_events.empty()) {
        oss << "  context_events: " << context_events.size() << "\n";
    }
    return oss.str();
}

FailureTrace& FailureTraceCollector::capture(const DiagnosticEmitter& emitter, ErrorKind kind,
                                             const std::string& module,
                                             const std::string& stage,
                                             const std::string& error_message) {
    FailureTrace trace;
    trace.correlation_id = emitter.correlation_id();
    trace.kind = kind;
    trace.module = module;
    trace.stage = stage;
    trace.error_message = error_message;
    trace.context_events = emitter.events();
    traces_.push_back(std::move(trace));
    return traces_.back();
}

} // namespace cellflow::core
