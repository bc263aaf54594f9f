#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace cellflow::core {

enum class Severity {
    Info,
    Warning,
    Error,
};

// Failure classes reported by the layout and style stages.
enum class ErrorKind {
    LayoutCalculation,
    MalformedStyle,
    InvalidScrollTarget,
};

struct DiagnosticEvent {
    std::chrono::steady_clock::time_point timestamp;
    Severity severity = Severity::Info;
    std::string module;
    std::string stage;
    std::string message;
    std::uint64_t correlation_id = 0;
};

const char* severity_name(Severity severity);
const char* error_kind_name(ErrorKind kind);

std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

class DiagnosticEmitter {
public:
    void emit(Severity severity, const std::string& module,
              const std::string& stage, const std::string& message);

    void info(const std::string& module, const std::string& stage, const std::string& message) {
        emit(Severity::Info, module, stage, message);
    }
    void warning(const std::string& module, const std::string& stage, const std::string& message) {
        emit(Severity::Warning, module, stage, message);
    }
    void error(const std::string& module, const std::string& stage, const std::string& message) {
        emit(Severity::Error, module, stage, message);
    }

    // Render passes stamp their sequence number here.
    void set_correlation_id(std::uint64_t id) { correlation_id_ = id; }
    std::uint64_t correlation_id() const { return correlation_id_; }

    void set_min_severity(Severity min) { min_severity_ = min; }
    Severity min_severity() const { return min_severity_; }

    void add_observer(DiagnosticObserver observer);

    const std::vector<DiagnosticEvent>& events() const { return events_; }
    std::vector<DiagnosticEvent> events_by_severity(Severity severity) const;
    std::vector<DiagnosticEvent> events_by_module(const std::string& module) const;

    void clear() { events_.clear(); }
    std::size_t size() const { return events_.size(); }

private:
    std::vector<DiagnosticEvent> events_;
    std::vector<DiagnosticObserver> observers_;
    std::uint64_t correlation_id_ = 0;
    Severity min_severity_ = Severity::Info;
};

struct FailureSnapshot {
    std::string key;
    std::string value;
};

struct FailureTrace {
    std::uint64_t correlation_id = 0;
    ErrorKind kind = ErrorKind::LayoutCalculation;
    std::string module;
    std::string stage;
    std::string error_message;
    std::vector<DiagnosticEvent> context_events;
    std::vector<FailureSnapshot> snapshots;

    void add_snapshot(const std::string& key, const std::string& value);
    const std::string* snapshot(const std::string& key) const;
    std::string format() const;
};

class FailureTraceCollector {
public:
    FailureTrace& capture(const DiagnosticEmitter& emitter, ErrorKind kind,
                          const std::string& module, const std::string& stage,
                          const std::string& error_message);

    const std::vector<FailureTrace>& traces() const { return traces_; }
    void clear() { traces_.clear(); }
    std::size_t size() const { return traces_.size(); }

private:
    std::vector<FailureTrace> traces_;
};

} // namespace cellflow::core
