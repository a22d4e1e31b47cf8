#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace mender::core {

enum class Severity {
    Info,
    Warning,
    Error,
};

struct DiagnosticEvent {
    Severity severity = Severity::Info;
    std::string module;   // "scanner", "balancer", "config"...
    std::string stage;    // "entity", "encoding", "start-tag"...
    std::string message;
    std::uint64_t correlation_id = 0;
    // Source position the diagnostic refers to, 0 when unknown.
    int line = 0;
    int column = 0;
};

const char* severity_name(Severity severity);

std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

// Collects the diagnostics of every parse run by one parser and fans
// them out to observers. Events of one parse share a correlation id.
class DiagnosticEmitter {
public:
    void emit(Severity severity, const std::string& module,
              const std::string& stage, const std::string& message,
              int line = 0, int column = 0);

    void warn(const std::string& module, const std::string& stage,
              const std::string& message, int line = 0, int column = 0) {
        emit(Severity::Warning, module, stage, message, line, column);
    }

    void set_correlation_id(std::uint64_t id);
    std::uint64_t correlation_id() const;

    void add_observer(DiagnosticObserver observer);

    const std::vector<DiagnosticEvent>& events() const;
    std::vector<DiagnosticEvent> events_by_severity(Severity severity) const;
    std::vector<DiagnosticEvent> events_by_stage(const std::string& stage) const;
    std::vector<DiagnosticEvent> events_for(std::uint64_t correlation_id) const;

    std::size_t size() const;

private:
    std::vector<DiagnosticEvent> select(const std::function<bool(const DiagnosticEvent&)>& keep) const;

    std::vector<DiagnosticEvent> events_;
    std::vector<DiagnosticObserver> observers_;
    std::uint64_t correlation_id_ = 0;
};

// Process-wide counter used to tag each parse with a distinct id.
std::uint64_t next_correlation_id();

}  // namespace mender::core
