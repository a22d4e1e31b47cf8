#include <mender/core/diagnostics.h>

#include <atomic>
#include <sstream>
#include <utility>

namespace mender::core {

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Info:    return "info";
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
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
    if (event.line > 0) {
        oss << " " << event.line << ":" << event.column;
    }
    if (event.correlation_id != 0) {
        oss << " (cid:" << event.correlation_id << ")";
    }
    oss << ": " << event.message;
    return oss.str();
}

void DiagnosticEmitter::emit(Severity severity, const std::string& module,
                             const std::string& stage, const std::string& message,
                             int line, int column) {
    DiagnosticEvent event;
    event.severity = severity;
    event.module = module;
    event.stage = stage;
    event.message = message;
    event.correlation_id = correlation_id_;
    event.line = line;
    event.column = column;
    events_.push_back(event);

    for (const auto& observer : observers_) {
        observer(events_.back());
    }
}

void DiagnosticEmitter::set_correlation_id(std::uint64_t id) {
    correlation_id_ = id;
}

std::uint64_t DiagnosticEmitter::correlation_id() const {
    return correlation_id_;
}

void DiagnosticEmitter::add_observer(DiagnosticObserver observer) {
    observers_.push_back(std::move(observer));
}

const std::vector<DiagnosticEvent>& DiagnosticEmitter::events() const {
    return events_;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_severity(Severity severity) const {
    return select([severity](const DiagnosticEvent& e) { return e.severity == severity; });
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_stage(const std::string& stage) const {
    return select([&stage](const DiagnosticEvent& e) { return e.stage == stage; });
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_for(std::uint64_t correlation_id) const {
    return select([correlation_id](const DiagnosticEvent& e) {
        return e.correlation_id == correlation_id;
    });
}

std::size_t DiagnosticEmitter::size() const {
    return events_.size();
}

std::vector<DiagnosticEvent> DiagnosticEmitter::select(
    const std::function<bool(const DiagnosticEvent&)>& keep) const {
    std::vector<DiagnosticEvent> result;
    for (const auto& e : events_) {
        if (keep(e)) {
            result.push_back(e);
        }
    }
    return result;
}

std::uint64_t next_correlation_id() {
    static std::atomic<std::uint64_t> counter{0};
    return ++counter;
}

}  // namespace mender::core
