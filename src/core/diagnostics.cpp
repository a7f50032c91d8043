#include <dropshade/core/diagnostics.h>

#include <sstream>

namespace dropshade::core {

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
    if (event.run_id != 0) {
        oss << " (run:" << event.run_id << ")";
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
    event.run_id = run_id_;

    events_.push_back(event);

    for (const auto& observer : observers_) {
        observer(event);
    }
}

void DiagnosticEmitter::info(const std::string& module, const std::string& stage,
                             const std::string& message) {
    emit(Severity::Info, module, stage, message);
}

void DiagnosticEmitter::warning(const std::string& module, const std::string& stage,
                                const std::string& message) {
    emit(Severity::Warning, module, stage, message);
}

void DiagnosticEmitter::error(const std::string& module, const std::string& stage,
                              const std::string& message) {
    emit(Severity::Error, module, stage, message);
}

void DiagnosticEmitter::set_run_id(std::uint64_t id) {
    run_id_ = id;
}

std::uint64_t DiagnosticEmitter::run_id() const {
    return run_id_;
}

void DiagnosticEmitter::set_min_severity(Severity min) {
    min_severity_ = min;
}

void DiagnosticEmitter::add_observer(DiagnosticObserver observer) {
    observers_.push_back(std::move(observer));
}

const std::vector<DiagnosticEvent>& DiagnosticEmitter::events() const {
    return events_;
}

}  // namespace dropshade::core
