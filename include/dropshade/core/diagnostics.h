#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace dropshade::core {

enum class Severity {
    Info,
    Warning,
    Error,
};

struct DiagnosticEvent {
    std::chrono::steady_clock::time_point timestamp;
    Severity severity = Severity::Info;
    std::string module;
    std::string stage;
    std::string message;
    std::uint64_t run_id = 0;
};

const char* severity_name(Severity severity);

std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

// Collects diagnostics for one run and forwards them to observers.
// Events below the minimum severity are dropped before anything sees them.
class DiagnosticEmitter {
public:
    void emit(Severity severity, const std::string& module,
              const std::string& stage, const std::string& message);

    void info(const std::string& module, const std::string& stage, const std::string& message);
    void warning(const std::string& module, const std::string& stage, const std::string& message);
    void error(const std::string& module, const std::string& stage, const std::string& message);

    void set_run_id(std::uint64_t id);
    std::uint64_t run_id() const;

    void set_min_severity(Severity min);

    void add_observer(DiagnosticObserver observer);

    const std::vector<DiagnosticEvent>& events() const;

private:
    std::vector<DiagnosticEvent> events_;
    std::vector<DiagnosticObserver> observers_;
    std::uint64_t run_id_ = 0;
    Severity min_severity_ = Severity::Info;
};

}  // namespace dropshade::core
