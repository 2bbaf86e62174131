#include "styletree/core/diagnostics.h"

#include "styletree/core/parse_error.h"

#include <sstream>
#include <utility>

namespace styletree::core {

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
    if (event.source_offset.has_value()) {
        oss << " @" << *event.source_offset;
    }
    oss << ": " << event.message;
    return oss.str();
}

void DiagnosticEmitter::emit(Severity severity, const std::string& module,
                             const std::string& stage, const std::string& message) {
    DiagnosticEvent event;
    event.severity = severity;
    event.module = module;
    event.stage = stage;
    event.message = message;
    record(std::move(event));
}

void DiagnosticEmitter::report_failure(const std::string& module, const std::string& stage,
                                       const ParseError& error) {
    DiagnosticEvent event;
    event.severity = Severity::Error;
    event.module = module;
    event.stage = stage;
    event.message = std::string(error_kind_name(error.kind()));
    if (!error.detail().empty()) {
        event.message += ": " + error.detail();
    }
    event.source_offset = error.offset();
    record(std::move(event));
}

void DiagnosticEmitter::record(DiagnosticEvent event) {
    if (event.severity < min_severity_) {
        return;
    }
    event.timestamp = std::chrono::steady_clock::now();
    events_.push_back(event);

    for (const auto& observer : observers_) {
        observer(event);
    }
}

bool DiagnosticEmitter::has_errors() const {
    for (const auto& e : events_) {
        if (e.severity == Severity::Error) {
            return true;
        }
    }
    return false;
}

void DiagnosticEmitter::set_min_severity(Severity min) {
    min_severity_ = min;
}

Severity DiagnosticEmitter::min_severity() const {
    return min_severity_;
}

void DiagnosticEmitter::add_observer(DiagnosticObserver observer) {
    observers_.push_back(std::move(observer));
}

const std::vector<DiagnosticEvent>& DiagnosticEmitter::events() const {
    return events_;
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

void DiagnosticEmitter::clear() {
    events_.clear();
}

std::size_t DiagnosticEmitter::size() const {
    return events_.size();
}

}  // namespace styletree::core
