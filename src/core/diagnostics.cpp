#include <stratum/core/diagnostics.h>

#include <algorithm>
#include <iterator>
#include <sstream>

namespace stratum::core {

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Info:    return "info";
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
    }
    return "unknown";
}

std::string format_diagnostic(const DiagnosticEvent& event) {
    std::ostringstream out;
    out << '[' << severity_name(event.severity) << "] " << event.module;
    if (!event.stage.empty()) out << '/' << event.stage;
    if (!event.subject.empty()) out << ' ' << event.subject;
    if (event.correlation_id != 0) out << " (cid:" << event.correlation_id << ')';
    out << ": " << event.message;
    return out.str();
}

void DiagnosticEmitter::emit(Severity severity, const std::string& module, const std::string& stage,
                             const std::string& message, const std::string& subject) {
    if (severity < min_severity_) return;

    events_.push_back({std::chrono::steady_clock::now(), severity, module, stage,
                       subject, message, correlation_id_});
    // Copy: an observer may emit and grow the event list.
    const DiagnosticEvent event = events_.back();
    for (const auto& observer : observers_) {
        observer(event);
    }
}

void DiagnosticEmitter::add_observer(DiagnosticObserver observer) {
    observers_.push_back(std::move(observer));
}

template<typename Pred>
std::vector<DiagnosticEvent> DiagnosticEmitter::select(Pred pred) const {
    std::vector<DiagnosticEvent> matched;
    std::copy_if(events_.begin(), events_.end(), std::back_inserter(matched), pred);
    return matched;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_severity(Severity severity) const {
    return select([severity](const DiagnosticEvent& e) { return e.severity == severity; });
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_stage(const std::string& stage) const {
    return select([&stage](const DiagnosticEvent& e) { return e.stage == stage; });
}

std::size_t DiagnosticEmitter::count(Severity severity) const {
    return static_cast<std::size_t>(std::count_if(events_.begin(), events_.end(),
        [severity](const DiagnosticEvent& e) { return e.severity == severity; }));
}

const DiagnosticEvent* DiagnosticEmitter::last() const {
    return events_.empty() ? nullptr : &events_.back();
}

} // namespace stratum::core
