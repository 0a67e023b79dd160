#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace stratum::core {

enum class Severity {
    Info,
    Warning,
    Error,
};

// One event raised while the layer tree changes or paints. |subject|
// names the layer involved, e.g. "layer(z=3)", and may be empty.
struct DiagnosticEvent {
    std::chrono::steady_clock::time_point timestamp;
    Severity severity = Severity::Info;
    std::string module;
    std::string stage;
    std::string subject;
    std::string message;
    std::uint64_t correlation_id = 0;
};

const char* severity_name(Severity severity);

// "[warning] layer/render layer(z=2): message", with " (cid:N)" after the
// subject when a correlation id is set.
std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

// Event sink owned by the root of a render tree. Events under the minimum
// severity are dropped; observers see the rest synchronously, in emission
// order.
class DiagnosticEmitter {
public:
    void emit(Severity severity, const std::string& module, const std::string& stage,
              const std::string& message, const std::string& subject = {});

    // Stamped on every following event, e.g. one id per frame.
    void set_correlation_id(std::uint64_t id) { correlation_id_ = id; }
    std::uint64_t correlation_id() const { return correlation_id_; }

    void set_min_severity(Severity min) { min_severity_ = min; }
    Severity min_severity() const { return min_severity_; }

    void add_observer(DiagnosticObserver observer);

    const std::vector<DiagnosticEvent>& events() const { return events_; }
    std::vector<DiagnosticEvent> events_by_severity(Severity severity) const;
    std::vector<DiagnosticEvent> events_by_stage(const std::string& stage) const;
    std::size_t count(Severity severity) const;
    // Most recent event, or null when none was kept.
    const DiagnosticEvent* last() const;

    void clear() { events_.clear(); }
    std::size_t size() const { return events_.size(); }

private:
    template<typename Pred>
    std::vector<DiagnosticEvent> select(Pred pred) const;

    std::vector<DiagnosticEvent> events_;
    std::vector<DiagnosticObserver> observers_;
    std::uint64_t correlation_id_ = 0;
    Severity min_severity_ = Severity::Info;
};

} // namespace stratum::core
