#include <vigil/engine/telemetry.h>

#include <spdlog/spdlog.h>

namespace vigil::engine {

const char* toString(EventResult result) {
    switch (result) {
        case EventResult::Success:
            return "SUCCESS";
        case EventResult::Error:
            return "ERROR";
        case EventResult::Timeout:
            return "TIMEOUT";
    }
    return "ERROR";
}

void LoggingTelemetrySink::onSourceRefresh(const SourceRefreshEvent& event) {
    spdlog::info("[Telemetry] source_refresh type={} source={} user={} duration_ms={} result={}",
                 toString(event.requestType), event.sourceId, event.userId,
                 event.duration.count(), toString(event.result));
}

void LoggingTelemetrySink::onWholeRefresh(const WholeRefreshEvent& event) {
    spdlog::info("[Telemetry] whole_refresh type={} duration_ms={} result={}",
                 toString(event.requestType), event.duration.count(), toString(event.result));
}

void LoggingTelemetrySink::onSessionSuperseded(const SessionSupersededEvent& event) {
    spdlog::info("[Telemetry] session_superseded id={} reason={} in_flight={} age_ms={}",
                 event.sessionId, toString(event.reason), event.abandonedInFlight,
                 event.age.count());
}

void LoggingTelemetrySink::onSafetyState(const SafetyStateSnapshot& event) {
    spdlog::info("[Telemetry] safety_state severity={} open={} dismissed={}",
                 core::toString(event.overallSeverity), event.openIssueCount,
                 event.dismissedIssueCount);
}

void LoggingTelemetrySink::onSourceState(const SourceStateEvent& event) {
    spdlog::info("[Telemetry] source_state source={} managed={} max_severity={} open={} "
                 "dismissed={}",
                 event.sourceId, event.isManagedProfile,
                 event.maxSeverityLevel ? std::to_string(*event.maxSeverityLevel) : "none",
                 event.openIssueCount, event.dismissedIssueCount);
}

} // namespace vigil::engine
