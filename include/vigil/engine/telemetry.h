#pragma once

#include <vigil/core/ids.h>
#include <vigil/core/severity.h>
#include <vigil/engine/refresh_types.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace vigil::engine {

enum class EventResult { Success, Error, Timeout };

const char* toString(EventResult result);

struct SourceRefreshEvent {
    RefreshRequestType requestType;
    std::string sourceId;
    core::UserId userId{0};
    std::chrono::milliseconds duration{0};
    EventResult result{EventResult::Success};
};

struct WholeRefreshEvent {
    RefreshRequestType requestType;
    std::chrono::milliseconds duration{0};
    EventResult result{EventResult::Success};
};

struct SessionSupersededEvent {
    std::string sessionId;
    RefreshReason reason;
    std::size_t abandonedInFlight{0};
    std::chrono::milliseconds age{0};
};

struct SafetyStateSnapshot {
    core::OverallSeverity overallSeverity{core::OverallSeverity::Unknown};
    std::int64_t openIssueCount{0};
    std::int64_t dismissedIssueCount{0};
};

struct SourceStateEvent {
    std::string sourceId;
    bool isManagedProfile{false};
    // Numeric SeverityLevel of the worst open issue or status, absent when nothing is known.
    std::optional<int> maxSeverityLevel;
    std::int64_t openIssueCount{0};
    std::int64_t dismissedIssueCount{0};
};

/**
 * Receiver of engine telemetry. Called while the engine lock is held, so implementations
 * must not call back into the engine.
 */
class TelemetrySink {
public:
    virtual ~TelemetrySink() = default;

    virtual void onSourceRefresh(const SourceRefreshEvent& event) = 0;
    virtual void onWholeRefresh(const WholeRefreshEvent& event) = 0;
    virtual void onSessionSuperseded(const SessionSupersededEvent& event) = 0;
    virtual void onSafetyState(const SafetyStateSnapshot& event) = 0;
    virtual void onSourceState(const SourceStateEvent& event) = 0;
};

// Writes every event to the default spdlog logger at info level.
class LoggingTelemetrySink final : public TelemetrySink {
public:
    void onSourceRefresh(const SourceRefreshEvent& event) override;
    void onWholeRefresh(const WholeRefreshEvent& event) override;
    void onSessionSuperseded(const SessionSupersededEvent& event) override;
    void onSafetyState(const SafetyStateSnapshot& event) override;
    void onSourceState(const SourceStateEvent& event) override;
};

} // namespace vigil::engine
