#pragma once

#include <vigil/config/source_registry.h>
#include <vigil/core/types.h>
#include <vigil/core/user_profile_group.h>
#include <vigil/engine/aggregation_engine.h>
#include <vigil/engine/engine_lock.h>
#include <vigil/engine/issue_dismissal_cache.h>
#include <vigil/engine/refresh_coordinator.h>
#include <vigil/engine/source_report_store.h>
#include <vigil/engine/telemetry.h>

#include <nlohmann/json_fwd.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace vigil::engine {

// What the transport must ask for after a refresh was started.
struct RefreshPlan {
    // Absent when nothing is tracked, i.e. no response can complete the session.
    std::optional<std::string> sessionId;
    RefreshReason reason{RefreshReason::Other};
    RefreshRequestType requestType{RefreshRequestType::FetchFreshData};
    std::vector<core::SourceKey> sources;
};

struct ReportOutcome {
    // The stored data changed, so consumers should recompute the view.
    bool changed{false};
    // This report completed the refresh session it answered.
    bool sessionCompleted{false};
};

struct SafetySnapshot {
    SafetyStateSnapshot state;
    std::vector<SourceStateEvent> sources;
};

/**
 * Owns the report store, the dismissal cache and the refresh coordinator together with the
 * lock that serializes them. Every mutating or reading call takes the Guard obtained from
 * lock().acquire(); telemetry is emitted synchronously under that Guard.
 */
class SafetyHub {
public:
    using Guard = EngineLock::Guard;
    using WallClockFn = std::function<TimePoint()>;

    struct Config {
        std::unordered_set<std::string> untrackedSourceIds;
        bool telemetryEnabled{true};
    };

    struct Dependencies {
        std::shared_ptr<const config::SourceRegistry> registry;
        // Optional; a LoggingTelemetrySink is used when null.
        TelemetrySink* telemetry{nullptr};
        // Optional; an IntentActionResolver is used when null.
        const ActionResolver* resolver{nullptr};
        StatusStrings strings;
        WallClockFn wallClock;
        RefreshCoordinator::ClockFn steadyClock;
    };

    SafetyHub(Config config, Dependencies deps);
    ~SafetyHub();

    SafetyHub(const SafetyHub&) = delete;
    SafetyHub& operator=(const SafetyHub&) = delete;
    SafetyHub(SafetyHub&&) = delete;
    SafetyHub& operator=(SafetyHub&&) = delete;

    EngineLock& lock() noexcept { return lock_; }

    RefreshPlan startRefresh(const Guard& guard, RefreshReason reason,
                             const core::UserProfileGroup& users);

    // Stores a report after validating it against the source's descriptor. A session id that
    // is not the open session leaves the session untouched but still stores valid data.
    Result<ReportOutcome> setSourceReport(const Guard& guard, const core::SourceKey& key,
                                          SourceReport report,
                                          const std::optional<std::string>& sessionId = {});

    Result<ReportOutcome> reportSourceError(const Guard& guard, const core::SourceKey& key,
                                            const std::optional<std::string>& sessionId = {});

    // Marks every source still in flight as errored. Returns the timed out keys.
    SourceKeySet timeoutRefresh(const Guard& guard, std::string_view sessionId);

    // Forgets everything about a removed user. Returns whether the open session was cleared.
    bool clearForUser(const Guard& guard, core::UserId userId);

    Result<void> dismissIssue(const Guard& guard, const core::IssueKey& key);

    Result<void> markActionInFlight(const Guard& guard, const core::IssueActionId& id);
    // `resolved` drops the issue from the stored report until the source reports it again.
    Result<ReportOutcome> completeAction(const Guard& guard, const core::IssueActionId& id,
                                         bool success, bool resolved);

    AggregatedView view(const Guard& guard, const core::UserProfileGroup& users) const;

    // Emits the safety state and per-source state telemetry. Skipped (nullopt) when the
    // configuration disallows telemetry.
    std::optional<SafetySnapshot> pullSnapshot(const Guard& guard,
                                               const core::UserProfileGroup& users);

    void clearAllData(const Guard& guard);

    RefreshStatus refreshStatus(const Guard& guard) const { return coordinator_.status(guard); }

    std::vector<DismissalRecord> exportDismissals(const Guard& guard) const;
    Result<void> importDismissals(const Guard& guard, std::vector<DismissalRecord> records);
    bool dismissalsDirty(const Guard& guard) const noexcept { return cache_.isDirty(guard); }
    void markDismissalsPersisted(const Guard& guard) noexcept { cache_.markClean(guard); }

    nlohmann::json toJson(const Guard& guard) const;

    const config::SourceRegistry& registry() const noexcept { return *registry_; }
    const RefreshCoordinator& coordinator() const noexcept { return coordinator_; }
    const SourceReportStore& store() const noexcept { return store_; }

private:
    Result<void> validateReport(const config::SourceDescriptor& source,
                                const SourceReport& report) const;
    std::optional<SourceIssue> findIssue(const Guard& guard, const core::IssueKey& key) const;

    Config config_;
    std::shared_ptr<const config::SourceRegistry> registry_;
    std::unique_ptr<TelemetrySink> ownedTelemetry_;
    TelemetrySink* telemetry_;
    std::unique_ptr<ActionResolver> ownedResolver_;
    const ActionResolver* resolver_;
    WallClockFn wallClock_;

    EngineLock lock_;
    SourceReportStore store_;
    IssueDismissalCache cache_;
    RefreshCoordinator coordinator_;
    AggregationEngine engine_;
};

} // namespace vigil::engine
