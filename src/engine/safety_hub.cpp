#include <vigil/engine/safety_hub.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace vigil::engine {

using config::SourceDescriptor;
using config::SourceType;

namespace {

std::shared_ptr<const config::SourceRegistry>
orEmptyRegistry(std::shared_ptr<const config::SourceRegistry> registry) {
    if (registry)
        return registry;
    spdlog::warn("[SafetyHub] No source registry configured; every report will be rejected");
    return std::make_shared<const config::SourceRegistry>();
}

} // namespace

SafetyHub::SafetyHub(Config config, Dependencies deps)
    : config_(std::move(config)),
      registry_(orEmptyRegistry(std::move(deps.registry))),
      ownedTelemetry_(deps.telemetry ? nullptr : std::make_unique<LoggingTelemetrySink>()),
      telemetry_(deps.telemetry ? deps.telemetry : ownedTelemetry_.get()),
      ownedResolver_(deps.resolver ? nullptr : std::make_unique<IntentActionResolver>()),
      resolver_(deps.resolver ? deps.resolver : ownedResolver_.get()),
      wallClock_(deps.wallClock ? std::move(deps.wallClock)
                                : WallClockFn([] { return std::chrono::system_clock::now(); })),
      coordinator_(*telemetry_, RefreshCoordinator::Config{config_.untrackedSourceIds},
                   std::move(deps.steadyClock)),
      engine_(*resolver_, std::move(deps.strings)) {
    spdlog::debug("[SafetyHub] Initialized with {} source(s), {} untracked",
                  registry_->sourceCount(), config_.untrackedSourceIds.size());
}

SafetyHub::~SafetyHub() = default;

RefreshPlan SafetyHub::startRefresh(const Guard& guard, RefreshReason reason,
                                    const core::UserProfileGroup& users) {
    RefreshPlan plan;
    plan.reason = reason;
    plan.requestType = toRequestType(reason);

    for (const auto& group : registry_->groups()) {
        for (const auto& source : group.sources) {
            if (source.type == SourceType::Static)
                continue;

            std::vector<core::UserId> userIds{users.profileParentUserId()};
            if (source.supportsManagedProfiles()) {
                auto running = users.managedRunningProfileUserIds();
                userIds.insert(userIds.end(), running.begin(), running.end());
            }
            for (auto userId : userIds) {
                core::SourceKey key{source.id, userId};
                if (reason == RefreshReason::PageOpen && !source.refreshOnPageOpenAllowed &&
                    store_.contains(guard, key)) {
                    continue;
                }
                plan.sources.push_back(std::move(key));
            }
        }
    }

    auto sessionId = coordinator_.startSession(guard, reason, users);
    coordinator_.markInFlight(guard, sessionId, plan.sources);
    if (coordinator_.inFlightCount(guard) == 0) {
        // Nothing can complete the session, so it is closed right away.
        coordinator_.clear(guard, sessionId);
        spdlog::debug("[SafetyHub] Refresh {} has no tracked source; not kept open", sessionId);
    } else {
        plan.sessionId = std::move(sessionId);
    }

    spdlog::info("[SafetyHub] Refresh reason={} type={} asks {} source(s)", toString(reason),
                 toString(plan.requestType), plan.sources.size());
    return plan;
}

Result<void> SafetyHub::validateReport(const SourceDescriptor& source,
                                       const SourceReport& report) const {
    if (source.type == SourceType::Static) {
        return Error{ErrorCode::InvalidArgument,
                     "Source " + source.id + " is static and cannot report data"};
    }
    if (source.type == SourceType::IssueOnly && report.status) {
        return Error{ErrorCode::InvalidArgument,
                     "Source " + source.id + " is issue-only and cannot report a status"};
    }

    int maxIssueSeverity = 0;
    for (const auto& issue : report.issues) {
        if (!source.allowsSeverity(issue.severity)) {
            return Error{ErrorCode::InvalidArgument,
                         "Issue " + issue.id + " of source " + source.id + " has severity " +
                             core::toString(issue.severity) + " above the allowed maximum"};
        }
        maxIssueSeverity = std::max(maxIssueSeverity, static_cast<int>(issue.severity));
    }

    if (report.status) {
        if (!source.allowsSeverity(report.status->severity)) {
            return Error{ErrorCode::InvalidArgument,
                         "Status of source " + source.id + " has severity " +
                             core::toString(report.status->severity) +
                             " above the allowed maximum"};
        }
        if (static_cast<int>(report.status->severity) < maxIssueSeverity) {
            return Error{ErrorCode::InvalidArgument,
                         "Status of source " + source.id +
                             " is less severe than one of its issues"};
        }
    }
    return Result<void>();
}

Result<ReportOutcome> SafetyHub::setSourceReport(const Guard& guard, const core::SourceKey& key,
                                                 SourceReport report,
                                                 const std::optional<std::string>& sessionId) {
    const auto* source = registry_->find(key.sourceId);
    if (!source) {
        return Error{ErrorCode::InvalidArgument, "Unexpected source " + key.sourceId};
    }
    if (auto valid = validateReport(*source, report); !valid) {
        spdlog::warn("[SafetyHub] Rejected report for {}: {}", key.toString(),
                     valid.error().message);
        return valid.error();
    }

    std::vector<std::string> issueIds;
    issueIds.reserve(report.issues.size());
    for (const auto& issue : report.issues) {
        issueIds.push_back(issue.id);
    }

    ReportOutcome outcome;
    outcome.changed = store_.set(guard, key, std::move(report));
    cache_.updateIssuesForSource(guard, key, issueIds, wallClock_());
    if (sessionId) {
        outcome.sessionCompleted = coordinator_.reportComplete(guard, *sessionId, key, true);
    }
    return outcome;
}

Result<ReportOutcome> SafetyHub::reportSourceError(const Guard& guard, const core::SourceKey& key,
                                                   const std::optional<std::string>& sessionId) {
    const auto* source = registry_->find(key.sourceId);
    if (!source) {
        return Error{ErrorCode::InvalidArgument, "Unexpected source " + key.sourceId};
    }
    if (source->type == SourceType::Static) {
        return Error{ErrorCode::InvalidArgument,
                     "Source " + key.sourceId + " is static and cannot report errors"};
    }

    ReportOutcome outcome;
    outcome.changed = store_.setError(guard, key);
    if (sessionId) {
        outcome.sessionCompleted = coordinator_.reportComplete(guard, *sessionId, key, false);
    }
    spdlog::info("[SafetyHub] Source {} reported an error", key.toString());
    return outcome;
}

SourceKeySet SafetyHub::timeoutRefresh(const Guard& guard, std::string_view sessionId) {
    auto timedOut = coordinator_.timeout(guard, sessionId);
    for (const auto& key : timedOut) {
        store_.setError(guard, key);
    }
    return timedOut;
}

bool SafetyHub::clearForUser(const Guard& guard, core::UserId userId) {
    store_.clearForUser(guard, userId);
    cache_.clearForUser(guard, userId);
    bool cleared = coordinator_.clearForUser(guard, userId);
    spdlog::info("[SafetyHub] Cleared data of user {}", userId);
    return cleared;
}

std::optional<SourceIssue> SafetyHub::findIssue(const Guard& guard,
                                                const core::IssueKey& key) const {
    auto report = store_.get(guard, key.sourceKey());
    if (!report)
        return std::nullopt;
    auto it = std::find_if(report->issues.begin(), report->issues.end(),
                           [&](const SourceIssue& issue) { return issue.id == key.issueId; });
    if (it == report->issues.end())
        return std::nullopt;
    return *it;
}

Result<void> SafetyHub::dismissIssue(const Guard& guard, const core::IssueKey& key) {
    auto issue = findIssue(guard, key);
    if (!issue) {
        return Error{ErrorCode::NotFound, "Issue " + key.toString() + " is not reported"};
    }
    cache_.dismiss(guard, key, issue->severity, wallClock_());
    return Result<void>();
}

Result<void> SafetyHub::markActionInFlight(const Guard& guard, const core::IssueActionId& id) {
    auto issue = findIssue(guard, id.issueKey);
    if (!issue) {
        return Error{ErrorCode::NotFound, "Issue " + id.issueKey.toString() + " is not reported"};
    }
    bool known = std::any_of(issue->actions.begin(), issue->actions.end(),
                             [&](const IssueAction& action) { return action.id == id.actionId; });
    if (!known) {
        return Error{ErrorCode::NotFound, "Action " + id.actionId + " not found on issue " +
                                              id.issueKey.toString()};
    }
    store_.markActionInFlight(guard, id);
    return Result<void>();
}

Result<ReportOutcome> SafetyHub::completeAction(const Guard& guard, const core::IssueActionId& id,
                                                bool success, bool resolved) {
    if (!store_.unmarkActionInFlight(guard, id)) {
        return Error{ErrorCode::InvalidState,
                     "Action " + id.actionId + " of " + id.issueKey.toString() +
                         " is not in flight"};
    }

    ReportOutcome outcome;
    outcome.changed = true;
    if (!success || !resolved) {
        return outcome;
    }

    auto key = id.issueKey.sourceKey();
    auto report = store_.get(guard, key);
    if (!report) {
        return outcome;
    }
    std::erase_if(report->issues,
                  [&](const SourceIssue& issue) { return issue.id == id.issueKey.issueId; });
    store_.set(guard, key, std::move(*report));
    spdlog::debug("[SafetyHub] Issue {} resolved by action {}", id.issueKey.toString(),
                  id.actionId);
    return outcome;
}

AggregatedView SafetyHub::view(const Guard& guard, const core::UserProfileGroup& users) const {
    return engine_.computeView(guard, *registry_, store_, cache_, coordinator_.status(guard),
                               users);
}

std::optional<SafetySnapshot> SafetyHub::pullSnapshot(const Guard& guard,
                                                      const core::UserProfileGroup& users) {
    if (!config_.telemetryEnabled || !registry_->allowsTelemetry()) {
        spdlog::debug("[SafetyHub] Skipping telemetry pull: disallowed by configuration");
        return std::nullopt;
    }

    SafetySnapshot snapshot;
    auto current = view(guard, users);
    auto open = static_cast<std::int64_t>(current.issues.size());
    snapshot.state = SafetyStateSnapshot{current.status.severity, open,
                                         cache_.countActive(guard, users) - open};
    telemetry_->onSafetyState(snapshot.state);

    auto collect = [&](const SourceDescriptor& source, core::UserId userId, bool isManaged) {
        SourceStateEvent event;
        event.sourceId = source.id;
        event.isManagedProfile = isManaged;
        if (auto report = store_.get(guard, core::SourceKey{source.id, userId})) {
            for (const auto& issue : report->issues) {
                core::IssueKey key{source.id, issue.id, userId};
                if (cache_.isDismissed(guard, key, issue.severity)) {
                    ++event.dismissedIssueCount;
                } else {
                    ++event.openIssueCount;
                    event.maxSeverityLevel =
                        std::max(event.maxSeverityLevel.value_or(static_cast<int>(issue.severity)),
                                 static_cast<int>(issue.severity));
                }
            }
            if (report->status) {
                int status = static_cast<int>(report->status->severity);
                event.maxSeverityLevel = std::max(event.maxSeverityLevel.value_or(status), status);
            }
        }
        telemetry_->onSourceState(event);
        snapshot.sources.push_back(std::move(event));
    };

    for (const auto& group : registry_->groups()) {
        for (const auto& source : group.sources) {
            if (!source.isExternal() || !source.loggingAllowed)
                continue;
            collect(source, users.profileParentUserId(), false);
            if (!source.supportsManagedProfiles())
                continue;
            for (auto userId : users.managedRunningProfileUserIds()) {
                collect(source, userId, true);
            }
        }
    }
    return snapshot;
}

void SafetyHub::clearAllData(const Guard& guard) {
    store_.clearAll(guard);
    cache_.clear(guard);
    coordinator_.clear(guard);
    spdlog::info("[SafetyHub] Cleared all data");
}

std::vector<DismissalRecord> SafetyHub::exportDismissals(const Guard& guard) const {
    return cache_.snapshot(guard);
}

Result<void> SafetyHub::importDismissals(const Guard& guard,
                                         std::vector<DismissalRecord> records) {
    return cache_.load(guard, std::move(records));
}

nlohmann::json SafetyHub::toJson(const Guard& guard) const {
    nlohmann::json j;
    j["sources"] = registry_->sourceCount();
    j["reports"] = store_.size(guard);
    j["errors"] = store_.errorCount(guard);
    j["actions_in_flight"] = store_.actionsInFlight(guard);
    j["dismissal_records"] = cache_.size(guard);
    j["dismissals_dirty"] = cache_.isDirty(guard);
    j["refresh"] = coordinator_.toJson(guard);
    return j;
}

} // namespace vigil::engine
