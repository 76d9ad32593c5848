#include <vigil/engine/aggregation_engine.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>

namespace vigil::engine {

using config::GroupType;
using config::SourceDescriptor;
using config::SourcesGroup;
using config::SourceType;
using core::EntrySeverity;
using core::OverallSeverity;

namespace {

std::optional<std::string> optionalText(const std::string& text) {
    if (text.empty())
        return std::nullopt;
    return text;
}

// Issue severities never contribute Unknown; missing data shows up through the entries.
struct OverallState {
    OverallSeverity issues{OverallSeverity::Ok};
    OverallSeverity entries{OverallSeverity::Ok};

    void addIssue(OverallSeverity severity) {
        if (severity == OverallSeverity::Unknown)
            return;
        issues = core::mergeOverallSeverity(issues, severity);
    }

    void addEntry(OverallSeverity severity) {
        entries = core::mergeOverallSeverity(entries, severity);
    }

    OverallSeverity overall() const {
        if (entries == OverallSeverity::Unknown && issues <= OverallSeverity::Ok)
            return OverallSeverity::Unknown;
        return issues;
    }

    bool hasSettingsToReview() const {
        return entries == OverallSeverity::Unknown || entries > issues;
    }
};

struct CategorizedIssue {
    ViewIssue issue;
    IssueCategory category;
};

} // namespace

std::optional<std::string> IntentActionResolver::resolve(const SourceDescriptor& source,
                                                         core::UserId, bool) const {
    return optionalText(source.intentAction);
}

class AggregationEngine::Builder {
public:
    Builder(const AggregationEngine& engine, const SourceReportStore& store,
            const IssueDismissalCache& cache, const Guard& guard)
        : engine_(engine), store_(store), cache_(cache), guard_(guard) {}

    AggregatedView build(const config::SourceRegistry& registry, RefreshStatus refreshStatus,
                         const core::UserProfileGroup& users) {
        AggregatedView view;
        for (const auto& group : registry.groups()) {
            addIssues(group, users);
            switch (group.type) {
                case GroupType::Collapsible:
                    addEntryGroup(view.entriesOrGroups, group, users);
                    break;
                case GroupType::Rigid:
                    addStaticEntryGroup(view.staticEntryGroups, group, users);
                    break;
                case GroupType::Hidden:
                    break;
            }
        }

        std::stable_sort(issues_.begin(), issues_.end(),
                         [](const CategorizedIssue& a, const CategorizedIssue& b) {
                             return a.issue.severity > b.issue.severity;
                         });

        view.issues.reserve(issues_.size());
        for (auto& item : issues_) {
            view.issues.push_back(std::move(item.issue));
        }

        const auto overall = state_.overall();
        const bool review = state_.hasSettingsToReview();
        view.status.severity = overall;
        view.status.refreshStatus = refreshStatus;
        view.status.hasSettingsToReview = review;
        view.status.title = statusTitle(overall, refreshStatus, review);
        view.status.summary = statusSummary(overall, refreshStatus, view.issues.size(), review);
        return view;
    }

private:
    const StatusStrings& strings() const { return engine_.strings_; }

    bool isQuietMode(bool isManaged, bool running) const { return isManaged && !running; }

    void addIssues(const SourcesGroup& group, const core::UserProfileGroup& users) {
        for (const auto& source : group.sources) {
            if (!source.isExternal())
                continue;
            addIssues(source, users.profileParentUserId());
            if (!source.supportsManagedProfiles())
                continue;
            for (auto userId : users.managedRunningProfileUserIds()) {
                addIssues(source, userId);
            }
        }
    }

    void addIssues(const SourceDescriptor& source, core::UserId userId) {
        auto report = store_.get(guard_, core::SourceKey{source.id, userId});
        if (!report)
            return;

        for (const auto& issue : report->issues) {
            core::IssueKey key{source.id, issue.id, userId};
            if (cache_.isDismissed(guard_, key, issue.severity))
                continue;

            ViewIssue viewIssue;
            viewIssue.id = core::encodeViewIssueId(key, issue.typeId);
            viewIssue.key = key;
            viewIssue.typeId = issue.typeId;
            viewIssue.severity = core::toIssueSeverity(issue.severity);
            viewIssue.category = issue.category;
            viewIssue.title = issue.title;
            viewIssue.subtitle = issue.subtitle;
            viewIssue.summary = issue.summary;
            viewIssue.shouldConfirmDismissal = viewIssue.severity > core::IssueSeverity::Ok;
            viewIssue.actions.reserve(issue.actions.size());
            for (const auto& action : issue.actions) {
                core::IssueActionId actionId{key, action.id};
                viewIssue.actions.push_back(ViewIssueAction{
                    core::encodeIssueActionId(actionId), action.label, action.resolving,
                    store_.isActionInFlight(guard_, actionId), action.successMessage});
            }

            state_.addIssue(core::toOverallSeverity(issue.severity));
            issues_.push_back(CategorizedIssue{std::move(viewIssue), issue.category});
        }
    }

    void addEntryGroup(std::vector<EntryOrGroup>& out, const SourcesGroup& group,
                       const core::UserProfileGroup& users) {
        auto groupSeverity = EntrySeverity::Unspecified;
        std::vector<Entry> entries;
        entries.reserve(group.sources.size());

        for (const auto& source : group.sources) {
            groupSeverity = core::mergeEntrySeverity(
                groupSeverity,
                addEntry(entries, source, users.profileParentUserId(), false, false));
            if (!source.supportsManagedProfiles())
                continue;
            for (auto userId : users.managedProfileUserIds()) {
                groupSeverity = core::mergeEntrySeverity(
                    groupSeverity,
                    addEntry(entries, source, userId, true, users.isManagedUserRunning(userId)));
            }
        }

        if (entries.empty())
            return;
        if (entries.size() == 1) {
            out.emplace_back(std::move(entries.front()));
            return;
        }

        EntryGroup entryGroup;
        entryGroup.id = core::encodeEntryGroupId(group.id);
        entryGroup.title = group.title;
        entryGroup.summary = groupSummary(group, groupSeverity, entries);
        entryGroup.severity = groupSeverity;
        entryGroup.iconType = group.statelessIconType;
        entryGroup.entries = std::move(entries);
        out.emplace_back(std::move(entryGroup));
    }

    EntrySeverity addEntry(std::vector<Entry>& entries, const SourceDescriptor& source,
                           core::UserId userId, bool isManaged, bool running) {
        auto entry = toEntry(source, userId, isManaged, running);
        if (!entry)
            return EntrySeverity::Unspecified;
        state_.addEntry(core::toOverallSeverity(entry->severity));
        auto severity = entry->severity;
        entries.push_back(std::move(*entry));
        return severity;
    }

    std::optional<Entry> toEntry(const SourceDescriptor& source, core::UserId userId,
                                 bool isManaged, bool running) {
        switch (source.type) {
            case SourceType::IssueOnly:
                return std::nullopt;
            case SourceType::Dynamic: {
                core::SourceKey key{source.id, userId};
                auto report = store_.get(guard_, key);
                const bool quiet = isQuietMode(isManaged, running);
                if (!report || !report->status) {
                    return toDefaultEntry(source, userId, isManaged, running,
                                          EntrySeverity::Unknown);
                }
                if (quiet) {
                    return toDefaultEntry(source, userId, isManaged, running,
                                          EntrySeverity::Unspecified);
                }
                const auto& status = *report->status;
                auto action = status.pendingAction;
                bool enabled = status.enabled;
                if (!action) {
                    action = engine_.resolver_.resolve(source, userId, false);
                    enabled = enabled && action.has_value();
                }
                Entry entry;
                entry.id = core::encodeEntryId(key);
                entry.key = key;
                entry.title = status.title;
                entry.summary = optionalText(status.summary);
                entry.severity =
                    enabled ? core::toEntrySeverity(status.severity) : EntrySeverity::Unspecified;
                entry.enabled = enabled;
                entry.action = std::move(action);
                entry.isManagedProfile = isManaged;
                return entry;
            }
            case SourceType::Static:
                return toDefaultEntry(source, userId, isManaged, running,
                                      EntrySeverity::Unspecified);
        }
        spdlog::warn("[AggregationEngine] Unknown type of source {} in collapsible group",
                     source.id);
        return std::nullopt;
    }

    std::optional<Entry> toDefaultEntry(const SourceDescriptor& source, core::UserId userId,
                                        bool isManaged, bool running, EntrySeverity severity) {
        if (source.isDefaultEntryHidden())
            return std::nullopt;

        core::SourceKey key{source.id, userId};
        const bool quiet = isQuietMode(isManaged, running);
        Entry entry;
        entry.id = core::encodeEntryId(key);
        entry.key = key;
        entry.title = defaultTitle(source, isManaged);
        entry.action = engine_.resolver_.resolve(source, userId, quiet);
        entry.enabled = entry.action.has_value() && !source.isDefaultEntryDisabled();
        entry.summary = defaultSummary(source, key);
        entry.severity = severity;
        entry.isManagedProfile = isManaged;
        if (quiet) {
            entry.enabled = false;
            entry.summary = strings().workProfilePausedSummary;
            entry.severity = EntrySeverity::Unspecified;
        }
        return entry;
    }

    std::string defaultTitle(const SourceDescriptor& source, bool isManaged) const {
        if (isManaged && !source.titleForWork.empty())
            return source.titleForWork;
        return source.title;
    }

    std::optional<std::string> defaultSummary(const SourceDescriptor& source,
                                              const core::SourceKey& key) const {
        if (store_.hasError(guard_, key))
            return strings().refreshErrorSummary(1);
        return optionalText(source.summary);
    }

    std::optional<std::string> groupSummary(const SourcesGroup& group, EntrySeverity severity,
                                            const std::vector<Entry>& entries) const {
        switch (severity) {
            case EntrySeverity::CriticalWarning:
            case EntrySeverity::Recommendation:
            case EntrySeverity::Ok:
                for (const auto& entry : entries) {
                    if (entry.severity != severity || !entry.summary)
                        continue;
                    if (severity > EntrySeverity::Ok)
                        return entry.summary;
                    auto report = store_.get(guard_, entry.key);
                    if (report && !report->issues.empty())
                        return entry.summary;
                }
                return optionalText(group.summary);
            case EntrySeverity::Unspecified:
                return optionalText(group.summary);
            case EntrySeverity::Unknown: {
                auto errors = std::count_if(entries.begin(), entries.end(), [&](const Entry& e) {
                    return store_.hasError(guard_, e.key);
                });
                if (errors > 0)
                    return strings().refreshErrorSummary(static_cast<std::size_t>(errors));
                return strings().groupUnknownSummary;
            }
        }
        spdlog::warn("[AggregationEngine] Unexpected severity {} for entry group {}",
                     static_cast<int>(severity), group.id);
        return optionalText(group.summary);
    }

    void addStaticEntryGroup(std::vector<StaticEntryGroup>& out, const SourcesGroup& group,
                             const core::UserProfileGroup& users) {
        StaticEntryGroup staticGroup;
        staticGroup.title = group.title;
        for (const auto& source : group.sources) {
            addStaticEntry(staticGroup.entries, source, users.profileParentUserId(), false,
                           false);
            if (!source.supportsManagedProfiles())
                continue;
            for (auto userId : users.managedProfileUserIds()) {
                addStaticEntry(staticGroup.entries, source, userId, true,
                               users.isManagedUserRunning(userId));
            }
        }
        out.push_back(std::move(staticGroup));
    }

    void addStaticEntry(std::vector<StaticEntry>& entries, const SourceDescriptor& source,
                        core::UserId userId, bool isManaged, bool running) {
        auto entry = toStaticEntry(source, userId, isManaged, running);
        if (!entry)
            return;
        core::SourceKey key{source.id, userId};
        if (isQuietMode(isManaged, running) || store_.hasError(guard_, key)) {
            state_.addEntry(OverallSeverity::Unknown);
        }
        entries.push_back(std::move(*entry));
    }

    std::optional<StaticEntry> toStaticEntry(const SourceDescriptor& source, core::UserId userId,
                                             bool isManaged, bool running) {
        switch (source.type) {
            case SourceType::IssueOnly:
                return std::nullopt;
            case SourceType::Dynamic: {
                auto report = store_.get(guard_, core::SourceKey{source.id, userId});
                if (report && report->status && !isQuietMode(isManaged, running)) {
                    const auto& status = *report->status;
                    if (!status.pendingAction) {
                        spdlog::debug("[AggregationEngine] Dropping static entry of {} for user "
                                      "{}: status has no action",
                                      source.id, userId);
                        return std::nullopt;
                    }
                    return StaticEntry{status.title, optionalText(status.summary),
                                       *status.pendingAction};
                }
                return toDefaultStaticEntry(source, userId, isManaged, running);
            }
            case SourceType::Static:
                return toDefaultStaticEntry(source, userId, isManaged, running);
        }
        spdlog::warn("[AggregationEngine] Unknown type of source {} in rigid group", source.id);
        return std::nullopt;
    }

    std::optional<StaticEntry> toDefaultStaticEntry(const SourceDescriptor& source,
                                                    core::UserId userId, bool isManaged,
                                                    bool running) {
        if (source.isDefaultEntryHidden())
            return std::nullopt;

        const bool quiet = isQuietMode(isManaged, running);
        auto action = engine_.resolver_.resolve(source, userId, quiet);
        if (!action) {
            spdlog::debug("[AggregationEngine] Dropping static entry of {} for user {}: no "
                          "action resolved",
                          source.id, userId);
            return std::nullopt;
        }

        StaticEntry entry;
        entry.title = defaultTitle(source, isManaged);
        entry.summary = defaultSummary(source, core::SourceKey{source.id, userId});
        entry.action = std::move(*action);
        if (quiet) {
            entry.summary = strings().workProfilePausedSummary;
        }
        return entry;
    }

    std::string statusTitle(OverallSeverity overall, RefreshStatus refreshStatus,
                            bool review) const {
        if (refreshStatus != RefreshStatus::None)
            return strings().scanningTitle;
        switch (overall) {
            case OverallSeverity::Unknown:
            case OverallSeverity::Ok:
                return review ? strings().okReviewTitle : strings().okTitle;
            case OverallSeverity::Recommendation:
                return titleFromCategory(strings().deviceRecommendationTitle,
                                         strings().accountRecommendationTitle,
                                         strings().generalRecommendationTitle);
            case OverallSeverity::CriticalWarning:
                return titleFromCategory(strings().deviceCriticalTitle,
                                         strings().accountCriticalTitle,
                                         strings().generalCriticalTitle);
        }
        spdlog::warn("[AggregationEngine] Unexpected overall severity {}",
                     static_cast<int>(overall));
        return {};
    }

    std::string titleFromCategory(const std::string& device, const std::string& account,
                                  const std::string& general) const {
        if (issues_.empty()) {
            spdlog::warn("[AggregationEngine] No issues found for a non-green status");
            return general;
        }
        switch (issues_.front().category) {
            case IssueCategory::Device:
                return device;
            case IssueCategory::Account:
                return account;
            case IssueCategory::General:
                return general;
        }
        return general;
    }

    std::string statusSummary(OverallSeverity overall, RefreshStatus refreshStatus,
                              std::size_t issueCount, bool review) const {
        if (refreshStatus != RefreshStatus::None)
            return strings().loadingSummary;
        if (overall <= OverallSeverity::Ok && issueCount == 0)
            return review ? strings().okReviewSummary : strings().okSummary;
        return strings().alertsSummary(issueCount);
    }

    const AggregationEngine& engine_;
    const SourceReportStore& store_;
    const IssueDismissalCache& cache_;
    const Guard& guard_;
    OverallState state_;
    std::vector<CategorizedIssue> issues_;
};

AggregationEngine::AggregationEngine(const ActionResolver& resolver, StatusStrings strings)
    : resolver_(resolver), strings_(std::move(strings)) {}

AggregatedView AggregationEngine::computeView(const Guard& guard,
                                              const config::SourceRegistry& registry,
                                              const SourceReportStore& store,
                                              const IssueDismissalCache& cache,
                                              RefreshStatus refreshStatus,
                                              const core::UserProfileGroup& users) const {
    try {
        Builder builder(*this, store, cache, guard);
        return builder.build(registry, refreshStatus, users);
    } catch (const std::exception& e) {
        spdlog::error("[AggregationEngine] Failed to compute view: {}", e.what());
        return AggregatedView::defaultView();
    }
}

} // namespace vigil::engine
