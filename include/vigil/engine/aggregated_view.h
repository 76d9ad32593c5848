#pragma once

#include <vigil/config/source_registry.h>
#include <vigil/core/ids.h>
#include <vigil/core/severity.h>
#include <vigil/engine/refresh_types.h>
#include <vigil/engine/source_report.h>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace vigil::engine {

struct ViewIssueAction {
    std::string id;
    std::string label;
    bool resolving{false};
    bool inFlight{false};
    std::optional<std::string> successMessage;

    bool operator==(const ViewIssueAction&) const = default;
};

struct ViewIssue {
    std::string id;
    core::IssueKey key;
    std::string typeId;
    core::IssueSeverity severity{core::IssueSeverity::Ok};
    IssueCategory category{IssueCategory::General};
    std::string title;
    std::optional<std::string> subtitle;
    std::string summary;
    bool shouldConfirmDismissal{false};
    std::vector<ViewIssueAction> actions;

    bool operator==(const ViewIssue&) const = default;
};

struct Entry {
    std::string id;
    core::SourceKey key;
    std::string title;
    std::optional<std::string> summary;
    core::EntrySeverity severity{core::EntrySeverity::Unknown};
    bool enabled{false};
    std::optional<std::string> action;
    bool isManagedProfile{false};

    bool operator==(const Entry&) const = default;
};

struct EntryGroup {
    std::string id;
    std::string title;
    std::optional<std::string> summary;
    core::EntrySeverity severity{core::EntrySeverity::Unspecified};
    config::StatelessIconType iconType{config::StatelessIconType::None};
    std::vector<Entry> entries;

    bool operator==(const EntryGroup&) const = default;
};

using EntryOrGroup = std::variant<Entry, EntryGroup>;

struct StaticEntry {
    std::string title;
    std::optional<std::string> summary;
    std::string action;

    bool operator==(const StaticEntry&) const = default;
};

struct StaticEntryGroup {
    std::string title;
    std::vector<StaticEntry> entries;

    bool operator==(const StaticEntryGroup&) const = default;
};

struct ViewStatus {
    std::string title;
    std::string summary;
    core::OverallSeverity severity{core::OverallSeverity::Unknown};
    RefreshStatus refreshStatus{RefreshStatus::None};
    bool hasSettingsToReview{false};

    bool operator==(const ViewStatus&) const = default;
};

/**
 * Snapshot of everything a consumer renders. Computed on demand from the stores; never
 * cached or patched in place.
 */
struct AggregatedView {
    ViewStatus status;
    std::vector<ViewIssue> issues;
    std::vector<EntryOrGroup> entriesOrGroups;
    std::vector<StaticEntryGroup> staticEntryGroups;

    // Empty, all-unknown view returned when the engine is disabled or failed.
    static AggregatedView defaultView() { return AggregatedView{}; }
};

} // namespace vigil::engine
