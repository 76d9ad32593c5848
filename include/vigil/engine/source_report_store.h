#pragma once

#include <vigil/core/ids.h>
#include <vigil/engine/engine_lock.h>
#include <vigil/engine/source_report.h>

#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace vigil::engine {

/**
 * Latest report per (source, user), plus the per-source error flags and the set of issue
 * actions currently executing.
 */
class SourceReportStore {
public:
    using Guard = EngineLock::Guard;

    std::optional<SourceReport> get(const Guard&, const core::SourceKey& key) const;
    bool contains(const Guard&, const core::SourceKey& key) const;

    // Replaces the report and clears the error flag. Returns whether anything changed.
    bool set(const Guard&, const core::SourceKey& key, SourceReport report);

    // Drops the report and the error flag of one key.
    bool clear(const Guard&, const core::SourceKey& key);
    void clearForUser(const Guard&, core::UserId userId);
    void clearAll(const Guard&);

    // Marks the key as errored; the last report, if any, is dropped.
    bool setError(const Guard&, const core::SourceKey& key);
    bool hasError(const Guard&, const core::SourceKey& key) const;

    void markActionInFlight(const Guard&, const core::IssueActionId& id);
    bool unmarkActionInFlight(const Guard&, const core::IssueActionId& id);
    bool isActionInFlight(const Guard&, const core::IssueActionId& id) const;

    std::size_t size(const Guard&) const noexcept { return reports_.size(); }
    std::size_t errorCount(const Guard&) const noexcept { return errors_.size(); }
    std::size_t actionsInFlight(const Guard&) const noexcept { return actionsInFlight_.size(); }

private:
    void dropStaleActions(const core::SourceKey& key, const SourceReport* report);

    std::unordered_map<core::SourceKey, SourceReport, core::SourceKeyHash> reports_;
    std::unordered_set<core::SourceKey, core::SourceKeyHash> errors_;
    std::unordered_set<core::IssueActionId, core::IssueActionIdHash> actionsInFlight_;
};

} // namespace vigil::engine
