#pragma once

#include <vigil/core/ids.h>
#include <vigil/core/severity.h>
#include <vigil/core/types.h>
#include <vigil/core/user_profile_group.h>
#include <vigil/engine/engine_lock.h>

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace vigil::engine {

/**
 * Bookkeeping for one issue key. `dismissCount == 0` iff `dismissedAt` and
 * `dismissedSeverity` are both absent.
 */
struct DismissalRecord {
    core::IssueKey key;
    TimePoint firstSeenAt;
    std::optional<TimePoint> dismissedAt;
    std::optional<core::SeverityLevel> dismissedSeverity;
    int dismissCount{0};

    bool operator==(const DismissalRecord&) const = default;
};

/**
 * Tracks which issues have been seen and which the user dismissed, and at what severity.
 * A dismissed issue stays hidden while its reported severity is at or below the severity it
 * had when last dismissed; reporting it at a higher severity resurfaces it without touching
 * the record.
 */
class IssueDismissalCache {
public:
    using Guard = EngineLock::Guard;

    void dismiss(const Guard&, const core::IssueKey& key, core::SeverityLevel currentSeverity,
                 TimePoint now);

    bool isDismissed(const Guard&, const core::IssueKey& key,
                     core::SeverityLevel currentSeverity) const;

    std::optional<DismissalRecord> find(const Guard&, const core::IssueKey& key) const;

    // Records known for users of the group, i.e. issues currently reported by its sources.
    std::int64_t countActive(const Guard&, const core::UserProfileGroup& users) const;

    // Registers first sightings of `issueIds` and forgets issues the source no longer reports.
    void updateIssuesForSource(const Guard&, const core::SourceKey& source,
                               const std::vector<std::string>& issueIds, TimePoint now);

    void clearForUser(const Guard&, core::UserId userId);
    void clear(const Guard&);

    // Persistence hooks: full snapshot and wholesale load.
    std::vector<DismissalRecord> snapshot(const Guard&) const;
    Result<void> load(const Guard&, std::vector<DismissalRecord> records);
    bool isDirty(const Guard&) const noexcept { return dirty_; }
    void markClean(const Guard&) noexcept { dirty_ = false; }

    std::size_t size(const Guard&) const noexcept { return records_.size(); }

private:
    std::unordered_map<core::IssueKey, DismissalRecord, core::IssueKeyHash> records_;
    bool dirty_{false};
};

} // namespace vigil::engine
