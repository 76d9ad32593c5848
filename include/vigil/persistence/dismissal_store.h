#pragma once

#include <vigil/core/types.h>
#include <vigil/engine/issue_dismissal_cache.h>
#include <vigil/persistence/persisted_issue.h>

#include <filesystem>
#include <vector>

namespace vigil::persistence {

/**
 * JSON file holding the dismissal records across restarts:
 *
 *   {"version": 1, "issues": [{"key": ..., "first_seen_at_ms": ..., "dismiss_count": ...,
 *                              "dismissed_at_ms": ..., "dismissed_severity": ...}]}
 *
 * Writes go to a sibling temp file that is renamed over the target.
 */
class DismissalStore {
public:
    static constexpr int kVersion = 1;

    explicit DismissalStore(std::filesystem::path path);

    // A missing file is an empty store.
    Result<std::vector<PersistedIssue>> load() const;
    Result<void> save(const std::vector<PersistedIssue>& issues) const;
    Result<void> remove() const;

    // Convenience wrappers converting to and from the cache's records.
    Result<std::vector<engine::DismissalRecord>> loadRecords() const;
    Result<void> saveRecords(const std::vector<engine::DismissalRecord>& records) const;

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

Result<PersistedIssue> toPersisted(const engine::DismissalRecord& record);
Result<engine::DismissalRecord> fromPersisted(const PersistedIssue& issue);

} // namespace vigil::persistence
