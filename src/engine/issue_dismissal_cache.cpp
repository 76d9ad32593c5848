#include <vigil/engine/issue_dismissal_cache.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_set>

namespace vigil::engine {

void IssueDismissalCache::dismiss(const Guard&, const core::IssueKey& key,
                                  core::SeverityLevel currentSeverity, TimePoint now) {
    auto it = records_.find(key);
    if (it == records_.end()) {
        spdlog::debug("[IssueDismissalCache] Dismissing unseen issue {}", key.toString());
        it = records_.emplace(key, DismissalRecord{key, now, std::nullopt, std::nullopt, 0}).first;
    }
    auto& record = it->second;
    record.dismissCount += 1;
    record.dismissedAt = now;
    record.dismissedSeverity = currentSeverity;
    dirty_ = true;
    spdlog::debug("[IssueDismissalCache] Dismissed {} at {} (count={})", key.toString(),
                  core::toString(currentSeverity), record.dismissCount);
}

bool IssueDismissalCache::isDismissed(const Guard&, const core::IssueKey& key,
                                      core::SeverityLevel currentSeverity) const {
    auto it = records_.find(key);
    if (it == records_.end())
        return false;
    const auto& record = it->second;
    if (!record.dismissedAt || !record.dismissedSeverity)
        return false;
    return currentSeverity <= *record.dismissedSeverity;
}

std::optional<DismissalRecord> IssueDismissalCache::find(const Guard&,
                                                         const core::IssueKey& key) const {
    auto it = records_.find(key);
    if (it == records_.end())
        return std::nullopt;
    return it->second;
}

std::int64_t IssueDismissalCache::countActive(const Guard&,
                                              const core::UserProfileGroup& users) const {
    return static_cast<std::int64_t>(
        std::count_if(records_.begin(), records_.end(),
                      [&](const auto& kv) { return users.contains(kv.first.userId); }));
}

void IssueDismissalCache::updateIssuesForSource(const Guard&, const core::SourceKey& source,
                                                const std::vector<std::string>& issueIds,
                                                TimePoint now) {
    std::unordered_set<std::string> reported(issueIds.begin(), issueIds.end());

    auto removed = std::erase_if(records_, [&](const auto& kv) {
        const auto& key = kv.first;
        return key.sourceId == source.sourceId && key.userId == source.userId &&
               reported.find(key.issueId) == reported.end();
    });

    std::size_t added = 0;
    for (const auto& issueId : reported) {
        core::IssueKey key{source.sourceId, issueId, source.userId};
        if (records_.emplace(key, DismissalRecord{key, now, std::nullopt, std::nullopt, 0})
                .second) {
            ++added;
        }
    }
    if (removed > 0 || added > 0) {
        dirty_ = true;
        spdlog::debug("[IssueDismissalCache] {}: {} new issue(s), {} forgotten", source.toString(),
                      added, removed);
    }
}

void IssueDismissalCache::clearForUser(const Guard&, core::UserId userId) {
    if (std::erase_if(records_, [&](const auto& kv) { return kv.first.userId == userId; }) > 0) {
        dirty_ = true;
    }
}

void IssueDismissalCache::clear(const Guard&) {
    if (!records_.empty()) {
        dirty_ = true;
    }
    records_.clear();
}

std::vector<DismissalRecord> IssueDismissalCache::snapshot(const Guard&) const {
    std::vector<DismissalRecord> out;
    out.reserve(records_.size());
    for (const auto& [key, record] : records_) {
        out.push_back(record);
    }
    std::sort(out.begin(), out.end(), [](const DismissalRecord& a, const DismissalRecord& b) {
        return core::encodeIssueKey(a.key) < core::encodeIssueKey(b.key);
    });
    return out;
}

Result<void> IssueDismissalCache::load(const Guard&, std::vector<DismissalRecord> records) {
    std::unordered_map<core::IssueKey, DismissalRecord, core::IssueKeyHash> loaded;
    for (auto& record : records) {
        if (record.dismissCount < 0) {
            return Error{ErrorCode::InvalidData,
                         "Negative dismiss count for " + record.key.toString()};
        }
        if ((record.dismissCount > 0) != record.dismissedAt.has_value()) {
            return Error{ErrorCode::InvalidData,
                         "dismissCount and dismissedAt disagree for " + record.key.toString()};
        }
        if (record.dismissCount > 0 && !record.dismissedSeverity) {
            // Records written without a severity keep the issue hidden at every level.
            record.dismissedSeverity = core::SeverityLevel::CriticalWarning;
        }
        if (record.dismissCount == 0) {
            record.dismissedSeverity.reset();
        }
        auto key = record.key;
        loaded.insert_or_assign(std::move(key), std::move(record));
    }
    records_ = std::move(loaded);
    dirty_ = false;
    spdlog::debug("[IssueDismissalCache] Loaded {} record(s)", records_.size());
    return {};
}

} // namespace vigil::engine
