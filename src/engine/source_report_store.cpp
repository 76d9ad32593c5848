#include <vigil/engine/source_report_store.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace vigil::engine {

std::optional<SourceReport> SourceReportStore::get(const Guard&,
                                                   const core::SourceKey& key) const {
    auto it = reports_.find(key);
    if (it == reports_.end())
        return std::nullopt;
    return it->second;
}

bool SourceReportStore::contains(const Guard&, const core::SourceKey& key) const {
    return reports_.find(key) != reports_.end();
}

bool SourceReportStore::set(const Guard&, const core::SourceKey& key, SourceReport report) {
    bool hadError = errors_.erase(key) > 0;
    auto it = reports_.find(key);
    if (it != reports_.end() && it->second == report) {
        return hadError;
    }
    auto& stored = reports_[key];
    stored = std::move(report);
    dropStaleActions(key, &stored);
    return true;
}

bool SourceReportStore::clear(const Guard&, const core::SourceKey& key) {
    bool removed = reports_.erase(key) > 0;
    removed = errors_.erase(key) > 0 || removed;
    dropStaleActions(key, nullptr);
    return removed;
}

void SourceReportStore::clearForUser(const Guard&, core::UserId userId) {
    std::erase_if(reports_, [&](const auto& kv) { return kv.first.userId == userId; });
    std::erase_if(errors_, [&](const auto& key) { return key.userId == userId; });
    std::erase_if(actionsInFlight_,
                  [&](const auto& action) { return action.issueKey.userId == userId; });
}

void SourceReportStore::clearAll(const Guard&) {
    reports_.clear();
    errors_.clear();
    actionsInFlight_.clear();
}

bool SourceReportStore::setError(const Guard&, const core::SourceKey& key) {
    bool removedData = reports_.erase(key) > 0;
    bool newError = errors_.insert(key).second;
    dropStaleActions(key, nullptr);
    spdlog::debug("[SourceReportStore] {} errored (dropped data: {})", key.toString(),
                  removedData);
    return removedData || newError;
}

bool SourceReportStore::hasError(const Guard&, const core::SourceKey& key) const {
    return errors_.find(key) != errors_.end();
}

void SourceReportStore::markActionInFlight(const Guard&, const core::IssueActionId& id) {
    actionsInFlight_.insert(id);
}

bool SourceReportStore::unmarkActionInFlight(const Guard&, const core::IssueActionId& id) {
    return actionsInFlight_.erase(id) > 0;
}

bool SourceReportStore::isActionInFlight(const Guard&, const core::IssueActionId& id) const {
    return actionsInFlight_.find(id) != actionsInFlight_.end();
}

void SourceReportStore::dropStaleActions(const core::SourceKey& key, const SourceReport* report) {
    std::erase_if(actionsInFlight_, [&](const core::IssueActionId& action) {
        if (action.issueKey.sourceKey() != key)
            return false;
        if (report == nullptr)
            return true;
        auto issue = std::find_if(report->issues.begin(), report->issues.end(),
                                  [&](const SourceIssue& i) { return i.id == action.issueKey.issueId; });
        if (issue == report->issues.end())
            return true;
        return std::none_of(issue->actions.begin(), issue->actions.end(),
                            [&](const IssueAction& a) { return a.id == action.actionId; });
    });
}

} // namespace vigil::engine
