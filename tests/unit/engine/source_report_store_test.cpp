#include <gtest/gtest.h>
#include <vigil/engine/source_report_store.h>

using namespace vigil::engine;
using vigil::core::IssueActionId;
using vigil::core::IssueKey;
using vigil::core::SeverityLevel;
using vigil::core::SourceKey;

namespace {

SourceReport reportWithAction(const std::string& issueId, const std::string& actionId) {
    SourceReport report;
    SourceIssue issue;
    issue.id = issueId;
    issue.typeId = issueId;
    issue.severity = SeverityLevel::Recommendation;
    issue.title = "t";
    issue.summary = "s";
    issue.actions.push_back(IssueAction{actionId, "Fix", true, std::nullopt});
    report.issues.push_back(issue);
    return report;
}

} // namespace

TEST(SourceReportStore, SetReportsChangesOnly) {
    EngineLock lock;
    SourceReportStore store;
    auto guard = lock.acquire();
    SourceKey key{"lock", 0};

    EXPECT_TRUE(store.set(guard, key, reportWithAction("i", "a")));
    EXPECT_FALSE(store.set(guard, key, reportWithAction("i", "a")));
    EXPECT_TRUE(store.contains(guard, key));

    // An empty report is data, not absence.
    EXPECT_TRUE(store.set(guard, key, SourceReport{}));
    ASSERT_TRUE(store.get(guard, key).has_value());
    EXPECT_TRUE(store.get(guard, key)->issues.empty());
}

TEST(SourceReportStore, ErrorDropsDataAndIsClearedBySet) {
    EngineLock lock;
    SourceReportStore store;
    auto guard = lock.acquire();
    SourceKey key{"lock", 0};

    store.set(guard, key, reportWithAction("i", "a"));
    EXPECT_TRUE(store.setError(guard, key));
    EXPECT_FALSE(store.contains(guard, key));
    EXPECT_TRUE(store.hasError(guard, key));
    EXPECT_FALSE(store.setError(guard, key));

    EXPECT_TRUE(store.set(guard, key, reportWithAction("i", "a")));
    EXPECT_FALSE(store.hasError(guard, key));
}

TEST(SourceReportStore, InFlightActionsFollowReportedIssues) {
    EngineLock lock;
    SourceReportStore store;
    auto guard = lock.acquire();
    SourceKey key{"lock", 0};
    IssueActionId action{IssueKey{"lock", "i", 0}, "a"};

    store.set(guard, key, reportWithAction("i", "a"));
    store.markActionInFlight(guard, action);
    EXPECT_TRUE(store.isActionInFlight(guard, action));

    // Same issue, same action: stays in flight.
    auto updated = reportWithAction("i", "a");
    updated.issues[0].summary = "changed";
    store.set(guard, key, updated);
    EXPECT_TRUE(store.isActionInFlight(guard, action));

    // The action disappears from the report.
    store.set(guard, key, reportWithAction("i", "other"));
    EXPECT_FALSE(store.isActionInFlight(guard, action));
}

TEST(SourceReportStore, ClearForUserOnlyTouchesThatUser) {
    EngineLock lock;
    SourceReportStore store;
    auto guard = lock.acquire();

    store.set(guard, SourceKey{"lock", 0}, SourceReport{});
    store.set(guard, SourceKey{"lock", 10}, SourceReport{});
    store.setError(guard, SourceKey{"backup", 10});

    store.clearForUser(guard, 10);
    EXPECT_EQ(store.size(guard), 1u);
    EXPECT_EQ(store.errorCount(guard), 0u);

    store.clearAll(guard);
    EXPECT_EQ(store.size(guard), 0u);
}
