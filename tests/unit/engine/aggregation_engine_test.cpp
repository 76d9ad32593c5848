#include <gtest/gtest.h>
#include <vigil/engine/aggregation_engine.h>

#include "../../common/test_helpers.h"

#include <variant>

using namespace vigil;
using namespace vigil::engine;
using vigil::config::GroupType;
using vigil::config::ProfileScope;
using vigil::config::SourceRegistry;
using vigil::core::EntrySeverity;
using vigil::core::IssueKey;
using vigil::core::OverallSeverity;
using vigil::core::SeverityLevel;
using vigil::core::SourceKey;
using vigil::core::UserProfileGroup;
using vigil::tests::dynamicSource;
using vigil::tests::issueOnlySource;
using vigil::tests::makeGroup;
using vigil::tests::staticSource;

namespace {

SourceStatus status(std::string title, std::string summary, SeverityLevel severity) {
    SourceStatus s;
    s.title = std::move(title);
    s.summary = std::move(summary);
    s.severity = severity;
    return s;
}

SourceIssue issue(std::string id, SeverityLevel severity,
                  IssueCategory category = IssueCategory::General) {
    SourceIssue i;
    i.id = id;
    i.typeId = "type_" + id;
    i.severity = severity;
    i.category = category;
    i.title = "Issue " + id;
    i.summary = "Summary " + id;
    return i;
}

class NoActionResolver : public ActionResolver {
public:
    std::optional<std::string> resolve(const config::SourceDescriptor&, core::UserId,
                                       bool) const override {
        return std::nullopt;
    }
};

class AggregationEngineTest : public ::testing::Test {
protected:
    void useRegistry(std::vector<config::SourcesGroup> groups) {
        auto created = SourceRegistry::create(std::move(groups));
        ASSERT_TRUE(created) << created.error().message;
        registry_ = std::move(created).value();
    }

    void useTwoSourceGroup() {
        useRegistry({makeGroup("g", GroupType::Collapsible, {dynamicSource("a"), dynamicSource("b")})});
    }

    AggregatedView compute(const UserProfileGroup& users = UserProfileGroup(0),
                           RefreshStatus refresh = RefreshStatus::None) {
        auto guard = lock_.acquire();
        return engine_.computeView(guard, registry_, store_, cache_, refresh, users);
    }

    void setReport(const SourceKey& key, SourceReport report) {
        auto guard = lock_.acquire();
        std::vector<std::string> ids;
        for (const auto& i : report.issues)
            ids.push_back(i.id);
        store_.set(guard, key, std::move(report));
        cache_.updateIssuesForSource(guard, key, ids, TimePoint{});
    }

    void dismiss(const IssueKey& key, SeverityLevel severity) {
        auto guard = lock_.acquire();
        cache_.dismiss(guard, key, severity, TimePoint{});
    }

    static const EntryGroup& asGroup(const EntryOrGroup& item) {
        return std::get<EntryGroup>(item);
    }

    IntentActionResolver resolver_;
    AggregationEngine engine_{resolver_};
    SourceRegistry registry_;
    EngineLock lock_;
    SourceReportStore store_;
    IssueDismissalCache cache_;
};

} // namespace

TEST_F(AggregationEngineTest, CriticalIssueDrivesStatus) {
    useTwoSourceGroup();
    setReport({"a", 0},
              SourceReport{status("A", "A is critical", SeverityLevel::CriticalWarning),
                           {issue("i1", SeverityLevel::CriticalWarning, IssueCategory::Device)}});
    setReport({"b", 0}, SourceReport{status("B", "B is fine", SeverityLevel::Information), {}});

    auto view = compute();
    ASSERT_EQ(view.issues.size(), 1u);
    EXPECT_EQ(view.issues[0].id, "a|i1|0|type_i1");
    EXPECT_EQ(view.issues[0].severity, core::IssueSeverity::CriticalWarning);
    EXPECT_TRUE(view.issues[0].shouldConfirmDismissal);

    EXPECT_EQ(view.status.severity, OverallSeverity::CriticalWarning);
    EXPECT_EQ(view.status.title, "Device is at risk");
    EXPECT_EQ(view.status.summary, "1 alert");
    EXPECT_FALSE(view.status.hasSettingsToReview);

    ASSERT_EQ(view.entriesOrGroups.size(), 1u);
    const auto& group = asGroup(view.entriesOrGroups[0]);
    EXPECT_EQ(group.severity, EntrySeverity::CriticalWarning);
    EXPECT_EQ(group.summary, "A is critical");
    ASSERT_EQ(group.entries.size(), 2u);
    EXPECT_EQ(group.entries[0].title, "A");
    EXPECT_EQ(group.entries[0].action, "open.a");
    EXPECT_TRUE(group.entries[0].enabled);
    EXPECT_EQ(group.entries[1].severity, EntrySeverity::Ok);
}

TEST_F(AggregationEngineTest, DismissedAtCriticalStaysHiddenAtRecommendation) {
    useTwoSourceGroup();
    setReport({"a", 0}, SourceReport{status("A", "s", SeverityLevel::CriticalWarning),
                                     {issue("i1", SeverityLevel::CriticalWarning)}});
    dismiss(IssueKey{"a", "i1", 0}, SeverityLevel::CriticalWarning);

    setReport({"a", 0}, SourceReport{status("A", "s", SeverityLevel::Recommendation),
                                     {issue("i1", SeverityLevel::Recommendation)}});
    EXPECT_TRUE(compute().issues.empty());
}

TEST_F(AggregationEngineTest, DismissedAtRecommendationResurfacesAtCritical) {
    useTwoSourceGroup();
    setReport({"a", 0}, SourceReport{status("A", "s", SeverityLevel::Recommendation),
                                     {issue("i1", SeverityLevel::Recommendation)}});
    dismiss(IssueKey{"a", "i1", 0}, SeverityLevel::Recommendation);
    EXPECT_TRUE(compute().issues.empty());

    setReport({"a", 0}, SourceReport{status("A", "s", SeverityLevel::CriticalWarning),
                                     {issue("i1", SeverityLevel::CriticalWarning)}});
    auto view = compute();
    ASSERT_EQ(view.issues.size(), 1u);
    EXPECT_EQ(view.status.severity, OverallSeverity::CriticalWarning);
}

TEST_F(AggregationEngineTest, NoDataIsUnknownWithDefaultEntries) {
    useTwoSourceGroup();
    auto view = compute();

    EXPECT_EQ(view.status.severity, OverallSeverity::Unknown);
    EXPECT_TRUE(view.status.hasSettingsToReview);
    EXPECT_EQ(view.status.title, "Review your settings");
    EXPECT_EQ(view.status.summary, "Check your settings");

    const auto& group = asGroup(view.entriesOrGroups.at(0));
    EXPECT_EQ(group.severity, EntrySeverity::Unknown);
    EXPECT_EQ(group.summary, "Couldn't check settings");
    EXPECT_EQ(group.entries[0].title, "Title a");
    EXPECT_EQ(group.entries[0].summary, "Summary a");
    EXPECT_EQ(group.entries[0].severity, EntrySeverity::Unknown);
}

TEST_F(AggregationEngineTest, ErroredSourcesAreCountedInGroupSummary) {
    useTwoSourceGroup();
    {
        auto guard = lock_.acquire();
        store_.setError(guard, {"a", 0});
        store_.setError(guard, {"b", 0});
    }
    auto view = compute();
    const auto& group = asGroup(view.entriesOrGroups.at(0));
    EXPECT_EQ(group.summary, "Couldn't check 2 settings");
    EXPECT_EQ(group.entries[0].summary, "Couldn't check setting");
}

TEST_F(AggregationEngineTest, RefreshInProgressOverridesTexts) {
    useTwoSourceGroup();
    auto view = compute(UserProfileGroup(0), RefreshStatus::FullRescanInProgress);
    EXPECT_EQ(view.status.title, "Scanning…");
    EXPECT_EQ(view.status.summary, "Loading…");
    EXPECT_EQ(view.status.refreshStatus, RefreshStatus::FullRescanInProgress);
}

TEST_F(AggregationEngineTest, IssuesSortedBySeverityKeepingSourceOrder) {
    useRegistry({makeGroup("g", GroupType::Collapsible,
                           {dynamicSource("a"), dynamicSource("b"), issueOnlySource("c")})});
    setReport({"a", 0}, SourceReport{status("A", "s", SeverityLevel::CriticalWarning),
                                     {issue("a1", SeverityLevel::Recommendation),
                                      issue("a2", SeverityLevel::CriticalWarning)}});
    setReport({"b", 0}, SourceReport{status("B", "s", SeverityLevel::Recommendation),
                                     {issue("b1", SeverityLevel::Recommendation)}});
    setReport({"c", 0}, SourceReport{std::nullopt, {issue("c1", SeverityLevel::Information)}});

    auto view = compute();
    ASSERT_EQ(view.issues.size(), 4u);
    EXPECT_EQ(view.issues[0].key.issueId, "a2");
    EXPECT_EQ(view.issues[1].key.issueId, "a1");
    EXPECT_EQ(view.issues[2].key.issueId, "b1");
    EXPECT_EQ(view.issues[3].key.issueId, "c1");
    EXPECT_FALSE(view.issues[3].shouldConfirmDismissal);
    EXPECT_EQ(view.status.summary, "4 alerts");
    EXPECT_EQ(view.status.title, "Safety warning");

    // Issue-only sources contribute no entry.
    EXPECT_EQ(asGroup(view.entriesOrGroups.at(0)).entries.size(), 2u);
}

TEST_F(AggregationEngineTest, SingleEntryGroupCollapsesToEntry) {
    useRegistry({makeGroup("g", GroupType::Collapsible, {dynamicSource("a")})});
    setReport({"a", 0}, SourceReport{status("A", "fine", SeverityLevel::Information), {}});
    auto view = compute();
    ASSERT_EQ(view.entriesOrGroups.size(), 1u);
    ASSERT_TRUE(std::holds_alternative<Entry>(view.entriesOrGroups[0]));
    EXPECT_EQ(std::get<Entry>(view.entriesOrGroups[0]).id, "a|0");
    EXPECT_EQ(view.status.severity, OverallSeverity::Ok);
    EXPECT_EQ(view.status.title, "Looks good");
    EXPECT_EQ(view.status.summary, "No problems found");
}

TEST_F(AggregationEngineTest, PausedWorkProfileIsQuiet) {
    useRegistry({makeGroup("g", GroupType::Collapsible,
                           {dynamicSource("a", ProfileScope::All)})});
    setReport({"a", 0}, SourceReport{status("A", "fine", SeverityLevel::Information), {}});
    setReport({"a", 10}, SourceReport{status("A work", "bad", SeverityLevel::CriticalWarning),
                                      {issue("w1", SeverityLevel::CriticalWarning)}});

    auto view = compute(UserProfileGroup(0, {{10, false}}));
    EXPECT_TRUE(view.issues.empty());

    const auto& group = asGroup(view.entriesOrGroups.at(0));
    ASSERT_EQ(group.entries.size(), 2u);
    const auto& work = group.entries[1];
    EXPECT_TRUE(work.isManagedProfile);
    EXPECT_EQ(work.title, "Work a");
    EXPECT_EQ(work.summary, "Work profile is paused");
    EXPECT_EQ(work.severity, EntrySeverity::Unspecified);
    EXPECT_FALSE(work.enabled);
    EXPECT_EQ(view.status.severity, OverallSeverity::Ok);
}

TEST_F(AggregationEngineTest, RunningWorkProfileContributesIssues) {
    useRegistry({makeGroup("g", GroupType::Collapsible,
                           {dynamicSource("a", ProfileScope::All)})});
    setReport({"a", 0}, SourceReport{status("A", "fine", SeverityLevel::Information), {}});
    setReport({"a", 10}, SourceReport{status("A work", "bad", SeverityLevel::Recommendation),
                                      {issue("w1", SeverityLevel::Recommendation)}});

    auto view = compute(UserProfileGroup(0, {{10, true}}));
    ASSERT_EQ(view.issues.size(), 1u);
    EXPECT_EQ(view.issues[0].key.userId, 10);
    EXPECT_EQ(view.status.severity, OverallSeverity::Recommendation);
    EXPECT_EQ(view.status.title, "Safety recommendation");
}

TEST_F(AggregationEngineTest, HiddenGroupsOnlyContributeIssues) {
    useRegistry({makeGroup("g", GroupType::Collapsible, {dynamicSource("a")}),
                 makeGroup("h", GroupType::Hidden, {issueOnlySource("scan")})});
    setReport({"a", 0}, SourceReport{status("A", "fine", SeverityLevel::Information), {}});
    setReport({"scan", 0},
              SourceReport{std::nullopt,
                           {issue("s1", SeverityLevel::Recommendation, IssueCategory::Account)}});

    auto view = compute();
    EXPECT_EQ(view.entriesOrGroups.size(), 1u);
    ASSERT_EQ(view.issues.size(), 1u);
    EXPECT_EQ(view.status.title, "Account may be at risk");
}

TEST_F(AggregationEngineTest, RigidGroupBuildsStaticEntries) {
    auto withAction = dynamicSource("dyn");
    useRegistry({makeGroup("g", GroupType::Collapsible, {dynamicSource("a")}),
                 makeGroup("r", GroupType::Rigid,
                           {staticSource("st"), withAction, dynamicSource("noaction")})});
    setReport({"a", 0}, SourceReport{status("A", "fine", SeverityLevel::Information), {}});

    auto dynStatus = status("Dyn", "dyn summary", SeverityLevel::Information);
    dynStatus.pendingAction = "pending.dyn";
    setReport({"dyn", 0}, SourceReport{dynStatus, {}});
    setReport({"noaction", 0},
              SourceReport{status("No", "no action", SeverityLevel::Information), {}});

    auto view = compute();
    ASSERT_EQ(view.staticEntryGroups.size(), 1u);
    const auto& entries = view.staticEntryGroups[0].entries;
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].title, "Title st");
    EXPECT_EQ(entries[0].action, "open.st");
    EXPECT_EQ(entries[1].title, "Dyn");
    EXPECT_EQ(entries[1].action, "pending.dyn");
    EXPECT_EQ(view.status.severity, OverallSeverity::Ok);
}

TEST_F(AggregationEngineTest, EmptyRigidGroupIsStillListed) {
    useRegistry({makeGroup("r", GroupType::Rigid, {issueOnlySource("scan")})});
    auto view = compute();
    ASSERT_EQ(view.staticEntryGroups.size(), 1u);
    EXPECT_TRUE(view.staticEntryGroups[0].entries.empty());
}

TEST_F(AggregationEngineTest, ErroredRigidEntryMakesStatusUnknown) {
    useRegistry({makeGroup("r", GroupType::Rigid, {dynamicSource("dyn")})});
    {
        auto guard = lock_.acquire();
        store_.setError(guard, {"dyn", 0});
    }
    auto view = compute();
    EXPECT_EQ(view.status.severity, OverallSeverity::Unknown);
    ASSERT_EQ(view.staticEntryGroups.at(0).entries.size(), 1u);
    EXPECT_EQ(view.staticEntryGroups[0].entries[0].summary, "Couldn't check setting");
}

TEST_F(AggregationEngineTest, UnresolvableActionDisablesEntry) {
    NoActionResolver noAction;
    AggregationEngine engine(noAction);
    useRegistry({makeGroup("g", GroupType::Collapsible, {dynamicSource("a")})});
    setReport({"a", 0}, SourceReport{status("A", "bad", SeverityLevel::Recommendation), {}});

    auto guard = lock_.acquire();
    auto view = engine.computeView(guard, registry_, store_, cache_, RefreshStatus::None,
                                   UserProfileGroup(0));
    const auto& entry = std::get<Entry>(view.entriesOrGroups.at(0));
    EXPECT_FALSE(entry.enabled);
    EXPECT_FALSE(entry.action.has_value());
    EXPECT_EQ(entry.severity, EntrySeverity::Unspecified);
}

TEST_F(AggregationEngineTest, InFlightActionsAreFlagged) {
    useRegistry({makeGroup("g", GroupType::Collapsible, {dynamicSource("a")})});
    auto withAction = issue("i1", SeverityLevel::Recommendation);
    withAction.actions.push_back(IssueAction{"fix", "Fix", true, std::string("Fixed")});
    setReport({"a", 0}, SourceReport{status("A", "s", SeverityLevel::Recommendation), {withAction}});
    {
        auto guard = lock_.acquire();
        store_.markActionInFlight(guard, core::IssueActionId{IssueKey{"a", "i1", 0}, "fix"});
    }

    auto view = compute();
    ASSERT_EQ(view.issues.at(0).actions.size(), 1u);
    const auto& action = view.issues[0].actions[0];
    EXPECT_EQ(action.id, "a|i1|0|fix");
    EXPECT_TRUE(action.inFlight);
    EXPECT_TRUE(action.resolving);
    EXPECT_EQ(action.successMessage, "Fixed");
}

TEST_F(AggregationEngineTest, SettingsBehindIssuesAskForReview) {
    useTwoSourceGroup();
    setReport({"a", 0}, SourceReport{status("A", "needs care", SeverityLevel::Recommendation), {}});
    setReport({"b", 0}, SourceReport{status("B", "fine", SeverityLevel::Information), {}});

    auto view = compute();
    EXPECT_TRUE(view.issues.empty());
    EXPECT_EQ(view.status.severity, OverallSeverity::Ok);
    EXPECT_TRUE(view.status.hasSettingsToReview);
    EXPECT_EQ(view.status.title, "Review your settings");
    EXPECT_EQ(asGroup(view.entriesOrGroups.at(0)).summary, "needs care");
}
