#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <vigil/engine/refresh_coordinator.h>

#include "../../common/test_helpers.h"

using namespace vigil::engine;
using vigil::core::SourceKey;
using vigil::core::UserProfileGroup;
using vigil::tests::FakeClock;
using vigil::tests::RecordingTelemetrySink;

namespace {

class RefreshCoordinatorTest : public ::testing::Test {
protected:
    RefreshCoordinatorTest()
        : coordinator_(sink_, RefreshCoordinator::Config{{"untracked"}}, clock_.fn()) {}

    const SourceKey a_{"a", 0};
    const SourceKey b_{"b", 0};
    const UserProfileGroup users_{0};

    RecordingTelemetrySink sink_;
    FakeClock clock_;
    EngineLock lock_;
    RefreshCoordinator coordinator_;
};

} // namespace

TEST_F(RefreshCoordinatorTest, CompletesWhenLastTrackedSourceAnswers) {
    auto guard = lock_.acquire();
    auto id = coordinator_.startSession(guard, RefreshReason::Other, users_);
    coordinator_.markInFlight(guard, id, {a_, b_});
    EXPECT_EQ(coordinator_.status(guard), RefreshStatus::DataFetchInProgress);

    clock_.advance(std::chrono::milliseconds(30));
    EXPECT_FALSE(coordinator_.reportComplete(guard, id, a_, true));
    EXPECT_TRUE(coordinator_.reportComplete(guard, id, b_, true));

    EXPECT_EQ(coordinator_.status(guard), RefreshStatus::None);
    EXPECT_FALSE(coordinator_.currentSessionId(guard).has_value());

    ASSERT_EQ(sink_.sourceEvents.size(), 2u);
    EXPECT_EQ(sink_.sourceEvents[0].sourceId, "a");
    EXPECT_EQ(sink_.sourceEvents[0].duration, std::chrono::milliseconds(30));
    EXPECT_EQ(sink_.sourceEvents[0].requestType, RefreshRequestType::FetchFreshData);
    ASSERT_EQ(sink_.wholeEvents.size(), 1u);
    EXPECT_EQ(sink_.wholeEvents[0].result, EventResult::Success);
}

TEST_F(RefreshCoordinatorTest, CompletionIsReportedExactlyOnce) {
    auto guard = lock_.acquire();
    auto id = coordinator_.startSession(guard, RefreshReason::PageOpen, users_);
    coordinator_.markInFlight(guard, id, {a_});
    EXPECT_TRUE(coordinator_.reportComplete(guard, id, a_, true));
    EXPECT_FALSE(coordinator_.reportComplete(guard, id, a_, true));
    EXPECT_EQ(coordinator_.staleCallCount(), 1u);
    EXPECT_EQ(sink_.wholeEvents.size(), 1u);
    EXPECT_EQ(sink_.wholeEvents[0].requestType, RefreshRequestType::GetData);
}

TEST_F(RefreshCoordinatorTest, TrackedFailureMarksWholeRefreshAsError) {
    auto guard = lock_.acquire();
    auto id = coordinator_.startSession(guard, RefreshReason::Other, users_);
    coordinator_.markInFlight(guard, id, {a_, b_});
    coordinator_.reportComplete(guard, id, a_, false);
    EXPECT_TRUE(coordinator_.reportComplete(guard, id, b_, true));

    ASSERT_EQ(sink_.sourceEvents.size(), 2u);
    EXPECT_EQ(sink_.sourceEvents[0].result, EventResult::Error);
    ASSERT_EQ(sink_.wholeEvents.size(), 1u);
    EXPECT_EQ(sink_.wholeEvents[0].result, EventResult::Error);
}

TEST_F(RefreshCoordinatorTest, UntrackedSourcesNeverBlockCompletion) {
    auto guard = lock_.acquire();
    SourceKey untracked{"untracked", 0};
    auto id = coordinator_.startSession(guard, RefreshReason::Other, users_);
    coordinator_.markInFlight(guard, id, {a_, untracked});
    EXPECT_EQ(coordinator_.inFlightCount(guard), 1u);
    EXPECT_FALSE(coordinator_.isTracked("untracked"));

    EXPECT_TRUE(coordinator_.reportComplete(guard, id, a_, true));
    EXPECT_EQ(sink_.sourceEvents.size(), 1u);
}

TEST_F(RefreshCoordinatorTest, SecondSessionSupersedesFirst) {
    auto guard = lock_.acquire();
    auto first = coordinator_.startSession(guard, RefreshReason::Other, users_);
    coordinator_.markInFlight(guard, first, {a_});
    auto second = coordinator_.startSession(guard, RefreshReason::RescanButton, users_);
    coordinator_.markInFlight(guard, second, {b_});

    EXPECT_NE(first, second);
    EXPECT_EQ(coordinator_.currentSessionId(guard), second);
    EXPECT_EQ(coordinator_.inFlightCount(guard), 1u);
    EXPECT_EQ(coordinator_.status(guard), RefreshStatus::FullRescanInProgress);

    ASSERT_EQ(sink_.supersededEvents.size(), 1u);
    EXPECT_EQ(sink_.supersededEvents[0].sessionId, first);
    EXPECT_EQ(sink_.supersededEvents[0].abandonedInFlight, 1u);

    // Replies to the superseded session are rejected.
    EXPECT_FALSE(coordinator_.reportComplete(guard, first, a_, true));
    EXPECT_EQ(coordinator_.staleCallCount(), 1u);
    EXPECT_EQ(coordinator_.inFlightCount(guard), 1u);
}

TEST_F(RefreshCoordinatorTest, TimeoutReturnsOutstandingKeys) {
    auto guard = lock_.acquire();
    auto id = coordinator_.startSession(guard, RefreshReason::Other, users_);
    coordinator_.markInFlight(guard, id, {a_, b_});
    coordinator_.reportComplete(guard, id, a_, true);

    clock_.advance(std::chrono::seconds(10));
    auto timedOut = coordinator_.timeout(guard, id);
    EXPECT_EQ(timedOut, SourceKeySet{b_});
    EXPECT_EQ(coordinator_.status(guard), RefreshStatus::None);

    ASSERT_EQ(sink_.sourceEvents.size(), 2u);
    EXPECT_EQ(sink_.sourceEvents[1].result, EventResult::Timeout);
    EXPECT_EQ(sink_.sourceEvents[1].duration, std::chrono::seconds(10));
    ASSERT_EQ(sink_.wholeEvents.size(), 1u);
    EXPECT_EQ(sink_.wholeEvents[0].result, EventResult::Timeout);

    // A late reply after the timeout changes nothing.
    EXPECT_FALSE(coordinator_.reportComplete(guard, id, b_, true));
    EXPECT_EQ(sink_.sourceEvents.size(), 2u);
    EXPECT_EQ(sink_.wholeEvents.size(), 1u);
}

TEST_F(RefreshCoordinatorTest, TimeoutWithStaleIdIsIgnored) {
    auto guard = lock_.acquire();
    auto id = coordinator_.startSession(guard, RefreshReason::Other, users_);
    coordinator_.markInFlight(guard, id, {a_});
    EXPECT_TRUE(coordinator_.timeout(guard, "not-a-session").empty());
    EXPECT_EQ(coordinator_.inFlightCount(guard), 1u);
    EXPECT_EQ(coordinator_.staleCallCount(), 1u);
}

TEST_F(RefreshCoordinatorTest, RemovingParentUserClearsSession) {
    auto guard = lock_.acquire();
    auto id = coordinator_.startSession(guard, RefreshReason::Other, users_);
    coordinator_.markInFlight(guard, id, {a_});
    EXPECT_TRUE(coordinator_.clearForUser(guard, 0));
    EXPECT_FALSE(coordinator_.currentSessionId(guard).has_value());
    EXPECT_TRUE(sink_.wholeEvents.empty());
}

TEST_F(RefreshCoordinatorTest, RemovingManagedUserDropsItsKeys) {
    auto guard = lock_.acquire();
    UserProfileGroup users(0, {{10, true}});
    SourceKey work{"a", 10};
    auto id = coordinator_.startSession(guard, RefreshReason::Other, users);
    coordinator_.markInFlight(guard, id, {a_, work});

    EXPECT_FALSE(coordinator_.clearForUser(guard, 10));
    EXPECT_EQ(coordinator_.inFlightCount(guard), 1u);

    EXPECT_TRUE(coordinator_.reportComplete(guard, id, a_, true));
}

TEST_F(RefreshCoordinatorTest, RemovingLastManagedUserKeysClearsSession) {
    auto guard = lock_.acquire();
    UserProfileGroup users(0, {{10, true}});
    auto id = coordinator_.startSession(guard, RefreshReason::Other, users);
    coordinator_.markInFlight(guard, id, {SourceKey{"a", 10}});
    EXPECT_TRUE(coordinator_.clearForUser(guard, 10));
    EXPECT_FALSE(coordinator_.currentSessionId(guard).has_value());
}

TEST_F(RefreshCoordinatorTest, ClearWithIdChecksSession) {
    auto guard = lock_.acquire();
    auto id = coordinator_.startSession(guard, RefreshReason::Other, users_);
    EXPECT_FALSE(coordinator_.clear(guard, "other"));
    EXPECT_TRUE(coordinator_.clear(guard, id));
    EXPECT_FALSE(coordinator_.clear(guard));
}

TEST_F(RefreshCoordinatorTest, DebugDumpListsInFlightKeys) {
    auto guard = lock_.acquire();
    auto id = coordinator_.startSession(guard, RefreshReason::LocaleChange, users_);
    coordinator_.markInFlight(guard, id, {b_, a_});

    auto j = coordinator_.toJson(guard);
    EXPECT_TRUE(j["refresh_in_progress"].get<bool>());
    EXPECT_EQ(j["session"]["id"], id);
    EXPECT_EQ(j["session"]["in_flight"], nlohmann::json::array({"a|0", "b|0"}));
}
