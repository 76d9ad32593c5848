#pragma once

#include <vigil/core/ids.h>
#include <vigil/core/user_profile_group.h>
#include <vigil/engine/engine_lock.h>
#include <vigil/engine/refresh_types.h>
#include <vigil/engine/telemetry.h>

#include <nlohmann/json_fwd.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace vigil::engine {

using SourceKeySet = std::unordered_set<core::SourceKey, core::SourceKeyHash>;

/**
 * Refresh state machine: Idle -> SessionOpen -> Idle.
 *
 * At most one session is open. Starting a new one supersedes the current one. Every call
 * that names a session id is rejected (warning + staleCallCount) unless it matches the open
 * session. The session is cleared inside the call that empties its in-flight set, so an
 * empty in-flight set is never observable from outside.
 */
class RefreshCoordinator {
public:
    using Guard = EngineLock::Guard;
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;

    struct Config {
        // Sources that are refreshed but never timed and never block completion.
        std::unordered_set<std::string> untrackedSourceIds;
    };

    explicit RefreshCoordinator(TelemetrySink& telemetry, Config config = {},
                                ClockFn clock = {});

    RefreshCoordinator(const RefreshCoordinator&) = delete;
    RefreshCoordinator& operator=(const RefreshCoordinator&) = delete;

    std::string startSession(const Guard&, RefreshReason reason,
                             const core::UserProfileGroup& targetUsers);

    void markInFlight(const Guard&, std::string_view sessionId,
                      const std::vector<core::SourceKey>& keys);

    // True iff this call completed the session.
    bool reportComplete(const Guard&, std::string_view sessionId, const core::SourceKey& key,
                        bool success);

    RefreshStatus status(const Guard&) const;

    // Keys still in flight when the session timed out; empty for a stale id.
    SourceKeySet timeout(const Guard&, std::string_view sessionId);

    // True if the session was cleared as a result.
    bool clearForUser(const Guard&, core::UserId userId);

    bool clear(const Guard&);
    bool clear(const Guard&, std::string_view sessionId);

    std::optional<std::string> currentSessionId(const Guard&) const;
    std::optional<RefreshReason> currentReason(const Guard&) const;
    std::size_t inFlightCount(const Guard&) const;
    bool isTracked(std::string_view sourceId) const;

    std::uint64_t staleCallCount() const noexcept {
        return staleCalls_.load(std::memory_order_relaxed);
    }

    nlohmann::json toJson(const Guard&) const;

private:
    struct Session {
        std::string id;
        RefreshReason reason;
        core::UserProfileGroup users;
        Clock::time_point startedAt;
        std::unordered_map<core::SourceKey, Clock::time_point, core::SourceKeyHash> inFlight;
        bool trackedFailureSeen{false};
    };

    bool checkSession(const char* method, std::string_view sessionId);
    std::optional<Session> takeSession();
    std::chrono::milliseconds elapsedSince(Clock::time_point start) const;

    TelemetrySink& telemetry_;
    Config config_;
    ClockFn clock_;
    std::optional<Session> session_;
    std::uint64_t counter_{0};
    std::atomic<std::uint64_t> staleCalls_{0};
};

} // namespace vigil::engine
