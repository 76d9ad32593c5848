#include <vigil/engine/refresh_coordinator.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace vigil::engine {

RefreshCoordinator::RefreshCoordinator(TelemetrySink& telemetry, Config config, ClockFn clock)
    : telemetry_(telemetry), config_(std::move(config)), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return Clock::now(); };
    }
}

std::string RefreshCoordinator::startSession(const Guard&, RefreshReason reason,
                                             const core::UserProfileGroup& targetUsers) {
    if (session_) {
        spdlog::warn("[RefreshCoordinator] Replacing ongoing refresh {} ({} source(s) in flight)",
                     session_->id, session_->inFlight.size());
        telemetry_.onSessionSuperseded(SessionSupersededEvent{session_->id, session_->reason,
                                                              session_->inFlight.size(),
                                                              elapsedSince(session_->startedAt)});
    }

    std::string id = core::generateUUID() + "_" + std::to_string(counter_++);
    spdlog::debug("[RefreshCoordinator] Starting refresh {} reason={} parent_user={}", id,
                  toString(reason), targetUsers.profileParentUserId());

    session_.emplace();
    session_->id = id;
    session_->reason = reason;
    session_->users = targetUsers;
    session_->startedAt = clock_();
    return id;
}

void RefreshCoordinator::markInFlight(const Guard&, std::string_view sessionId,
                                      const std::vector<core::SourceKey>& keys) {
    if (!checkSession("markInFlight", sessionId)) {
        return;
    }
    const auto now = clock_();
    for (const auto& key : keys) {
        bool tracked = isTracked(key.sourceId);
        if (tracked) {
            session_->inFlight.insert_or_assign(key, now);
        }
        spdlog::debug("[RefreshCoordinator] Refresh started for {} in {} tracking={}, {} tracked "
                      "in flight",
                      key.toString(), session_->id, tracked, session_->inFlight.size());
    }
}

bool RefreshCoordinator::reportComplete(const Guard&, std::string_view sessionId,
                                        const core::SourceKey& key, bool success) {
    if (!checkSession("reportComplete", sessionId)) {
        return false;
    }

    const auto requestType = toRequestType(session_->reason);
    const bool tracked = isTracked(key.sourceId);
    session_->trackedFailureSeen |= (tracked && !success);

    auto it = session_->inFlight.find(key);
    if (it != session_->inFlight.end()) {
        auto duration = elapsedSince(it->second);
        session_->inFlight.erase(it);
        telemetry_.onSourceRefresh(SourceRefreshEvent{requestType, key.sourceId, key.userId,
                                                      duration,
                                                      success ? EventResult::Success
                                                              : EventResult::Error});
    }
    spdlog::debug("[RefreshCoordinator] Refresh completed for {} in {} success={} tracking={}, "
                  "{} tracked still in flight",
                  key.toString(), session_->id, success, tracked, session_->inFlight.size());

    if (!session_->inFlight.empty()) {
        return false;
    }

    auto finished = takeSession();
    spdlog::debug("[RefreshCoordinator] Refresh {} completed", finished->id);
    telemetry_.onWholeRefresh(WholeRefreshEvent{requestType, elapsedSince(finished->startedAt),
                                                finished->trackedFailureSeen
                                                    ? EventResult::Error
                                                    : EventResult::Success});
    return true;
}

RefreshStatus RefreshCoordinator::status(const Guard&) const {
    if (!session_ || session_->inFlight.empty()) {
        return RefreshStatus::None;
    }
    if (session_->reason == RefreshReason::RescanButton) {
        return RefreshStatus::FullRescanInProgress;
    }
    return RefreshStatus::DataFetchInProgress;
}

SourceKeySet RefreshCoordinator::timeout(const Guard&, std::string_view sessionId) {
    if (!checkSession("timeout", sessionId)) {
        return {};
    }
    auto cleared = takeSession();
    if (cleared->inFlight.empty()) {
        return {};
    }

    const auto requestType = toRequestType(cleared->reason);
    SourceKeySet timedOut;
    for (const auto& [key, startedAt] : cleared->inFlight) {
        telemetry_.onSourceRefresh(SourceRefreshEvent{requestType, key.sourceId, key.userId,
                                                      elapsedSince(startedAt),
                                                      EventResult::Timeout});
        timedOut.insert(key);
    }
    telemetry_.onWholeRefresh(
        WholeRefreshEvent{requestType, elapsedSince(cleared->startedAt), EventResult::Timeout});
    spdlog::info("[RefreshCoordinator] Refresh {} timed out with {} source(s) in flight",
                 cleared->id, timedOut.size());
    return timedOut;
}

bool RefreshCoordinator::clearForUser(const Guard&, core::UserId userId) {
    if (!session_) {
        spdlog::debug("[RefreshCoordinator] clearForUser({}) with no refresh in progress", userId);
        return false;
    }
    bool clearSession = session_->users.profileParentUserId() == userId;
    if (!clearSession) {
        std::erase_if(session_->inFlight,
                      [&](const auto& kv) { return kv.first.userId == userId; });
        clearSession = session_->inFlight.empty();
    }
    if (!clearSession) {
        return false;
    }
    auto cleared = takeSession();
    spdlog::info("[RefreshCoordinator] Cleared refresh {} after removal of user {}", cleared->id,
                 userId);
    return true;
}

bool RefreshCoordinator::clear(const Guard&) {
    return takeSession().has_value();
}

bool RefreshCoordinator::clear(const Guard&, std::string_view sessionId) {
    if (!checkSession("clear", sessionId)) {
        return false;
    }
    return takeSession().has_value();
}

std::optional<std::string> RefreshCoordinator::currentSessionId(const Guard&) const {
    if (!session_)
        return std::nullopt;
    return session_->id;
}

std::optional<RefreshReason> RefreshCoordinator::currentReason(const Guard&) const {
    if (!session_)
        return std::nullopt;
    return session_->reason;
}

std::size_t RefreshCoordinator::inFlightCount(const Guard&) const {
    return session_ ? session_->inFlight.size() : 0;
}

bool RefreshCoordinator::isTracked(std::string_view sourceId) const {
    return config_.untrackedSourceIds.find(std::string(sourceId)) ==
           config_.untrackedSourceIds.end();
}

nlohmann::json RefreshCoordinator::toJson(const Guard&) const {
    nlohmann::json j;
    j["refresh_in_progress"] = session_.has_value();
    j["counter"] = counter_;
    j["stale_calls"] = staleCallCount();
    if (session_) {
        nlohmann::json s;
        s["id"] = session_->id;
        s["reason"] = toString(session_->reason);
        s["profile_parent_user"] = session_->users.profileParentUserId();
        s["tracked_failure_seen"] = session_->trackedFailureSeen;
        s["elapsed_ms"] = elapsedSince(session_->startedAt).count();
        std::vector<std::string> keys;
        for (const auto& [key, startedAt] : session_->inFlight) {
            keys.push_back(core::encodeEntryId(key));
        }
        std::sort(keys.begin(), keys.end());
        s["in_flight"] = keys;
        j["session"] = std::move(s);
    }
    return j;
}

bool RefreshCoordinator::checkSession(const char* method, std::string_view sessionId) {
    if (!session_ || session_->id != sessionId) {
        staleCalls_.fetch_add(1, std::memory_order_relaxed);
        spdlog::warn("[RefreshCoordinator] {} called for invalid refresh id {}; no such refresh "
                     "in progress",
                     method, sessionId);
        return false;
    }
    return true;
}

std::optional<RefreshCoordinator::Session> RefreshCoordinator::takeSession() {
    if (!session_) {
        spdlog::debug("[RefreshCoordinator] Clear called but no refresh in progress");
        return std::nullopt;
    }
    std::optional<Session> taken = std::move(session_);
    session_.reset();
    spdlog::debug("[RefreshCoordinator] Cleared refresh {}", taken->id);
    return taken;
}

std::chrono::milliseconds RefreshCoordinator::elapsedSince(Clock::time_point start) const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(clock_() - start);
}

} // namespace vigil::engine
