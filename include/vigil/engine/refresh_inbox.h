#pragma once

#include <vigil/core/ids.h>
#include <vigil/core/user_profile_group.h>
#include <vigil/engine/refresh_types.h>
#include <vigil/engine/safety_hub.h>
#include <vigil/engine/source_report.h>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace vigil::persistence {
class DismissalStore;
}

namespace vigil::engine {

/**
 * Delivers refresh requests to sources. Called outside the engine lock; replies come back
 * through RefreshInbox::postResponse / postFailure from any thread.
 */
class SourceTransport {
public:
    virtual ~SourceTransport() = default;

    virtual void dispatch(const RefreshPlan& plan) = 0;
};

struct SourceResponse {
    std::optional<std::string> sessionId;
    core::SourceKey key;
    SourceReport report;
};

struct SourceFailure {
    std::optional<std::string> sessionId;
    core::SourceKey key;
};

/**
 * Serializes transport callbacks onto one strand and owns the refresh timeout timer. Each
 * handler takes the hub's lock, applies one change, releases it, and only then calls the
 * transport, the dismissal store or the notification callbacks.
 */
class RefreshInbox {
public:
    struct Config {
        std::chrono::milliseconds refreshTimeout{10000};
    };

    struct Dependencies {
        SafetyHub* hub{nullptr};
        SourceTransport* transport{nullptr};
        boost::asio::any_io_executor executor;
        persistence::DismissalStore* dismissalStore{nullptr};
        std::function<void()> onDataChanged;
        // Called after the plan was dispatched; a plan without session id never finishes.
        std::function<void(const RefreshPlan& plan)> onRefreshStarted;
        std::function<void(const std::string& sessionId, bool timedOut)> onSessionFinished;
    };

    RefreshInbox(Config config, Dependencies deps);
    ~RefreshInbox();

    RefreshInbox(const RefreshInbox&) = delete;
    RefreshInbox& operator=(const RefreshInbox&) = delete;

    void requestRefresh(RefreshReason reason, core::UserProfileGroup users);
    void postResponse(SourceResponse response);
    void postFailure(SourceFailure failure);
    void postUserRemoved(core::UserId userId);
    void postDismiss(core::IssueKey key);

    // Cancels the pending timeout; queued messages are still processed.
    void stop();

    std::uint64_t rejectedReports() const noexcept {
        return rejected_.load(std::memory_order_relaxed);
    }

private:
    void handleRefresh(RefreshReason reason, const core::UserProfileGroup& users);
    void handleResponse(SourceResponse response);
    void handleFailure(const SourceFailure& failure);
    void handleUserRemoved(core::UserId userId);
    void handleDismiss(const core::IssueKey& key);
    void handleTimeout(const std::string& sessionId);

    void finishIfCompleted(const std::optional<std::string>& sessionId, bool completed);
    void armTimeout(const std::string& sessionId);
    void cancelTimeout();
    void persistDismissalsIfDirty();
    void notifyDataChanged();

    Config config_;
    Dependencies deps_;
    boost::asio::strand<boost::asio::any_io_executor> strand_;
    boost::asio::steady_timer timer_;
    // Session the armed timer belongs to.
    std::optional<std::string> timedSession_;
    std::atomic<std::uint64_t> rejected_{0};
};

} // namespace vigil::engine
