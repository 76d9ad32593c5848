#include <vigil/engine/refresh_inbox.h>
#include <vigil/persistence/dismissal_store.h>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

namespace vigil::engine {

RefreshInbox::RefreshInbox(Config config, Dependencies deps)
    : config_(std::move(config)),
      deps_(std::move(deps)),
      strand_(boost::asio::make_strand(deps_.executor)),
      timer_(strand_) {}

RefreshInbox::~RefreshInbox() {
    timer_.cancel();
}

void RefreshInbox::requestRefresh(RefreshReason reason, core::UserProfileGroup users) {
    boost::asio::post(strand_, [this, reason, users = std::move(users)]() {
        handleRefresh(reason, users);
    });
}

void RefreshInbox::postResponse(SourceResponse response) {
    boost::asio::post(strand_, [this, response = std::move(response)]() mutable {
        handleResponse(std::move(response));
    });
}

void RefreshInbox::postFailure(SourceFailure failure) {
    boost::asio::post(strand_,
                      [this, failure = std::move(failure)]() { handleFailure(failure); });
}

void RefreshInbox::postUserRemoved(core::UserId userId) {
    boost::asio::post(strand_, [this, userId]() { handleUserRemoved(userId); });
}

void RefreshInbox::postDismiss(core::IssueKey key) {
    boost::asio::post(strand_, [this, key = std::move(key)]() { handleDismiss(key); });
}

void RefreshInbox::stop() {
    boost::asio::post(strand_, [this]() { cancelTimeout(); });
}

void RefreshInbox::handleRefresh(RefreshReason reason, const core::UserProfileGroup& users) {
    RefreshPlan plan;
    {
        auto guard = deps_.hub->lock().acquire();
        plan = deps_.hub->startRefresh(guard, reason, users);
    }

    if (plan.sessionId) {
        armTimeout(*plan.sessionId);
    } else {
        cancelTimeout();
    }
    notifyDataChanged();

    if (!plan.sources.empty()) {
        if (deps_.transport) {
            deps_.transport->dispatch(plan);
        } else {
            spdlog::warn("[RefreshInbox] No transport configured; {} source(s) not asked",
                         plan.sources.size());
        }
    }
    if (deps_.onRefreshStarted) {
        deps_.onRefreshStarted(plan);
    }
}

void RefreshInbox::handleResponse(SourceResponse response) {
    auto outcome = [&] {
        auto guard = deps_.hub->lock().acquire();
        return deps_.hub->setSourceReport(guard, response.key, std::move(response.report),
                                          response.sessionId);
    }();

    if (!outcome) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        spdlog::warn("[RefreshInbox] Dropped report from {}: {}", response.key.toString(),
                     outcome.error().message);
        return;
    }

    persistDismissalsIfDirty();
    if (outcome.value().changed || outcome.value().sessionCompleted) {
        notifyDataChanged();
    }
    finishIfCompleted(response.sessionId, outcome.value().sessionCompleted);
}

void RefreshInbox::handleFailure(const SourceFailure& failure) {
    auto outcome = [&] {
        auto guard = deps_.hub->lock().acquire();
        return deps_.hub->reportSourceError(guard, failure.key, failure.sessionId);
    }();

    if (!outcome) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        spdlog::warn("[RefreshInbox] Dropped failure from {}: {}", failure.key.toString(),
                     outcome.error().message);
        return;
    }

    if (outcome.value().changed || outcome.value().sessionCompleted) {
        notifyDataChanged();
    }
    finishIfCompleted(failure.sessionId, outcome.value().sessionCompleted);
}

void RefreshInbox::handleUserRemoved(core::UserId userId) {
    bool sessionCleared = false;
    {
        auto guard = deps_.hub->lock().acquire();
        sessionCleared = deps_.hub->clearForUser(guard, userId);
    }
    if (sessionCleared) {
        cancelTimeout();
    }
    persistDismissalsIfDirty();
    notifyDataChanged();
}

void RefreshInbox::handleDismiss(const core::IssueKey& key) {
    auto dismissed = [&] {
        auto guard = deps_.hub->lock().acquire();
        return deps_.hub->dismissIssue(guard, key);
    }();

    if (!dismissed) {
        spdlog::warn("[RefreshInbox] Cannot dismiss {}: {}", key.toString(),
                     dismissed.error().message);
        return;
    }
    persistDismissalsIfDirty();
    notifyDataChanged();
}

void RefreshInbox::handleTimeout(const std::string& sessionId) {
    if (timedSession_ != sessionId) {
        return;
    }
    timedSession_.reset();

    SourceKeySet timedOut;
    {
        auto guard = deps_.hub->lock().acquire();
        timedOut = deps_.hub->timeoutRefresh(guard, sessionId);
    }
    spdlog::info("[RefreshInbox] Refresh {} timed out, {} source(s) did not answer", sessionId,
                 timedOut.size());

    notifyDataChanged();
    if (deps_.onSessionFinished) {
        deps_.onSessionFinished(sessionId, true);
    }
}

void RefreshInbox::finishIfCompleted(const std::optional<std::string>& sessionId,
                                     bool completed) {
    if (!completed || !sessionId) {
        return;
    }
    if (timedSession_ == *sessionId) {
        cancelTimeout();
    }
    if (deps_.onSessionFinished) {
        deps_.onSessionFinished(*sessionId, false);
    }
}

void RefreshInbox::armTimeout(const std::string& sessionId) {
    timedSession_ = sessionId;
    timer_.expires_after(config_.refreshTimeout);

    boost::asio::co_spawn(
        strand_,
        [this, sessionId]() -> boost::asio::awaitable<void> {
            // Cancelled or re-armed before the wait started.
            if (timedSession_ != sessionId) {
                co_return;
            }
            try {
                co_await timer_.async_wait(boost::asio::use_awaitable);
            } catch (const boost::system::system_error& e) {
                if (e.code() == boost::asio::error::operation_aborted) {
                    co_return;
                }
                throw;
            }
            handleTimeout(sessionId);
        },
        boost::asio::detached);
}

void RefreshInbox::cancelTimeout() {
    timedSession_.reset();
    timer_.cancel();
}

void RefreshInbox::persistDismissalsIfDirty() {
    if (!deps_.dismissalStore) {
        return;
    }

    std::vector<DismissalRecord> records;
    {
        auto guard = deps_.hub->lock().acquire();
        if (!deps_.hub->dismissalsDirty(guard)) {
            return;
        }
        records = deps_.hub->exportDismissals(guard);
    }

    auto saved = deps_.dismissalStore->saveRecords(records);
    if (!saved) {
        spdlog::error("[RefreshInbox] Failed to persist dismissals: {}", saved.error().message);
        return;
    }

    auto guard = deps_.hub->lock().acquire();
    deps_.hub->markDismissalsPersisted(guard);
}

void RefreshInbox::notifyDataChanged() {
    if (deps_.onDataChanged) {
        deps_.onDataChanged();
    }
}

} // namespace vigil::engine
