#pragma once

#include <vigil/config/source_registry.h>
#include <vigil/core/user_profile_group.h>
#include <vigil/engine/aggregated_view.h>
#include <vigil/engine/engine_lock.h>
#include <vigil/engine/issue_dismissal_cache.h>
#include <vigil/engine/refresh_types.h>
#include <vigil/engine/source_report_store.h>
#include <vigil/engine/status_strings.h>

#include <optional>
#include <string>

namespace vigil::engine {

/**
 * Resolves the action launched from a source's entry. Returns nullopt when nothing can
 * handle the configured intent for that user; such entries are disabled (collapsible groups)
 * or dropped (rigid groups).
 */
class ActionResolver {
public:
    virtual ~ActionResolver() = default;

    virtual std::optional<std::string> resolve(const config::SourceDescriptor& source,
                                               core::UserId userId, bool quietMode) const = 0;
};

// Resolves to the descriptor's intent action whenever one is configured.
class IntentActionResolver final : public ActionResolver {
public:
    std::optional<std::string> resolve(const config::SourceDescriptor& source, core::UserId userId,
                                       bool quietMode) const override;
};

/**
 * Builds the AggregatedView from the report store, the dismissal cache and the current
 * refresh status. Stateless apart from its collaborators; every call recomputes the whole
 * view.
 */
class AggregationEngine {
public:
    using Guard = EngineLock::Guard;

    explicit AggregationEngine(const ActionResolver& resolver, StatusStrings strings = {});

    // Failures while building are logged and yield AggregatedView::defaultView().
    AggregatedView computeView(const Guard& guard, const config::SourceRegistry& registry,
                               const SourceReportStore& store, const IssueDismissalCache& cache,
                               RefreshStatus refreshStatus,
                               const core::UserProfileGroup& users) const;

    const StatusStrings& strings() const noexcept { return strings_; }

private:
    class Builder;

    const ActionResolver& resolver_;
    StatusStrings strings_;
};

} // namespace vigil::engine
