#pragma once

#include <vigil/core/severity.h>
#include <vigil/core/types.h>

#include <nlohmann/json_fwd.hpp>

#include <optional>
#include <string>

namespace vigil::persistence {

/**
 * On-disk form of one dismissal record. Only create() builds instances, so every value
 * satisfies: dismissCount >= 0, dismissedAt present iff dismissCount > 0, and a dismissed
 * severity only on dismissed records.
 */
class PersistedIssue {
public:
    static Result<PersistedIssue> create(std::string key, TimePoint firstSeenAt,
                                         std::optional<TimePoint> dismissedAt, int dismissCount,
                                         std::optional<core::SeverityLevel> dismissedSeverity);

    static Result<PersistedIssue> fromJson(const nlohmann::json& j);
    nlohmann::json toJson() const;

    const std::string& key() const noexcept { return key_; }
    TimePoint firstSeenAt() const noexcept { return firstSeenAt_; }
    const std::optional<TimePoint>& dismissedAt() const noexcept { return dismissedAt_; }
    int dismissCount() const noexcept { return dismissCount_; }
    const std::optional<core::SeverityLevel>& dismissedSeverity() const noexcept {
        return dismissedSeverity_;
    }

    bool operator==(const PersistedIssue&) const = default;

private:
    PersistedIssue() = default;

    std::string key_;
    TimePoint firstSeenAt_{};
    std::optional<TimePoint> dismissedAt_;
    int dismissCount_{0};
    std::optional<core::SeverityLevel> dismissedSeverity_;
};

} // namespace vigil::persistence
