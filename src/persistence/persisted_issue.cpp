#include <vigil/persistence/persisted_issue.h>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>
#include <optional>

namespace vigil::persistence {

namespace {

using json = nlohmann::json;

std::optional<int> toInt(const json& value) {
    if (value.is_number_unsigned()) {
        auto raw = value.get<std::uint64_t>();
        if (raw > static_cast<std::uint64_t>(std::numeric_limits<int>::max()))
            return std::nullopt;
        return static_cast<int>(raw);
    }
    if (value.is_number_integer()) {
        auto raw = value.get<std::int64_t>();
        if (raw < std::numeric_limits<int>::min() || raw > std::numeric_limits<int>::max())
            return std::nullopt;
        return static_cast<int>(raw);
    }
    return std::nullopt;
}

std::int64_t toEpochMs(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint fromEpochMs(std::int64_t ms) {
    return TimePoint(std::chrono::milliseconds(ms));
}

} // namespace

Result<PersistedIssue> PersistedIssue::create(std::string key, TimePoint firstSeenAt,
                                              std::optional<TimePoint> dismissedAt,
                                              int dismissCount,
                                              std::optional<core::SeverityLevel> dismissedSeverity) {
    if (key.empty()) {
        return Error{ErrorCode::InvalidData, "Required attribute key missing"};
    }
    if (dismissCount < 0) {
        return Error{ErrorCode::InvalidData, "Dismiss count cannot be negative"};
    }
    if (dismissedAt && dismissCount == 0) {
        return Error{ErrorCode::InvalidData,
                     "Issue " + key + " has a dismissal time but a dismiss count of 0"};
    }
    if (dismissCount > 0 && !dismissedAt) {
        return Error{ErrorCode::InvalidData,
                     "Issue " + key + " has a dismiss count but no dismissal time"};
    }
    if (dismissedSeverity && dismissCount == 0) {
        return Error{ErrorCode::InvalidData,
                     "Issue " + key + " has a dismissed severity but was never dismissed"};
    }

    PersistedIssue issue;
    issue.key_ = std::move(key);
    issue.firstSeenAt_ = firstSeenAt;
    issue.dismissedAt_ = dismissedAt;
    issue.dismissCount_ = dismissCount;
    issue.dismissedSeverity_ = dismissedSeverity;
    return issue;
}

Result<PersistedIssue> PersistedIssue::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Error{ErrorCode::InvalidData, "Persisted issue must be an object"};
    }
    if (!j.contains("key") || !j["key"].is_string()) {
        return Error{ErrorCode::InvalidData, "Required attribute key missing"};
    }
    if (!j.contains("first_seen_at_ms") || !j["first_seen_at_ms"].is_number_integer()) {
        return Error{ErrorCode::InvalidData, "Required attribute first_seen_at_ms missing"};
    }

    std::optional<TimePoint> dismissedAt;
    if (j.contains("dismissed_at_ms") && !j["dismissed_at_ms"].is_null()) {
        if (!j["dismissed_at_ms"].is_number_integer()) {
            return Error{ErrorCode::InvalidData, "dismissed_at_ms must be an integer"};
        }
        dismissedAt = fromEpochMs(j["dismissed_at_ms"].get<std::int64_t>());
    }

    int dismissCount = 0;
    if (j.contains("dismiss_count")) {
        auto count = toInt(j["dismiss_count"]);
        if (!count) {
            return Error{ErrorCode::InvalidData,
                         "dismiss_count must be an integer in int range, got " +
                             j["dismiss_count"].dump()};
        }
        dismissCount = *count;
    }

    std::optional<core::SeverityLevel> severity;
    if (j.contains("dismissed_severity") && !j["dismissed_severity"].is_null()) {
        const auto& value = j["dismissed_severity"];
        if (value.is_string()) {
            severity = core::parseSeverityLevel(value.get<std::string>());
        } else if (auto numeric = toInt(value)) {
            severity = core::severityLevelFromInt(*numeric);
        }
        if (!severity) {
            return Error{ErrorCode::InvalidData,
                         "Unknown dismissed_severity " + value.dump()};
        }
    }

    return create(j["key"].get<std::string>(),
                  fromEpochMs(j["first_seen_at_ms"].get<std::int64_t>()), dismissedAt,
                  dismissCount, severity);
}

nlohmann::json PersistedIssue::toJson() const {
    nlohmann::json j;
    j["key"] = key_;
    j["first_seen_at_ms"] = toEpochMs(firstSeenAt_);
    j["dismiss_count"] = dismissCount_;
    if (dismissedAt_) {
        j["dismissed_at_ms"] = toEpochMs(*dismissedAt_);
    }
    if (dismissedSeverity_) {
        j["dismissed_severity"] = core::toString(*dismissedSeverity_);
    }
    return j;
}

} // namespace vigil::persistence
