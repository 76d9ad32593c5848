#include <vigil/engine/json_codec.h>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <variant>

namespace vigil::engine {

using json = nlohmann::json;

namespace {

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

Result<core::SeverityLevel> severityFromJson(const json& value, const std::string& where) {
    std::optional<core::SeverityLevel> level;
    if (value.is_string()) {
        level = core::parseSeverityLevel(value.get<std::string>());
    } else if (auto numeric = toInt(value)) {
        level = core::severityLevelFromInt(*numeric);
    }
    if (!level) {
        return Error{ErrorCode::InvalidData, "Unknown severity " + value.dump() + " in " + where};
    }
    return *level;
}

Result<std::string> requiredString(const json& j, const char* name, const std::string& where) {
    if (!j.contains(name) || !j[name].is_string()) {
        return Error{ErrorCode::InvalidData,
                     std::string("Missing string attribute ") + name + " in " + where};
    }
    return j[name].get<std::string>();
}

// Absent or null yields nullopt; any other non-string is rejected.
Result<std::optional<std::string>> optionalString(const json& j, const char* name,
                                                  const std::string& where) {
    if (!j.contains(name) || j[name].is_null())
        return std::optional<std::string>{};
    if (!j[name].is_string()) {
        return Error{ErrorCode::InvalidData,
                     std::string("Attribute ") + name + " must be a string in " + where};
    }
    return std::optional<std::string>{j[name].get<std::string>()};
}

Result<bool> optionalBool(const json& j, const char* name, bool fallback,
                          const std::string& where) {
    if (!j.contains(name))
        return fallback;
    if (!j[name].is_boolean()) {
        return Error{ErrorCode::InvalidData,
                     std::string("Attribute ") + name + " must be a boolean in " + where};
    }
    return j[name].get<bool>();
}

Result<IssueAction> actionFromJson(const json& j, const std::string& where) {
    auto id = requiredString(j, "id", where);
    if (!id)
        return id.error();
    auto label = requiredString(j, "label", where);
    if (!label)
        return label.error();

    IssueAction action;
    action.id = std::move(id).value();
    action.label = std::move(label).value();
    auto resolving = optionalBool(j, "resolving", false, where);
    if (!resolving)
        return resolving.error();
    action.resolving = resolving.value();
    auto successMessage = optionalString(j, "success_message", where);
    if (!successMessage)
        return successMessage.error();
    action.successMessage = std::move(successMessage).value();
    return action;
}

Result<SourceIssue> issueFromJson(const json& j) {
    if (!j.is_object())
        return Error{ErrorCode::InvalidData, "Issue must be an object"};

    auto id = requiredString(j, "id", "issue");
    if (!id)
        return id.error();
    const std::string where = "issue " + id.value();

    SourceIssue issue;
    issue.id = id.value();
    auto typeId = optionalString(j, "type_id", where);
    if (!typeId)
        return typeId.error();
    issue.typeId = typeId.value().value_or(issue.id);

    if (!j.contains("severity"))
        return Error{ErrorCode::InvalidData, "Missing severity in " + where};
    auto severity = severityFromJson(j["severity"], where);
    if (!severity)
        return severity.error();
    issue.severity = severity.value();

    if (j.contains("category")) {
        auto category = j["category"].is_string()
                            ? parseIssueCategory(j["category"].get<std::string>())
                            : std::nullopt;
        if (!category) {
            return Error{ErrorCode::InvalidData,
                         "Unknown category " + j["category"].dump() + " in " + where};
        }
        issue.category = *category;
    }

    auto title = requiredString(j, "title", where);
    if (!title)
        return title.error();
    issue.title = std::move(title).value();
    auto subtitle = optionalString(j, "subtitle", where);
    if (!subtitle)
        return subtitle.error();
    issue.subtitle = std::move(subtitle).value();
    auto summary = optionalString(j, "summary", where);
    if (!summary)
        return summary.error();
    issue.summary = summary.value().value_or(std::string{});

    if (j.contains("actions")) {
        if (!j["actions"].is_array())
            return Error{ErrorCode::InvalidData, "actions must be an array in " + where};
        for (const auto& a : j["actions"]) {
            auto action = actionFromJson(a, where);
            if (!action)
                return action.error();
            issue.actions.push_back(std::move(action).value());
        }
    }
    return issue;
}

Result<SourceStatus> statusFromJson(const json& j) {
    if (!j.is_object())
        return Error{ErrorCode::InvalidData, "status must be an object"};

    auto title = requiredString(j, "title", "status");
    if (!title)
        return title.error();

    SourceStatus status;
    status.title = std::move(title).value();
    auto summary = optionalString(j, "summary", "status");
    if (!summary)
        return summary.error();
    status.summary = summary.value().value_or(std::string{});
    if (j.contains("severity")) {
        auto severity = severityFromJson(j["severity"], "status");
        if (!severity)
            return severity.error();
        status.severity = severity.value();
    }
    auto enabled = optionalBool(j, "enabled", true, "status");
    if (!enabled)
        return enabled.error();
    status.enabled = enabled.value();
    auto pendingAction = optionalString(j, "pending_action", "status");
    if (!pendingAction)
        return pendingAction.error();
    status.pendingAction = std::move(pendingAction).value();
    return status;
}

json optionalToJson(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

json entryToJson(const Entry& entry) {
    return json{{"id", entry.id},
                {"source_id", entry.key.sourceId},
                {"user_id", entry.key.userId},
                {"title", entry.title},
                {"summary", optionalToJson(entry.summary)},
                {"severity", core::toString(entry.severity)},
                {"enabled", entry.enabled},
                {"action", optionalToJson(entry.action)},
                {"managed_profile", entry.isManagedProfile}};
}

} // namespace

Result<SourceReport> reportFromJson(const json& j) {
    if (!j.is_object())
        return Error{ErrorCode::InvalidData, "Report must be a JSON object"};

    SourceReport report;
    if (j.contains("status") && !j["status"].is_null()) {
        auto status = statusFromJson(j["status"]);
        if (!status)
            return status.error();
        report.status = std::move(status).value();
    }
    if (j.contains("issues")) {
        if (!j["issues"].is_array())
            return Error{ErrorCode::InvalidData, "issues must be an array"};
        for (const auto& i : j["issues"]) {
            auto issue = issueFromJson(i);
            if (!issue)
                return issue.error();
            report.issues.push_back(std::move(issue).value());
        }
    }
    return report;
}

json toJson(const SourceReport& report) {
    json j;
    if (report.status) {
        const auto& s = *report.status;
        j["status"] = {{"title", s.title},
                       {"summary", s.summary},
                       {"severity", core::toString(s.severity)},
                       {"enabled", s.enabled},
                       {"pending_action", optionalToJson(s.pendingAction)}};
    } else {
        j["status"] = nullptr;
    }
    json issues = json::array();
    for (const auto& issue : report.issues) {
        json actions = json::array();
        for (const auto& a : issue.actions) {
            actions.push_back({{"id", a.id},
                               {"label", a.label},
                               {"resolving", a.resolving},
                               {"success_message", optionalToJson(a.successMessage)}});
        }
        issues.push_back({{"id", issue.id},
                          {"type_id", issue.typeId},
                          {"severity", core::toString(issue.severity)},
                          {"category", toString(issue.category)},
                          {"title", issue.title},
                          {"subtitle", optionalToJson(issue.subtitle)},
                          {"summary", issue.summary},
                          {"actions", std::move(actions)}});
    }
    j["issues"] = std::move(issues);
    return j;
}

json toJson(const AggregatedView& view) {
    json j;
    j["status"] = {{"title", view.status.title},
                   {"summary", view.status.summary},
                   {"severity", core::toString(view.status.severity)},
                   {"refresh_status", toString(view.status.refreshStatus)},
                   {"has_settings_to_review", view.status.hasSettingsToReview}};

    json issues = json::array();
    for (const auto& issue : view.issues) {
        json actions = json::array();
        for (const auto& a : issue.actions) {
            actions.push_back({{"id", a.id},
                               {"label", a.label},
                               {"resolving", a.resolving},
                               {"in_flight", a.inFlight},
                               {"success_message", optionalToJson(a.successMessage)}});
        }
        issues.push_back({{"id", issue.id},
                          {"severity", core::toString(issue.severity)},
                          {"category", toString(issue.category)},
                          {"title", issue.title},
                          {"subtitle", optionalToJson(issue.subtitle)},
                          {"summary", issue.summary},
                          {"should_confirm_dismissal", issue.shouldConfirmDismissal},
                          {"actions", std::move(actions)}});
    }
    j["issues"] = std::move(issues);

    json entries = json::array();
    for (const auto& item : view.entriesOrGroups) {
        if (const auto* entry = std::get_if<Entry>(&item)) {
            entries.push_back({{"entry", entryToJson(*entry)}});
            continue;
        }
        const auto& group = std::get<EntryGroup>(item);
        json groupEntries = json::array();
        for (const auto& entry : group.entries) {
            groupEntries.push_back(entryToJson(entry));
        }
        entries.push_back({{"group",
                            {{"id", group.id},
                             {"title", group.title},
                             {"summary", optionalToJson(group.summary)},
                             {"severity", core::toString(group.severity)},
                             {"icon", config::toString(group.iconType)},
                             {"entries", std::move(groupEntries)}}}});
    }
    j["entries"] = std::move(entries);

    json staticGroups = json::array();
    for (const auto& group : view.staticEntryGroups) {
        json groupEntries = json::array();
        for (const auto& entry : group.entries) {
            groupEntries.push_back({{"title", entry.title},
                                    {"summary", optionalToJson(entry.summary)},
                                    {"action", entry.action}});
        }
        staticGroups.push_back({{"title", group.title}, {"entries", std::move(groupEntries)}});
    }
    j["static_groups"] = std::move(staticGroups);
    return j;
}

json toJson(const SafetySnapshot& snapshot) {
    json j;
    j["overall_severity"] = core::toString(snapshot.state.overallSeverity);
    j["open_issues"] = snapshot.state.openIssueCount;
    j["dismissed_issues"] = snapshot.state.dismissedIssueCount;
    json sources = json::array();
    for (const auto& s : snapshot.sources) {
        sources.push_back({{"source_id", s.sourceId},
                           {"managed_profile", s.isManagedProfile},
                           {"max_severity_level", s.maxSeverityLevel
                                                      ? json(*s.maxSeverityLevel)
                                                      : json(nullptr)},
                           {"open_issues", s.openIssueCount},
                           {"dismissed_issues", s.dismissedIssueCount}});
    }
    j["sources"] = std::move(sources);
    return j;
}

} // namespace vigil::engine
