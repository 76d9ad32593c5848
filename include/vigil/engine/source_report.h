#pragma once

#include <vigil/core/severity.h>

#include <optional>
#include <string>
#include <vector>

namespace vigil::engine {

enum class IssueCategory { Device, Account, General };

const char* toString(IssueCategory category);
std::optional<IssueCategory> parseIssueCategory(const std::string& name);

struct IssueAction {
    std::string id;
    std::string label;
    // Resolving actions make the issue go away on success.
    bool resolving{false};
    std::optional<std::string> successMessage;

    bool operator==(const IssueAction&) const = default;
};

struct SourceIssue {
    std::string id;
    std::string typeId;
    core::SeverityLevel severity{core::SeverityLevel::Information};
    IssueCategory category{IssueCategory::General};
    std::string title;
    std::optional<std::string> subtitle;
    std::string summary;
    std::vector<IssueAction> actions;

    bool operator==(const SourceIssue&) const = default;
};

struct SourceStatus {
    std::string title;
    std::string summary;
    core::SeverityLevel severity{core::SeverityLevel::Unspecified};
    bool enabled{true};
    // Action launched from the entry; when absent the source's configured intent is used.
    std::optional<std::string> pendingAction;

    bool operator==(const SourceStatus&) const = default;
};

/**
 * Latest report of one source for one user. Replaced wholesale on every set. A report with no
 * status and no issues is distinct from "no report yet", which the store models as absence.
 */
struct SourceReport {
    std::optional<SourceStatus> status;
    std::vector<SourceIssue> issues;

    bool operator==(const SourceReport&) const = default;
};

} // namespace vigil::engine
