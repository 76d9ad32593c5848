#include <vigil/engine/source_report.h>

namespace vigil::engine {

const char* toString(IssueCategory category) {
    switch (category) {
        case IssueCategory::Device:
            return "DEVICE";
        case IssueCategory::Account:
            return "ACCOUNT";
        case IssueCategory::General:
            return "GENERAL";
    }
    return "GENERAL";
}

std::optional<IssueCategory> parseIssueCategory(const std::string& name) {
    if (name == "DEVICE" || name == "device")
        return IssueCategory::Device;
    if (name == "ACCOUNT" || name == "account")
        return IssueCategory::Account;
    if (name == "GENERAL" || name == "general")
        return IssueCategory::General;
    return std::nullopt;
}

} // namespace vigil::engine
