#include <vigil/core/severity.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>

namespace vigil::core {

const char* toString(SeverityLevel level) {
    switch (level) {
        case SeverityLevel::Unspecified:
            return "UNSPECIFIED";
        case SeverityLevel::Information:
            return "INFORMATION";
        case SeverityLevel::Recommendation:
            return "RECOMMENDATION";
        case SeverityLevel::CriticalWarning:
            return "CRITICAL_WARNING";
    }
    return "UNKNOWN";
}

const char* toString(IssueSeverity level) {
    switch (level) {
        case IssueSeverity::Ok:
            return "OK";
        case IssueSeverity::Recommendation:
            return "RECOMMENDATION";
        case IssueSeverity::CriticalWarning:
            return "CRITICAL_WARNING";
    }
    return "UNKNOWN";
}

const char* toString(EntrySeverity level) {
    switch (level) {
        case EntrySeverity::Unknown:
            return "UNKNOWN";
        case EntrySeverity::Unspecified:
            return "UNSPECIFIED";
        case EntrySeverity::Ok:
            return "OK";
        case EntrySeverity::Recommendation:
            return "RECOMMENDATION";
        case EntrySeverity::CriticalWarning:
            return "CRITICAL_WARNING";
    }
    return "UNKNOWN";
}

const char* toString(OverallSeverity level) {
    switch (level) {
        case OverallSeverity::Unknown:
            return "UNKNOWN";
        case OverallSeverity::Ok:
            return "OK";
        case OverallSeverity::Recommendation:
            return "RECOMMENDATION";
        case OverallSeverity::CriticalWarning:
            return "CRITICAL_WARNING";
    }
    return "UNKNOWN";
}

std::optional<SeverityLevel> severityLevelFromInt(int value) {
    switch (value) {
        case static_cast<int>(SeverityLevel::Unspecified):
            return SeverityLevel::Unspecified;
        case static_cast<int>(SeverityLevel::Information):
            return SeverityLevel::Information;
        case static_cast<int>(SeverityLevel::Recommendation):
            return SeverityLevel::Recommendation;
        case static_cast<int>(SeverityLevel::CriticalWarning):
            return SeverityLevel::CriticalWarning;
        default:
            return std::nullopt;
    }
}

std::optional<SeverityLevel> parseSeverityLevel(std::string_view text) {
    std::string upper(text);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "UNSPECIFIED")
        return SeverityLevel::Unspecified;
    if (upper == "INFORMATION")
        return SeverityLevel::Information;
    if (upper == "RECOMMENDATION")
        return SeverityLevel::Recommendation;
    if (upper == "CRITICAL_WARNING" || upper == "CRITICAL")
        return SeverityLevel::CriticalWarning;

    int numeric = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), numeric);
    if (ec == std::errc() && ptr == text.data() + text.size()) {
        return severityLevelFromInt(numeric);
    }
    return std::nullopt;
}

IssueSeverity toIssueSeverity(SeverityLevel level) {
    switch (level) {
        case SeverityLevel::Unspecified:
            spdlog::warn("[Severity] Unexpected UNSPECIFIED severity on an issue");
            return IssueSeverity::Ok;
        case SeverityLevel::Information:
            return IssueSeverity::Ok;
        case SeverityLevel::Recommendation:
            return IssueSeverity::Recommendation;
        case SeverityLevel::CriticalWarning:
            return IssueSeverity::CriticalWarning;
    }
    spdlog::warn("[Severity] Unexpected issue severity level {}", static_cast<int>(level));
    return IssueSeverity::Ok;
}

EntrySeverity toEntrySeverity(SeverityLevel level) {
    switch (level) {
        case SeverityLevel::Unspecified:
            return EntrySeverity::Unspecified;
        case SeverityLevel::Information:
            return EntrySeverity::Ok;
        case SeverityLevel::Recommendation:
            return EntrySeverity::Recommendation;
        case SeverityLevel::CriticalWarning:
            return EntrySeverity::CriticalWarning;
    }
    spdlog::warn("[Severity] Unexpected status severity level {}", static_cast<int>(level));
    return EntrySeverity::Unknown;
}

OverallSeverity toOverallSeverity(SeverityLevel level) {
    switch (level) {
        case SeverityLevel::Unspecified:
        case SeverityLevel::Information:
            return OverallSeverity::Ok;
        case SeverityLevel::Recommendation:
            return OverallSeverity::Recommendation;
        case SeverityLevel::CriticalWarning:
            return OverallSeverity::CriticalWarning;
    }
    spdlog::warn("[Severity] Unexpected severity level {}", static_cast<int>(level));
    return OverallSeverity::Unknown;
}

OverallSeverity toOverallSeverity(EntrySeverity level) {
    switch (level) {
        case EntrySeverity::Unknown:
            return OverallSeverity::Unknown;
        case EntrySeverity::Unspecified:
        case EntrySeverity::Ok:
            return OverallSeverity::Ok;
        case EntrySeverity::Recommendation:
            return OverallSeverity::Recommendation;
        case EntrySeverity::CriticalWarning:
            return OverallSeverity::CriticalWarning;
    }
    spdlog::warn("[Severity] Unexpected entry severity level {}", static_cast<int>(level));
    return OverallSeverity::Unknown;
}

OverallSeverity mergeOverallSeverity(OverallSeverity left, OverallSeverity right) {
    if (left == OverallSeverity::Unknown || right == OverallSeverity::Unknown) {
        return OverallSeverity::Unknown;
    }
    return std::max(left, right);
}

EntrySeverity mergeEntrySeverity(EntrySeverity left, EntrySeverity right) {
    if (left > EntrySeverity::Ok || right > EntrySeverity::Ok) {
        return std::max(left, right);
    }
    if (left == EntrySeverity::Unknown || right == EntrySeverity::Unknown) {
        return EntrySeverity::Unknown;
    }
    return std::max(left, right);
}

} // namespace vigil::core
