#pragma once

#include <optional>
#include <string_view>

namespace vigil::core {

// Severity reported by a source for its status and its issues. Values are stable and used in
// persisted data and wire payloads.
enum class SeverityLevel : int {
    Unspecified = 100,
    Information = 200,
    Recommendation = 300,
    CriticalWarning = 400,
};

enum class IssueSeverity : int {
    Ok = 2100,
    Recommendation = 2200,
    CriticalWarning = 2300,
};

// Unknown means "no data / errored", Unspecified means "stateless".
enum class EntrySeverity : int {
    Unknown = 3000,
    Unspecified = 3100,
    Ok = 3200,
    Recommendation = 3300,
    CriticalWarning = 3400,
};

enum class OverallSeverity : int {
    Unknown = 1000,
    Ok = 1100,
    Recommendation = 1200,
    CriticalWarning = 1300,
};

const char* toString(SeverityLevel level);
const char* toString(IssueSeverity level);
const char* toString(EntrySeverity level);
const char* toString(OverallSeverity level);

// Accepts the upper-case name ("CRITICAL_WARNING") or the numeric value ("400").
std::optional<SeverityLevel> parseSeverityLevel(std::string_view text);
std::optional<SeverityLevel> severityLevelFromInt(int value);

// Conversions between scales. Values outside the enumerators degrade to the neutral value of
// the target scale and log a warning.
IssueSeverity toIssueSeverity(SeverityLevel level);
EntrySeverity toEntrySeverity(SeverityLevel level);
OverallSeverity toOverallSeverity(SeverityLevel level);
OverallSeverity toOverallSeverity(EntrySeverity level);

// Unknown dominates, otherwise the maximum.
OverallSeverity mergeOverallSeverity(OverallSeverity left, OverallSeverity right);

// Anything above Ok wins by maximum; below that Unknown dominates.
EntrySeverity mergeEntrySeverity(EntrySeverity left, EntrySeverity right);

} // namespace vigil::core
