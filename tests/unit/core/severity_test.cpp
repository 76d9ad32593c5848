#include <gtest/gtest.h>
#include <vigil/core/severity.h>

using namespace vigil::core;

TEST(Severity, ParsesNamesAndNumbers) {
    EXPECT_EQ(parseSeverityLevel("RECOMMENDATION"), SeverityLevel::Recommendation);
    EXPECT_EQ(parseSeverityLevel("critical_warning"), SeverityLevel::CriticalWarning);
    EXPECT_EQ(parseSeverityLevel("200"), SeverityLevel::Information);
    EXPECT_FALSE(parseSeverityLevel("250").has_value());
    EXPECT_FALSE(parseSeverityLevel("SEVERE").has_value());
    EXPECT_FALSE(parseSeverityLevel("").has_value());
}

TEST(Severity, ScaleConversions) {
    EXPECT_EQ(toIssueSeverity(SeverityLevel::Information), IssueSeverity::Ok);
    EXPECT_EQ(toIssueSeverity(SeverityLevel::CriticalWarning), IssueSeverity::CriticalWarning);

    EXPECT_EQ(toEntrySeverity(SeverityLevel::Unspecified), EntrySeverity::Unspecified);
    EXPECT_EQ(toEntrySeverity(SeverityLevel::Information), EntrySeverity::Ok);
    EXPECT_EQ(toEntrySeverity(static_cast<SeverityLevel>(123)), EntrySeverity::Unknown);

    EXPECT_EQ(toOverallSeverity(SeverityLevel::Unspecified), OverallSeverity::Ok);
    EXPECT_EQ(toOverallSeverity(EntrySeverity::Unknown), OverallSeverity::Unknown);
    EXPECT_EQ(toOverallSeverity(EntrySeverity::Unspecified), OverallSeverity::Ok);
    EXPECT_EQ(toOverallSeverity(EntrySeverity::Recommendation), OverallSeverity::Recommendation);
}

TEST(Severity, OverallMergeUnknownDominates) {
    EXPECT_EQ(mergeOverallSeverity(OverallSeverity::Ok, OverallSeverity::CriticalWarning),
              OverallSeverity::CriticalWarning);
    EXPECT_EQ(mergeOverallSeverity(OverallSeverity::CriticalWarning, OverallSeverity::Unknown),
              OverallSeverity::Unknown);
}

TEST(Severity, EntryMergeWarningsBeatUnknown) {
    EXPECT_EQ(mergeEntrySeverity(EntrySeverity::Unknown, EntrySeverity::Recommendation),
              EntrySeverity::Recommendation);
    EXPECT_EQ(mergeEntrySeverity(EntrySeverity::Ok, EntrySeverity::Unknown),
              EntrySeverity::Unknown);
    EXPECT_EQ(mergeEntrySeverity(EntrySeverity::Unspecified, EntrySeverity::Ok),
              EntrySeverity::Ok);
}

TEST(Severity, NamesAreStable) {
    EXPECT_STREQ(toString(SeverityLevel::CriticalWarning), "CRITICAL_WARNING");
    EXPECT_STREQ(toString(EntrySeverity::Unknown), "UNKNOWN");
    EXPECT_STREQ(toString(IssueSeverity::Ok), "OK");
}
