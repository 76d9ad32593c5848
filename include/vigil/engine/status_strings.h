#pragma once

#include <cstddef>
#include <string>

namespace vigil::engine {

// User-visible texts of the aggregated view. Defaults are plain English; callers that
// localize replace the fields.
struct StatusStrings {
    std::string scanningTitle{"Scanning…"};
    std::string loadingSummary{"Loading…"};

    std::string okTitle{"Looks good"};
    std::string okReviewTitle{"Review your settings"};
    std::string okSummary{"No problems found"};
    std::string okReviewSummary{"Check your settings"};

    std::string deviceRecommendationTitle{"Device may be at risk"};
    std::string accountRecommendationTitle{"Account may be at risk"};
    std::string generalRecommendationTitle{"Safety recommendation"};
    std::string deviceCriticalTitle{"Device is at risk"};
    std::string accountCriticalTitle{"Account is at risk"};
    std::string generalCriticalTitle{"Safety warning"};

    std::string workProfilePausedSummary{"Work profile is paused"};
    std::string groupUnknownSummary{"Couldn't check settings"};

    std::string alertsSummary(std::size_t count) const;
    std::string refreshErrorSummary(std::size_t count) const;
};

} // namespace vigil::engine
