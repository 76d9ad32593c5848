#pragma once

#include <vigil/core/types.h>
#include <vigil/engine/aggregated_view.h>
#include <vigil/engine/safety_hub.h>
#include <vigil/engine/source_report.h>

#include <nlohmann/json_fwd.hpp>

namespace vigil::engine {

/**
 * JSON wire format of source reports:
 *
 *   {"status": {"title", "summary", "severity", "enabled", "pending_action"},
 *    "issues": [{"id", "type_id", "severity", "category", "title", "subtitle", "summary",
 *                "actions": [{"id", "label", "resolving", "success_message"}]}]}
 *
 * Severities are accepted by name ("RECOMMENDATION") or numeric value (300). Unknown
 * severities or categories fail with InvalidData.
 */
Result<SourceReport> reportFromJson(const nlohmann::json& j);
nlohmann::json toJson(const SourceReport& report);

nlohmann::json toJson(const AggregatedView& view);
nlohmann::json toJson(const SafetySnapshot& snapshot);

} // namespace vigil::engine
