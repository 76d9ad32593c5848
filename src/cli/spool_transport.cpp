#include <vigil/cli/spool_transport.h>
#include <vigil/engine/json_codec.h>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>

namespace vigil::cli {

using json = nlohmann::json;

SpoolTransport::SpoolTransport(std::filesystem::path spoolDir) : spoolDir_(std::move(spoolDir)) {}

std::filesystem::path SpoolTransport::reportPath(const core::SourceKey& key) const {
    return spoolDir_ / fmt::format("{}.{}.json", key.sourceId, key.userId);
}

void SpoolTransport::dispatch(const engine::RefreshPlan& plan) {
    if (!inbox_) {
        spdlog::warn("[SpoolTransport] No inbox attached; dropping {} request(s)",
                     plan.sources.size());
        return;
    }

    for (const auto& key : plan.sources) {
        auto path = reportPath(key);
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            spdlog::debug("[SpoolTransport] No report for {} at {}", key.toString(), path.string());
            continue;
        }

        std::ifstream in(path);
        if (!in) {
            spdlog::warn("[SpoolTransport] Cannot open {}", path.string());
            inbox_->postFailure(engine::SourceFailure{plan.sessionId, key});
            continue;
        }

        json j;
        try {
            in >> j;
        } catch (const json::exception& e) {
            spdlog::warn("[SpoolTransport] Malformed report {}: {}", path.string(), e.what());
            inbox_->postFailure(engine::SourceFailure{plan.sessionId, key});
            continue;
        }

        if (j.is_object() && j.contains("error") && j["error"].is_boolean() &&
            j["error"].get<bool>()) {
            inbox_->postFailure(engine::SourceFailure{plan.sessionId, key});
            continue;
        }

        auto report = engine::reportFromJson(j);
        if (!report) {
            spdlog::warn("[SpoolTransport] Invalid report {}: {}", path.string(),
                         report.error().message);
            inbox_->postFailure(engine::SourceFailure{plan.sessionId, key});
            continue;
        }
        inbox_->postResponse(
            engine::SourceResponse{plan.sessionId, key, std::move(report).value()});
    }
}

} // namespace vigil::cli
