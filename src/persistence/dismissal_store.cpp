#include <vigil/persistence/dismissal_store.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <fstream>
#include <system_error>

namespace vigil::persistence {

DismissalStore::DismissalStore(std::filesystem::path path) : path_(std::move(path)) {}

Result<std::vector<PersistedIssue>> DismissalStore::load() const {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        spdlog::debug("[DismissalStore] No dismissal file at {}", path_.string());
        return std::vector<PersistedIssue>{};
    }

    std::ifstream ifs(path_);
    if (!ifs) {
        return Error{ErrorCode::PermissionDenied, "Cannot open " + path_.string()};
    }

    nlohmann::json j;
    try {
        ifs >> j;
    } catch (const nlohmann::json::parse_error& e) {
        return Error{ErrorCode::CorruptedData,
                     "Malformed dismissal file " + path_.string() + ": " + e.what()};
    }

    if (!j.is_object() || !j.contains("issues") || !j["issues"].is_array()) {
        return Error{ErrorCode::CorruptedData,
                     "Dismissal file " + path_.string() + " has no issues array"};
    }
    if (j.contains("version")) {
        const auto& version = j["version"];
        if (!version.is_number_integer()) {
            return Error{ErrorCode::CorruptedData,
                         "Dismissal file " + path_.string() + " has a non-integer version " +
                             version.dump()};
        }
        if (version.get<std::int64_t>() != kVersion) {
            return Error{ErrorCode::NotSupported,
                         "Unsupported dismissal file version " + version.dump()};
        }
    }

    std::vector<PersistedIssue> issues;
    issues.reserve(j["issues"].size());
    for (const auto& entry : j["issues"]) {
        auto issue = PersistedIssue::fromJson(entry);
        if (!issue) {
            return Error{ErrorCode::CorruptedData,
                         "Invalid record in " + path_.string() + ": " + issue.error().message};
        }
        issues.push_back(std::move(issue).value());
    }
    spdlog::debug("[DismissalStore] Loaded {} record(s) from {}", issues.size(), path_.string());
    return issues;
}

Result<void> DismissalStore::save(const std::vector<PersistedIssue>& issues) const {
    nlohmann::json j;
    j["version"] = kVersion;
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& issue : issues) {
        entries.push_back(issue.toJson());
    }
    j["issues"] = std::move(entries);

    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::WriteError, "Cannot create " +
                                                    path_.parent_path().string() + ": " +
                                                    ec.message()};
        }
    }

    auto tempPath = path_;
    tempPath += ".tmp";

    std::ofstream ofs(tempPath);
    if (!ofs) {
        return Error{ErrorCode::WriteError, "Cannot open " + tempPath.string()};
    }
    ofs << j.dump(2);
    ofs.close();
    if (!ofs) {
        return Error{ErrorCode::WriteError, "Failed writing " + tempPath.string()};
    }

    std::filesystem::rename(tempPath, path_, ec);
    if (ec) {
        return Error{ErrorCode::WriteError,
                     "Cannot replace " + path_.string() + ": " + ec.message()};
    }
    spdlog::debug("[DismissalStore] Saved {} record(s) to {}", issues.size(), path_.string());
    return Result<void>();
}

Result<void> DismissalStore::remove() const {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        return Error{ErrorCode::WriteError, "Cannot remove " + path_.string() + ": " + ec.message()};
    }
    return Result<void>();
}

Result<std::vector<engine::DismissalRecord>> DismissalStore::loadRecords() const {
    auto issues = load();
    if (!issues)
        return issues.error();

    std::vector<engine::DismissalRecord> records;
    records.reserve(issues.value().size());
    for (const auto& issue : issues.value()) {
        auto record = fromPersisted(issue);
        if (!record)
            return record.error();
        records.push_back(std::move(record).value());
    }
    return records;
}

Result<void> DismissalStore::saveRecords(
    const std::vector<engine::DismissalRecord>& records) const {
    std::vector<PersistedIssue> issues;
    issues.reserve(records.size());
    for (const auto& record : records) {
        auto issue = toPersisted(record);
        if (!issue)
            return issue.error();
        issues.push_back(std::move(issue).value());
    }
    return save(issues);
}

Result<PersistedIssue> toPersisted(const engine::DismissalRecord& record) {
    return PersistedIssue::create(core::encodeIssueKey(record.key), record.firstSeenAt,
                                  record.dismissedAt, record.dismissCount,
                                  record.dismissedSeverity);
}

Result<engine::DismissalRecord> fromPersisted(const PersistedIssue& issue) {
    auto key = core::decodeIssueKey(issue.key());
    if (!key) {
        return Error{ErrorCode::CorruptedData,
                     "Undecodable issue key " + issue.key() + ": " + key.error().message};
    }
    engine::DismissalRecord record;
    record.key = std::move(key).value();
    record.firstSeenAt = issue.firstSeenAt();
    record.dismissedAt = issue.dismissedAt();
    record.dismissedSeverity = issue.dismissedSeverity();
    record.dismissCount = issue.dismissCount();
    return record;
}

} // namespace vigil::persistence
