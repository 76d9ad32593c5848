#pragma once

#include <vigil/core/types.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace vigil::core {

using UserId = std::int32_t;

// Addressing unit for all per-source state.
struct SourceKey {
    std::string sourceId;
    UserId userId{0};

    bool operator==(const SourceKey&) const = default;

    std::string toString() const;
};

struct SourceKeyHash {
    std::size_t operator()(const SourceKey& key) const noexcept {
        std::size_t h = std::hash<std::string>{}(key.sourceId);
        return h ^ (std::hash<UserId>{}(key.userId) + 0x9e3779b9 + (h << 6) + (h >> 2));
    }
};

// Identity of an issue across reports; its content may change, the key does not.
struct IssueKey {
    std::string sourceId;
    std::string issueId;
    UserId userId{0};

    bool operator==(const IssueKey&) const = default;

    SourceKey sourceKey() const { return SourceKey{sourceId, userId}; }
    std::string toString() const;
};

struct IssueKeyHash {
    std::size_t operator()(const IssueKey& key) const noexcept {
        std::size_t h = std::hash<std::string>{}(key.sourceId);
        h ^= std::hash<std::string>{}(key.issueId) + 0x9e3779b9 + (h << 6) + (h >> 2);
        h ^= std::hash<UserId>{}(key.userId) + 0x9e3779b9 + (h << 6) + (h >> 2);
        return h;
    }
};

struct IssueActionId {
    IssueKey issueKey;
    std::string actionId;

    bool operator==(const IssueActionId&) const = default;
};

struct IssueActionIdHash {
    std::size_t operator()(const IssueActionId& id) const noexcept {
        std::size_t h = IssueKeyHash{}(id.issueKey);
        return h ^ (std::hash<std::string>{}(id.actionId) + 0x9e3779b9 + (h << 6) + (h >> 2));
    }
};

/**
 * Opaque string encodings used for view ids and persisted keys. Fields are separated by '|'
 * and percent-escaped so that arbitrary source and issue ids round-trip.
 */
std::string encodeIssueKey(const IssueKey& key);
Result<IssueKey> decodeIssueKey(std::string_view encoded);

std::string encodeEntryId(const SourceKey& key);

std::string encodeIssueActionId(const IssueActionId& id);

// View id of an issue: its key plus the issue type id.
std::string encodeViewIssueId(const IssueKey& key, std::string_view typeId);

std::string encodeEntryGroupId(std::string_view groupId);

/**
 * Generate a UUID v4 string (xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx).
 * Uses std::random_device + mt19937_64.
 */
std::string generateUUID();

} // namespace vigil::core
