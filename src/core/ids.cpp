#include <vigil/core/ids.h>

#include <charconv>
#include <cstdio>
#include <random>
#include <vector>

namespace vigil::core {

namespace {

constexpr char kSeparator = '|';

std::string escapeField(std::string_view raw) {
    std::string out;
    out.reserve(raw.size());
    for (char c : raw) {
        if (c == '%') {
            out += "%25";
        } else if (c == kSeparator) {
            out += "%7C";
        } else {
            out.push_back(c);
        }
    }
    return out;
}

Result<std::string> unescapeField(std::string_view escaped) {
    std::string out;
    out.reserve(escaped.size());
    for (std::size_t i = 0; i < escaped.size(); ++i) {
        char c = escaped[i];
        if (c != '%') {
            out.push_back(c);
            continue;
        }
        if (i + 2 >= escaped.size()) {
            return Error{ErrorCode::InvalidData, "Truncated escape sequence in id"};
        }
        auto code = escaped.substr(i + 1, 2);
        if (code == "25") {
            out.push_back('%');
        } else if (code == "7C" || code == "7c") {
            out.push_back(kSeparator);
        } else {
            return Error{ErrorCode::InvalidData, "Unknown escape sequence in id"};
        }
        i += 2;
    }
    return out;
}

std::vector<std::string_view> splitFields(std::string_view encoded) {
    std::vector<std::string_view> fields;
    std::size_t start = 0;
    while (true) {
        auto pos = encoded.find(kSeparator, start);
        if (pos == std::string_view::npos) {
            fields.push_back(encoded.substr(start));
            break;
        }
        fields.push_back(encoded.substr(start, pos - start));
        start = pos + 1;
    }
    return fields;
}

Result<UserId> parseUserId(std::string_view field) {
    UserId value = 0;
    auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), value);
    if (field.empty() || ec != std::errc() || ptr != field.data() + field.size()) {
        return Error{ErrorCode::InvalidData, "Invalid user id in encoded id: " + std::string(field)};
    }
    return value;
}

} // namespace

std::string SourceKey::toString() const {
    return "SourceKey{" + sourceId + ", user=" + std::to_string(userId) + "}";
}

std::string IssueKey::toString() const {
    return "IssueKey{" + sourceId + "/" + issueId + ", user=" + std::to_string(userId) + "}";
}

std::string encodeIssueKey(const IssueKey& key) {
    return escapeField(key.sourceId) + kSeparator + escapeField(key.issueId) + kSeparator +
           std::to_string(key.userId);
}

Result<IssueKey> decodeIssueKey(std::string_view encoded) {
    auto fields = splitFields(encoded);
    if (fields.size() != 3) {
        return Error{ErrorCode::InvalidData, "Malformed issue key: " + std::string(encoded)};
    }
    auto sourceId = unescapeField(fields[0]);
    if (!sourceId)
        return sourceId.error();
    auto issueId = unescapeField(fields[1]);
    if (!issueId)
        return issueId.error();
    auto userId = parseUserId(fields[2]);
    if (!userId)
        return userId.error();
    if (sourceId.value().empty() || issueId.value().empty()) {
        return Error{ErrorCode::InvalidData, "Issue key has an empty field"};
    }
    return IssueKey{std::move(sourceId).value(), std::move(issueId).value(), userId.value()};
}

std::string encodeEntryId(const SourceKey& key) {
    return escapeField(key.sourceId) + kSeparator + std::to_string(key.userId);
}

std::string encodeIssueActionId(const IssueActionId& id) {
    return encodeIssueKey(id.issueKey) + kSeparator + escapeField(id.actionId);
}

std::string encodeViewIssueId(const IssueKey& key, std::string_view typeId) {
    return encodeIssueKey(key) + kSeparator + escapeField(typeId);
}

std::string encodeEntryGroupId(std::string_view groupId) {
    return escapeField(groupId);
}

std::string generateUUID() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dist;
    uint64_t a = dist(rng);
    uint64_t b = dist(rng);

    // Version 4, variant 1
    a = (a & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull;
    b = (b & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx", static_cast<uint32_t>(a >> 32),
                  static_cast<uint16_t>((a >> 16) & 0xFFFF), static_cast<uint16_t>(a & 0xFFFF),
                  static_cast<uint16_t>(b >> 48),
                  static_cast<unsigned long long>(b & 0x0000FFFFFFFFFFFFull));
    return std::string(buf);
}

} // namespace vigil::core
