#include <vigil/config/source_registry.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <optional>
#include <unordered_set>

namespace vigil::config {

using json = nlohmann::json;

const char* toString(SourceType type) {
    switch (type) {
        case SourceType::Static:
            return "static";
        case SourceType::Dynamic:
            return "dynamic";
        case SourceType::IssueOnly:
            return "issue_only";
    }
    return "unknown";
}

const char* toString(ProfileScope profile) {
    switch (profile) {
        case ProfileScope::Primary:
            return "primary";
        case ProfileScope::All:
            return "all";
    }
    return "unknown";
}

const char* toString(InitialDisplayState state) {
    switch (state) {
        case InitialDisplayState::Enabled:
            return "enabled";
        case InitialDisplayState::Disabled:
            return "disabled";
        case InitialDisplayState::Hidden:
            return "hidden";
    }
    return "unknown";
}

const char* toString(GroupType type) {
    switch (type) {
        case GroupType::Collapsible:
            return "collapsible";
        case GroupType::Rigid:
            return "rigid";
        case GroupType::Hidden:
            return "hidden";
    }
    return "unknown";
}

const char* toString(StatelessIconType type) {
    switch (type) {
        case StatelessIconType::None:
            return "none";
        case StatelessIconType::Privacy:
            return "privacy";
    }
    return "unknown";
}

namespace {

Error invalid(const std::string& sourceId, const std::string& what) {
    return Error{ErrorCode::ValidationError,
                 "Invalid source '" + sourceId + "': " + what};
}

Result<void> checkAttribute(const SourceDescriptor& s, bool present, const char* name,
                            bool required, bool prohibited) {
    if (required && !present) {
        return invalid(s.id, std::string("required attribute ") + name + " missing");
    }
    if (prohibited && present) {
        return invalid(s.id, std::string("prohibited attribute ") + name + " present");
    }
    return {};
}

std::optional<SourceType> parseSourceType(const std::string& s) {
    if (s == "static")
        return SourceType::Static;
    if (s == "dynamic")
        return SourceType::Dynamic;
    if (s == "issue_only")
        return SourceType::IssueOnly;
    return std::nullopt;
}

std::optional<ProfileScope> parseProfile(const std::string& s) {
    if (s == "primary")
        return ProfileScope::Primary;
    if (s == "all")
        return ProfileScope::All;
    return std::nullopt;
}

std::optional<InitialDisplayState> parseDisplayState(const std::string& s) {
    if (s == "enabled")
        return InitialDisplayState::Enabled;
    if (s == "disabled")
        return InitialDisplayState::Disabled;
    if (s == "hidden")
        return InitialDisplayState::Hidden;
    return std::nullopt;
}

GroupType parseGroupType(const std::string& groupId, const std::string& s) {
    if (s == "collapsible")
        return GroupType::Collapsible;
    if (s == "rigid")
        return GroupType::Rigid;
    if (s == "hidden")
        return GroupType::Hidden;
    spdlog::warn("[SourceRegistry] Unexpected group type '{}' for group '{}', treating as hidden",
                 s, groupId);
    return GroupType::Hidden;
}

StatelessIconType parseIconType(const std::string& groupId, const std::string& s) {
    if (s.empty() || s == "none")
        return StatelessIconType::None;
    if (s == "privacy")
        return StatelessIconType::Privacy;
    spdlog::warn("[SourceRegistry] Unexpected stateless icon type '{}' for group '{}'", s, groupId);
    return StatelessIconType::None;
}

Result<SourceDescriptor> parseSource(const json& j) {
    if (!j.is_object()) {
        return Error{ErrorCode::ValidationError, "Source entry must be an object"};
    }
    SourceDescriptor s;
    s.id = j.value("id", std::string{});

    if (!j.contains("type")) {
        return invalid(s.id, "required attribute type missing");
    }
    auto type = parseSourceType(j.at("type").get<std::string>());
    if (!type) {
        return invalid(s.id, "unexpected type '" + j.at("type").get<std::string>() + "'");
    }
    s.type = *type;

    if (!j.contains("profile")) {
        return invalid(s.id, "required attribute profile missing");
    }
    auto profile = parseProfile(j.at("profile").get<std::string>());
    if (!profile) {
        return invalid(s.id, "unexpected profile '" + j.at("profile").get<std::string>() + "'");
    }
    s.profile = *profile;

    if (j.contains("initial_display_state")) {
        auto state = parseDisplayState(j.at("initial_display_state").get<std::string>());
        if (!state) {
            return invalid(s.id, "unexpected initial_display_state");
        }
        if (s.type != SourceType::Dynamic) {
            return invalid(s.id, "prohibited attribute initial_display_state present");
        }
        s.initialDisplayState = *state;
    }

    s.packageName = j.value("package_name", std::string{});
    s.title = j.value("title", std::string{});
    s.titleForWork = j.value("title_for_work", std::string{});
    s.summary = j.value("summary", std::string{});
    s.intentAction = j.value("intent_action", std::string{});

    if (j.contains("max_severity_level")) {
        if (s.type == SourceType::Static) {
            return invalid(s.id, "prohibited attribute max_severity_level present");
        }
        const auto& v = j.at("max_severity_level");
        if (v.is_number_integer()) {
            s.maxSeverityLevel = v.get<int>();
        } else {
            auto level = core::parseSeverityLevel(v.get<std::string>());
            if (!level) {
                return invalid(s.id, "unexpected max_severity_level");
            }
            s.maxSeverityLevel = static_cast<int>(*level);
        }
    }
    if (j.contains("logging_allowed")) {
        if (s.type == SourceType::Static) {
            return invalid(s.id, "prohibited attribute logging_allowed present");
        }
        s.loggingAllowed = j.at("logging_allowed").get<bool>();
    }
    if (j.contains("refresh_on_page_open_allowed")) {
        if (s.type == SourceType::Static) {
            return invalid(s.id, "prohibited attribute refresh_on_page_open_allowed present");
        }
        s.refreshOnPageOpenAllowed = j.at("refresh_on_page_open_allowed").get<bool>();
    }

    if (auto v = s.validate(); !v) {
        return v.error();
    }
    return s;
}

} // namespace

Result<void> SourceDescriptor::validate() const {
    if (id.empty()) {
        return Error{ErrorCode::ValidationError, "Invalid source: required attribute id missing"};
    }
    const bool isStatic = type == SourceType::Static;
    const bool isDynamic = type == SourceType::Dynamic;
    const bool isIssueOnly = type == SourceType::IssueOnly;
    const bool isHidden = initialDisplayState == InitialDisplayState::Hidden;
    const bool isEnabled = initialDisplayState == InitialDisplayState::Enabled;
    const bool hasWork = profile == ProfileScope::All;
    const bool titleRequired = (isDynamic && !isHidden) || isStatic;

    if (auto r = checkAttribute(*this, !packageName.empty(), "packageName", isDynamic || isIssueOnly,
                                isStatic);
        !r)
        return r;
    if ((isStatic || isIssueOnly) && initialDisplayState != InitialDisplayState::Enabled) {
        return invalid(id, "prohibited attribute initialDisplayState present");
    }
    if (auto r = checkAttribute(*this, !title.empty(), "title", titleRequired, isIssueOnly); !r)
        return r;
    if (auto r = checkAttribute(*this, !titleForWork.empty(), "titleForWork",
                                hasWork && titleRequired, !hasWork || isIssueOnly);
        !r)
        return r;
    if (auto r = checkAttribute(*this, !summary.empty(), "summary", isDynamic && !isHidden,
                                isIssueOnly);
        !r)
        return r;
    if (auto r = checkAttribute(*this, !intentAction.empty(), "intentAction",
                                (isDynamic && isEnabled) || isStatic, isIssueOnly);
        !r)
        return r;
    if (isStatic) {
        if (maxSeverityLevel != std::numeric_limits<int>::max()) {
            return invalid(id, "prohibited attribute maxSeverityLevel present");
        }
        if (!loggingAllowed) {
            return invalid(id, "prohibited attribute loggingAllowed present");
        }
        if (refreshOnPageOpenAllowed) {
            return invalid(id, "prohibited attribute refreshOnPageOpenAllowed present");
        }
    }
    return {};
}

Result<SourceRegistry> SourceRegistry::create(std::vector<SourcesGroup> groups,
                                              bool allowsTelemetry) {
    SourceRegistry registry;
    registry.allowsTelemetry_ = allowsTelemetry;

    std::unordered_set<std::string> groupIds;
    for (std::size_t g = 0; g < groups.size(); ++g) {
        const auto& group = groups[g];
        if (group.id.empty()) {
            return Error{ErrorCode::ValidationError, "Sources group without an id"};
        }
        if (!groupIds.insert(group.id).second) {
            return Error{ErrorCode::ValidationError, "Duplicate sources group id '" + group.id + "'"};
        }
        if (group.sources.empty()) {
            return Error{ErrorCode::ValidationError,
                         "Sources group '" + group.id + "' has no sources"};
        }
        if (group.type != GroupType::Hidden && group.title.empty()) {
            return Error{ErrorCode::ValidationError,
                         "Sources group '" + group.id + "' requires a title"};
        }
        for (std::size_t s = 0; s < group.sources.size(); ++s) {
            const auto& source = group.sources[s];
            if (auto v = source.validate(); !v) {
                return v.error();
            }
            if (!registry.index_.emplace(source.id, Location{g, s}).second) {
                return Error{ErrorCode::ValidationError,
                             "Duplicate source id '" + source.id + "'"};
            }
        }
    }
    registry.groups_ = std::move(groups);
    spdlog::debug("[SourceRegistry] Loaded {} groups, {} sources", registry.groups_.size(),
                  registry.index_.size());
    return registry;
}

Result<SourceRegistry> SourceRegistry::fromJson(const json& root) {
    try {
        if (!root.is_object() || !root.contains("groups") || !root.at("groups").is_array()) {
            return Error{ErrorCode::ValidationError, "Source config requires a 'groups' array"};
        }
        std::vector<SourcesGroup> groups;
        for (const auto& jg : root.at("groups")) {
            SourcesGroup group;
            group.id = jg.value("id", std::string{});
            group.title = jg.value("title", std::string{});
            group.summary = jg.value("summary", std::string{});
            group.type = parseGroupType(group.id, jg.value("type", std::string{"collapsible"}));
            group.statelessIconType =
                parseIconType(group.id, jg.value("stateless_icon", std::string{}));
            if (jg.contains("sources")) {
                for (const auto& js : jg.at("sources")) {
                    auto source = parseSource(js);
                    if (!source)
                        return source.error();
                    group.sources.push_back(std::move(source).value());
                }
            }
            groups.push_back(std::move(group));
        }
        return create(std::move(groups), root.value("allow_telemetry", true));
    } catch (const json::exception& e) {
        return Error{ErrorCode::ValidationError, std::string("Malformed source config: ") + e.what()};
    }
}

Result<SourceRegistry> SourceRegistry::loadFromFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::FileNotFound, "Cannot open source config: " + path.string()};
    }
    json root;
    try {
        in >> root;
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::ValidationError,
                     "Source config " + path.string() + " is not valid JSON: " + e.what()};
    }
    return fromJson(root);
}

const SourceDescriptor* SourceRegistry::find(std::string_view sourceId) const {
    auto it = index_.find(std::string(sourceId));
    if (it == index_.end())
        return nullptr;
    return &groups_[it->second.group].sources[it->second.source];
}

} // namespace vigil::config
