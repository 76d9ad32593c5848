#pragma once

#include <vigil/core/severity.h>
#include <vigil/core/types.h>

#include <nlohmann/json_fwd.hpp>

#include <filesystem>
#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace vigil::config {

enum class SourceType { Static, Dynamic, IssueOnly };

enum class ProfileScope { Primary, All };

enum class InitialDisplayState { Enabled, Disabled, Hidden };

enum class GroupType { Collapsible, Rigid, Hidden };

enum class StatelessIconType { None, Privacy };

const char* toString(SourceType type);
const char* toString(ProfileScope profile);
const char* toString(InitialDisplayState state);
const char* toString(GroupType type);
const char* toString(StatelessIconType type);

/**
 * Immutable description of one safety source. Dynamic and issue-only sources push reports;
 * static sources only contribute a fixed entry built from this descriptor.
 */
struct SourceDescriptor {
    std::string id;
    SourceType type{SourceType::Dynamic};
    std::string packageName;
    std::string title;
    std::string titleForWork;
    std::string summary;
    std::string intentAction;
    ProfileScope profile{ProfileScope::Primary};
    InitialDisplayState initialDisplayState{InitialDisplayState::Enabled};
    // Highest severity the source may report, compared on the numeric scale.
    int maxSeverityLevel{std::numeric_limits<int>::max()};
    bool loggingAllowed{true};
    bool refreshOnPageOpenAllowed{false};

    bool supportsManagedProfiles() const noexcept { return profile == ProfileScope::All; }
    bool isExternal() const noexcept { return type != SourceType::Static; }
    bool isDefaultEntryHidden() const noexcept {
        return initialDisplayState == InitialDisplayState::Hidden;
    }
    bool isDefaultEntryDisabled() const noexcept {
        return initialDisplayState == InitialDisplayState::Disabled;
    }
    bool allowsSeverity(core::SeverityLevel level) const noexcept {
        return static_cast<int>(level) <= maxSeverityLevel;
    }

    // Required/prohibited attribute rules per source type.
    Result<void> validate() const;
};

struct SourcesGroup {
    std::string id;
    std::string title;
    std::string summary;
    GroupType type{GroupType::Collapsible};
    StatelessIconType statelessIconType{StatelessIconType::None};
    std::vector<SourceDescriptor> sources;
};

/**
 * The configured groups of sources, in display order. Built once at load time; any
 * malformed descriptor fails the whole load with ValidationError.
 */
class SourceRegistry {
public:
    SourceRegistry() = default;

    static Result<SourceRegistry> create(std::vector<SourcesGroup> groups,
                                         bool allowsTelemetry = true);
    static Result<SourceRegistry> fromJson(const nlohmann::json& root);
    static Result<SourceRegistry> loadFromFile(const std::filesystem::path& path);

    const std::vector<SourcesGroup>& groups() const noexcept { return groups_; }
    const SourceDescriptor* find(std::string_view sourceId) const;
    bool allowsTelemetry() const noexcept { return allowsTelemetry_; }
    std::size_t sourceCount() const noexcept { return index_.size(); }

private:
    struct Location {
        std::size_t group;
        std::size_t source;
    };

    std::vector<SourcesGroup> groups_;
    std::unordered_map<std::string, Location> index_;
    bool allowsTelemetry_{true};
};

} // namespace vigil::config
