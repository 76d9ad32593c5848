#pragma once

#include <vigil/core/ids.h>

#include <algorithm>
#include <vector>

namespace vigil::core {

struct ManagedProfile {
    UserId userId{0};
    bool running{true};
};

/**
 * A profile parent user together with its managed (work) profiles. A managed profile that
 * is not running is in quiet mode: its entries are shown paused and its issues are hidden.
 */
class UserProfileGroup {
public:
    UserProfileGroup() = default;
    explicit UserProfileGroup(UserId profileParentUserId,
                              std::vector<ManagedProfile> managedProfiles = {})
        : profileParentUserId_(profileParentUserId), managedProfiles_(std::move(managedProfiles)) {}

    UserId profileParentUserId() const noexcept { return profileParentUserId_; }
    const std::vector<ManagedProfile>& managedProfiles() const noexcept { return managedProfiles_; }

    std::vector<UserId> managedProfileUserIds() const {
        std::vector<UserId> ids;
        ids.reserve(managedProfiles_.size());
        for (const auto& profile : managedProfiles_) {
            ids.push_back(profile.userId);
        }
        return ids;
    }

    std::vector<UserId> managedRunningProfileUserIds() const {
        std::vector<UserId> ids;
        for (const auto& profile : managedProfiles_) {
            if (profile.running)
                ids.push_back(profile.userId);
        }
        return ids;
    }

    bool isManagedUserRunning(UserId userId) const {
        return std::any_of(managedProfiles_.begin(), managedProfiles_.end(),
                           [&](const ManagedProfile& p) { return p.userId == userId && p.running; });
    }

    bool contains(UserId userId) const {
        if (userId == profileParentUserId_)
            return true;
        return std::any_of(managedProfiles_.begin(), managedProfiles_.end(),
                           [&](const ManagedProfile& p) { return p.userId == userId; });
    }

private:
    UserId profileParentUserId_{0};
    std::vector<ManagedProfile> managedProfiles_;
};

} // namespace vigil::core
