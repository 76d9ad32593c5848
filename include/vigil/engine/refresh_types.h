#pragma once

#include <optional>
#include <string_view>

namespace vigil::engine {

enum class RefreshReason {
    PageOpen,
    RescanButton,
    DeviceReboot,
    LocaleChange,
    FeatureEnabled,
    Other,
};

// Bucketing used for telemetry and for what sources are asked to do.
enum class RefreshRequestType {
    GetData,
    FetchFreshData,
};

enum class RefreshStatus {
    None,
    DataFetchInProgress,
    FullRescanInProgress,
};

const char* toString(RefreshReason reason);
const char* toString(RefreshRequestType type);
const char* toString(RefreshStatus status);

// Command line names: PAGE_OPEN, BUTTON_CLICK, REBOOT, LOCALE_CHANGE, SAFETY_CENTER_ENABLED, OTHER.
std::optional<RefreshReason> parseRefreshReason(std::string_view name);

RefreshRequestType toRequestType(RefreshReason reason);

} // namespace vigil::engine
