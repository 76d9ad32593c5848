#include <vigil/engine/refresh_types.h>

namespace vigil::engine {

const char* toString(RefreshReason reason) {
    switch (reason) {
        case RefreshReason::PageOpen:
            return "PAGE_OPEN";
        case RefreshReason::RescanButton:
            return "BUTTON_CLICK";
        case RefreshReason::DeviceReboot:
            return "REBOOT";
        case RefreshReason::LocaleChange:
            return "LOCALE_CHANGE";
        case RefreshReason::FeatureEnabled:
            return "SAFETY_CENTER_ENABLED";
        case RefreshReason::Other:
            return "OTHER";
    }
    return "OTHER";
}

const char* toString(RefreshRequestType type) {
    switch (type) {
        case RefreshRequestType::GetData:
            return "GET_DATA";
        case RefreshRequestType::FetchFreshData:
            return "FETCH_FRESH_DATA";
    }
    return "FETCH_FRESH_DATA";
}

const char* toString(RefreshStatus status) {
    switch (status) {
        case RefreshStatus::None:
            return "NONE";
        case RefreshStatus::DataFetchInProgress:
            return "DATA_FETCH_IN_PROGRESS";
        case RefreshStatus::FullRescanInProgress:
            return "FULL_RESCAN_IN_PROGRESS";
    }
    return "NONE";
}

std::optional<RefreshReason> parseRefreshReason(std::string_view name) {
    if (name == "PAGE_OPEN")
        return RefreshReason::PageOpen;
    if (name == "BUTTON_CLICK")
        return RefreshReason::RescanButton;
    if (name == "REBOOT")
        return RefreshReason::DeviceReboot;
    if (name == "LOCALE_CHANGE")
        return RefreshReason::LocaleChange;
    if (name == "SAFETY_CENTER_ENABLED")
        return RefreshReason::FeatureEnabled;
    if (name == "OTHER")
        return RefreshReason::Other;
    return std::nullopt;
}

RefreshRequestType toRequestType(RefreshReason reason) {
    switch (reason) {
        case RefreshReason::PageOpen:
            return RefreshRequestType::GetData;
        case RefreshReason::RescanButton:
        case RefreshReason::DeviceReboot:
        case RefreshReason::LocaleChange:
        case RefreshReason::FeatureEnabled:
        case RefreshReason::Other:
            return RefreshRequestType::FetchFreshData;
    }
    return RefreshRequestType::FetchFreshData;
}

} // namespace vigil::engine
