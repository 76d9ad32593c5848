#include <vigil/engine/status_strings.h>

#include <fmt/format.h>

namespace vigil::engine {

std::string StatusStrings::alertsSummary(std::size_t count) const {
    if (count == 1)
        return "1 alert";
    return fmt::format("{} alerts", count);
}

std::string StatusStrings::refreshErrorSummary(std::size_t count) const {
    if (count == 1)
        return "Couldn't check setting";
    return fmt::format("Couldn't check {} settings", count);
}

} // namespace vigil::engine
