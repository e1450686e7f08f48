#include "ConfigEnums.hpp"

#include <algorithm>

bool Config::isKnownSignalEvent(std::string_view event) {
    return std::ranges::any_of(SIGNAL_EVENTS, [event](const auto& e) { return e.event == event; });
}
