#pragma once

#include <optional>
#include <string>

namespace Config::Directive {
    struct SSignal {
        std::string                id;
        std::string                event;
        std::string                action;
        std::optional<std::string> label;
        bool                       enabled = true;

        bool                       complete() const {
            return !event.empty() && !action.empty();
        }

        bool operator==(const SSignal&) const = default;
    };
}
