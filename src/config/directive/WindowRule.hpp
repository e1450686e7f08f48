#pragma once

#include "../ConfigEnums.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace Config::Directive {

    // strips one leading ^ and one trailing $
    std::string stripAnchors(std::string_view pattern);

    struct SWindowRule {
        std::string                 id;
        std::optional<std::string>  app; // without anchors
        std::optional<std::string>  title;
        bool                        manage = true;
        std::optional<bool>         sticky;
        std::optional<eWindowLayer> layer;
        std::optional<int64_t>      space;
        bool                        enabled = true;

        bool                        hasSelector() const;
        bool                        matches(const std::string& appName, const std::string& windowTitle = "") const;

        bool                        operator==(const SWindowRule&) const = default;
    };

    // narrower rule view for keeping apps out of tiling
    struct SExclusionRule {
        std::string                id;
        std::string                app; // required, without anchors
        std::optional<std::string> title;
        bool                       manageOff = true;
        bool                       sticky    = false;
        eWindowLayer               layer     = WINDOW_LAYER_NORMAL;
        std::optional<int64_t>     space;
        bool                       enabled = true;

        // an exclusion without actions renders to nothing
        bool                       hasActions() const;
        bool                       matches(const std::string& appName, const std::string& windowTitle = "") const;

        bool                       operator==(const SExclusionRule&) const = default;
    };
}
