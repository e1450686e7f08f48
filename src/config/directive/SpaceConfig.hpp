#pragma once

#include "../ConfigEnums.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Config::Directive {

    // per space override, keyed by its 1-based index
    struct SSpaceConfig {
        int64_t                                          index = 1;
        std::optional<std::string>                       label;
        std::optional<eLayout>                           layout;
        std::optional<int64_t>                           gap;
        std::optional<int64_t>                           topPadding;
        std::optional<int64_t>                           bottomPadding;
        std::optional<int64_t>                           leftPadding;
        std::optional<int64_t>                           rightPadding;

        // `config --space N` pairs with no typed field, raw and in file order
        std::vector<std::pair<std::string, std::string>> extras;

        std::string                                      displayName() const;

        /*
            Applies `config --space N <key> <value>`, the last line for a key wins.
            Returns false when the pair ended up in extras, either because the key
            has no typed field or because the value doesn't fit it.
        */
        bool applyOverride(const std::string& key, const std::string& value);

        bool operator==(const SSpaceConfig&) const = default;
    };
}
