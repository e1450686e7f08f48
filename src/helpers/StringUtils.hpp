#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace NStringUtils {
    std::string              toLower(std::string_view str);

    // splits on '\n', a trailing '\r' is dropped from every line
    std::vector<std::string> splitLines(std::string_view text);

    // optional sign followed by decimal digits only
    std::optional<int64_t>   parseInt(std::string_view str);
    std::optional<double>    parseFloat(std::string_view str);

    // integral doubles keep a trailing ".0" so they parse back as floats
    std::string              formatFloat(double value);
};
