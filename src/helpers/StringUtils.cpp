#include "StringUtils.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <format>
#include <ranges>

std::string NStringUtils::toLower(std::string_view str) {
    std::string result{str};
    std::ranges::transform(result, result.begin(), [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::vector<std::string> NStringUtils::splitLines(std::string_view text) {
    std::vector<std::string> lines;

    for (const auto& part : text | std::views::split('\n')) {
        std::string line{part.begin(), part.end()};
        if (line.ends_with('\r'))
            line.pop_back();
        lines.emplace_back(std::move(line));
    }

    return lines;
}

std::optional<int64_t> NStringUtils::parseInt(std::string_view str) {
    if (str.empty())
        return std::nullopt;

    if (str.front() == '+')
        str.remove_prefix(1);

    if (str.empty() || str == "-")
        return std::nullopt;

    int64_t value = 0;
    const auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec != std::errc{} || ptr != str.data() + str.size())
        return std::nullopt;

    return value;
}

std::optional<double> NStringUtils::parseFloat(std::string_view str) {
    if (str.empty())
        return std::nullopt;

    if (str.front() == '+')
        str.remove_prefix(1);

    // reject inf, nan and hex floats, from_chars would take them
    const bool SANE = !str.empty() && std::ranges::all_of(str, [](char c) { return (c >= '0' && c <= '9') || c == '.' || c == '-' || c == '+' || c == 'e' || c == 'E'; }) &&
        std::ranges::any_of(str, [](char c) { return c >= '0' && c <= '9'; });
    if (!SANE)
        return std::nullopt;

    double value = 0;
    const auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec != std::errc{} || ptr != str.data() + str.size())
        return std::nullopt;

    return value;
}

std::string NStringUtils::formatFloat(double value) {
    if (std::isfinite(value) && value == std::trunc(value) && std::fabs(value) < 1e15)
        return std::format("{:.1f}", value);

    return std::format("{}", value);
}
