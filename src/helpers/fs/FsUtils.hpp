#pragma once
#include <optional>
#include <string>

namespace NFsUtils {
    // whole file, untouched. nullopt if missing or unreadable
    std::optional<std::string> readFileAsString(const std::string& path);

    // overwrites the file if exists
    bool writeToFile(const std::string& path, const std::string& content);
};
