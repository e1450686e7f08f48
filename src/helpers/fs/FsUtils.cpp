#include "FsUtils.hpp"
#include "../../debug/log/Logger.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>

std::optional<std::string> NFsUtils::readFileAsString(const std::string& path) {
    std::error_code ec;

    if (!std::filesystem::exists(path, ec) || ec) {
        Log::logger->log(Log::ERR, "FsUtils::readFileAsString: {} doesn't exist", path);
        return std::nullopt;
    }

    if (std::filesystem::is_directory(path, ec) || ec) {
        Log::logger->log(Log::ERR, "FsUtils::readFileAsString: {} is a directory", path);
        return std::nullopt;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.good()) {
        Log::logger->log(Log::ERR, "FsUtils::readFileAsString: couldn't open {}", path);
        return std::nullopt;
    }

    return std::string((std::istreambuf_iterator<char>(file)), (std::istreambuf_iterator<char>()));
}

bool NFsUtils::writeToFile(const std::string& path, const std::string& content) {
    std::ofstream of(path, std::ios::trunc | std::ios::binary);
    if (!of.good()) {
        Log::logger->log(Log::ERR, "FsUtils::writeToFile: couldn't open {} for writing", path);
        return false;
    }

    of << content;
    of.close();

    if (of.fail()) {
        Log::logger->log(Log::ERR, "FsUtils::writeToFile: failed writing {}", path);
        return false;
    }

    return true;
}
