#include "Logger.hpp"

using namespace Log;

CLogger::CLogger() {
    const auto IS_TRACE = Env::isTrace();
    m_logger.setLogLevel(IS_TRACE ? Hyprutils::CLI::LOG_TRACE : Hyprutils::CLI::LOG_WARN);
    m_logger.setEnableColor(false);
    m_logger.setEnableStdout(true);
    m_logger.setTime(false);
}

void CLogger::log(Hyprutils::CLI::eLogLevel level, const std::string_view& str) {
    static bool TRACE = Env::isTrace();

    if (!m_logsEnabled)
        return;

    if (level == Hyprutils::CLI::LOG_TRACE && !TRACE)
        return;

    m_logger.log(level, str);
}

void CLogger::setOutputFile(const std::string& path) {
    m_logger.setOutputFile(path);
    m_logger.setTime(true);
}

void CLogger::quiet() {
    m_logger.setEnableStdout(false);
}

void CLogger::setVerbose(bool verbose) {
    if (Env::isTrace())
        return;

    m_logger.setLogLevel(verbose ? Hyprutils::CLI::LOG_DEBUG : Hyprutils::CLI::LOG_WARN);
}
