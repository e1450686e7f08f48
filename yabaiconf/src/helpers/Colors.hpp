#pragma once

namespace Colors {
    constexpr const char* RED    = "\x1b[31m";
    constexpr const char* GREEN  = "\x1b[32m";
    constexpr const char* YELLOW = "\x1b[33m";
    constexpr const char* RESET  = "\x1b[0m";
};
