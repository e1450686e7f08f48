#pragma once

#include <cstddef>
#include <format>
#include <string>
#include <vector>

namespace Config {

    // a structural problem found on one line of a config file
    struct SDiagnostic {
        size_t      line = 0; // 1-based
        std::string message;
        std::string text;

        std::string toString() const {
            return std::format("Line {}: {}\n  {}", line, message, text);
        }

        bool operator==(const SDiagnostic&) const = default;
    };

    using DiagnosticList = std::vector<SDiagnostic>;
}
