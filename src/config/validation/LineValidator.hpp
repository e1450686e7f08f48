#pragma once

#include "../Diagnostic.hpp"

#include <string_view>

namespace Config::Validation {

    /*
        Structural checks over raw directive text, one pass, line numbers are 1-based.
        Unrecognized lines, yabai commands without -m, malformed config lines,
        rule or signal commands without --add/--remove, signals missing event= or action=
        (one diagnostic each) and rule selectors that are not valid regular expressions.
    */
    DiagnosticList validateDirectiveText(std::string_view text);

    // missing " : " style separator, or a line the binding grammar rejects
    DiagnosticList validateBindingText(std::string_view text);
}
