#include "LineValidator.hpp"
#include "../directive/DirectiveParser.hpp"
#include "../directive/PropertyTokenizer.hpp"
#include "../directive/SelectorMatcher.hpp"
#include "../binding/BindingParser.hpp"
#include "../../helpers/StringUtils.hpp"

#include <re2/re2.h>

#include <format>

#include <hyprutils/string/String.hpp>
using namespace Hyprutils::String;

using namespace Config;
using namespace Config::Validation;

static const RE2 CONFIG_SHAPE_RE(R"(yabai\s+-m\s+config\s+(\S+)\s+(.+))");
static const RE2 RULE_ADD_RE(R"(yabai\s+-m\s+rule\s+--add\s+(.+))");

static void validateRuleSelectors(DiagnosticList& out, size_t lineNo, const std::string& line, const std::string& command) {
    std::string props;
    if (!RE2::FullMatch(command, RULE_ADD_RE, &props))
        return;

    const auto PROPS = Directive::tokenizeProperties(props);

    for (const auto& key : {"app", "title"}) {
        const auto* TOKEN = PROPS.get(key);
        if (!TOKEN)
            continue;

        Directive::CSelectorMatcher matcher(TOKEN->value);
        if (!matcher.valid())
            out.emplace_back(SDiagnostic{.line = lineNo, .message = std::format("Invalid regular expression in {} selector: {}", key, matcher.error()), .text = line});
    }
}

static void validateYabaiCommand(DiagnosticList& out, size_t lineNo, const std::string& line) {
    const auto COMMAND = Directive::stripTrailingComment(line);

    if (!COMMAND.contains("-m")) {
        out.emplace_back(SDiagnostic{.line = lineNo, .message = "Missing -m flag in yabai command", .text = line});
        return;
    }

    if (COMMAND.contains("-m config") && !RE2::FullMatch(COMMAND, CONFIG_SHAPE_RE)) {
        out.emplace_back(SDiagnostic{.line = lineNo, .message = "Invalid config command format", .text = line});
        return;
    }

    const bool ADD    = COMMAND.contains("--add");
    const bool REMOVE = COMMAND.contains("--remove");

    if (COMMAND.contains("-m rule")) {
        if (!ADD && !REMOVE) {
            out.emplace_back(SDiagnostic{.line = lineNo, .message = "Rule command missing --add or --remove", .text = line});
            return;
        }

        if (ADD)
            validateRuleSelectors(out, lineNo, line, COMMAND);
    }

    if (COMMAND.contains("-m signal")) {
        if (!ADD && !REMOVE) {
            out.emplace_back(SDiagnostic{.line = lineNo, .message = "Signal command missing --add or --remove", .text = line});
            return;
        }

        if (!ADD)
            return;

        if (!COMMAND.contains("event="))
            out.emplace_back(SDiagnostic{.line = lineNo, .message = "Signal --add missing event parameter", .text = line});
        if (!COMMAND.contains("action="))
            out.emplace_back(SDiagnostic{.line = lineNo, .message = "Signal --add missing action parameter", .text = line});
    }
}

DiagnosticList Config::Validation::validateDirectiveText(std::string_view text) {
    DiagnosticList result;
    size_t         lineNo = 0;

    for (const auto& rawLine : NStringUtils::splitLines(text)) {
        ++lineNo;

        const auto LINE = trim(rawLine);

        if (LINE.empty() || LINE.starts_with('#'))
            continue;

        if (LINE.starts_with("yabai ")) {
            validateYabaiCommand(result, lineNo, LINE);
            continue;
        }

        if (LINE.starts_with("echo ") || LINE.contains('='))
            continue;

        result.emplace_back(SDiagnostic{.line = lineNo, .message = "Unrecognized command", .text = LINE});
    }

    return result;
}

DiagnosticList Config::Validation::validateBindingText(std::string_view text) {
    DiagnosticList result;
    size_t         lineNo = 0;

    for (const auto& rawLine : NStringUtils::splitLines(text)) {
        ++lineNo;

        const auto LINE = trim(rawLine);

        if (LINE.empty() || LINE.starts_with('#') || LINE.starts_with("::"))
            continue;

        if (!LINE.contains(':')) {
            result.emplace_back(SDiagnostic{.line = lineNo, .message = "Missing command separator \":\"", .text = LINE});
            continue;
        }

        if (!Binding::parseBindingLine(LINE))
            result.emplace_back(SDiagnostic{.line = lineNo, .message = "Invalid shortcut format", .text = LINE});
    }

    return result;
}
