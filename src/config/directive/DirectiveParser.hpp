#pragma once

#include "DirectiveConfig.hpp"
#include "PropertyTokenizer.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Config::Directive {

    inline constexpr const char* DISABLED_PREFIX = "# [DISABLED] ";

    /*
        Builds a config from directive text. Never fails: unparsable lines are skipped,
        selector-less rules and incomplete signals are dropped. Identifiers (rule_N,
        exclusion_N, signal_N) are numbered per call.
    */
    CDirectiveConfig              parseDirectives(std::string_view text);

    // every `rule --add` line through the exclusion builder
    std::vector<SExclusionRule>   parseExclusionRules(std::string_view text);

    std::optional<SWindowRule>    buildWindowRule(const CPropertyMap& props, std::string id);
    std::optional<SExclusionRule> buildExclusionRule(const CPropertyMap& props, std::string id);
    std::optional<SSignal>        buildSignal(const CPropertyMap& props, std::string id);

    // drops a ` #` comment that is not inside quotes, and trims
    std::string                   stripTrailingComment(std::string_view line);

    // `# === Name ===`, returns Name
    std::optional<std::string>    sectionMarker(std::string_view line);
}
