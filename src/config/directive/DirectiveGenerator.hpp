#pragma once

#include "DirectiveConfig.hpp"

#include <string>
#include <vector>

namespace Config::Directive {

    /*
        Canonical directive text. Section order is fixed:
        header, exclusions, window rules, layout, gaps, external bar, mouse,
        appearance, borders, additional settings, spaces, signals, status line.
        Disabled rules and signals are kept as `# [DISABLED] ` lines.
    */
    std::string              generateDirectives(const CDirectiveConfig& config);

    // single entity renderers, empty when the entity renders to nothing
    std::string              exclusionLine(const SExclusionRule& rule);
    std::string              windowRuleLine(const SWindowRule& rule);
    std::string              signalLine(const SSignal& signal);
    std::vector<std::string> spaceLines(const SSpaceConfig& space);
    std::string              settingLine(const std::string& key, const std::string& value);
}
