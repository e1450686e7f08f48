#pragma once

#include "../directive/DirectiveConfig.hpp"
#include "../binding/HotkeyBinding.hpp"

#include <string>
#include <vector>

namespace Config::Validation {

    struct SSettingIssue {
        std::string subject; // setting key, or kind:id for entities
        std::string message;

        bool        operator==(const SSettingIssue&) const = default;
    };

    /*
        Value checks on a parsed model: enumerated settings hold a known value,
        numbers stay in range, colours are 0xAARRGGBB. Also unknown signal events,
        space indices below 1 and repeated space indices.
    */
    std::vector<SSettingIssue> validateSettings(const Directive::CDirectiveConfig& config);

    // modifiers outside the hotkey modifier table, keys skhd doesn't know, empty keys or actions
    std::vector<SSettingIssue> validateBindingSet(const Binding::CBindingSet& set);
}
