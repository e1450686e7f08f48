#pragma once

#include "HotkeyBinding.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Config::Binding {

    inline constexpr const char* DISABLED_PREFIX = "# [DISABLED]";

    // leads a description comment that would otherwise read as a marker
    inline constexpr char        DESCRIPTION_ESCAPE = '\\';

    struct SHotkey {
        std::vector<std::string> modifiers;
        std::string              key;
    };

    /*
        `shift + alt - j`. Modifiers and key are split at the last " - ",
        falling back to the last '-'. No separator means no modifiers.
        Modifiers are trimmed and lowercased, the key must be one token.
    */
    std::optional<SHotkey>        parseHotkey(std::string_view hotkey);

    /*
        One `hotkey : action` line, split at the first " : ".
        Comments, blank lines and `::` mode declarations give nullopt.
    */
    std::optional<SHotkeyBinding> parseBindingLine(std::string_view line, std::string id = "", std::optional<std::string> category = std::nullopt,
                                                   std::optional<std::string> description = std::nullopt);

    /*
        Whole file. `# === Name ===` sets the category for what follows (Uncategorized clears it),
        other comments become the description of the next binding (one leading \ is dropped), `# [DISABLED] ` lines
        come back with enabled=false. Bindings without a category are classified from their action.
    */
    CBindingSet                   parseBindings(std::string_view text);
}
