#pragma once

#include "HotkeyBinding.hpp"

#include <string>

namespace Config::Binding {

    // `shift + alt - j`, or just the key without modifiers
    std::string hotkeyString(const SHotkeyBinding& binding);

    // description comment (if any) plus the binding, disabled ones behind `# [DISABLED] `
    std::string bindingLine(const SHotkeyBinding& binding);

    // grouped by category: focus, move, resize, layout, space, display, custom, Uncategorized, then the rest
    std::string generateBindings(const CBindingSet& set);
}
