#pragma once

#include "../ConfigEnums.hpp"

#include <string_view>

namespace Config::Binding {

    /*
        First match over the lowercased action. Only actions that talk to yabai
        are classified, everything else is custom.
        focus -> move -> resize -> layout -> space / display -> custom
    */
    eBindingCategory classifyBinding(std::string_view action);

    // preset catalogue grouping, space and display land in one bucket
    ePresetCategory  classifyPreset(std::string_view action);
    ePresetCategory  presetCategoryFor(eBindingCategory category);
}
