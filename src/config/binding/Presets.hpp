#pragma once

#include "HotkeyBinding.hpp"

#include <utility>
#include <vector>

namespace Config::Binding {

    /*
        The bindings of one preset in table order, ids binding_0 onwards.
        Categories come from classifyBinding, the same way a file without markers is read.
    */
    CBindingSet presetBindings(ePreset preset);

    // preset bindings in catalogue buckets, PRESET_CATEGORIES order, empty buckets left out
    std::vector<std::pair<ePresetCategory, std::vector<SHotkeyBinding>>> presetGroups(ePreset preset);
}
