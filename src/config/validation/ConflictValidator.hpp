#pragma once

#include "../binding/HotkeyBinding.hpp"

#include <optional>
#include <string>
#include <vector>

namespace Config::Validation {

    // case folded, sorted, without duplicates
    std::vector<std::string>             normalizeModifiers(const std::vector<std::string>& modifiers);

    // enabled bindings with the same modifier set and the same key, case-insensitively
    bool                                 hasConflict(const Binding::CBindingSet& set, const std::vector<std::string>& modifiers, const std::string& key,
                                                     const std::optional<std::string>& excludeId = std::nullopt);
    std::vector<Binding::SHotkeyBinding> findConflicts(const Binding::CBindingSet& set, const std::vector<std::string>& modifiers, const std::string& key,
                                                       const std::optional<std::string>& excludeId = std::nullopt);

    struct SConflict {
        Binding::SHotkeyBinding first;
        Binding::SHotkeyBinding second;
    };

    // every conflicting pair, in set order
    std::vector<SConflict> allConflicts(const Binding::CBindingSet& set);
}
