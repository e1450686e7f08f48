#include "ConflictValidator.hpp"
#include "../../helpers/StringUtils.hpp"

#include <algorithm>

using namespace Config;
using namespace Config::Validation;

std::vector<std::string> Config::Validation::normalizeModifiers(const std::vector<std::string>& modifiers) {
    std::vector<std::string> result;
    result.reserve(modifiers.size());

    for (const auto& m : modifiers) {
        result.emplace_back(NStringUtils::toLower(m));
    }

    std::ranges::sort(result);
    const auto [first, last] = std::ranges::unique(result);
    result.erase(first, last);

    return result;
}

static bool sameHotkey(const Binding::SHotkeyBinding& binding, const std::vector<std::string>& normalizedMods, const std::string& lowerKey) {
    return NStringUtils::toLower(binding.key) == lowerKey && normalizeModifiers(binding.modifiers) == normalizedMods;
}

std::vector<Binding::SHotkeyBinding> Config::Validation::findConflicts(const Binding::CBindingSet& set, const std::vector<std::string>& modifiers, const std::string& key,
                                                                       const std::optional<std::string>& excludeId) {
    const auto                           MODS = normalizeModifiers(modifiers);
    const auto                           KEY  = NStringUtils::toLower(key);

    std::vector<Binding::SHotkeyBinding> result;

    for (const auto& b : set.bindings()) {
        if (!b.enabled || (excludeId.has_value() && b.id == *excludeId))
            continue;

        if (sameHotkey(b, MODS, KEY))
            result.emplace_back(b);
    }

    return result;
}

bool Config::Validation::hasConflict(const Binding::CBindingSet& set, const std::vector<std::string>& modifiers, const std::string& key,
                                     const std::optional<std::string>& excludeId) {
    const auto MODS = normalizeModifiers(modifiers);
    const auto KEY  = NStringUtils::toLower(key);

    return std::ranges::any_of(set.bindings(), [&](const auto& b) { return b.enabled && (!excludeId.has_value() || b.id != *excludeId) && sameHotkey(b, MODS, KEY); });
}

std::vector<SConflict> Config::Validation::allConflicts(const Binding::CBindingSet& set) {
    std::vector<SConflict> result;
    const auto&            BINDINGS = set.bindings();

    for (size_t i = 0; i < BINDINGS.size(); ++i) {
        if (!BINDINGS[i].enabled)
            continue;

        const auto MODS = normalizeModifiers(BINDINGS[i].modifiers);
        const auto KEY  = NStringUtils::toLower(BINDINGS[i].key);

        for (size_t j = i + 1; j < BINDINGS.size(); ++j) {
            if (BINDINGS[j].enabled && sameHotkey(BINDINGS[j], MODS, KEY))
                result.emplace_back(SConflict{.first = BINDINGS[i], .second = BINDINGS[j]});
        }
    }

    return result;
}
