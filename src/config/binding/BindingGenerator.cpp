#include "BindingGenerator.hpp"
#include "BindingParser.hpp"

#include <algorithm>
#include <format>

#include <hyprutils/string/String.hpp>
using namespace Hyprutils::String;

using namespace Config;
using namespace Config::Binding;

std::string Config::Binding::hotkeyString(const SHotkeyBinding& binding) {
    if (binding.modifiers.empty())
        return binding.key;

    std::string mods;
    for (const auto& m : binding.modifiers) {
        if (!mods.empty())
            mods += " + ";
        mods += m;
    }

    return std::format("{} - {}", mods, binding.key);
}

std::string Config::Binding::bindingLine(const SHotkeyBinding& binding) {
    std::string out;

    if (binding.description.has_value()) {
        auto desc = *binding.description;
        std::ranges::replace(desc, '\n', ' ');

        const auto LEAD = trim(desc);
        if (LEAD.starts_with("[DISABLED]") || LEAD.starts_with("===") || LEAD.starts_with(DESCRIPTION_ESCAPE))
            desc.insert(desc.begin(), DESCRIPTION_ESCAPE);

        out += std::format("# {}\n", desc);
    }

    const auto LINE = std::format("{} : {}", hotkeyString(binding), binding.action);

    if (!binding.enabled)
        out += std::format("{} {}", DISABLED_PREFIX, LINE);
    else
        out += LINE;

    return out;
}

// known categories in table order, then null, then unknown ones
static size_t categoryRank(const std::optional<std::string>& category) {
    const size_t KNOWN = BINDING_CATEGORIES.entries().size();

    if (!category.has_value())
        return KNOWN;

    if (const auto CAT = BINDING_CATEGORIES.fromString(*category); CAT)
        return static_cast<size_t>(*CAT);

    return KNOWN + 1;
}

static std::string categoryTitle(const std::optional<std::string>& category) {
    if (!category.has_value())
        return "Uncategorized";

    if (const auto CAT = BINDING_CATEGORIES.fromString(*category); CAT)
        return std::string{BINDING_CATEGORIES.displayName(*CAT)};

    return *category;
}

std::string Config::Binding::generateBindings(const CBindingSet& set) {
    std::string out = "# skhd configuration\n# Generated by yabaiconf\n\n";

    auto        groups = set.categories();
    std::ranges::stable_sort(groups, [](const auto& a, const auto& b) { return categoryRank(a) < categoryRank(b); });

    for (const auto& category : groups) {
        out += std::format("# === {} ===\n", categoryTitle(category));

        for (const auto& binding : set.byCategory(category)) {
            out += bindingLine(binding);
            out += '\n';
        }

        out += '\n';
    }

    return out;
}
