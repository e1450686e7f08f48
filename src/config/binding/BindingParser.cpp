#include "BindingParser.hpp"
#include "CategoryClassifier.hpp"
#include "../../helpers/StringUtils.hpp"
#include "../../debug/log/Logger.hpp"

#include <re2/re2.h>

#include <algorithm>
#include <cctype>
#include <format>

#include <hyprutils/string/String.hpp>
#include <hyprutils/string/VarList2.hpp>
using namespace Hyprutils::String;

using namespace Config;
using namespace Config::Binding;

static const RE2 CATEGORY_RE(R"(#\s*===\s*(.+?)\s*===.*)");

static bool hasWhitespace(std::string_view s) {
    return std::ranges::any_of(s, [](unsigned char c) { return std::isspace(c); });
}

std::optional<SHotkey> Config::Binding::parseHotkey(std::string_view hotkey) {
    const auto  TRIMMED = trim(std::string{hotkey});

    std::string modsPart;
    std::string keyPart;

    if (const auto POS = TRIMMED.rfind(" - "); POS != std::string::npos) {
        modsPart = TRIMMED.substr(0, POS);
        keyPart  = TRIMMED.substr(POS + 3);
    } else if (const auto DASH = TRIMMED.rfind('-'); DASH != std::string::npos && DASH > 0 && DASH + 1 < TRIMMED.size()) {
        modsPart = TRIMMED.substr(0, DASH);
        keyPart  = TRIMMED.substr(DASH + 1);
    } else
        keyPart = TRIMMED;

    SHotkey result;
    result.key = trim(keyPart);

    if (result.key.empty() || hasWhitespace(result.key))
        return std::nullopt;

    if (!trim(modsPart).empty()) {
        CVarList2 mods(std::move(modsPart), 0, '+', true);
        for (const auto& m : mods) {
            auto mod = NStringUtils::toLower(trim(std::string{m}));
            if (!mod.empty())
                result.modifiers.emplace_back(std::move(mod));
        }

        // "+ - j" and friends
        if (result.modifiers.empty())
            return std::nullopt;
    }

    return result;
}

std::optional<SHotkeyBinding> Config::Binding::parseBindingLine(std::string_view line, std::string id, std::optional<std::string> category,
                                                                std::optional<std::string> description) {
    const auto TRIMMED = trim(std::string{line});

    if (TRIMMED.empty() || TRIMMED.starts_with('#') || TRIMMED.starts_with("::"))
        return std::nullopt;

    const auto SEP = TRIMMED.find(" : ");
    if (SEP == std::string::npos)
        return std::nullopt;

    const auto ACTION = trim(TRIMMED.substr(SEP + 3));
    if (ACTION.empty())
        return std::nullopt;

    auto hotkey = parseHotkey(TRIMMED.substr(0, SEP));
    if (!hotkey)
        return std::nullopt;

    return SHotkeyBinding{
        .id          = std::move(id),
        .modifiers   = std::move(hotkey->modifiers),
        .key         = std::move(hotkey->key),
        .action      = ACTION,
        .category    = std::move(category),
        .description = std::move(description),
        .enabled     = true,
    };
}

CBindingSet Config::Binding::parseBindings(std::string_view text) {
    std::vector<SHotkeyBinding> bindings;
    size_t                      nextId = 0;
    std::optional<std::string>  currentCategory;
    std::optional<std::string>  pendingDescription;

    for (const auto& rawLine : NStringUtils::splitLines(text)) {
        const auto  LINE = trim(rawLine);

        std::string categoryName;
        if (RE2::FullMatch(LINE, CATEGORY_RE, &categoryName)) {
            currentCategory = normalizeCategory(categoryName);
            pendingDescription.reset();
            continue;
        }

        bool        enabled = true;
        std::string body    = LINE;

        if (LINE.starts_with(DISABLED_PREFIX)) {
            enabled = false;
            body    = trim(LINE.substr(std::string_view{DISABLED_PREFIX}.size()));
        } else if (LINE.starts_with('#')) {
            pendingDescription = trim(LINE.substr(1));
            if (pendingDescription->starts_with(DESCRIPTION_ESCAPE))
                pendingDescription->erase(0, 1);
            continue;
        }

        auto binding = parseBindingLine(body, std::format("binding_{}", nextId), currentCategory, pendingDescription);
        pendingDescription.reset();

        if (!binding) {
            if (!body.empty() && !body.starts_with("::"))
                Log::logger->log(Log::TRACE, "binding: skipping {}", body);
            continue;
        }

        if (!binding->category)
            binding->category = std::string{BINDING_CATEGORIES.toString(classifyBinding(binding->action))};

        binding->enabled = enabled;
        bindings.emplace_back(std::move(*binding));
        nextId++;
    }

    return CBindingSet{std::move(bindings)};
}
