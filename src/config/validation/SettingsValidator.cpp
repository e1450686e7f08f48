#include "SettingsValidator.hpp"
#include "../directive/SettingDescriptions.hpp"

#include <re2/re2.h>

#include <algorithm>
#include <format>
#include <set>

using namespace Config;
using namespace Config::Validation;

static const RE2 COLOR_RE(R"(0x[0-9a-fA-F]{8})");

static std::string joined(const std::vector<std::string>& v) {
    std::string result;
    for (const auto& s : v) {
        if (!result.empty())
            result += ", ";
        result += s;
    }
    return result;
}

static std::optional<std::string> checkValue(const Directive::SSettingDescription& desc, const SETTINGVALUE& value) {
    if (settingTypeOf(value) != desc.type && !(desc.type == SETTING_TYPE_FLOAT && settingTypeOf(value) == SETTING_TYPE_INT))
        return std::format("expected a {} value", settingTypeName(desc.type));

    if (const auto* CHOICES = std::get_if<Directive::SSettingDescription::SChoiceData>(&desc.data)) {
        const auto STR = settingValueToString(value);
        if (std::ranges::find(CHOICES->choices, STR) == CHOICES->choices.end())
            return std::format("\"{}\" is not one of {}", STR, joined(CHOICES->choices));
    } else if (const auto* RANGE = std::get_if<Directive::SSettingDescription::SRangeData>(&desc.data)) {
        const double NUM = std::holds_alternative<double>(value) ? std::get<double>(value) : static_cast<double>(std::get<int64_t>(value));

        const bool   BELOW = RANGE->minExclusive ? NUM <= RANGE->min : NUM < RANGE->min;
        const bool   ABOVE = RANGE->maxExclusive ? NUM >= RANGE->max : NUM > RANGE->max;

        if (BELOW || ABOVE)
            return std::format("{} is outside {}{}, {}{}", settingValueToString(value), RANGE->minExclusive ? "(" : "[", RANGE->min, RANGE->max, RANGE->maxExclusive ? ")" : "]");
    } else if (std::holds_alternative<Directive::SSettingDescription::SColorData>(desc.data)) {
        const auto STR = settingValueToString(value);
        if (!RE2::FullMatch(STR, COLOR_RE))
            return std::format("\"{}\" is not a 0xAARRGGBB colour", STR);
    }

    return std::nullopt;
}

std::vector<SSettingIssue> Config::Validation::validateSettings(const Directive::CDirectiveConfig& config) {
    std::vector<SSettingIssue> issues;

    for (const auto& desc : Directive::settingDescriptions()) {
        const auto VALUE = config.getSetting(desc.key);
        if (!VALUE)
            continue;

        if (const auto PROBLEM = checkValue(desc, *VALUE); PROBLEM)
            issues.emplace_back(SSettingIssue{.subject = desc.key, .message = *PROBLEM});
    }

    for (const auto& signal : config.signals()) {
        if (!isKnownSignalEvent(signal.event))
            issues.emplace_back(SSettingIssue{.subject = std::format("signal:{}", signal.id), .message = std::format("unknown event \"{}\"", signal.event)});
    }

    std::set<int64_t> seen;
    for (const auto& space : config.spaces()) {
        const auto SUBJECT = std::format("space:{}", space.index);

        if (space.index < 1)
            issues.emplace_back(SSettingIssue{.subject = SUBJECT, .message = "space indices start at 1"});

        if (!seen.insert(space.index).second)
            issues.emplace_back(SSettingIssue{.subject = SUBJECT, .message = "space configured more than once"});
    }

    return issues;
}

std::vector<SSettingIssue> Config::Validation::validateBindingSet(const Binding::CBindingSet& set) {
    std::vector<SSettingIssue> issues;

    for (const auto& b : set.bindings()) {
        const auto SUBJECT = std::format("binding:{}", b.id);

        for (const auto& m : b.modifiers) {
            if (!HOTKEY_MODIFIERS.contains(m))
                issues.emplace_back(SSettingIssue{.subject = SUBJECT, .message = std::format("unknown modifier \"{}\"", m)});
        }

        if (b.key.empty())
            issues.emplace_back(SSettingIssue{.subject = SUBJECT, .message = "no key"});
        else if (!b.hasValidKey())
            issues.emplace_back(SSettingIssue{.subject = SUBJECT, .message = std::format("unknown key \"{}\"", b.key)});

        if (b.action.empty())
            issues.emplace_back(SSettingIssue{.subject = SUBJECT, .message = "no action"});
    }

    return issues;
}
