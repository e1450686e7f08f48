#include "DirectiveGenerator.hpp"
#include "DirectiveParser.hpp"
#include "PropertyTokenizer.hpp"
#include "SettingDescriptions.hpp"

#include <format>

using namespace Config;
using namespace Config::Directive;

static std::string anchored(const std::string& app) {
    return quoteValue("^" + app + "$");
}

static std::string withState(const std::string& line, bool enabled) {
    if (line.empty() || enabled)
        return line;
    return DISABLED_PREFIX + line;
}

std::string Config::Directive::settingLine(const std::string& key, const std::string& value) {
    return std::format("yabai -m config {} {}", key, value);
}

std::string Config::Directive::exclusionLine(const SExclusionRule& rule) {
    if (rule.app.empty() || !rule.hasActions())
        return "";

    std::string line = std::format("yabai -m rule --add app={}", anchored(rule.app));

    if (rule.title.has_value() && !rule.title->empty())
        line += std::format(" title={}", quoteValue(*rule.title));
    if (rule.manageOff)
        line += " manage=off";
    if (rule.sticky)
        line += " sticky=on";
    if (rule.layer != WINDOW_LAYER_NORMAL)
        line += std::format(" layer={}", WINDOW_LAYERS.toString(rule.layer));
    if (rule.space.has_value())
        line += std::format(" space={}", *rule.space);

    return withState(line, rule.enabled);
}

std::string Config::Directive::windowRuleLine(const SWindowRule& rule) {
    if (!rule.hasSelector())
        return "";

    std::string line = "yabai -m rule --add";

    if (rule.app.has_value() && !rule.app->empty())
        line += std::format(" app={}", anchored(*rule.app));
    if (rule.title.has_value() && !rule.title->empty())
        line += std::format(" title={}", quoteValue(*rule.title));

    line += rule.manage ? " manage=on" : " manage=off";

    if (rule.sticky.has_value())
        line += *rule.sticky ? " sticky=on" : " sticky=off";
    if (rule.layer.has_value())
        line += std::format(" layer={}", WINDOW_LAYERS.toString(*rule.layer));
    if (rule.space.has_value())
        line += std::format(" space={}", *rule.space);

    return withState(line, rule.enabled);
}

std::string Config::Directive::signalLine(const SSignal& signal) {
    if (!signal.complete())
        return "";

    std::string line = "yabai -m signal --add";

    if (signal.label.has_value() && !signal.label->empty())
        line += std::format(" label={}", quoteValue(*signal.label));

    line += std::format(" event={} action={}", signal.event, quoteValue(signal.action));

    return withState(line, signal.enabled);
}

std::vector<std::string> Config::Directive::spaceLines(const SSpaceConfig& space) {
    std::vector<std::string> lines;

    if (space.label.has_value())
        lines.emplace_back(std::format("yabai -m space {} --label {}", space.index, quoteValue(*space.label)));
    if (space.layout.has_value())
        lines.emplace_back(std::format("yabai -m config --space {} layout {}", space.index, LAYOUTS.toString(*space.layout)));

    const std::pair<const char*, const std::optional<int64_t>*> INTS[] = {
        {"window_gap", &space.gap},
        {"top_padding", &space.topPadding},
        {"bottom_padding", &space.bottomPadding},
        {"left_padding", &space.leftPadding},
        {"right_padding", &space.rightPadding},
    };

    for (const auto& [key, value] : INTS) {
        if (value->has_value())
            lines.emplace_back(std::format("yabai -m config --space {} {} {}", space.index, key, **value));
    }

    for (const auto& [key, value] : space.extras) {
        lines.emplace_back(std::format("yabai -m config --space {} {} {}", space.index, key, value));
    }

    return lines;
}

static void writeLine(std::string& out, const std::string& line) {
    out += line;
    out += '\n';
}

static void writeSettingSection(std::string& out, const CDirectiveConfig& config, eSettingSection section) {
    std::vector<std::string> lines;

    for (const auto& desc : settingDescriptions()) {
        if (desc.section != section)
            continue;

        if (!desc.toggle.empty() && !config.getBool(desc.toggle))
            continue;

        const auto VALUE = config.getSetting(desc.key);
        if (!VALUE)
            continue;

        lines.emplace_back(settingLine(desc.key, settingValueToString(*VALUE)));
    }

    // a section whose only setting is unset is left out entirely
    if (lines.empty())
        return;

    writeLine(out, std::format("# === {} ===", settingSectionTitle(section)));
    for (const auto& l : lines) {
        writeLine(out, l);
    }
    writeLine(out, "");
}

std::string Config::Directive::generateDirectives(const CDirectiveConfig& config) {
    std::string out;

    writeLine(out, "#!/usr/bin/env sh");
    writeLine(out, "");
    writeLine(out, "# yabai configuration");
    writeLine(out, "# Generated by yabaiconf");
    writeLine(out, "");

    // exclusions go first so they apply before anything else is set up
    writeLine(out, "# === Window Rules (Exclusions) ===");
    for (const auto& rule : config.exclusions()) {
        if (const auto LINE = exclusionLine(rule); !LINE.empty())
            writeLine(out, LINE);
    }
    writeLine(out, "");

    if (!config.rules().empty()) {
        writeLine(out, "# === Window Rules ===");
        for (const auto& rule : config.rules()) {
            if (const auto LINE = windowRuleLine(rule); !LINE.empty())
                writeLine(out, LINE);
        }
        writeLine(out, "");
    }

    for (const auto SECTION : {SETTING_SECTION_LAYOUT, SETTING_SECTION_GAPS, SETTING_SECTION_EXTERNAL_BAR, SETTING_SECTION_MOUSE, SETTING_SECTION_APPEARANCE, SETTING_SECTION_BORDERS}) {
        writeSettingSection(out, config, SECTION);
    }

    if (!config.extraSettings().empty()) {
        writeLine(out, "# === Additional Settings ===");
        for (const auto& [key, value] : config.extraSettings()) {
            writeLine(out, settingLine(key, value));
        }
        writeLine(out, "");
    }

    if (!config.spaces().empty()) {
        writeLine(out, "# === Space Configurations ===");
        for (const auto& space : config.spaces()) {
            for (const auto& l : spaceLines(space)) {
                writeLine(out, l);
            }
        }
        writeLine(out, "");
    }

    if (!config.signals().empty()) {
        writeLine(out, "# === Signals ===");
        for (const auto& signal : config.signals()) {
            if (const auto LINE = signalLine(signal); !LINE.empty())
                writeLine(out, LINE);
        }
        writeLine(out, "");
    }

    writeLine(out, "echo \"yabai configuration loaded...\"");

    return out;
}
