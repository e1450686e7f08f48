#include "SettingDescriptions.hpp"

#include <algorithm>

using namespace Config::Directive;

const char* Config::Directive::settingSectionTitle(eSettingSection section) {
    switch (section) {
        case SETTING_SECTION_LAYOUT: return "Layout";
        case SETTING_SECTION_GAPS: return "Gaps and Padding";
        case SETTING_SECTION_EXTERNAL_BAR: return "External Bar";
        case SETTING_SECTION_MOUSE: return "Mouse";
        case SETTING_SECTION_APPEARANCE: return "Window Appearance";
        case SETTING_SECTION_BORDERS: return "Window Borders";
    }
    return "";
}

const std::vector<SSettingDescription>& Config::Directive::settingDescriptions() {
    return SETTING_DESCRIPTIONS;
}

const SSettingDescription* Config::Directive::findSetting(std::string_view key) {
    const auto IT = std::ranges::find_if(SETTING_DESCRIPTIONS, [key](const auto& d) { return d.key == key; });
    return IT == SETTING_DESCRIPTIONS.end() ? nullptr : &*IT;
}
