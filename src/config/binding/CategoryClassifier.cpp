#include "CategoryClassifier.hpp"
#include "../../helpers/StringUtils.hpp"

#include <algorithm>
#include <initializer_list>
#include <string>

using namespace Config;

static bool containsAny(const std::string& haystack, std::initializer_list<std::string_view> needles) {
    return std::ranges::any_of(needles, [&haystack](std::string_view n) { return haystack.contains(n); });
}

eBindingCategory Config::Binding::classifyBinding(std::string_view action) {
    const auto ACTION = NStringUtils::toLower(action);

    if (!ACTION.contains("yabai"))
        return BINDING_CATEGORY_CUSTOM;

    const bool WINDOW = ACTION.contains("-m window");

    if (WINDOW && ACTION.contains("--focus"))
        return BINDING_CATEGORY_FOCUS;

    if (WINDOW && containsAny(ACTION, {"--swap", "--warp", "--move"}))
        return BINDING_CATEGORY_MOVE;

    if (WINDOW && containsAny(ACTION, {"--resize", "--ratio", "--toggle zoom"}))
        return BINDING_CATEGORY_RESIZE;

    if ((WINDOW || ACTION.contains("-m space")) && ACTION.contains("--toggle"))
        return BINDING_CATEGORY_LAYOUT;

    if (containsAny(ACTION, {"-m config layout", "-m space --layout", "--balance", "--equalize", "--rotate", "--mirror"}))
        return BINDING_CATEGORY_LAYOUT;

    if (containsAny(ACTION, {"-m space", "-m window --space"}))
        return BINDING_CATEGORY_SPACE;

    if (containsAny(ACTION, {"-m display", "-m window --display"}))
        return BINDING_CATEGORY_DISPLAY;

    return BINDING_CATEGORY_CUSTOM;
}

ePresetCategory Config::Binding::presetCategoryFor(eBindingCategory category) {
    switch (category) {
        case BINDING_CATEGORY_FOCUS: return PRESET_CATEGORY_FOCUS;
        case BINDING_CATEGORY_MOVE: return PRESET_CATEGORY_MOVE;
        case BINDING_CATEGORY_RESIZE: return PRESET_CATEGORY_RESIZE;
        case BINDING_CATEGORY_LAYOUT: return PRESET_CATEGORY_LAYOUT;
        case BINDING_CATEGORY_SPACE:
        case BINDING_CATEGORY_DISPLAY: return PRESET_CATEGORY_SPACES;
        case BINDING_CATEGORY_CUSTOM: return PRESET_CATEGORY_CUSTOM;
    }
    return PRESET_CATEGORY_CUSTOM;
}

ePresetCategory Config::Binding::classifyPreset(std::string_view action) {
    return presetCategoryFor(classifyBinding(action));
}
