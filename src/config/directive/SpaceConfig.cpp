#include "SpaceConfig.hpp"
#include "../../helpers/StringUtils.hpp"

#include <algorithm>
#include <format>

using namespace Config::Directive;

std::string SSpaceConfig::displayName() const {
    if (label.has_value() && !label->empty())
        return *label;
    return std::format("Space {}", index);
}

static std::optional<int64_t>* intField(SSpaceConfig& space, const std::string& key) {
    if (key == "window_gap")
        return &space.gap;
    if (key == "top_padding")
        return &space.topPadding;
    if (key == "bottom_padding")
        return &space.bottomPadding;
    if (key == "left_padding")
        return &space.leftPadding;
    if (key == "right_padding")
        return &space.rightPadding;
    return nullptr;
}

bool SSpaceConfig::applyOverride(const std::string& key, const std::string& value) {
    std::erase_if(extras, [&key](const auto& e) { return e.first == key; });

    if (key == "layout") {
        layout = LAYOUTS.fromString(value);
        if (layout)
            return true;
    } else if (auto* field = intField(*this, key); field) {
        *field = NStringUtils::parseInt(value);
        if (field->has_value())
            return true;
    }

    extras.emplace_back(key, value);
    return false;
}
