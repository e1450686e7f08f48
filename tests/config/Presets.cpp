
#include <config/binding/Presets.hpp>
#include <config/binding/BindingParser.hpp>
#include <config/binding/BindingGenerator.hpp>
#include <config/validation/ConflictValidator.hpp>
#include <config/validation/SettingsValidator.hpp>

#include <gtest/gtest.h>

#include <algorithm>

using namespace Config;
using namespace Config::Binding;

TEST(Presets, catalogue) {
    EXPECT_EQ(PRESETS.strings(), (std::vector<std::string>{"vim", "arrows", "minimal", "i3", "stack"}));
    EXPECT_EQ(PRESETS.fromString("I3"), PRESET_I3);
    EXPECT_EQ(PRESETS.displayName(PRESET_STACK), "Stack Focused");

    EXPECT_EQ(presetBindings(PRESET_VIM).bindings().size(), 44);
    EXPECT_EQ(presetBindings(PRESET_ARROWS).bindings().size(), 32);
    EXPECT_EQ(presetBindings(PRESET_MINIMAL).bindings().size(), 11);
    EXPECT_EQ(presetBindings(PRESET_I3).bindings().size(), 38);
    EXPECT_EQ(presetBindings(PRESET_STACK).bindings().size(), 10);
}

TEST(Presets, bindingsAreCleanAndFormatStable) {
    for (const auto& entry : PRESETS.entries()) {
        const auto SET = presetBindings(entry.value);

        EXPECT_TRUE(Validation::validateBindingSet(SET).empty()) << entry.str;
        EXPECT_TRUE(Validation::allConflicts(SET).empty()) << entry.str;

        // writing groups by category, so only the ids may move
        const auto ONCE = parseBindings(generateBindings(SET));
        ASSERT_EQ(ONCE.bindings().size(), SET.bindings().size()) << entry.str;
        for (const auto& b : SET.bindings()) {
            const auto SAME = std::ranges::find_if(ONCE.bindings(), [&b](const auto& o) {
                return o.modifiers == b.modifiers && o.key == b.key && o.action == b.action && o.category == b.category && o.description == b.description;
            });
            EXPECT_NE(SAME, ONCE.bindings().end()) << entry.str << " " << b.id;
        }

        EXPECT_EQ(parseBindings(generateBindings(ONCE)), ONCE) << entry.str;
    }
}

TEST(Presets, entries) {
    const auto VIM = presetBindings(PRESET_VIM);

    const auto FIRST = VIM.findBinding("binding_0");
    ASSERT_TRUE(FIRST.has_value());
    EXPECT_EQ(FIRST->modifiers, std::vector<std::string>{"alt"});
    EXPECT_EQ(FIRST->key, "h");
    EXPECT_EQ(FIRST->action, "yabai -m window --focus west");
    EXPECT_EQ(FIRST->category, "focus");
    EXPECT_EQ(FIRST->description, "Focus window to the west");

    EXPECT_EQ(VIM.findBinding("binding_12")->action, "yabai -m window --resize left:-50:0");
    EXPECT_EQ(VIM.findBinding("binding_16")->action, "yabai -m space --focus 1");
    EXPECT_EQ(VIM.findBinding("binding_16")->category, "space");

    // workspace 10 sits on the 0 key
    const auto I3    = presetBindings(PRESET_I3);
    const auto TENTH = I3.findBinding("binding_17");
    ASSERT_TRUE(TENTH.has_value());
    EXPECT_EQ(TENTH->key, "0");
    EXPECT_EQ(TENTH->action, "yabai -m space --focus 10");
    EXPECT_EQ(TENTH->description, "Focus workspace 10");
    EXPECT_EQ(I3.findBinding("binding_3")->key, ";");
}

TEST(Presets, groups) {
    const auto GROUPS = presetGroups(PRESET_VIM);

    std::vector<ePresetCategory> order;
    size_t                       total = 0;
    for (const auto& [category, bindings] : GROUPS) {
        order.emplace_back(category);
        total += bindings.size();
    }

    EXPECT_EQ(order, (std::vector<ePresetCategory>{PRESET_CATEGORY_FOCUS, PRESET_CATEGORY_MOVE, PRESET_CATEGORY_RESIZE, PRESET_CATEGORY_LAYOUT, PRESET_CATEGORY_SPACES}));
    EXPECT_EQ(total, presetBindings(PRESET_VIM).bindings().size());

    // spaces and displays share a bucket
    EXPECT_EQ(GROUPS[4].second.size(), 22);

    const auto STACK = presetGroups(PRESET_STACK);
    ASSERT_FALSE(STACK.empty());
    EXPECT_EQ(STACK.back().first, PRESET_CATEGORY_CUSTOM);
    EXPECT_EQ(STACK.back().second.size(), 4);
}
