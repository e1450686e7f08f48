
#include <config/binding/BindingParser.hpp>
#include <config/binding/BindingGenerator.hpp>
#include <config/binding/CategoryClassifier.hpp>
#include <config/validation/ConflictValidator.hpp>

#include <gtest/gtest.h>

using namespace Config;
using namespace Config::Binding;

static SHotkeyBinding binding(const std::string& id, std::vector<std::string> mods, const std::string& key, const std::string& action,
                              std::optional<std::string> category = std::nullopt) {
    return SHotkeyBinding{.id = id, .modifiers = std::move(mods), .key = key, .action = action, .category = std::move(category)};
}

TEST(Binding, modifierKeySplit) {
    const auto PARSED = parseBindingLine("shift + alt - j : yabai -m window --swap south");

    ASSERT_TRUE(PARSED.has_value());
    EXPECT_EQ(PARSED->modifiers, (std::vector<std::string>{"shift", "alt"}));
    EXPECT_EQ(PARSED->key, "j");
    EXPECT_EQ(PARSED->action, "yabai -m window --swap south");
    EXPECT_TRUE(PARSED->enabled);
}

TEST(Binding, hotkeyForms) {
    const auto DASH = parseHotkey("alt-h");
    ASSERT_TRUE(DASH.has_value());
    EXPECT_EQ(DASH->modifiers, std::vector<std::string>{"alt"});
    EXPECT_EQ(DASH->key, "h");

    const auto BARE = parseHotkey("f1");
    ASSERT_TRUE(BARE.has_value());
    EXPECT_TRUE(BARE->modifiers.empty());
    EXPECT_EQ(BARE->key, "f1");

    const auto CASED = parseHotkey("  Shift + ALT - J ");
    ASSERT_TRUE(CASED.has_value());
    EXPECT_EQ(CASED->modifiers, (std::vector<std::string>{"shift", "alt"}));
    EXPECT_EQ(CASED->key, "J");

    // split at the last separator, the key may be a dash itself
    const auto MINUS = parseHotkey("cmd - -");
    ASSERT_TRUE(MINUS.has_value());
    EXPECT_EQ(MINUS->modifiers, std::vector<std::string>{"cmd"});
    EXPECT_EQ(MINUS->key, "-");

    EXPECT_FALSE(parseHotkey("alt - ").has_value());
    EXPECT_FALSE(parseHotkey("alt - two words").has_value());
    EXPECT_FALSE(parseHotkey("+ - j").has_value());
}

TEST(Binding, lineRejects) {
    EXPECT_FALSE(parseBindingLine("").has_value());
    EXPECT_FALSE(parseBindingLine("# alt - h : yabai -m window --focus west").has_value());
    EXPECT_FALSE(parseBindingLine(":: default").has_value());
    EXPECT_FALSE(parseBindingLine("alt - h yabai").has_value());
    EXPECT_FALSE(parseBindingLine("alt - h : ").has_value());

    // only the first " : " splits, the action keeps the rest
    const auto PARSED = parseBindingLine("ctrl - t : echo a : b");
    ASSERT_TRUE(PARSED.has_value());
    EXPECT_EQ(PARSED->action, "echo a : b");
}

TEST(Binding, categoryInference) {
    EXPECT_EQ(classifyBinding("yabai -m window --focus west"), BINDING_CATEGORY_FOCUS);
    EXPECT_EQ(classifyBinding("yabai -m space --layout bsp"), BINDING_CATEGORY_LAYOUT);
    EXPECT_EQ(classifyBinding("open -a Terminal"), BINDING_CATEGORY_CUSTOM);

    EXPECT_EQ(classifyBinding("yabai -m window --warp east"), BINDING_CATEGORY_MOVE);
    EXPECT_EQ(classifyBinding("yabai -m window --resize left:-20:0"), BINDING_CATEGORY_RESIZE);
    EXPECT_EQ(classifyBinding("yabai -m window --toggle zoom-fullscreen"), BINDING_CATEGORY_RESIZE);
    EXPECT_EQ(classifyBinding("yabai -m window --toggle float"), BINDING_CATEGORY_LAYOUT);
    EXPECT_EQ(classifyBinding("yabai -m space --balance"), BINDING_CATEGORY_LAYOUT);
    EXPECT_EQ(classifyBinding("yabai -m space --rotate 90"), BINDING_CATEGORY_LAYOUT);
    EXPECT_EQ(classifyBinding("yabai -m space --focus 2"), BINDING_CATEGORY_SPACE);
    EXPECT_EQ(classifyBinding("yabai -m window --space 3"), BINDING_CATEGORY_SPACE);
    EXPECT_EQ(classifyBinding("yabai -m display --focus next"), BINDING_CATEGORY_DISPLAY);
    EXPECT_EQ(classifyBinding("YABAI -M WINDOW --FOCUS north"), BINDING_CATEGORY_FOCUS);
    EXPECT_EQ(classifyBinding("yabai --restart-service"), BINDING_CATEGORY_CUSTOM);

    // presets fold space and display together
    EXPECT_EQ(classifyPreset("yabai -m space --focus 2"), PRESET_CATEGORY_SPACES);
    EXPECT_EQ(classifyPreset("yabai -m display --focus next"), PRESET_CATEGORY_SPACES);
    EXPECT_EQ(classifyPreset("yabai -m window --focus west"), PRESET_CATEGORY_FOCUS);
}

TEST(Binding, parseFile) {
    const std::string TEXT = R"#(# === Focus ===
# focus west
alt - h : yabai -m window --focus west
# [DISABLED] alt - l : yabai -m window --focus east

# === Uncategorized ===
cmd - return : open -a Terminal
:: passthrough
ctrl - x : yabai -m space --layout bsp
broken line
)#";

    const auto SET = parseBindings(TEXT);
    ASSERT_EQ(SET.bindings().size(), 4);

    const auto& B = SET.bindings();

    EXPECT_EQ(B[0].id, "binding_0");
    EXPECT_EQ(B[0].category, "focus");
    EXPECT_EQ(B[0].description, "focus west");
    EXPECT_TRUE(B[0].enabled);

    EXPECT_EQ(B[1].id, "binding_1");
    EXPECT_EQ(B[1].key, "l");
    EXPECT_EQ(B[1].category, "focus");
    EXPECT_EQ(B[1].description, std::nullopt);
    EXPECT_FALSE(B[1].enabled);

    // no category context, so the classifier picks one
    EXPECT_EQ(B[2].key, "return");
    EXPECT_EQ(B[2].category, "custom");
    EXPECT_EQ(B[3].category, "layout");

    EXPECT_EQ(SET.enabledCount(), 3);
    EXPECT_EQ(SET.disabledCount(), 1);
}

TEST(Binding, generation) {
    const CBindingSet SET{std::vector<SHotkeyBinding>{
        binding("binding_0", {"shift", "alt"}, "j", "yabai -m window --swap south", "move"),
        SHotkeyBinding{.id = "binding_1", .modifiers = {"alt"}, .key = "h", .action = "yabai -m window --focus west", .category = "focus", .description = "focus west"},
        binding("binding_2", {}, "f1", "open -a Terminal"),
    }};

    const std::string EXPECTED = R"#(# skhd configuration
# Generated by yabaiconf

# === Focus ===
# focus west
alt - h : yabai -m window --focus west

# === Move ===
shift + alt - j : yabai -m window --swap south

# === Uncategorized ===
f1 : open -a Terminal

)#";

    EXPECT_EQ(generateBindings(SET), EXPECTED);
    EXPECT_EQ(hotkeyString(SET.bindings()[0]), "shift + alt - j");
    EXPECT_EQ(SET.bindings()[0].displayString(), "⇧⌥J");
}

TEST(Binding, disabledBindingSurvivesRoundTrip) {
    auto disabled        = binding("binding_1", {"alt"}, "l", "yabai -m window --focus east", "focus");
    disabled.enabled     = false;
    disabled.description = "focus east";

    const CBindingSet SET{std::vector<SHotkeyBinding>{binding("binding_0", {"alt"}, "h", "yabai -m window --focus west", "focus"), disabled}};

    const auto        TEXT = generateBindings(SET);
    EXPECT_TRUE(TEXT.contains("# [DISABLED] alt - l : yabai -m window --focus east\n"));

    const auto REPARSED = parseBindings(TEXT);
    ASSERT_EQ(REPARSED.bindings().size(), 2);
    EXPECT_FALSE(REPARSED.bindings()[1].enabled);
    EXPECT_EQ(REPARSED.bindings()[1].description, "focus east");
    EXPECT_EQ(REPARSED, SET);
}

TEST(Binding, roundTrip) {
    auto described        = binding("binding_3", {"cmd"}, "return", "open -a Terminal", "custom");
    described.description = "terminal";

    // already in canonical group order
    const CBindingSet SET{std::vector<SHotkeyBinding>{
        binding("binding_0", {"alt"}, "h", "yabai -m window --focus west", "focus"),
        binding("binding_1", {"shift", "alt"}, "h", "yabai -m window --swap west", "move"),
        binding("binding_2", {"ctrl", "alt"}, "2", "yabai -m space --focus 2", "space"),
        described,
        binding("binding_4", {"hyper"}, "m", "open -a Mail", "my apps"),
    }};

    EXPECT_EQ(parseBindings(generateBindings(SET)), SET);

    // files in any order settle after one pass
    const std::string MESSY = R"#(cmd - m : open -a Mail
alt - h : yabai -m window --focus west
# === Custom ===
ctrl - e : echo hi
)#";

    const auto ONCE  = parseBindings(generateBindings(parseBindings(MESSY)));
    const auto TWICE = parseBindings(generateBindings(ONCE));
    EXPECT_EQ(ONCE, TWICE);
    EXPECT_EQ(generateBindings(ONCE), generateBindings(TWICE));
}

TEST(Binding, conflicts) {
    const CBindingSet SET{std::vector<SHotkeyBinding>{
        binding("binding_0", {"alt"}, "h", "yabai -m window --focus west"),
        binding("binding_1", {"ALT"}, "H", "yabai -m window --swap west"),
        binding("binding_2", {"shift", "alt"}, "j", "a"),
        binding("binding_3", {"alt", "shift", "alt"}, "j", "b"),
    }};

    EXPECT_TRUE(Validation::hasConflict(SET, {"alt"}, "h"));
    EXPECT_TRUE(Validation::hasConflict(SET, {"alt"}, "h", "binding_0"));
    EXPECT_FALSE(Validation::hasConflict(SET, {"cmd"}, "h"));
    EXPECT_EQ(Validation::findConflicts(SET, {"alt", "shift"}, "J").size(), 2);

    const auto ALL = Validation::allConflicts(SET);
    ASSERT_EQ(ALL.size(), 2);
    EXPECT_EQ(ALL[0].first.id, "binding_0");
    EXPECT_EQ(ALL[0].second.id, "binding_1");
    EXPECT_EQ(ALL[1].first.id, "binding_2");
    EXPECT_EQ(ALL[1].second.id, "binding_3");

    EXPECT_EQ(Validation::normalizeModifiers({"Shift", "alt", "shift"}), (std::vector<std::string>{"alt", "shift"}));
}

TEST(Binding, disabledBindingsDontConflict) {
    auto second    = binding("binding_1", {"alt"}, "h", "yabai -m window --swap west");
    second.enabled = false;

    const CBindingSet SET{std::vector<SHotkeyBinding>{binding("binding_0", {"alt"}, "h", "yabai -m window --focus west"), second}};

    EXPECT_TRUE(Validation::allConflicts(SET).empty());
    EXPECT_EQ(Validation::findConflicts(SET, {"alt"}, "h").size(), 1);
    EXPECT_FALSE(Validation::hasConflict(SET, {"alt"}, "h", "binding_0"));
}

TEST(Binding, setEdits) {
    const CBindingSet SET{std::vector<SHotkeyBinding>{binding("binding_0", {"alt"}, "h", "a", "focus"), binding("binding_1", {"alt"}, "j", "b", "move")}};

    EXPECT_FALSE(SET.addBinding(binding("binding_0", {}, "x", "c")).has_value());
    EXPECT_FALSE(SET.addBinding(binding("", {}, "x", "c")).has_value());
    EXPECT_FALSE(SET.updateBinding(binding("binding_9", {}, "x", "c")).has_value());

    const auto ADDED = SET.addBinding(binding(SET.nextId(), {"cmd"}, "x", "c"));
    ASSERT_TRUE(ADDED.has_value());
    EXPECT_EQ(ADDED->bindings().back().id, "binding_2");
    EXPECT_EQ(SET.bindings().size(), 2);

    const auto UPDATED = SET.updateBinding(binding("binding_1", {"alt"}, "k", "b", "move"));
    ASSERT_TRUE(UPDATED.has_value());
    EXPECT_EQ(UPDATED->findBinding("binding_1")->key, "k");

    EXPECT_EQ(SET.removeBinding("binding_0").nextId(), "binding_0");
    EXPECT_EQ(SET.byCategory("move").size(), 1);
    EXPECT_EQ(SET.categories(), (std::vector<std::optional<std::string>>{"focus", "move"}));
}

TEST(Binding, categoriesAreNormalized) {
    const CBindingSet SET{std::vector<SHotkeyBinding>{
        binding("binding_0", {"hyper"}, "m", "open -a Mail", "My Apps"),
        binding("binding_1", {"alt"}, "h", "yabai -m window --focus west", " Focus "),
        binding("binding_2", {"alt"}, "x", "echo", "Uncategorized"),
    }};

    EXPECT_EQ(SET.bindings()[0].category, "my apps");
    EXPECT_EQ(SET.bindings()[1].category, "focus");
    EXPECT_EQ(SET.bindings()[2].category, std::nullopt);

    // edits go through the same normalization
    const auto ADDED = SET.addBinding(binding("binding_3", {"cmd"}, "t", "open -a Terminal", "TOOLS"));
    ASSERT_TRUE(ADDED.has_value());
    EXPECT_EQ(ADDED->findBinding("binding_3")->category, "tools");

    const auto UPDATED = SET.updateBinding(binding("binding_0", {"hyper"}, "m", "open -a Mail", "Mail Stuff"));
    ASSERT_TRUE(UPDATED.has_value());
    EXPECT_EQ(UPDATED->findBinding("binding_0")->category, "mail stuff");

    const CBindingSet NAMED{std::vector<SHotkeyBinding>{binding("binding_0", {"hyper"}, "m", "open -a Mail", "My Apps")}};
    EXPECT_EQ(parseBindings(generateBindings(NAMED)), NAMED);
}

TEST(Binding, markerLikeDescriptionsRoundTrip) {
    auto disabledLike        = binding("binding_0", {"alt"}, "h", "yabai -m window --focus west", "focus");
    disabledLike.description = "[DISABLED] not really";
    auto sectionLike         = binding("binding_1", {"alt"}, "l", "yabai -m window --focus east", "focus");
    sectionLike.description  = "=== Move ===";
    auto escaped             = binding("binding_2", {"alt"}, "j", "yabai -m window --focus south", "focus");
    escaped.description      = "\\ leading backslash";

    const CBindingSet SET{std::vector<SHotkeyBinding>{disabledLike, sectionLike, escaped}};

    const auto        TEXT = generateBindings(SET);
    EXPECT_TRUE(TEXT.contains("# \\[DISABLED] not really\n"));
    EXPECT_TRUE(TEXT.contains("# \\=== Move ===\n"));
    EXPECT_TRUE(TEXT.contains("# \\\\ leading backslash\n"));

    const auto REPARSED = parseBindings(TEXT);
    ASSERT_EQ(REPARSED.bindings().size(), 3);
    EXPECT_TRUE(REPARSED.bindings()[0].enabled);
    EXPECT_EQ(REPARSED.bindings()[1].category, "focus");
    EXPECT_EQ(REPARSED, SET);
}
