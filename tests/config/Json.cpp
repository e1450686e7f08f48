
#include <config/json/JsonExchange.hpp>
#include <config/directive/DirectiveParser.hpp>
#include <config/binding/BindingParser.hpp>
#include <config/binding/BindingGenerator.hpp>

#include <gtest/gtest.h>

using namespace Config;
using namespace Config::Json;

static Directive::CDirectiveConfig sampleDirectives() {
    return Directive::parseDirectives(R"#(
yabai -m config layout stack
yabai -m config window_gap 12
yabai -m config split_ratio 0.35
yabai -m config window_border on
yabai -m config external_bar main:24:0
yabai -m config menubar_opacity 0.5

# === Window Rules (Exclusions) ===
yabai -m rule --add app="^Finder$" manage=off
yabai -m rule --add app="^Raycast$" title="Settings" sticky=on layer=above space=2

# === Window Rules ===
yabai -m rule --add app="^Firefox$" manage=on
# [DISABLED] yabai -m rule --add title="Picture-in-Picture" manage=off sticky=on

yabai -m signal --add label="focus" event=window_focused action="echo \"hi\""
yabai -m space 1 --label "web"
yabai -m config --space 3 layout float
yabai -m config --space 3 left_padding 40
yabai -m config --space 3 auto_balance on
)#");
}

TEST(Json, directiveRoundTrip) {
    const auto CONFIG = sampleDirectives();

    ASSERT_EQ(CONFIG.exclusions().size(), 2);
    ASSERT_EQ(CONFIG.rules().size(), 2);
    ASSERT_EQ(CONFIG.extraSettings().size(), 1);

    const auto JSON = directiveToJson(CONFIG);
    ASSERT_TRUE(JSON.has_value()) << JSON.error().message;

    const auto BACK = directiveFromJson(*JSON);
    ASSERT_TRUE(BACK.has_value()) << BACK.error().message;
    EXPECT_EQ(*BACK, CONFIG);

    // settings keep their declared types across the number-only json side
    EXPECT_EQ(BACK->getSetting("window_gap"), SETTINGVALUE{int64_t{12}});
    EXPECT_EQ(BACK->getSetting("active_window_opacity"), SETTINGVALUE{1.0});

    ASSERT_TRUE(BACK->findSpace(3).has_value());
    EXPECT_EQ(BACK->findSpace(3)->extras, (std::vector<std::pair<std::string, std::string>>{{"auto_balance", "on"}}));
}

TEST(Json, directiveFieldNames) {
    const auto JSON = directiveToJson(sampleDirectives());
    ASSERT_TRUE(JSON.has_value());

    for (const auto& field : {"\"settings\"", "\"extraSettings\"", "\"appName\"", "\"manageOff\"", "\"titlePattern\"", "\"assignedSpace\"", "\"isEnabled\"",
                              "\"leftPadding\"", "\"window_gap\"", "\"menubar_opacity\""}) {
        EXPECT_TRUE(JSON->contains(field)) << field;
    }
}

TEST(Json, missingSectionsTakeDefaults) {
    const auto CONFIG = directiveFromJson(R"({"settings": {"layout": "float"}})");
    ASSERT_TRUE(CONFIG.has_value());

    EXPECT_EQ(CONFIG->getString("layout"), "float");
    EXPECT_EQ(CONFIG->getInt("window_gap"), 6);
    EXPECT_TRUE(CONFIG->rules().empty());

    const auto EMPTY = directiveFromJson("{}");
    ASSERT_TRUE(EMPTY.has_value());
    EXPECT_EQ(*EMPTY, Directive::CDirectiveConfig{});
}

TEST(Json, syntaxErrors) {
    for (const auto& text : {"", "not json", "{\"settings\": ", "[1, 2"}) {
        const auto RESULT = directiveFromJson(text);
        ASSERT_FALSE(RESULT.has_value()) << text;
        EXPECT_EQ(RESULT.error().kind, JSON_ERROR_SYNTAX) << text;
    }

    EXPECT_EQ(bindingsFromJson("{,}").error().kind, JSON_ERROR_SYNTAX);
    EXPECT_EQ(exclusionsFromJson("nope").error().kind, JSON_ERROR_SYNTAX);
}

TEST(Json, shapeErrors) {
    const std::vector<std::string> BAD_DIRECTIVES = {
        "[]",
        R"({"settings": []})",
        R"({"settings": {"no_such_setting": 1}})",
        R"({"settings": {"window_gap": "wide"}})",
        R"({"settings": {"window_gap": 1.5}})",
        R"({"settings": {"auto_balance": "on"}})",
        R"({"extraSettings": [{"key": "layout", "value": "bsp"}]})",
        R"({"rules": [{"id": "rule_0", "manage": false}]})",
        R"({"rules": [{"id": "rule_0", "appName": "a", "layer": "sideways"}]})",
        R"({"signals": [{"id": "signal_0", "event": "window_focused"}]})",
        R"({"spaces": [{"index": 1}, {"index": 1}]})",
        R"({"exclusions": [{"id": "a", "appName": "x"}, {"id": "a", "appName": "y"}]})",
        R"({"spaces": [{"index": 1, "extraSettings": {}}]})",
        R"({"spaces": [{"index": 1, "extraSettings": [{"key": "window_gap", "value": "4"}]}]})",
        R"({"spaces": [{"index": 1, "layout": "bsp", "extraSettings": [{"key": "layout", "value": "tiled"}]}]})",
        R"({"spaces": [{"index": 1, "extraSettings": [{"key": "a", "value": "1"}, {"key": "a", "value": "2"}]}]})",
        R"({"spaces": [{"index": 1, "extraSettings": [{"key": "two words", "value": "1"}]}]})",
    };

    for (const auto& text : BAD_DIRECTIVES) {
        const auto RESULT = directiveFromJson(text);
        ASSERT_FALSE(RESULT.has_value()) << text;
        EXPECT_EQ(RESULT.error().kind, JSON_ERROR_SHAPE) << text;
        EXPECT_FALSE(RESULT.error().message.empty()) << text;
    }

    const auto MISSING = directiveFromJson(R"({"signals": [{"id": "signal_0", "event": "window_focused"}]})");
    EXPECT_EQ(MISSING.error().message, "$.signals[0].action: missing");
}

TEST(Json, bindingsRoundTrip) {
    const auto SET = Binding::parseBindings(R"#(# === Focus ===
# focus west
alt - h : yabai -m window --focus west
# [DISABLED] alt - l : yabai -m window --focus east
# === Tools ===
cmd + shift - t : open -a "Terminal"
)#");

    // a null category can't come from text, but json keeps it
    const auto WITH_NULL = SET.addBinding(Binding::SHotkeyBinding{.id = "binding_9", .modifiers = {}, .key = "f1", .action = "echo"});
    ASSERT_TRUE(WITH_NULL.has_value());

    const auto JSON = bindingsToJson(*WITH_NULL);
    ASSERT_TRUE(JSON.has_value());
    EXPECT_TRUE(JSON->contains("\"bindings\""));

    const auto BACK = bindingsFromJson(*JSON);
    ASSERT_TRUE(BACK.has_value()) << BACK.error().message;
    EXPECT_EQ(*BACK, *WITH_NULL);
    EXPECT_EQ(BACK->findBinding("binding_9")->category, std::nullopt);
}

TEST(Json, bindingCategoriesLoadLowercase) {
    const auto SET = bindingsFromJson(R"({"bindings": [{"id": "a", "key": "m", "action": "open -a Mail", "modifiers": ["hyper"], "category": "My Apps"}]})");
    ASSERT_TRUE(SET.has_value()) << SET.error().message;
    EXPECT_EQ(SET->findBinding("a")->category, "my apps");

    const auto REPARSED = Binding::parseBindings(Binding::generateBindings(*SET));
    ASSERT_EQ(REPARSED.bindings().size(), 1);
    EXPECT_EQ(REPARSED.bindings()[0].category, "my apps");
}

TEST(Json, bindingShapeErrors) {
    const std::vector<std::string> BAD = {
        R"({"bindings": {}})",
        R"({"bindings": [{"id": "a", "key": "h", "action": "x"}]})",
        R"({"bindings": [{"id": "a", "key": "h", "action": "x", "modifiers": "alt"}]})",
        R"({"bindings": [{"id": "a", "key": "h", "action": "x", "modifiers": [1]}]})",
        R"({"bindings": [{"id": "a", "key": "h", "action": "x", "modifiers": []}, {"id": "a", "key": "j", "action": "y", "modifiers": []}]})",
    };

    for (const auto& text : BAD) {
        const auto RESULT = bindingsFromJson(text);
        ASSERT_FALSE(RESULT.has_value()) << text;
        EXPECT_EQ(RESULT.error().kind, JSON_ERROR_SHAPE) << text;
    }

    const auto EMPTY = bindingsFromJson("{}");
    ASSERT_TRUE(EMPTY.has_value());
    EXPECT_TRUE(EMPTY->bindings().empty());
}

TEST(Json, exclusionsRoundTrip) {
    const auto RULES = Directive::parseExclusionRules(R"#(yabai -m rule --add app="^Finder$" manage=off
# [DISABLED] yabai -m rule --add app="^Steam$" title="Friends" layer=below space=4
)#");
    ASSERT_EQ(RULES.size(), 2);

    const auto JSON = exclusionsToJson(RULES);
    ASSERT_TRUE(JSON.has_value());

    const auto BACK = exclusionsFromJson(*JSON);
    ASSERT_TRUE(BACK.has_value()) << BACK.error().message;
    EXPECT_EQ(*BACK, RULES);

    // anchors given in json are stripped like in directive text
    const auto ANCHORED = exclusionsFromJson(R"([{"id": "x", "appName": "^Mail$"}])");
    ASSERT_TRUE(ANCHORED.has_value());
    EXPECT_EQ((*ANCHORED)[0].app, "Mail");
    EXPECT_TRUE((*ANCHORED)[0].manageOff);

    EXPECT_EQ(exclusionsFromJson("{}").error().kind, JSON_ERROR_SHAPE);
    EXPECT_EQ(exclusionsFromJson(R"([{"id": "x"}])").error().kind, JSON_ERROR_SHAPE);
}
