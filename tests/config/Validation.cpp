
#include <config/directive/DirectiveParser.hpp>
#include <config/validation/LineValidator.hpp>
#include <config/validation/SettingsValidator.hpp>

#include <gtest/gtest.h>

using namespace Config;
using namespace Config::Validation;

TEST(Validation, signalMissingAction) {
    const std::string TEXT = R"#(yabai -m config layout bsp

yabai -m signal --add event=window_focused
)#";

    const auto DIAGNOSTICS = validateDirectiveText(TEXT);

    ASSERT_EQ(DIAGNOSTICS.size(), 1);
    EXPECT_EQ(DIAGNOSTICS[0].line, 3);
    EXPECT_EQ(DIAGNOSTICS[0].message, "Signal --add missing action parameter");
    EXPECT_EQ(DIAGNOSTICS[0].text, "yabai -m signal --add event=window_focused");
    EXPECT_EQ(DIAGNOSTICS[0].toString(), "Line 3: Signal --add missing action parameter\n  yabai -m signal --add event=window_focused");

    EXPECT_TRUE(Directive::parseDirectives(TEXT).signals().empty());
}

TEST(Validation, signalMissingBoth) {
    const auto DIAGNOSTICS = validateDirectiveText("yabai -m signal --add label=x");

    ASSERT_EQ(DIAGNOSTICS.size(), 2);
    EXPECT_EQ(DIAGNOSTICS[0].message, "Signal --add missing event parameter");
    EXPECT_EQ(DIAGNOSTICS[1].message, "Signal --add missing action parameter");
    EXPECT_EQ(DIAGNOSTICS[1].line, 1);
}

TEST(Validation, directiveLines) {
    const std::string TEXT = R"#(#!/usr/bin/env sh
yabai config layout bsp
yabai -m config layout
yabai -m rule app=Finder
yabai -m signal event=window_focused action=x
ls -la
FOO=bar
echo "hello"
yabai -m rule --remove 0
yabai -m signal --remove 0
yabai -m space --focus 2
)#";

    const auto DIAGNOSTICS = validateDirectiveText(TEXT);

    const DiagnosticList EXPECTED = {
        {.line = 2, .message = "Missing -m flag in yabai command", .text = "yabai config layout bsp"},
        {.line = 3, .message = "Invalid config command format", .text = "yabai -m config layout"},
        {.line = 4, .message = "Rule command missing --add or --remove", .text = "yabai -m rule app=Finder"},
        {.line = 5, .message = "Signal command missing --add or --remove", .text = "yabai -m signal event=window_focused action=x"},
        {.line = 6, .message = "Unrecognized command", .text = "ls -la"},
    };

    EXPECT_EQ(DIAGNOSTICS, EXPECTED);
}

TEST(Validation, badSelectorRegex) {
    const auto DIAGNOSTICS = validateDirectiveText(R"(yabai -m rule --add app="^(Unclosed$" manage=off)");

    ASSERT_EQ(DIAGNOSTICS.size(), 1);
    EXPECT_TRUE(DIAGNOSTICS[0].message.starts_with("Invalid regular expression in app selector: "));

    EXPECT_TRUE(validateDirectiveText(R"(yabai -m rule --add app="^(Fire|Water)fox$" title=".*Private.*" manage=off)").empty());
}

TEST(Validation, bindingLines) {
    const std::string TEXT = R"#(# comment
:: default : echo mode
alt - h : yabai -m window --focus west
alt - j yabai -m window --focus south
alt - k: yabai -m window --focus north
alt - two words : echo nope

)#";

    const auto DIAGNOSTICS = validateBindingText(TEXT);

    ASSERT_EQ(DIAGNOSTICS.size(), 3);
    EXPECT_EQ(DIAGNOSTICS[0].line, 4);
    EXPECT_EQ(DIAGNOSTICS[0].message, "Missing command separator \":\"");
    EXPECT_EQ(DIAGNOSTICS[1].line, 5);
    EXPECT_EQ(DIAGNOSTICS[1].message, "Invalid shortcut format");
    EXPECT_EQ(DIAGNOSTICS[2].line, 6);
    EXPECT_EQ(DIAGNOSTICS[2].message, "Invalid shortcut format");
}

TEST(Validation, defaultSettingsAreClean) {
    EXPECT_TRUE(validateSettings(Directive::CDirectiveConfig{}).empty());
}

TEST(Validation, settingValues) {
    auto config = Directive::CDirectiveConfig{}
                      .setSetting("split_ratio", 1.5)
                      .and_then([](const auto& c) { return c.setSetting("layout", std::string{"spiral"}); })
                      .and_then([](const auto& c) { return c.setSetting("window_gap", int64_t{-4}); })
                      .and_then([](const auto& c) { return c.setSetting("window_border", true); })
                      .and_then([](const auto& c) { return c.setSetting("active_window_border_color", std::string{"red"}); })
                      .and_then([](const auto& c) { return c.setSetting("normal_window_opacity", 0.0); });

    ASSERT_TRUE(config.has_value());

    const auto ISSUES = validateSettings(*config);

    std::vector<std::string> subjects;
    for (const auto& i : ISSUES) {
        subjects.emplace_back(i.subject);
    }

    // table order
    EXPECT_EQ(subjects, (std::vector<std::string>{"layout", "split_ratio", "window_gap", "active_window_border_color"}));
    EXPECT_EQ(ISSUES[0].message, "\"spiral\" is not one of bsp, float, stack");
}

TEST(Validation, entityChecks) {
    const Directive::CDirectiveConfig CONFIG{{},
                                             {},
                                             {},
                                             {},
                                             {Directive::SSignal{.id = "signal_0", .event = "window_exploded", .action = "echo"},
                                              Directive::SSignal{.id = "signal_1", .event = "window_focused", .action = "echo"}},
                                             {Directive::SSpaceConfig{.index = 0}, Directive::SSpaceConfig{.index = 2}, Directive::SSpaceConfig{.index = 2}}};

    const std::vector<SSettingIssue> EXPECTED = {
        {.subject = "signal:signal_0", .message = "unknown event \"window_exploded\""},
        {.subject = "space:0", .message = "space indices start at 1"},
        {.subject = "space:2", .message = "space configured more than once"},
    };

    EXPECT_EQ(validateSettings(CONFIG), EXPECTED);
}

TEST(Validation, bindingSetChecks) {
    const Binding::CBindingSet SET{std::vector<Binding::SHotkeyBinding>{
        {.id = "binding_0", .modifiers = {"alt", "super"}, .key = "h", .action = "echo"},
        {.id = "binding_1", .modifiers = {"hyper"}, .key = "j", .action = ""},
        {.id = "binding_2", .modifiers = {"lcmd", "rshift"}, .key = "k", .action = "echo"},
        {.id = "binding_3", .modifiers = {"alt"}, .key = "enter", .action = "echo"},
        {.id = "binding_4", .modifiers = {"alt"}, .key = "f21", .action = "echo"},
    }};

    const std::vector<SSettingIssue> EXPECTED = {
        {.subject = "binding:binding_0", .message = "unknown modifier \"super\""},
        {.subject = "binding:binding_1", .message = "no action"},
        {.subject = "binding:binding_3", .message = "unknown key \"enter\""},
        {.subject = "binding:binding_4", .message = "unknown key \"f21\""},
    };

    EXPECT_EQ(validateBindingSet(SET), EXPECTED);
    EXPECT_FALSE(SET.bindings()[0].hasValidModifiers());
    EXPECT_TRUE(SET.bindings()[2].hasValidModifiers());
}

TEST(Validation, skhdKeyNames) {
    for (const auto& key : {"h", "J", "0", "f1", "F12", "f20", "return", "Space", "caps_lock", "forwarddelete", "kp_enter", "kp5", "0x32", ";", "[", "]", "-", "sound_up"}) {
        EXPECT_TRUE((Binding::SHotkeyBinding{.key = key}.hasValidKey())) << key;
    }

    for (const auto& key : {"", "hh", "f0", "f21", "enter", "kp", "0x123", "ctrl", "é"}) {
        EXPECT_FALSE((Binding::SHotkeyBinding{.key = key}.hasValidKey())) << key;
    }
}
