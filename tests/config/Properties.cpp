
#include <config/directive/PropertyTokenizer.hpp>
#include <config/directive/ValueCoercer.hpp>

#include <gtest/gtest.h>

using namespace Config;
using namespace Config::Directive;

TEST(Properties, tokenizeQuotedAndBare) {
    const auto PROPS = tokenizeProperties(R"(app="Finder App" manage=off)");

    ASSERT_EQ(PROPS.size(), 2);
    EXPECT_EQ(PROPS.entries()[0].first, "app");
    EXPECT_EQ(PROPS.entries()[1].first, "manage");

    ASSERT_TRUE(PROPS.get("app"));
    EXPECT_EQ(*PROPS.get("app"), (SPropertyToken{.value = "Finder App", .quoted = true}));
    EXPECT_EQ(coerceToken(*PROPS.get("app")), SETTINGVALUE{std::string{"Finder App"}});
    EXPECT_EQ(coerceToken(*PROPS.get("manage")), SETTINGVALUE{false});
}

TEST(Properties, tokenizeSignalFragment) {
    const auto PROPS = tokenizeProperties(R"(event=window_focused action="echo hi")");

    ASSERT_EQ(PROPS.size(), 2);
    EXPECT_EQ(PROPS.get("event")->value, "window_focused");
    EXPECT_FALSE(PROPS.get("event")->quoted);
    EXPECT_EQ(PROPS.get("action")->value, "echo hi");
}

TEST(Properties, tokenizeEdgeCases) {
    EXPECT_TRUE(tokenizeProperties("").empty());
    EXPECT_TRUE(tokenizeProperties("no pairs here").empty());

    // last value wins, first position stays
    const auto REPEATED = tokenizeProperties("a=1 b=2 a=3");
    ASSERT_EQ(REPEATED.size(), 2);
    EXPECT_EQ(REPEATED.entries()[0].first, "a");
    EXPECT_EQ(REPEATED.get("a")->value, "3");

    const auto SINGLE = tokenizeProperties("title='Some Title' space=2");
    EXPECT_EQ(SINGLE.get("title")->value, "Some Title");
    EXPECT_TRUE(SINGLE.get("title")->quoted);
    EXPECT_EQ(SINGLE.get("space")->value, "2");

    const auto ESCAPED = tokenizeProperties(R"(action="echo \"hi\"" label=x)");
    EXPECT_EQ(ESCAPED.get("action")->value, R"(echo "hi")");
    EXPECT_EQ(ESCAPED.get("label")->value, "x");

    // keys are case sensitive
    const auto CASED = tokenizeProperties("App=a app=b");
    EXPECT_EQ(CASED.size(), 2);
    EXPECT_EQ(CASED.get("App")->value, "a");
}

TEST(Properties, quoteValueEscapes) {
    EXPECT_EQ(quoteValue("plain"), "\"plain\"");
    EXPECT_EQ(quoteValue(R"(say "hi")"), R"("say \"hi\"")");

    const auto BACK = tokenizeProperties("action=" + quoteValue(R"(say "hi")"));
    EXPECT_EQ(BACK.get("action")->value, R"(say "hi")");

    // a trailing backslash must not swallow the closing quote
    EXPECT_EQ(quoteValue(R"(echo C:\)"), R"("echo C:\\")");
    const auto PATH = tokenizeProperties("action=" + quoteValue(R"(echo C:\)") + " label=x");
    ASSERT_TRUE(PATH.get("action"));
    EXPECT_TRUE(PATH.get("action")->quoted);
    EXPECT_EQ(PATH.get("action")->value, R"(echo C:\)");
    EXPECT_EQ(PATH.get("label")->value, "x");

    // other escapes are kept as written, so regex classes survive
    EXPECT_EQ(tokenizeProperties(R"(title="\d+ items")").get("title")->value, R"(\d+ items)");
}

TEST(Properties, coerceRaw) {
    EXPECT_EQ(coerceRaw("on"), SETTINGVALUE{true});
    EXPECT_EQ(coerceRaw("yes"), SETTINGVALUE{true});
    EXPECT_EQ(coerceRaw("false"), SETTINGVALUE{false});
    EXPECT_EQ(coerceRaw("12"), SETTINGVALUE{int64_t{12}});
    EXPECT_EQ(coerceRaw("-3"), SETTINGVALUE{int64_t{-3}});
    EXPECT_EQ(coerceRaw("0.5"), SETTINGVALUE{0.5});
    EXPECT_EQ(coerceRaw("1.0"), SETTINGVALUE{1.0});
    EXPECT_EQ(coerceRaw("0xff775759"), SETTINGVALUE{std::string{"0xff775759"}});
    EXPECT_EQ(coerceRaw("'quoted'"), SETTINGVALUE{std::string{"quoted"}});
    EXPECT_EQ(coerceRaw("all:30:0"), SETTINGVALUE{std::string{"all:30:0"}});
    EXPECT_EQ(coerceRaw("inf"), SETTINGVALUE{std::string{"inf"}});
}

TEST(Properties, coerceQuotedTokensStayStrings) {
    EXPECT_EQ(coerceToken(SPropertyToken{.value = "12", .quoted = true}), SETTINGVALUE{std::string{"12"}});
    EXPECT_EQ(coerceToken(SPropertyToken{.value = "on", .quoted = true}), SETTINGVALUE{std::string{"on"}});
    EXPECT_EQ(coerceToken(SPropertyToken{.value = "12", .quoted = false}), SETTINGVALUE{int64_t{12}});
}

TEST(Properties, coerceToDeclaredType) {
    EXPECT_EQ(coerceTo(SETTINGVALUE{1.9}, SETTING_TYPE_INT), SETTINGVALUE{int64_t{1}});
    EXPECT_EQ(coerceTo(SETTINGVALUE{int64_t{3}}, SETTING_TYPE_FLOAT), SETTINGVALUE{3.0});
    EXPECT_EQ(coerceTo(SETTINGVALUE{true}, SETTING_TYPE_STRING), SETTINGVALUE{std::string{"on"}});
    EXPECT_EQ(coerceTo(SETTINGVALUE{std::string{"Yes"}}, SETTING_TYPE_BOOL), SETTINGVALUE{true});
    EXPECT_EQ(coerceTo(SETTINGVALUE{std::string{"abc"}}, SETTING_TYPE_INT), std::nullopt);
    EXPECT_EQ(coerceTo(SETTINGVALUE{int64_t{1}}, SETTING_TYPE_BOOL), std::nullopt);
}

TEST(Properties, typedRuleFields) {
    const SPropertyToken QUOTED_YES{.value = "yes", .quoted = true};
    const SPropertyToken BARE_OFF{.value = "off", .quoted = false};
    const SPropertyToken JUNK{.value = "maybe", .quoted = false};
    const SPropertyToken SPACE{.value = "3", .quoted = true};

    EXPECT_EQ(tokenAsBool(&QUOTED_YES), true);
    EXPECT_EQ(tokenAsBool(&BARE_OFF), false);
    EXPECT_EQ(tokenAsBool(&JUNK), std::nullopt);
    EXPECT_EQ(tokenAsBool(nullptr), std::nullopt);
    EXPECT_EQ(tokenAsInt(&SPACE), 3);
    EXPECT_EQ(tokenAsInt(&JUNK), std::nullopt);
}

TEST(Properties, settingValueRendering) {
    EXPECT_EQ(settingValueToString(true), "on");
    EXPECT_EQ(settingValueToString(false), "off");
    EXPECT_EQ(settingValueToString(int64_t{6}), "6");
    EXPECT_EQ(settingValueToString(1.0), "1.0");
    EXPECT_EQ(settingValueToString(0.9), "0.9");
    EXPECT_EQ(settingValueToString(std::string{"bsp"}), "bsp");
}
