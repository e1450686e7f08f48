#include "DirectiveParser.hpp"
#include "SettingDescriptions.hpp"
#include "../../helpers/StringUtils.hpp"
#include "../../debug/log/Logger.hpp"

#include <re2/re2.h>

#include <algorithm>
#include <format>

#include <hyprutils/string/String.hpp>
using namespace Hyprutils::String;

using namespace Config;
using namespace Config::Directive;

static const RE2 SECTION_RE(R"(#\s*===\s*(.+?)\s*===.*)");
static const RE2 SPACE_LABEL_RE(R"(yabai\s+-m\s+space\s+(\d+)\s+--label\s+(.+))");
static const RE2 SPACE_CONFIG_RE(R"(yabai\s+-m\s+config\s+--space\s+(\d+)\s+(\S+)\s+(.+))");
static const RE2 CONFIG_RE(R"(yabai\s+-m\s+config\s+(\S+)\s+(.+))");
static const RE2 RULE_RE(R"(yabai\s+-m\s+rule\s+--add\s+(.+))");
static const RE2 SIGNAL_RE(R"(yabai\s+-m\s+signal\s+--add\s+(.+))");

namespace {
    // state threaded through one parse call only
    struct SParseState {
        SettingMap                  settings;
        ExtraSettings               extraSettings;
        std::vector<SExclusionRule> exclusions;
        std::vector<SWindowRule>    rules;
        std::vector<SSignal>        signals;
        std::vector<SSpaceConfig>   spaces;

        size_t                      nextRuleId      = 0;
        size_t                      nextExclusionId = 0;
        size_t                      nextSignalId    = 0;

        bool                        inExclusionSection = false;
    };
}

static std::string unquote(std::string_view s) {
    if (s.size() >= 2 && s.front() == '\'' && s.back() == '\'')
        return std::string{s.substr(1, s.size() - 2)};

    if (s.size() < 2 || s.front() != '"' || s.back() != '"')
        return std::string{s};

    std::string result;
    for (size_t i = 1; i + 1 < s.size(); ++i) {
        if (s[i] == '\\' && (s[i + 1] == '"' || s[i + 1] == '\\') && i + 2 < s.size())
            ++i;
        result += s[i];
    }
    return result;
}

std::string Config::Directive::stripTrailingComment(std::string_view line) {
    char quote = 0;
    for (size_t i = 0; i < line.size(); ++i) {
        const char C = line[i];

        if (quote) {
            if (C == '\\' && quote == '"' && i + 1 < line.size()) {
                ++i;
                continue;
            }
            if (C == quote)
                quote = 0;
            continue;
        }

        if (C == '"' || C == '\'') {
            quote = C;
            continue;
        }

        if (C == '#' && i > 0 && (line[i - 1] == ' ' || line[i - 1] == '\t'))
            return trim(std::string{line.substr(0, i)});
    }

    return trim(std::string{line});
}

std::optional<std::string> Config::Directive::sectionMarker(std::string_view line) {
    std::string name;
    if (!RE2::FullMatch(line, SECTION_RE, &name))
        return std::nullopt;
    return name;
}

std::optional<SWindowRule> Config::Directive::buildWindowRule(const CPropertyMap& props, std::string id) {
    if (props.empty())
        return std::nullopt;

    SWindowRule rule;
    rule.id = std::move(id);

    if (const auto* APP = props.get("app"); APP && !APP->value.empty())
        rule.app = stripAnchors(APP->value);
    if (const auto* TITLE = props.get("title"); TITLE && !TITLE->value.empty())
        rule.title = TITLE->value;

    if (!rule.hasSelector())
        return std::nullopt;

    rule.manage = tokenAsBool(props.get("manage")).value_or(true);
    rule.sticky = tokenAsBool(props.get("sticky"));
    rule.space  = tokenAsInt(props.get("space"));

    if (const auto* LAYER = props.get("layer"); LAYER) {
        rule.layer = WINDOW_LAYERS.fromString(LAYER->value);
        if (!rule.layer)
            Log::logger->log(Log::DEBUG, "directive: rule {} has unknown layer \"{}\", ignoring it", rule.id, LAYER->value);
    }

    return rule;
}

std::optional<SExclusionRule> Config::Directive::buildExclusionRule(const CPropertyMap& props, std::string id) {
    if (props.empty())
        return std::nullopt;

    const auto* APP = props.get("app");
    if (!APP)
        return std::nullopt;

    SExclusionRule rule;
    rule.id  = std::move(id);
    rule.app = stripAnchors(APP->value);

    if (rule.app.empty())
        return std::nullopt;

    if (const auto* TITLE = props.get("title"); TITLE && !TITLE->value.empty())
        rule.title = TITLE->value;

    rule.manageOff = tokenAsBool(props.get("manage")) == std::optional<bool>{false};
    rule.sticky    = tokenAsBool(props.get("sticky")) == std::optional<bool>{true};
    rule.space     = tokenAsInt(props.get("space"));

    if (const auto* LAYER = props.get("layer"); LAYER)
        rule.layer = WINDOW_LAYERS.fromString(LAYER->value).value_or(WINDOW_LAYER_NORMAL);

    return rule;
}

std::optional<SSignal> Config::Directive::buildSignal(const CPropertyMap& props, std::string id) {
    const auto* EVENT  = props.get("event");
    const auto* ACTION = props.get("action");

    if (!EVENT || !ACTION || EVENT->value.empty() || ACTION->value.empty())
        return std::nullopt;

    SSignal signal{.id = std::move(id), .event = EVENT->value, .action = ACTION->value};

    if (const auto* LABEL = props.get("label"); LABEL && !LABEL->value.empty())
        signal.label = LABEL->value;

    return signal;
}

static SSpaceConfig& spaceFor(SParseState& state, int64_t index) {
    auto it = std::ranges::find_if(state.spaces, [index](const auto& s) { return s.index == index; });
    if (it != state.spaces.end())
        return *it;

    return state.spaces.emplace_back(SSpaceConfig{.index = index});
}

static void applySetting(SParseState& state, const std::string& key, const std::string& rawValue) {
    const auto* DESC = findSetting(key);

    if (!DESC) {
        auto it = std::ranges::find_if(state.extraSettings, [&key](const auto& e) { return e.first == key; });
        if (it != state.extraSettings.end())
            it->second = rawValue;
        else
            state.extraSettings.emplace_back(key, rawValue);
        return;
    }

    const auto COERCED = coerceTo(coerceRaw(rawValue), DESC->type);
    if (!COERCED) {
        Log::logger->log(Log::DEBUG, "directive: \"{}\" is not a valid {} for {}, keeping the default", rawValue, settingTypeName(DESC->type), key);
        return;
    }

    state.settings[key] = *COERCED;
}

// manage=on and sticky=off only fit a plain rule
static bool fitsExclusion(const CPropertyMap& props, const SExclusionRule& rule) {
    return rule.hasActions() && tokenAsBool(props.get("manage")) != std::optional<bool>{true} && tokenAsBool(props.get("sticky")) != std::optional<bool>{false};
}

static void parseDirectiveLine(SParseState& state, const std::string& line, bool enabled) {
    std::string a, b, c;

    if (RE2::FullMatch(line, SPACE_LABEL_RE, &a, &b)) {
        const auto INDEX = NStringUtils::parseInt(a);
        if (!INDEX || !enabled)
            return;
        spaceFor(state, *INDEX).label = unquote(trim(b));
        return;
    }

    if (RE2::FullMatch(line, SPACE_CONFIG_RE, &a, &b, &c)) {
        const auto INDEX = NStringUtils::parseInt(a);
        if (!INDEX || !enabled)
            return;
        if (!spaceFor(state, *INDEX).applyOverride(b, unquote(trim(c))))
            Log::logger->log(Log::DEBUG, "directive: keeping space {} override {} {} verbatim", *INDEX, b, c);
        return;
    }

    if (RE2::FullMatch(line, CONFIG_RE, &a, &b)) {
        if (enabled)
            applySetting(state, a, trim(b));
        return;
    }

    if (RE2::FullMatch(line, RULE_RE, &a)) {
        const auto PROPS = tokenizeProperties(a);

        if (state.inExclusionSection) {
            if (auto rule = buildExclusionRule(PROPS, std::format("exclusion_{}", state.nextExclusionId)); rule && fitsExclusion(PROPS, *rule)) {
                rule->enabled = enabled;
                state.exclusions.emplace_back(std::move(*rule));
                state.nextExclusionId++;
                return;
            }

            // title-only selectors and managed windows stay plain rules
        }

        auto rule = buildWindowRule(PROPS, std::format("rule_{}", state.nextRuleId));
        if (!rule) {
            Log::logger->log(Log::TRACE, "directive: dropping rule without a selector: {}", line);
            return;
        }
        rule->enabled = enabled;
        state.rules.emplace_back(std::move(*rule));
        state.nextRuleId++;
        return;
    }

    if (RE2::FullMatch(line, SIGNAL_RE, &a)) {
        auto signal = buildSignal(tokenizeProperties(a), std::format("signal_{}", state.nextSignalId));
        if (!signal) {
            Log::logger->log(Log::TRACE, "directive: dropping signal without event or action: {}", line);
            return;
        }
        signal->enabled = enabled;
        state.signals.emplace_back(std::move(*signal));
        state.nextSignalId++;
        return;
    }

    Log::logger->log(Log::TRACE, "directive: skipping {}", line);
}

CDirectiveConfig Config::Directive::parseDirectives(std::string_view text) {
    SParseState state;

    for (const auto& rawLine : NStringUtils::splitLines(text)) {
        const auto LINE = trim(rawLine);

        if (LINE.empty())
            continue;

        if (const auto SECTION = sectionMarker(LINE); SECTION) {
            state.inExclusionSection = NStringUtils::toLower(*SECTION).contains("exclusion");
            continue;
        }

        bool        enabled = true;
        std::string body    = LINE;

        if (LINE.starts_with(DISABLED_PREFIX)) {
            enabled = false;
            body    = trim(LINE.substr(std::string_view{DISABLED_PREFIX}.size()));
        } else if (LINE.starts_with('#'))
            continue;

        if (!body.starts_with("yabai "))
            continue;

        parseDirectiveLine(state, stripTrailingComment(body), enabled);
    }

    return CDirectiveConfig{std::move(state.settings), std::move(state.extraSettings), std::move(state.exclusions), std::move(state.rules), std::move(state.signals),
                            std::move(state.spaces)};
}

std::vector<SExclusionRule> Config::Directive::parseExclusionRules(std::string_view text) {
    std::vector<SExclusionRule> result;
    size_t                      nextId = 0;

    for (const auto& rawLine : NStringUtils::splitLines(text)) {
        const auto LINE = trim(rawLine);

        if (LINE.empty())
            continue;

        bool        enabled = true;
        std::string body    = LINE;

        if (LINE.starts_with(DISABLED_PREFIX)) {
            enabled = false;
            body    = trim(LINE.substr(std::string_view{DISABLED_PREFIX}.size()));
        } else if (LINE.starts_with('#'))
            continue;

        std::string props;
        if (!RE2::FullMatch(stripTrailingComment(body), RULE_RE, &props))
            continue;

        auto rule = buildExclusionRule(tokenizeProperties(props), std::format("exclusion_{}", nextId));
        if (!rule)
            continue;

        rule->enabled = enabled;
        result.emplace_back(std::move(*rule));
        nextId++;
    }

    return result;
}
