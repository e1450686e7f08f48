#include "WindowRule.hpp"
#include "SelectorMatcher.hpp"

using namespace Config::Directive;

std::string Config::Directive::stripAnchors(std::string_view pattern) {
    if (pattern.starts_with('^'))
        pattern.remove_prefix(1);
    if (pattern.ends_with('$'))
        pattern.remove_suffix(1);
    return std::string{pattern};
}

static bool selectorMatches(const std::optional<std::string>& app, const std::optional<std::string>& title, const std::string& appName, const std::string& windowTitle) {
    if (app.has_value() && !CSelectorMatcher("^" + *app + "$").match(appName))
        return false;

    if (title.has_value() && !CSelectorMatcher(*title).match(windowTitle))
        return false;

    return true;
}

bool SWindowRule::hasSelector() const {
    return (app.has_value() && !app->empty()) || (title.has_value() && !title->empty());
}

bool SWindowRule::matches(const std::string& appName, const std::string& windowTitle) const {
    if (!enabled || !hasSelector())
        return false;

    return selectorMatches(app, title, appName, windowTitle);
}

bool SExclusionRule::hasActions() const {
    return manageOff || sticky || layer != WINDOW_LAYER_NORMAL || space.has_value();
}

bool SExclusionRule::matches(const std::string& appName, const std::string& windowTitle) const {
    if (!enabled || app.empty())
        return false;

    return selectorMatches(app, title, appName, windowTitle);
}
