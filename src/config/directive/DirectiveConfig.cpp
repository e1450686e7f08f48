#include "DirectiveConfig.hpp"
#include "SettingDescriptions.hpp"

#include <algorithm>
#include <format>

using namespace Config;
using namespace Config::Directive;

static void fillDefaults(SettingMap& settings) {
    for (const auto& desc : settingDescriptions()) {
        if (!desc.defaultValue.has_value() || settings.contains(desc.key))
            continue;

        settings.emplace(desc.key, *desc.defaultValue);
    }
}

template <typename T, typename Pred>
static std::optional<T> findIn(const std::vector<T>& vec, Pred&& pred) {
    const auto IT = std::ranges::find_if(vec, pred);
    if (IT == vec.end())
        return std::nullopt;
    return *IT;
}

template <typename T>
static std::vector<T> replaceById(const std::vector<T>& vec, const T& item) {
    std::vector<T> result = vec;
    for (auto& el : result) {
        if (el.id == item.id)
            el = item;
    }
    return result;
}

template <typename T>
static std::vector<T> eraseById(const std::vector<T>& vec, const std::string& id) {
    std::vector<T> result = vec;
    std::erase_if(result, [&id](const T& el) { return el.id == id; });
    return result;
}

CDirectiveConfig::CDirectiveConfig() {
    fillDefaults(m_settings);
}

CDirectiveConfig::CDirectiveConfig(SettingMap settings, ExtraSettings extraSettings, std::vector<SExclusionRule> exclusions, std::vector<SWindowRule> rules,
                                   std::vector<SSignal> signals, std::vector<SSpaceConfig> spaces) :
    m_settings(std::move(settings)), m_extraSettings(std::move(extraSettings)), m_exclusions(std::move(exclusions)), m_rules(std::move(rules)), m_signals(std::move(signals)),
    m_spaces(std::move(spaces)) {
    fillDefaults(m_settings);
}

const SettingMap& CDirectiveConfig::settings() const {
    return m_settings;
}

const ExtraSettings& CDirectiveConfig::extraSettings() const {
    return m_extraSettings;
}

const std::vector<SExclusionRule>& CDirectiveConfig::exclusions() const {
    return m_exclusions;
}

const std::vector<SWindowRule>& CDirectiveConfig::rules() const {
    return m_rules;
}

const std::vector<SSignal>& CDirectiveConfig::signals() const {
    return m_signals;
}

const std::vector<SSpaceConfig>& CDirectiveConfig::spaces() const {
    return m_spaces;
}

std::optional<SETTINGVALUE> CDirectiveConfig::getSetting(const std::string& key) const {
    if (const auto IT = m_settings.find(key); IT != m_settings.end())
        return IT->second;

    if (const auto IT = std::ranges::find_if(m_extraSettings, [&key](const auto& e) { return e.first == key; }); IT != m_extraSettings.end())
        return IT->second;

    return std::nullopt;
}

bool CDirectiveConfig::hasSetting(const std::string& key) const {
    return getSetting(key).has_value();
}

bool CDirectiveConfig::getBool(const std::string& key) const {
    const auto VAL = getSetting(key);
    if (!VAL)
        return false;

    const auto COERCED = coerceTo(*VAL, SETTING_TYPE_BOOL);
    return COERCED ? std::get<bool>(*COERCED) : false;
}

int64_t CDirectiveConfig::getInt(const std::string& key) const {
    const auto VAL = getSetting(key);
    if (!VAL)
        return 0;

    const auto COERCED = coerceTo(*VAL, SETTING_TYPE_INT);
    return COERCED ? std::get<int64_t>(*COERCED) : 0;
}

double CDirectiveConfig::getFloat(const std::string& key) const {
    const auto VAL = getSetting(key);
    if (!VAL)
        return 0.0;

    const auto COERCED = coerceTo(*VAL, SETTING_TYPE_FLOAT);
    return COERCED ? std::get<double>(*COERCED) : 0.0;
}

std::string CDirectiveConfig::getString(const std::string& key) const {
    const auto VAL = getSetting(key);
    if (!VAL)
        return "";

    return settingValueToString(*VAL);
}

std::expected<CDirectiveConfig, std::string> CDirectiveConfig::setSetting(const std::string& key, const SETTINGVALUE& value) const {
    CDirectiveConfig copy = *this;

    const auto*      DESC = findSetting(key);
    if (!DESC) {
        const auto RAW = settingValueToString(value);
        auto       it  = std::ranges::find_if(copy.m_extraSettings, [&key](const auto& e) { return e.first == key; });
        if (it != copy.m_extraSettings.end())
            it->second = RAW;
        else
            copy.m_extraSettings.emplace_back(key, RAW);
        return copy;
    }

    const auto GIVEN = settingTypeOf(value);
    if (GIVEN == DESC->type) {
        copy.m_settings[key] = value;
        return copy;
    }

    if (GIVEN == SETTING_TYPE_INT && DESC->type == SETTING_TYPE_FLOAT) {
        copy.m_settings[key] = static_cast<double>(std::get<int64_t>(value));
        return copy;
    }

    return std::unexpected(std::format("setting {} expects a {} value, got {}", key, settingTypeName(DESC->type), settingTypeName(GIVEN)));
}

CDirectiveConfig CDirectiveConfig::resetSetting(const std::string& key) const {
    CDirectiveConfig copy = *this;

    const auto*      DESC = findSetting(key);
    if (!DESC) {
        std::erase_if(copy.m_extraSettings, [&key](const auto& e) { return e.first == key; });
        return copy;
    }

    if (DESC->defaultValue.has_value())
        copy.m_settings[key] = *DESC->defaultValue;
    else
        copy.m_settings.erase(key);

    return copy;
}

std::optional<int64_t> CDirectiveConfig::uniformPadding() const {
    const auto TOP = getInt("top_padding");
    if (getInt("bottom_padding") != TOP || getInt("left_padding") != TOP || getInt("right_padding") != TOP)
        return std::nullopt;
    return TOP;
}

CDirectiveConfig CDirectiveConfig::withUniformPadding(int64_t padding) const {
    CDirectiveConfig copy = *this;
    for (const auto& k : {"top_padding", "bottom_padding", "left_padding", "right_padding"}) {
        copy.m_settings[k] = padding;
    }
    return copy;
}

CDirectiveConfig CDirectiveConfig::addExclusion(const SExclusionRule& rule) const {
    CDirectiveConfig copy = *this;
    copy.m_exclusions.emplace_back(rule);
    return copy;
}

CDirectiveConfig CDirectiveConfig::removeExclusion(const std::string& id) const {
    CDirectiveConfig copy = *this;
    copy.m_exclusions     = eraseById(m_exclusions, id);
    return copy;
}

CDirectiveConfig CDirectiveConfig::updateExclusion(const SExclusionRule& rule) const {
    CDirectiveConfig copy = *this;
    copy.m_exclusions     = replaceById(m_exclusions, rule);
    return copy;
}

std::optional<SExclusionRule> CDirectiveConfig::findExclusion(const std::string& id) const {
    return findIn(m_exclusions, [&id](const auto& r) { return r.id == id; });
}

CDirectiveConfig CDirectiveConfig::addRule(const SWindowRule& rule) const {
    CDirectiveConfig copy = *this;
    copy.m_rules.emplace_back(rule);
    return copy;
}

CDirectiveConfig CDirectiveConfig::removeRule(const std::string& id) const {
    CDirectiveConfig copy = *this;
    copy.m_rules          = eraseById(m_rules, id);
    return copy;
}

CDirectiveConfig CDirectiveConfig::updateRule(const SWindowRule& rule) const {
    CDirectiveConfig copy = *this;
    copy.m_rules          = replaceById(m_rules, rule);
    return copy;
}

std::optional<SWindowRule> CDirectiveConfig::findRule(const std::string& id) const {
    return findIn(m_rules, [&id](const auto& r) { return r.id == id; });
}

CDirectiveConfig CDirectiveConfig::addSignal(const SSignal& signal) const {
    CDirectiveConfig copy = *this;
    copy.m_signals.emplace_back(signal);
    return copy;
}

CDirectiveConfig CDirectiveConfig::removeSignal(const std::string& id) const {
    CDirectiveConfig copy = *this;
    copy.m_signals        = eraseById(m_signals, id);
    return copy;
}

CDirectiveConfig CDirectiveConfig::updateSignal(const SSignal& signal) const {
    CDirectiveConfig copy = *this;
    copy.m_signals        = replaceById(m_signals, signal);
    return copy;
}

std::optional<SSignal> CDirectiveConfig::findSignal(const std::string& id) const {
    return findIn(m_signals, [&id](const auto& s) { return s.id == id; });
}

CDirectiveConfig CDirectiveConfig::upsertSpace(const SSpaceConfig& space) const {
    CDirectiveConfig copy = *this;

    auto             it = std::ranges::find_if(copy.m_spaces, [&space](const auto& s) { return s.index == space.index; });
    if (it != copy.m_spaces.end())
        *it = space;
    else
        copy.m_spaces.emplace_back(space);

    return copy;
}

CDirectiveConfig CDirectiveConfig::removeSpace(int64_t index) const {
    CDirectiveConfig copy = *this;
    std::erase_if(copy.m_spaces, [index](const auto& s) { return s.index == index; });
    return copy;
}

std::optional<SSpaceConfig> CDirectiveConfig::findSpace(int64_t index) const {
    return findIn(m_spaces, [index](const auto& s) { return s.index == index; });
}

size_t CDirectiveConfig::enabledRuleCount() const {
    return std::ranges::count_if(m_rules, [](const auto& r) { return r.enabled; });
}

size_t CDirectiveConfig::enabledSignalCount() const {
    return std::ranges::count_if(m_signals, [](const auto& s) { return s.enabled; });
}
