#pragma once

#include "ValueCoercer.hpp"
#include "WindowRule.hpp"
#include "Signal.hpp"
#include "SpaceConfig.hpp"

#include <expected>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Config::Directive {

    using SettingMap    = std::map<std::string, SETTINGVALUE>;
    // unrecognized keys with their raw value text, in file order
    using ExtraSettings = std::vector<std::pair<std::string, std::string>>;

    /*
        Immutable directive side model. Every edit returns a new config.
        Recognized settings always hold a value, missing ones are filled from the
        setting table on construction (external_bar stays unset until given).
    */
    class CDirectiveConfig {
      public:
        CDirectiveConfig();
        CDirectiveConfig(SettingMap settings, ExtraSettings extraSettings, std::vector<SExclusionRule> exclusions, std::vector<SWindowRule> rules, std::vector<SSignal> signals,
                         std::vector<SSpaceConfig> spaces);

        const SettingMap&                              settings() const;
        const ExtraSettings&                           extraSettings() const;
        const std::vector<SExclusionRule>&             exclusions() const;
        const std::vector<SWindowRule>&                rules() const;
        const std::vector<SSignal>&                    signals() const;
        const std::vector<SSpaceConfig>&               spaces() const;

        std::optional<SETTINGVALUE>                    getSetting(const std::string& key) const;
        bool                                           hasSetting(const std::string& key) const;
        bool                                           getBool(const std::string& key) const;
        int64_t                                        getInt(const std::string& key) const;
        double                                         getFloat(const std::string& key) const;
        std::string                                    getString(const std::string& key) const;

        // known keys must get their declared type (ints widen into floats), unknown keys are kept as raw text
        std::expected<CDirectiveConfig, std::string>   setSetting(const std::string& key, const SETTINGVALUE& value) const;
        // back to the default, or unset for keys without one
        CDirectiveConfig                               resetSetting(const std::string& key) const;

        std::optional<int64_t>                         uniformPadding() const;
        CDirectiveConfig                               withUniformPadding(int64_t padding) const;

        CDirectiveConfig                               addExclusion(const SExclusionRule& rule) const;
        CDirectiveConfig                               removeExclusion(const std::string& id) const;
        CDirectiveConfig                               updateExclusion(const SExclusionRule& rule) const;
        std::optional<SExclusionRule>                  findExclusion(const std::string& id) const;

        CDirectiveConfig                               addRule(const SWindowRule& rule) const;
        CDirectiveConfig                               removeRule(const std::string& id) const;
        CDirectiveConfig                               updateRule(const SWindowRule& rule) const;
        std::optional<SWindowRule>                     findRule(const std::string& id) const;

        CDirectiveConfig                               addSignal(const SSignal& signal) const;
        CDirectiveConfig                               removeSignal(const std::string& id) const;
        CDirectiveConfig                               updateSignal(const SSignal& signal) const;
        std::optional<SSignal>                         findSignal(const std::string& id) const;

        // replaces the space with the same index or appends it
        CDirectiveConfig                               upsertSpace(const SSpaceConfig& space) const;
        CDirectiveConfig                               removeSpace(int64_t index) const;
        std::optional<SSpaceConfig>                    findSpace(int64_t index) const;

        size_t                                         enabledRuleCount() const;
        size_t                                         enabledSignalCount() const;

        bool                                           operator==(const CDirectiveConfig&) const = default;

      private:
        SettingMap                  m_settings;
        ExtraSettings               m_extraSettings;
        std::vector<SExclusionRule> m_exclusions;
        std::vector<SWindowRule>    m_rules;
        std::vector<SSignal>        m_signals;
        std::vector<SSpaceConfig>   m_spaces;
    };
}
