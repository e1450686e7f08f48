#pragma once

#include "PropertyTokenizer.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace Config {
    using SETTINGVALUE = std::variant<bool, int64_t, double, std::string>;

    enum eSettingType : uint8_t {
        SETTING_TYPE_BOOL = 0,
        SETTING_TYPE_INT,
        SETTING_TYPE_FLOAT,
        SETTING_TYPE_STRING,
    };

    eSettingType settingTypeOf(const SETTINGVALUE& value);
    const char*  settingTypeName(eSettingType type);

    // directive rendering, bools are on/off and floats keep their decimal point
    std::string  settingValueToString(const SETTINGVALUE& value);
}

namespace Config::Directive {

    /*
        Bare text: on/yes/true and off/no/false, then integer, then float,
        then one layer of matching quotes is stripped, then the text as is.
    */
    SETTINGVALUE                coerceRaw(std::string_view raw);

    // quoted tokens are always strings, bare ones go through coerceRaw
    SETTINGVALUE                coerceToken(const SPropertyToken& token);

    // maps a coerced value onto a declared type, nullopt means "use the default"
    std::optional<SETTINGVALUE> coerceTo(const SETTINGVALUE& value, eSettingType type);

    // typed rule fields take the boolean literal set whether quoted or not
    std::optional<bool>         tokenAsBool(const SPropertyToken* token);
    std::optional<int64_t>      tokenAsInt(const SPropertyToken* token);

    std::optional<bool>         boolFromLiteral(std::string_view str);
}
