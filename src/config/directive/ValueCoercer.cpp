#include "ValueCoercer.hpp"
#include "../../helpers/StringUtils.hpp"

#include <cmath>
#include <format>
#include <limits>

using namespace Config;
using namespace Config::Directive;

eSettingType Config::settingTypeOf(const SETTINGVALUE& value) {
    switch (value.index()) {
        case 0: return SETTING_TYPE_BOOL;
        case 1: return SETTING_TYPE_INT;
        case 2: return SETTING_TYPE_FLOAT;
        default: return SETTING_TYPE_STRING;
    }
}

const char* Config::settingTypeName(eSettingType type) {
    switch (type) {
        case SETTING_TYPE_BOOL: return "bool";
        case SETTING_TYPE_INT: return "int";
        case SETTING_TYPE_FLOAT: return "float";
        case SETTING_TYPE_STRING: return "string";
    }
    return "?";
}

std::string Config::settingValueToString(const SETTINGVALUE& value) {
    if (const auto* B = std::get_if<bool>(&value))
        return *B ? "on" : "off";
    if (const auto* I = std::get_if<int64_t>(&value))
        return std::format("{}", *I);
    if (const auto* F = std::get_if<double>(&value))
        return NStringUtils::formatFloat(*F);
    return std::get<std::string>(value);
}

std::optional<bool> Config::Directive::boolFromLiteral(std::string_view str) {
    const auto LOWER = NStringUtils::toLower(str);

    if (LOWER == "on" || LOWER == "yes" || LOWER == "true")
        return true;
    if (LOWER == "off" || LOWER == "no" || LOWER == "false")
        return false;

    return std::nullopt;
}

SETTINGVALUE Config::Directive::coerceRaw(std::string_view raw) {
    if (raw == "on" || raw == "yes" || raw == "true")
        return true;
    if (raw == "off" || raw == "no" || raw == "false")
        return false;

    if (const auto INT = NStringUtils::parseInt(raw); INT.has_value())
        return *INT;

    if (const auto FLOAT = NStringUtils::parseFloat(raw); FLOAT.has_value())
        return *FLOAT;

    if (raw.size() >= 2 && (raw.front() == '"' || raw.front() == '\'') && raw.back() == raw.front())
        return std::string{raw.substr(1, raw.size() - 2)};

    return std::string{raw};
}

SETTINGVALUE Config::Directive::coerceToken(const SPropertyToken& token) {
    if (token.quoted)
        return token.value;

    return coerceRaw(token.value);
}

std::optional<SETTINGVALUE> Config::Directive::coerceTo(const SETTINGVALUE& value, eSettingType type) {
    switch (type) {
        case SETTING_TYPE_BOOL: {
            if (const auto* B = std::get_if<bool>(&value))
                return *B;
            if (const auto* S = std::get_if<std::string>(&value)) {
                if (const auto LIT = boolFromLiteral(*S); LIT.has_value())
                    return *LIT;
            }
            return std::nullopt;
        }
        case SETTING_TYPE_INT: {
            if (const auto* I = std::get_if<int64_t>(&value))
                return *I;
            if (const auto* F = std::get_if<double>(&value)) {
                if (!std::isfinite(*F) || std::fabs(*F) >= static_cast<double>(std::numeric_limits<int64_t>::max()))
                    return std::nullopt;
                return static_cast<int64_t>(*F);
            }
            if (const auto* S = std::get_if<std::string>(&value)) {
                if (const auto INT = NStringUtils::parseInt(*S); INT.has_value())
                    return *INT;
            }
            return std::nullopt;
        }
        case SETTING_TYPE_FLOAT: {
            if (const auto* F = std::get_if<double>(&value))
                return *F;
            if (const auto* I = std::get_if<int64_t>(&value))
                return static_cast<double>(*I);
            if (const auto* S = std::get_if<std::string>(&value)) {
                if (const auto FLOAT = NStringUtils::parseFloat(*S); FLOAT.has_value())
                    return *FLOAT;
            }
            return std::nullopt;
        }
        case SETTING_TYPE_STRING: {
            if (const auto* S = std::get_if<std::string>(&value))
                return *S;
            // bare numbers given to a string setting keep their textual form
            return settingValueToString(value);
        }
    }

    return std::nullopt;
}

std::optional<bool> Config::Directive::tokenAsBool(const SPropertyToken* token) {
    if (!token)
        return std::nullopt;

    return boolFromLiteral(token->value);
}

std::optional<int64_t> Config::Directive::tokenAsInt(const SPropertyToken* token) {
    if (!token)
        return std::nullopt;

    if (const auto INT = NStringUtils::parseInt(token->value); INT.has_value())
        return *INT;

    if (const auto FLOAT = NStringUtils::parseFloat(token->value); FLOAT.has_value() && std::isfinite(*FLOAT) &&
        std::fabs(*FLOAT) < static_cast<double>(std::numeric_limits<int64_t>::max()))
        return static_cast<int64_t>(*FLOAT);

    return std::nullopt;
}
