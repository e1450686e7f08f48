#pragma once

#include "../directive/DirectiveConfig.hpp"
#include "../binding/HotkeyBinding.hpp"

#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace Config::Json {

    enum eJsonErrorKind : uint8_t {
        JSON_ERROR_SYNTAX = 0, // not json at all
        JSON_ERROR_SHAPE,      // json, but not the object we expect
        JSON_ERROR_WRITE,
    };

    struct SJsonError {
        eJsonErrorKind kind = JSON_ERROR_SYNTAX;
        std::string    message;
    };

    /*
        One object per entity, camelCase field names. The settings object is keyed by
        the directive key names themselves, unrecognized keys travel in extraSettings.
    */
    std::expected<std::string, SJsonError>                            directiveToJson(const Directive::CDirectiveConfig& config);
    std::expected<Directive::CDirectiveConfig, SJsonError>            directiveFromJson(std::string_view json);

    std::expected<std::string, SJsonError>                            bindingsToJson(const Binding::CBindingSet& set);
    std::expected<Binding::CBindingSet, SJsonError>                   bindingsFromJson(std::string_view json);

    std::expected<std::string, SJsonError>                            exclusionsToJson(const std::vector<Directive::SExclusionRule>& rules);
    std::expected<std::vector<Directive::SExclusionRule>, SJsonError> exclusionsFromJson(std::string_view json);
}
