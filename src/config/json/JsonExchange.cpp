#include "JsonExchange.hpp"
#include "../directive/SettingDescriptions.hpp"
#include "../../debug/log/Logger.hpp"

#include <glaze/glaze.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <format>
#include <set>

#include <hyprutils/string/String.hpp>
using namespace Hyprutils::String;

using namespace Config;
using namespace Config::Json;
using namespace Config::Directive;
using namespace Config::Binding;

using JsonObject = glz::generic::object_t;
using JsonArray  = glz::generic::array_t;

template <typename T>
using ShapeResult = std::expected<T, std::string>;

namespace {
    // read side helpers, each error carries the path it was found at
    ShapeResult<const JsonObject*> asObject(const glz::generic& json, const std::string& path) {
        if (const auto* OBJ = std::get_if<JsonObject>(&json.data))
            return OBJ;
        return std::unexpected(std::format("{}: expected an object", path));
    }

    const glz::generic* field(const JsonObject& obj, std::string_view key) {
        const auto IT = obj.find(key);
        if (IT == obj.end() || std::holds_alternative<std::nullptr_t>(IT->second.data))
            return nullptr;
        return &IT->second;
    }

    ShapeResult<std::string> asString(const glz::generic& json, const std::string& path) {
        if (const auto* STR = std::get_if<std::string>(&json.data))
            return *STR;
        return std::unexpected(std::format("{}: expected a string", path));
    }

    ShapeResult<bool> asBool(const glz::generic& json, const std::string& path) {
        if (const auto* B = std::get_if<bool>(&json.data))
            return *B;
        return std::unexpected(std::format("{}: expected a boolean", path));
    }

    ShapeResult<double> asNumber(const glz::generic& json, const std::string& path) {
        if (const auto* D = std::get_if<double>(&json.data))
            return *D;
        return std::unexpected(std::format("{}: expected a number", path));
    }

    ShapeResult<int64_t> asInt(const glz::generic& json, const std::string& path) {
        const auto NUM = asNumber(json, path);
        if (!NUM)
            return std::unexpected(NUM.error());

        if (!std::isfinite(*NUM) || std::trunc(*NUM) != *NUM || std::fabs(*NUM) > 9007199254740992.0)
            return std::unexpected(std::format("{}: expected an integer", path));

        return static_cast<int64_t>(*NUM);
    }

    ShapeResult<const JsonArray*> asArray(const glz::generic& json, const std::string& path) {
        if (const auto* ARR = std::get_if<JsonArray>(&json.data))
            return ARR;
        return std::unexpected(std::format("{}: expected an array", path));
    }

    template <typename T, typename Fn>
    ShapeResult<T> requiredField(const JsonObject& obj, std::string_view key, const std::string& path, Fn&& fn) {
        const auto* F = field(obj, key);
        if (!F)
            return std::unexpected(std::format("{}.{}: missing", path, key));
        return fn(*F, std::format("{}.{}", path, key));
    }

    template <typename T, typename Fn>
    ShapeResult<std::optional<T>> optionalField(const JsonObject& obj, std::string_view key, const std::string& path, Fn&& fn) {
        const auto* F = field(obj, key);
        if (!F)
            return std::optional<T>{};

        auto val = fn(*F, std::format("{}.{}", path, key));
        if (!val)
            return std::unexpected(val.error());
        return std::optional<T>{std::move(*val)};
    }

    template <typename T, typename Fn>
    ShapeResult<std::vector<T>> listField(const JsonObject& obj, std::string_view key, const std::string& path, Fn&& fn) {
        std::vector<T> result;

        const auto*    F = field(obj, key);
        if (!F)
            return result;

        const auto ARR = asArray(*F, std::format("{}.{}", path, key));
        if (!ARR)
            return std::unexpected(ARR.error());

        for (size_t i = 0; i < (*ARR)->size(); ++i) {
            auto el = fn((**ARR)[i], std::format("{}.{}[{}]", path, key, i));
            if (!el)
                return std::unexpected(el.error());
            result.emplace_back(std::move(*el));
        }

        return result;
    }

    std::expected<glz::generic, SJsonError> parseJson(std::string_view text) {
        const std::string BUFFER{text};
        auto              json = glz::read_json<glz::generic>(BUFFER);
        if (!json) {
            const auto MSG = glz::format_error(json.error(), BUFFER);
            Log::logger->log(Log::ERR, "json: not valid json: {}", MSG);
            return std::unexpected(SJsonError{.kind = JSON_ERROR_SYNTAX, .message = MSG});
        }

        return std::move(*json);
    }

    std::expected<std::string, SJsonError> writeJson(const glz::generic& json) {
        auto out = glz::write<glz::opts{.prettify = true}>(json);
        if (!out) {
            const auto MSG = glz::format_error(out.error());
            Log::logger->log(Log::ERR, "json: failed to write: {}", MSG);
            return std::unexpected(SJsonError{.kind = JSON_ERROR_WRITE, .message = MSG});
        }

        return *out;
    }

    template <typename... R>
    std::optional<std::string> firstError(const R&... results) {
        std::optional<std::string> err;
        ((err = err ? err : (results ? std::nullopt : std::optional<std::string>{results.error()})), ...);
        return err;
    }

    glz::generic newObject() {
        glz::generic json;
        json.data = JsonObject{};
        return json;
    }

    SJsonError shapeError(const std::string& msg) {
        Log::logger->log(Log::ERR, "json: unexpected shape: {}", msg);
        return SJsonError{.kind = JSON_ERROR_SHAPE, .message = msg};
    }
}

// this is a bit verbose, but the field names and optionals stay explicit

static JsonArray keyValuesToJson(const std::vector<std::pair<std::string, std::string>>& pairs) {
    JsonArray result;
    for (const auto& [key, value] : pairs) {
        auto pair     = newObject();
        pair["key"]   = key;
        pair["value"] = value;
        result.emplace_back(std::move(pair));
    }
    return result;
}

static ShapeResult<std::pair<std::string, std::string>> keyValueFromJson(const glz::generic& json, const std::string& path) {
    const auto OBJ = asObject(json, path);
    if (!OBJ)
        return std::unexpected(OBJ.error());

    auto key   = requiredField<std::string>(**OBJ, "key", path, asString);
    auto value = requiredField<std::string>(**OBJ, "value", path, asString);
    if (const auto ERR = firstError(key, value); ERR)
        return std::unexpected(*ERR);

    return std::pair{*key, *value};
}

static glz::generic settingToJson(const SETTINGVALUE& value) {
    glz::generic json;
    std::visit([&json](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, int64_t>)
            json.data = static_cast<double>(v);
        else
            json.data = v;
    }, value);
    return json;
}

static glz::generic exclusionToJson(const SExclusionRule& rule) {
    auto json = newObject();
    json["id"]        = rule.id;
    json["appName"]   = rule.app;
    json["manageOff"] = rule.manageOff;
    json["sticky"]    = rule.sticky;
    json["layer"]     = std::string{WINDOW_LAYERS.toString(rule.layer)};
    json["isEnabled"] = rule.enabled;
    if (rule.title)
        json["titlePattern"] = *rule.title;
    if (rule.space)
        json["assignedSpace"] = static_cast<double>(*rule.space);
    return json;
}

static glz::generic ruleToJson(const SWindowRule& rule) {
    auto json = newObject();
    json["id"]      = rule.id;
    json["manage"]  = rule.manage;
    json["enabled"] = rule.enabled;
    if (rule.app)
        json["appName"] = *rule.app;
    if (rule.title)
        json["title"] = *rule.title;
    if (rule.sticky)
        json["sticky"] = *rule.sticky;
    if (rule.layer)
        json["layer"] = std::string{WINDOW_LAYERS.toString(*rule.layer)};
    if (rule.space)
        json["space"] = static_cast<double>(*rule.space);
    return json;
}

static glz::generic signalToJson(const SSignal& signal) {
    auto json = newObject();
    json["id"]      = signal.id;
    json["event"]   = signal.event;
    json["action"]  = signal.action;
    json["enabled"] = signal.enabled;
    if (signal.label)
        json["label"] = *signal.label;
    return json;
}

static glz::generic spaceToJson(const SSpaceConfig& space) {
    auto json = newObject();
    json["index"] = static_cast<double>(space.index);
    if (space.label)
        json["label"] = *space.label;
    if (space.layout)
        json["layout"] = std::string{LAYOUTS.toString(*space.layout)};

    const std::pair<const char*, const std::optional<int64_t>*> INTS[] = {
        {"gap", &space.gap},
        {"topPadding", &space.topPadding},
        {"bottomPadding", &space.bottomPadding},
        {"leftPadding", &space.leftPadding},
        {"rightPadding", &space.rightPadding},
    };

    for (const auto& [key, value] : INTS) {
        if (value->has_value())
            json[key] = static_cast<double>(**value);
    }

    if (!space.extras.empty())
        json["extraSettings"] = keyValuesToJson(space.extras);

    return json;
}

static glz::generic bindingToJson(const SHotkeyBinding& binding) {
    auto json = newObject();
    json["id"]     = binding.id;
    json["key"]    = binding.key;
    json["action"] = binding.action;

    JsonArray mods;
    for (const auto& m : binding.modifiers) {
        mods.emplace_back(m);
    }
    json["modifiers"] = std::move(mods);
    json["enabled"]   = binding.enabled;

    if (binding.category)
        json["category"] = *binding.category;
    if (binding.description)
        json["description"] = *binding.description;
    return json;
}

static ShapeResult<SExclusionRule> exclusionFromJson(const glz::generic& json, const std::string& path) {
    const auto OBJ = asObject(json, path);
    if (!OBJ)
        return std::unexpected(OBJ.error());
    const auto& O = **OBJ;

    SExclusionRule rule;

    auto id = requiredField<std::string>(O, "id", path, asString);
    if (!id)
        return std::unexpected(id.error());
    rule.id = *id;

    auto app = requiredField<std::string>(O, "appName", path, asString);
    if (!app)
        return std::unexpected(app.error());
    rule.app = stripAnchors(*app);

    auto title = optionalField<std::string>(O, "titlePattern", path, asString);
    if (!title)
        return std::unexpected(title.error());
    rule.title = *title;

    auto manageOff = optionalField<bool>(O, "manageOff", path, asBool);
    auto sticky    = optionalField<bool>(O, "sticky", path, asBool);
    auto enabled   = optionalField<bool>(O, "isEnabled", path, asBool);
    auto space     = optionalField<int64_t>(O, "assignedSpace", path, asInt);
    auto layer     = optionalField<std::string>(O, "layer", path, asString);

    if (const auto ERR = firstError(manageOff, sticky, enabled, space, layer); ERR)
        return std::unexpected(*ERR);

    rule.manageOff = manageOff->value_or(true);
    rule.sticky    = sticky->value_or(false);
    rule.enabled   = enabled->value_or(true);
    rule.space     = *space;

    if (layer->has_value()) {
        const auto L = WINDOW_LAYERS.fromString(**layer);
        if (!L)
            return std::unexpected(std::format("{}.layer: unknown layer \"{}\"", path, **layer));
        rule.layer = *L;
    }

    return rule;
}

static ShapeResult<SWindowRule> ruleFromJson(const glz::generic& json, const std::string& path) {
    const auto OBJ = asObject(json, path);
    if (!OBJ)
        return std::unexpected(OBJ.error());
    const auto& O = **OBJ;

    auto        id      = requiredField<std::string>(O, "id", path, asString);
    auto        app     = optionalField<std::string>(O, "appName", path, asString);
    auto        title   = optionalField<std::string>(O, "title", path, asString);
    auto        manage  = optionalField<bool>(O, "manage", path, asBool);
    auto        sticky  = optionalField<bool>(O, "sticky", path, asBool);
    auto        layer   = optionalField<std::string>(O, "layer", path, asString);
    auto        space   = optionalField<int64_t>(O, "space", path, asInt);
    auto        enabled = optionalField<bool>(O, "enabled", path, asBool);

    if (const auto ERR = firstError(id, app, title, manage, sticky, layer, space, enabled); ERR)
        return std::unexpected(*ERR);

    SWindowRule rule{
        .id      = *id,
        .app     = app->has_value() ? std::optional<std::string>{stripAnchors(**app)} : std::nullopt,
        .title   = *title,
        .manage  = manage->value_or(true),
        .sticky  = *sticky,
        .space   = *space,
        .enabled = enabled->value_or(true),
    };

    if (layer->has_value()) {
        const auto L = WINDOW_LAYERS.fromString(**layer);
        if (!L)
            return std::unexpected(std::format("{}.layer: unknown layer \"{}\"", path, **layer));
        rule.layer = *L;
    }

    if (!rule.hasSelector())
        return std::unexpected(std::format("{}: a rule needs appName or title", path));

    return rule;
}

static ShapeResult<SSignal> signalFromJson(const glz::generic& json, const std::string& path) {
    const auto OBJ = asObject(json, path);
    if (!OBJ)
        return std::unexpected(OBJ.error());
    const auto& O = **OBJ;

    auto        id      = requiredField<std::string>(O, "id", path, asString);
    auto        event   = requiredField<std::string>(O, "event", path, asString);
    auto        action  = requiredField<std::string>(O, "action", path, asString);
    auto        label   = optionalField<std::string>(O, "label", path, asString);
    auto        enabled = optionalField<bool>(O, "enabled", path, asBool);

    if (const auto ERR = firstError(id, event, action, label, enabled); ERR)
        return std::unexpected(*ERR);

    SSignal signal{.id = *id, .event = *event, .action = *action, .label = *label, .enabled = enabled->value_or(true)};

    if (!signal.complete())
        return std::unexpected(std::format("{}: event and action can't be empty", path));

    return signal;
}

static ShapeResult<SSpaceConfig> spaceFromJson(const glz::generic& json, const std::string& path) {
    const auto OBJ = asObject(json, path);
    if (!OBJ)
        return std::unexpected(OBJ.error());
    const auto& O = **OBJ;

    auto        index  = requiredField<int64_t>(O, "index", path, asInt);
    auto        label  = optionalField<std::string>(O, "label", path, asString);
    auto        layout = optionalField<std::string>(O, "layout", path, asString);
    auto        gap    = optionalField<int64_t>(O, "gap", path, asInt);
    auto        top    = optionalField<int64_t>(O, "topPadding", path, asInt);
    auto        bottom = optionalField<int64_t>(O, "bottomPadding", path, asInt);
    auto        left   = optionalField<int64_t>(O, "leftPadding", path, asInt);
    auto        right  = optionalField<int64_t>(O, "rightPadding", path, asInt);
    auto        extras = listField<std::pair<std::string, std::string>>(O, "extraSettings", path, keyValueFromJson);

    if (const auto ERR = firstError(index, label, layout, gap, top, bottom, left, right, extras); ERR)
        return std::unexpected(*ERR);

    SSpaceConfig space{
        .index         = *index,
        .label         = *label,
        .gap           = *gap,
        .topPadding    = *top,
        .bottomPadding = *bottom,
        .leftPadding   = *left,
        .rightPadding  = *right,
        .extras        = *extras,
    };

    if (layout->has_value()) {
        const auto L = LAYOUTS.fromString(**layout);
        if (!L)
            return std::unexpected(std::format("{}.layout: unknown layout \"{}\"", path, **layout));
        space.layout = *L;
    }

    for (const auto& [key, value] : space.extras) {
        if (key.empty() || value.empty() || std::ranges::any_of(key, [](char c) { return std::isspace(static_cast<unsigned char>(c)); }) || trim(value) != value)
            return std::unexpected(std::format("{}.extraSettings: \"{}\" can't be written as a space line", path, key));
    }

    // replayed like the directive text, the pairs must not touch the typed overrides
    auto replay = space;
    replay.extras.clear();
    for (const auto& [key, value] : space.extras) {
        replay.applyOverride(key, value);
    }

    if (replay != space)
        return std::unexpected(std::format("{}.extraSettings: pairs overlap the typed overrides or repeat a key", path));

    return space;
}

static ShapeResult<SHotkeyBinding> bindingFromJson(const glz::generic& json, const std::string& path) {
    const auto OBJ = asObject(json, path);
    if (!OBJ)
        return std::unexpected(OBJ.error());
    const auto& O = **OBJ;

    auto        id          = requiredField<std::string>(O, "id", path, asString);
    auto        key         = requiredField<std::string>(O, "key", path, asString);
    auto        action      = requiredField<std::string>(O, "action", path, asString);
    auto        modifiers   = listField<std::string>(O, "modifiers", path, asString);
    auto        category    = optionalField<std::string>(O, "category", path, asString);
    auto        description = optionalField<std::string>(O, "description", path, asString);
    auto        enabled     = optionalField<bool>(O, "enabled", path, asBool);

    if (const auto ERR = firstError(id, key, action, modifiers, category, description, enabled); ERR)
        return std::unexpected(*ERR);

    if (!field(O, "modifiers"))
        return std::unexpected(std::format("{}.modifiers: missing", path));

    return SHotkeyBinding{
        .id          = *id,
        .modifiers   = *modifiers,
        .key         = *key,
        .action      = *action,
        .category    = *category,
        .description = *description,
        .enabled     = enabled->value_or(true),
    };
}

static ShapeResult<std::pair<SettingMap, ExtraSettings>> settingsFromJson(const JsonObject& root) {
    SettingMap    settings;
    ExtraSettings extra;

    if (const auto* SETTINGS = field(root, "settings"); SETTINGS) {
        const auto OBJ = asObject(*SETTINGS, "$.settings");
        if (!OBJ)
            return std::unexpected(OBJ.error());

        for (const auto& [key, value] : **OBJ) {
            const auto  PATH = std::format("$.settings.{}", key);
            const auto* DESC = findSetting(key);
            if (!DESC)
                return std::unexpected(std::format("{}: unknown setting, use extraSettings", PATH));

            if (std::holds_alternative<std::nullptr_t>(value.data))
                continue;

            switch (DESC->type) {
                case SETTING_TYPE_BOOL: {
                    const auto V = asBool(value, PATH);
                    if (!V)
                        return std::unexpected(V.error());
                    settings[key] = *V;
                    break;
                }
                case SETTING_TYPE_INT: {
                    const auto V = asInt(value, PATH);
                    if (!V)
                        return std::unexpected(V.error());
                    settings[key] = *V;
                    break;
                }
                case SETTING_TYPE_FLOAT: {
                    const auto V = asNumber(value, PATH);
                    if (!V)
                        return std::unexpected(V.error());
                    settings[key] = *V;
                    break;
                }
                case SETTING_TYPE_STRING: {
                    const auto V = asString(value, PATH);
                    if (!V)
                        return std::unexpected(V.error());
                    settings[key] = *V;
                    break;
                }
            }
        }
    }

    auto pairs = listField<std::pair<std::string, std::string>>(root, "extraSettings", "$", keyValueFromJson);

    if (!pairs)
        return std::unexpected(pairs.error());

    for (auto& [key, value] : *pairs) {
        if (findSetting(key))
            return std::unexpected(std::format("$.extraSettings: {} is a recognized setting, put it in settings", key));
        extra.emplace_back(std::move(key), std::move(value));
    }

    return std::pair{std::move(settings), std::move(extra)};
}

template <typename T>
static std::optional<std::string> duplicateId(const std::vector<T>& items, const std::string& what) {
    std::set<std::string> seen;
    for (const auto& i : items) {
        if (!seen.insert(i.id).second)
            return std::format("{}: duplicate id {}", what, i.id);
    }
    return std::nullopt;
}

std::expected<std::string, SJsonError> Config::Json::directiveToJson(const CDirectiveConfig& config) {
    auto settings = newObject();
    for (const auto& [key, value] : config.settings()) {
        settings[key] = settingToJson(value);
    }

    JsonArray exclusions, rules, signals, spaces;
    for (const auto& r : config.exclusions()) {
        exclusions.emplace_back(exclusionToJson(r));
    }
    for (const auto& r : config.rules()) {
        rules.emplace_back(ruleToJson(r));
    }
    for (const auto& s : config.signals()) {
        signals.emplace_back(signalToJson(s));
    }
    for (const auto& s : config.spaces()) {
        spaces.emplace_back(spaceToJson(s));
    }

    auto root             = newObject();
    root["settings"]      = std::move(settings);
    root["extraSettings"] = keyValuesToJson(config.extraSettings());
    root["exclusions"]    = std::move(exclusions);
    root["rules"]         = std::move(rules);
    root["signals"]       = std::move(signals);
    root["spaces"]        = std::move(spaces);

    return writeJson(root);
}

std::expected<CDirectiveConfig, SJsonError> Config::Json::directiveFromJson(std::string_view text) {
    const auto JSON = parseJson(text);
    if (!JSON)
        return std::unexpected(JSON.error());

    const auto ROOT = asObject(*JSON, "$");
    if (!ROOT)
        return std::unexpected(shapeError(ROOT.error()));

    auto settings   = settingsFromJson(**ROOT);
    auto exclusions = listField<SExclusionRule>(**ROOT, "exclusions", "$", exclusionFromJson);
    auto rules      = listField<SWindowRule>(**ROOT, "rules", "$", ruleFromJson);
    auto signals    = listField<SSignal>(**ROOT, "signals", "$", signalFromJson);
    auto spaces     = listField<SSpaceConfig>(**ROOT, "spaces", "$", spaceFromJson);

    if (const auto ERR = firstError(settings, exclusions, rules, signals, spaces); ERR)
        return std::unexpected(shapeError(*ERR));

    std::set<int64_t> indices;
    for (const auto& s : *spaces) {
        if (!indices.insert(s.index).second)
            return std::unexpected(shapeError(std::format("$.spaces: space {} appears twice", s.index)));
    }

    for (const auto& ERR : {duplicateId(*exclusions, "$.exclusions"), duplicateId(*rules, "$.rules"), duplicateId(*signals, "$.signals")}) {
        if (ERR)
            return std::unexpected(shapeError(*ERR));
    }

    return CDirectiveConfig{std::move(settings->first), std::move(settings->second), std::move(*exclusions), std::move(*rules), std::move(*signals), std::move(*spaces)};
}

std::expected<std::string, SJsonError> Config::Json::bindingsToJson(const CBindingSet& set) {
    JsonArray bindings;
    for (const auto& b : set.bindings()) {
        bindings.emplace_back(bindingToJson(b));
    }

    auto root        = newObject();
    root["bindings"] = std::move(bindings);

    return writeJson(root);
}

std::expected<CBindingSet, SJsonError> Config::Json::bindingsFromJson(std::string_view text) {
    const auto JSON = parseJson(text);
    if (!JSON)
        return std::unexpected(JSON.error());

    const auto ROOT = asObject(*JSON, "$");
    if (!ROOT)
        return std::unexpected(shapeError(ROOT.error()));

    auto bindings = listField<SHotkeyBinding>(**ROOT, "bindings", "$", bindingFromJson);
    if (!bindings)
        return std::unexpected(shapeError(bindings.error()));

    if (const auto ERR = duplicateId(*bindings, "$.bindings"); ERR)
        return std::unexpected(shapeError(*ERR));

    return CBindingSet{std::move(*bindings)};
}

std::expected<std::string, SJsonError> Config::Json::exclusionsToJson(const std::vector<SExclusionRule>& rules) {
    JsonArray arr;
    for (const auto& r : rules) {
        arr.emplace_back(exclusionToJson(r));
    }

    glz::generic root;
    root.data = std::move(arr);

    return writeJson(root);
}

std::expected<std::vector<SExclusionRule>, SJsonError> Config::Json::exclusionsFromJson(std::string_view text) {
    const auto JSON = parseJson(text);
    if (!JSON)
        return std::unexpected(JSON.error());

    const auto ARR = asArray(*JSON, "$");
    if (!ARR)
        return std::unexpected(shapeError(ARR.error()));

    std::vector<SExclusionRule> result;
    for (size_t i = 0; i < (*ARR)->size(); ++i) {
        auto rule = exclusionFromJson((**ARR)[i], std::format("$[{}]", i));
        if (!rule)
            return std::unexpected(shapeError(rule.error()));
        result.emplace_back(std::move(*rule));
    }

    if (const auto ERR = duplicateId(result, "$"); ERR)
        return std::unexpected(shapeError(*ERR));

    return result;
}
