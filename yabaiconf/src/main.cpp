#include "helpers/StringUtils.hpp"

#include <config/directive/DirectiveParser.hpp>
#include <config/directive/DirectiveGenerator.hpp>
#include <config/binding/BindingParser.hpp>
#include <config/binding/BindingGenerator.hpp>
#include <config/binding/Presets.hpp>
#include <config/validation/ConflictValidator.hpp>
#include <config/validation/LineValidator.hpp>
#include <config/validation/SettingsValidator.hpp>
#include <config/json/JsonExchange.hpp>
#include <debug/log/Logger.hpp>
#include <helpers/fs/FsUtils.hpp>

#include <cstdio>
#include <optional>
#include <print>
#include <string>
#include <vector>

using namespace Config;

constexpr std::string_view HELP = R"#(┏ yabaiconf, a yabai / skhd config tool
┃
┣ check [file]                 → Report structural problems, bad values and hotkey conflicts.
┣ format [file]                → Print the canonical form of a config.
┣ json [file]                  → Print a config as json.
┣ import [file.json]           → Print config text from json written by the json command.
┣ exclusions [file]            → Print the window exclusions of a yabai config as json.
┣ conflicts [file]             → List hotkeys bound more than once.
┣ match [file] [app] [title]   → List rules and exclusions that apply to a window.
┣ presets                      → List the built-in skhd presets.
┣ preset [name]                → Print the skhd config of a preset.
┣ events                       → List the yabai signal events.
┃
┣ Flags:
┃
┣ --yabai        | -y    → Treat the file as a yabai config.
┣ --skhd         | -s    → Treat the file as an skhd config.
┣ --output       | -o    → Write to a file instead of stdout.
┣ --log-file             → Mirror logs into a file.
┣ --help         | -h    → Show this menu.
┣ --verbose      | -v    → Enable debug logging.
┣ --quiet        | -q    → No log output on stdout.
┃
┣ Without --yabai or --skhd, files with skhd in their name are skhd configs.
┗
)#";

enum eFileKind : uint8_t {
    FILE_KIND_GUESS = 0,
    FILE_KIND_YABAI,
    FILE_KIND_SKHD,
};

static eFileKind resolveKind(eFileKind forced, const std::string& path) {
    if (forced != FILE_KIND_GUESS)
        return forced;

    return path.contains("skhd") ? FILE_KIND_SKHD : FILE_KIND_YABAI;
}

static const char* kindName(eFileKind kind) {
    return kind == FILE_KIND_SKHD ? "skhd" : "yabai";
}

static bool requireKind(const std::string& command, const std::string& path, eFileKind kind, eFileKind wanted) {
    if (kind == wanted)
        return true;

    std::println(stderr, "{}", failureString("{} needs a {} config, {} reads as {}. Pass --{} to override.", command, kindName(wanted), path, kindName(kind), kindName(wanted)));
    return false;
}

static bool emit(const std::string& content, const std::string& output) {
    if (output.empty()) {
        std::print("{}", content);
        return true;
    }

    if (!NFsUtils::writeToFile(output, content)) {
        std::println(stderr, "{}", failureString("Couldn't write {}", output));
        return false;
    }

    std::println(stderr, "{}", successString("Wrote {}", output));
    return true;
}

static int check(const std::string& text, eFileKind kind) {
    size_t issues = 0;

    if (kind == FILE_KIND_YABAI) {
        for (const auto& d : Validation::validateDirectiveText(text)) {
            std::println("{}", failureString("{}", d.toString()));
            issues++;
        }

        for (const auto& i : Validation::validateSettings(Directive::parseDirectives(text))) {
            std::println("{}", warningString("{}: {}", i.subject, i.message));
            issues++;
        }
    } else {
        for (const auto& d : Validation::validateBindingText(text)) {
            std::println("{}", failureString("{}", d.toString()));
            issues++;
        }

        const auto SET = Binding::parseBindings(text);

        for (const auto& i : Validation::validateBindingSet(SET)) {
            std::println("{}", warningString("{}: {}", i.subject, i.message));
            issues++;
        }

        for (const auto& c : Validation::allConflicts(SET)) {
            std::println("{}", warningString("{} is bound twice: {} and {}", Binding::hotkeyString(c.first), c.first.action, c.second.action));
            issues++;
        }
    }

    if (issues == 0) {
        std::println("{}", successString("No problems found"));
        return 0;
    }

    std::println("{}", infoString("{} problem(s) found", issues));
    return 1;
}

static int conflicts(const std::string& text) {
    const auto CONFLICTS = Validation::allConflicts(Binding::parseBindings(text));

    if (CONFLICTS.empty()) {
        std::println("{}", successString("No conflicting hotkeys"));
        return 0;
    }

    for (const auto& c : CONFLICTS) {
        std::println("{}", failureString("{}", Binding::hotkeyString(c.first)));
        std::println("    {} ({})", c.first.action, c.first.id);
        std::println("    {} ({})", c.second.action, c.second.id);
    }

    return 1;
}

static int listPresets() {
    for (const auto& entry : PRESETS.entries()) {
        std::println("{}", infoString("{} ({}, {} bindings)", entry.str, entry.displayName, Binding::presetBindings(entry.value).bindings().size()));
        std::println("    {}", entry.description);

        for (const auto& [category, bindings] : Binding::presetGroups(entry.value)) {
            std::println("    {}: {}", PRESET_CATEGORIES.displayName(category), bindings.size());
        }
    }

    return 0;
}

static int listEvents() {
    for (const auto& e : SIGNAL_EVENTS) {
        std::println("{:<28} {}", e.event, e.description);
    }

    return 0;
}

static int match(const std::string& text, const std::string& app, const std::string& title) {
    const auto CONFIG  = Directive::parseDirectives(text);
    size_t     matched = 0;

    for (const auto& e : CONFIG.exclusions()) {
        if (!e.enabled || !e.matches(app, title))
            continue;
        std::println("{}", infoString("{}", Directive::exclusionLine(e)));
        matched++;
    }

    for (const auto& r : CONFIG.rules()) {
        if (!r.enabled || !r.matches(app, title))
            continue;
        std::println("{}", infoString("{}", Directive::windowRuleLine(r)));
        matched++;
    }

    if (matched == 0) {
        std::println("{}", warningString("Nothing applies to {}", app));
        return 1;
    }

    return 0;
}

int main(int argc, char** argv) {
    std::vector<std::string> ARGS(static_cast<size_t>(argc));
    for (int i = 0; i < argc; ++i) {
        ARGS[i] = std::string{argv[i]};
    }

    if (ARGS.size() < 2) {
        std::println(stderr, "{}", HELP);
        return 1;
    }

    std::vector<std::string> command;
    bool                     verbose = false, quiet = false;
    eFileKind                kind = FILE_KIND_GUESS;
    std::string              output, logFile;

    for (int i = 1; i < argc; ++i) {
        if (ARGS[i].starts_with("-") && ARGS[i].size() > 1) {
            if (ARGS[i] == "--help" || ARGS[i] == "-h") {
                std::println("{}", HELP);
                return 0;
            } else if (ARGS[i] == "--verbose" || ARGS[i] == "-v") {
                verbose = true;
            } else if (ARGS[i] == "--quiet" || ARGS[i] == "-q") {
                quiet = true;
            } else if (ARGS[i] == "--yabai" || ARGS[i] == "-y") {
                kind = FILE_KIND_YABAI;
            } else if (ARGS[i] == "--skhd" || ARGS[i] == "-s") {
                kind = FILE_KIND_SKHD;
            } else if (ARGS[i] == "--output" || ARGS[i] == "-o" || ARGS[i] == "--log-file") {
                if (i + 1 >= argc) {
                    std::println(stderr, "Missing argument for {}", ARGS[i]);
                    return 1;
                }
                (ARGS[i] == "--log-file" ? logFile : output) = ARGS[i + 1];
                i++;
            } else {
                std::println(stderr, "Unrecognized option {}", ARGS[i]);
                return 1;
            }
        } else
            command.push_back(ARGS[i]);
    }

    if (command.empty()) {
        std::println(stderr, "{}", HELP);
        return 1;
    }

    Log::logger->setVerbose(verbose);
    if (quiet)
        Log::logger->quiet();
    if (!logFile.empty())
        Log::logger->setOutputFile(logFile);

    if (command[0] == "presets")
        return listPresets();
    else if (command[0] == "events")
        return listEvents();

    if (command.size() < 2) {
        std::println(stderr, "{}", HELP);
        return 1;
    }

    if (command[0] == "preset") {
        const auto PRESET = PRESETS.fromString(command[1]);
        if (!PRESET) {
            std::println(stderr, "{}", failureString("No preset named {}, see yabaiconf presets", command[1]));
            return 1;
        }

        return emit(Binding::generateBindings(Binding::presetBindings(*PRESET)), output) ? 0 : 1;
    }

    const auto& PATH = command[1];
    const auto  TEXT = NFsUtils::readFileAsString(PATH);
    if (!TEXT) {
        std::println(stderr, "{}", failureString("Couldn't read {}", PATH));
        return 1;
    }

    const auto KIND = resolveKind(kind, PATH);

    Log::logger->log(Log::DEBUG, "yabaiconf: {} on {} ({})", command[0], PATH, kindName(KIND));

    if (command[0] == "check") {
        return check(*TEXT, KIND);
    } else if (command[0] == "format") {
        const auto OUT = KIND == FILE_KIND_SKHD ? Binding::generateBindings(Binding::parseBindings(*TEXT)) : Directive::generateDirectives(Directive::parseDirectives(*TEXT));
        return emit(OUT, output) ? 0 : 1;
    } else if (command[0] == "json") {
        const auto OUT = KIND == FILE_KIND_SKHD ? Json::bindingsToJson(Binding::parseBindings(*TEXT)) : Json::directiveToJson(Directive::parseDirectives(*TEXT));
        if (!OUT) {
            std::println(stderr, "{}", failureString("Couldn't write json: {}", OUT.error().message));
            return 1;
        }
        return emit(*OUT + "\n", output) ? 0 : 1;
    } else if (command[0] == "import") {
        std::string out;

        if (KIND == FILE_KIND_SKHD) {
            const auto SET = Json::bindingsFromJson(*TEXT);
            if (!SET) {
                std::println(stderr, "{}", failureString("{}: {}", PATH, SET.error().message));
                return 1;
            }
            out = Binding::generateBindings(*SET);
        } else {
            const auto CONFIG = Json::directiveFromJson(*TEXT);
            if (!CONFIG) {
                std::println(stderr, "{}", failureString("{}: {}", PATH, CONFIG.error().message));
                return 1;
            }
            out = Directive::generateDirectives(*CONFIG);
        }

        return emit(out, output) ? 0 : 1;
    } else if (command[0] == "exclusions") {
        if (!requireKind(command[0], PATH, KIND, FILE_KIND_YABAI))
            return 1;

        const auto OUT = Json::exclusionsToJson(Directive::parseExclusionRules(*TEXT));
        if (!OUT) {
            std::println(stderr, "{}", failureString("Couldn't write json: {}", OUT.error().message));
            return 1;
        }
        return emit(*OUT + "\n", output) ? 0 : 1;
    } else if (command[0] == "conflicts") {
        if (!requireKind(command[0], PATH, KIND, FILE_KIND_SKHD))
            return 1;

        return conflicts(*TEXT);
    } else if (command[0] == "match") {
        if (!requireKind(command[0], PATH, KIND, FILE_KIND_YABAI))
            return 1;

        if (command.size() < 3) {
            std::println(stderr, "{}", failureString("Not enough args for match."));
            return 1;
        }

        return match(*TEXT, command[2], command.size() >= 4 ? command[3] : "");
    }

    std::println(stderr, "{}", failureString("Unknown command {}", command[0]));
    return 1;
}
