#include "Presets.hpp"
#include "CategoryClassifier.hpp"

#include <format>
#include <string>

using namespace Config;
using namespace Config::Binding;

namespace {
    struct SPresetEntry {
        std::vector<std::string> modifiers;
        std::string              key;
        std::string              action;
        std::string              description;
    };

    std::string focus(std::string_view dir) {
        return std::format("yabai -m window --focus {}", dir);
    }

    std::string swap(std::string_view dir) {
        return std::format("yabai -m window --swap {}", dir);
    }

    std::string warp(std::string_view dir) {
        return std::format("yabai -m window --warp {}", dir);
    }

    std::string stack(std::string_view dir) {
        return std::format("yabai -m window --stack {}", dir);
    }

    std::string resize(std::string_view edge, int dx, int dy) {
        return std::format("yabai -m window --resize {}:{}:{}", edge, dx, dy);
    }

    const std::string TOGGLE_FULLSCREEN = "yabai -m window --toggle zoom-fullscreen";
    const std::string TOGGLE_FLOAT      = "yabai -m window --toggle float";
    const std::string TOGGLE_SPLIT      = "yabai -m window --toggle split";

    // mods + 1..count focus a space, 10 sits on 0
    void addSpaceFocus(std::vector<SPresetEntry>& entries, const std::vector<std::string>& mods, int count, std::string_view noun = "space") {
        for (int i = 1; i <= count; ++i) {
            entries.emplace_back(SPresetEntry{mods, std::to_string(i % 10), std::format("yabai -m space --focus {}", i), std::format("Focus {} {}", noun, i)});
        }
    }

    void addSpaceMove(std::vector<SPresetEntry>& entries, const std::vector<std::string>& mods, int count, std::string_view what = "window to space") {
        for (int i = 1; i <= count; ++i) {
            entries.emplace_back(SPresetEntry{mods, std::to_string(i % 10), std::format("yabai -m window --space {}", i), std::format("Move {} {}", what, i)});
        }
    }

    std::vector<SPresetEntry> vimEntries() {
        std::vector<SPresetEntry> e = {
            {{"alt"}, "h", focus("west"), "Focus window to the west"},
            {{"alt"}, "j", focus("south"), "Focus window to the south"},
            {{"alt"}, "k", focus("north"), "Focus window to the north"},
            {{"alt"}, "l", focus("east"), "Focus window to the east"},
            {{"alt", "shift"}, "h", swap("west"), "Swap with window to the west"},
            {{"alt", "shift"}, "j", swap("south"), "Swap with window to the south"},
            {{"alt", "shift"}, "k", swap("north"), "Swap with window to the north"},
            {{"alt", "shift"}, "l", swap("east"), "Swap with window to the east"},
            {{"alt", "ctrl"}, "h", warp("west"), "Warp to the west"},
            {{"alt", "ctrl"}, "j", warp("south"), "Warp to the south"},
            {{"alt", "ctrl"}, "k", warp("north"), "Warp to the north"},
            {{"alt", "ctrl"}, "l", warp("east"), "Warp to the east"},
            {{"alt", "cmd"}, "h", resize("left", -50, 0), "Shrink from left edge"},
            {{"alt", "cmd"}, "j", resize("bottom", 0, 50), "Grow from bottom edge"},
            {{"alt", "cmd"}, "k", resize("top", 0, -50), "Shrink from top edge"},
            {{"alt", "cmd"}, "l", resize("right", 50, 0), "Grow from right edge"},
        };

        addSpaceFocus(e, {"alt"}, 9);
        addSpaceMove(e, {"alt", "shift"}, 9);

        e.insert(e.end(),
                 {
                     {{"alt"}, "f", TOGGLE_FULLSCREEN, "Toggle fullscreen zoom"},
                     {{"alt", "shift"}, "f", TOGGLE_FLOAT, "Toggle float"},
                     {{"alt"}, "s", TOGGLE_SPLIT, "Toggle split orientation"},
                     {{"alt"}, "e", "yabai -m space --balance", "Balance windows"},
                     {{"alt"}, "r", "yabai -m space --rotate 90", "Rotate layout 90 degrees"},
                     {{"alt", "shift"}, "r", "yabai -m space --rotate 270", "Rotate layout -90 degrees"},
                     {{"alt"}, "p", "yabai -m display --focus prev", "Focus previous display"},
                     {{"alt"}, "n", "yabai -m display --focus next", "Focus next display"},
                     {{"alt", "shift"}, "p", "yabai -m window --display prev", "Move window to previous display"},
                     {{"alt", "shift"}, "n", "yabai -m window --display next", "Move window to next display"},
                 });

        return e;
    }

    std::vector<SPresetEntry> arrowEntries() {
        std::vector<SPresetEntry> e = {
            {{"alt"}, "left", focus("west"), "Focus window to the left"},
            {{"alt"}, "down", focus("south"), "Focus window below"},
            {{"alt"}, "up", focus("north"), "Focus window above"},
            {{"alt"}, "right", focus("east"), "Focus window to the right"},
            {{"alt", "shift"}, "left", swap("west"), "Swap with window to the left"},
            {{"alt", "shift"}, "down", swap("south"), "Swap with window below"},
            {{"alt", "shift"}, "up", swap("north"), "Swap with window above"},
            {{"alt", "shift"}, "right", swap("east"), "Swap with window to the right"},
            {{"alt", "cmd"}, "left", resize("right", -50, 0), "Shrink window width"},
            {{"alt", "cmd"}, "down", resize("bottom", 0, 50), "Grow window height"},
            {{"alt", "cmd"}, "up", resize("bottom", 0, -50), "Shrink window height"},
            {{"alt", "cmd"}, "right", resize("right", 50, 0), "Grow window width"},
        };

        addSpaceFocus(e, {"ctrl"}, 9);
        addSpaceMove(e, {"ctrl", "shift"}, 9);

        e.insert(e.end(),
                 {
                     {{"alt"}, "return", TOGGLE_FULLSCREEN, "Toggle fullscreen"},
                     {{"alt", "shift"}, "space", TOGGLE_FLOAT, "Toggle float"},
                 });

        return e;
    }

    std::vector<SPresetEntry> minimalEntries() {
        std::vector<SPresetEntry> e = {
            {{"alt"}, "h", focus("west"), "Focus left"},
            {{"alt"}, "l", focus("east"), "Focus right"},
            {{"alt"}, "j", focus("south"), "Focus down"},
            {{"alt"}, "k", focus("north"), "Focus up"},
            {{"alt"}, "f", TOGGLE_FULLSCREEN, "Toggle fullscreen"},
            {{"alt", "shift"}, "f", TOGGLE_FLOAT, "Toggle float"},
        };

        addSpaceFocus(e, {"alt"}, 5);

        return e;
    }

    std::vector<SPresetEntry> i3Entries() {
        std::vector<SPresetEntry> e = {
            {{"alt"}, "j", focus("west"), "Focus left"},
            {{"alt"}, "k", focus("south"), "Focus down"},
            {{"alt"}, "l", focus("north"), "Focus up"},
            {{"alt"}, ";", focus("east"), "Focus right"},
            {{"alt", "shift"}, "j", swap("west"), "Move left"},
            {{"alt", "shift"}, "k", swap("south"), "Move down"},
            {{"alt", "shift"}, "l", swap("north"), "Move up"},
            {{"alt", "shift"}, ";", swap("east"), "Move right"},
        };

        addSpaceFocus(e, {"alt"}, 10, "workspace");
        addSpaceMove(e, {"alt", "shift"}, 10, "to workspace");

        e.insert(e.end(),
                 {
                     {{"alt"}, "e", "yabai -m space --layout bsp", "BSP layout (tiling)"},
                     {{"alt"}, "s", "yabai -m space --layout stack", "Stack layout (tabbed)"},
                     {{"alt"}, "w", "yabai -m space --layout float", "Floating layout"},
                     {{"alt"}, "f", TOGGLE_FULLSCREEN, "Toggle fullscreen"},
                     {{"alt", "shift"}, "space", TOGGLE_FLOAT, "Toggle floating"},
                     {{"alt"}, "v", TOGGLE_SPLIT, "Toggle split orientation"},
                     {{"alt", "ctrl"}, "j", resize("left", -50, 0), "Shrink width"},
                     {{"alt", "ctrl"}, "k", resize("bottom", 0, 50), "Grow height"},
                     {{"alt", "ctrl"}, "l", resize("bottom", 0, -50), "Shrink height"},
                     {{"alt", "ctrl"}, ";", resize("right", 50, 0), "Grow width"},
                 });

        return e;
    }

    std::vector<SPresetEntry> stackEntries() {
        return {
            {{"alt"}, "n", "yabai -m window --focus stack.next", "Focus next in stack"},
            {{"alt"}, "p", "yabai -m window --focus stack.prev", "Focus previous in stack"},
            {{"alt"}, "[", "yabai -m window --focus stack.first", "Focus first in stack"},
            {{"alt"}, "]", "yabai -m window --focus stack.last", "Focus last in stack"},
            {{"alt", "shift"}, "h", stack("west"), "Stack with west window"},
            {{"alt", "shift"}, "j", stack("south"), "Stack with south window"},
            {{"alt", "shift"}, "k", stack("north"), "Stack with north window"},
            {{"alt", "shift"}, "l", stack("east"), "Stack with east window"},
            {{"alt", "ctrl"}, "h", warp("west"), "Warp west (unstack)"},
            {{"alt", "ctrl"}, "l", warp("east"), "Warp east (unstack)"},
        };
    }

    std::vector<SPresetEntry> entriesFor(ePreset preset) {
        switch (preset) {
            case PRESET_VIM: return vimEntries();
            case PRESET_ARROWS: return arrowEntries();
            case PRESET_MINIMAL: return minimalEntries();
            case PRESET_I3: return i3Entries();
            case PRESET_STACK: return stackEntries();
        }
        return {};
    }
}

CBindingSet Config::Binding::presetBindings(ePreset preset) {
    std::vector<SHotkeyBinding> bindings;

    for (auto& e : entriesFor(preset)) {
        const auto CATEGORY = classifyBinding(e.action);
        bindings.emplace_back(SHotkeyBinding{
            .id          = std::format("binding_{}", bindings.size()),
            .modifiers   = std::move(e.modifiers),
            .key         = std::move(e.key),
            .action      = std::move(e.action),
            .category    = std::string{BINDING_CATEGORIES.toString(CATEGORY)},
            .description = std::move(e.description),
        });
    }

    return CBindingSet{std::move(bindings)};
}

std::vector<std::pair<ePresetCategory, std::vector<SHotkeyBinding>>> Config::Binding::presetGroups(ePreset preset) {
    const auto                                                           SET = presetBindings(preset);
    std::vector<std::pair<ePresetCategory, std::vector<SHotkeyBinding>>> result;

    for (const auto& entry : PRESET_CATEGORIES.entries()) {
        std::vector<SHotkeyBinding> group;
        for (const auto& b : SET.bindings()) {
            if (classifyPreset(b.action) == entry.value)
                group.emplace_back(b);
        }

        if (!group.empty())
            result.emplace_back(entry.value, std::move(group));
    }

    return result;
}
