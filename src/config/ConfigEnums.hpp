#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Config {

    template <typename E>
    struct SEnumEntry {
        E                value;
        std::string_view str;
        std::string_view displayName;
        std::string_view description = "";
        std::string_view symbol      = "";
    };

    // one row per variant, the canonical string form lives here and nowhere else
    template <typename E, size_t N>
    class CEnumTable {
      public:
        constexpr CEnumTable(std::array<SEnumEntry<E>, N> entries) : m_entries(entries) {
            ;
        }

        // case-insensitive
        std::optional<E> fromString(std::string_view s) const {
            for (const auto& e : m_entries) {
                if (equalsIgnoreCase(e.str, s))
                    return e.value;
            }
            return std::nullopt;
        }

        std::string_view toString(E value) const {
            return entry(value).str;
        }

        std::string_view displayName(E value) const {
            return entry(value).displayName;
        }

        std::string_view description(E value) const {
            return entry(value).description;
        }

        std::string_view symbol(E value) const {
            const auto& E_ = entry(value);
            return E_.symbol.empty() ? E_.str : E_.symbol;
        }

        bool contains(std::string_view s) const {
            return fromString(s).has_value();
        }

        std::vector<std::string> strings() const {
            std::vector<std::string> result;
            result.reserve(N);
            for (const auto& e : m_entries) {
                result.emplace_back(e.str);
            }
            return result;
        }

        const std::array<SEnumEntry<E>, N>& entries() const {
            return m_entries;
        }

      private:
        const SEnumEntry<E>& entry(E value) const {
            for (const auto& e : m_entries) {
                if (e.value == value)
                    return e;
            }
            return m_entries.front();
        }

        static bool equalsIgnoreCase(std::string_view a, std::string_view b) {
            if (a.size() != b.size())
                return false;

            for (size_t i = 0; i < a.size(); ++i) {
                const char CA = (a[i] >= 'A' && a[i] <= 'Z') ? a[i] - 'A' + 'a' : a[i];
                const char CB = (b[i] >= 'A' && b[i] <= 'Z') ? b[i] - 'A' + 'a' : b[i];
                if (CA != CB)
                    return false;
            }

            return true;
        }

        std::array<SEnumEntry<E>, N> m_entries;
    };

    enum eLayout : uint8_t {
        LAYOUT_BSP = 0,
        LAYOUT_FLOAT,
        LAYOUT_STACK,
    };

    enum eWindowPlacement : uint8_t {
        WINDOW_PLACEMENT_FIRST_CHILD = 0,
        WINDOW_PLACEMENT_SECOND_CHILD,
    };

    enum eMouseModifier : uint8_t {
        MOUSE_MODIFIER_ALT = 0,
        MOUSE_MODIFIER_CMD,
        MOUSE_MODIFIER_CTRL,
        MOUSE_MODIFIER_SHIFT,
        MOUSE_MODIFIER_FN,
    };

    enum eMouseAction : uint8_t {
        MOUSE_ACTION_MOVE = 0,
        MOUSE_ACTION_RESIZE,
    };

    enum eMouseDropAction : uint8_t {
        MOUSE_DROP_ACTION_SWAP = 0,
        MOUSE_DROP_ACTION_STACK,
    };

    enum eSplitType : uint8_t {
        SPLIT_TYPE_AUTO = 0,
        SPLIT_TYPE_VERTICAL,
        SPLIT_TYPE_HORIZONTAL,
    };

    enum eWindowShadow : uint8_t {
        WINDOW_SHADOW_ON = 0,
        WINDOW_SHADOW_OFF,
        WINDOW_SHADOW_FLOAT,
    };

    enum eFocusFollowsMouse : uint8_t {
        FOCUS_FOLLOWS_MOUSE_OFF = 0,
        FOCUS_FOLLOWS_MOUSE_AUTORAISE,
        FOCUS_FOLLOWS_MOUSE_AUTOFOCUS,
    };

    enum eWindowLayer : uint8_t {
        WINDOW_LAYER_BELOW = 0,
        WINDOW_LAYER_NORMAL,
        WINDOW_LAYER_ABOVE,
    };

    enum eHotkeyModifier : uint8_t {
        HOTKEY_MOD_ALT = 0,
        HOTKEY_MOD_LALT,
        HOTKEY_MOD_RALT,
        HOTKEY_MOD_SHIFT,
        HOTKEY_MOD_LSHIFT,
        HOTKEY_MOD_RSHIFT,
        HOTKEY_MOD_CMD,
        HOTKEY_MOD_LCMD,
        HOTKEY_MOD_RCMD,
        HOTKEY_MOD_CTRL,
        HOTKEY_MOD_LCTRL,
        HOTKEY_MOD_RCTRL,
        HOTKEY_MOD_FN,
        HOTKEY_MOD_HYPER,
        HOTKEY_MOD_MEH,
    };

    // hotkey grouping, space and display stay apart
    enum eBindingCategory : uint8_t {
        BINDING_CATEGORY_FOCUS = 0,
        BINDING_CATEGORY_MOVE,
        BINDING_CATEGORY_RESIZE,
        BINDING_CATEGORY_LAYOUT,
        BINDING_CATEGORY_SPACE,
        BINDING_CATEGORY_DISPLAY,
        BINDING_CATEGORY_CUSTOM,
    };

    // preset catalogue grouping, space and display share one bucket
    enum ePresetCategory : uint8_t {
        PRESET_CATEGORY_FOCUS = 0,
        PRESET_CATEGORY_MOVE,
        PRESET_CATEGORY_RESIZE,
        PRESET_CATEGORY_LAYOUT,
        PRESET_CATEGORY_SPACES,
        PRESET_CATEGORY_CUSTOM,
    };

    // ready-made skhd binding sets
    enum ePreset : uint8_t {
        PRESET_VIM = 0,
        PRESET_ARROWS,
        PRESET_MINIMAL,
        PRESET_I3,
        PRESET_STACK,
    };

    inline constexpr CEnumTable LAYOUTS{std::array{
        SEnumEntry<eLayout>{LAYOUT_BSP, "bsp", "Binary Space Partition", "Automatically tiles windows in a binary tree structure"},
        SEnumEntry<eLayout>{LAYOUT_FLOAT, "float", "Floating", "Windows float freely and can be moved/resized manually"},
        SEnumEntry<eLayout>{LAYOUT_STACK, "stack", "Stacking", "Windows stack on top of each other"},
    }};

    inline constexpr CEnumTable WINDOW_PLACEMENTS{std::array{
        SEnumEntry<eWindowPlacement>{WINDOW_PLACEMENT_FIRST_CHILD, "first_child", "First Child"},
        SEnumEntry<eWindowPlacement>{WINDOW_PLACEMENT_SECOND_CHILD, "second_child", "Second Child"},
    }};

    inline constexpr CEnumTable MOUSE_MODIFIERS{std::array{
        SEnumEntry<eMouseModifier>{MOUSE_MODIFIER_ALT, "alt", "Option (Alt)"},
        SEnumEntry<eMouseModifier>{MOUSE_MODIFIER_CMD, "cmd", "Command"},
        SEnumEntry<eMouseModifier>{MOUSE_MODIFIER_CTRL, "ctrl", "Control"},
        SEnumEntry<eMouseModifier>{MOUSE_MODIFIER_SHIFT, "shift", "Shift"},
        SEnumEntry<eMouseModifier>{MOUSE_MODIFIER_FN, "fn", "Function"},
    }};

    inline constexpr CEnumTable MOUSE_ACTIONS{std::array{
        SEnumEntry<eMouseAction>{MOUSE_ACTION_MOVE, "move", "Move Window"},
        SEnumEntry<eMouseAction>{MOUSE_ACTION_RESIZE, "resize", "Resize Window"},
    }};

    inline constexpr CEnumTable MOUSE_DROP_ACTIONS{std::array{
        SEnumEntry<eMouseDropAction>{MOUSE_DROP_ACTION_SWAP, "swap", "Swap Windows"},
        SEnumEntry<eMouseDropAction>{MOUSE_DROP_ACTION_STACK, "stack", "Stack Windows"},
    }};

    inline constexpr CEnumTable SPLIT_TYPES{std::array{
        SEnumEntry<eSplitType>{SPLIT_TYPE_AUTO, "auto", "Automatic"},
        SEnumEntry<eSplitType>{SPLIT_TYPE_VERTICAL, "vertical", "Vertical"},
        SEnumEntry<eSplitType>{SPLIT_TYPE_HORIZONTAL, "horizontal", "Horizontal"},
    }};

    inline constexpr CEnumTable WINDOW_SHADOWS{std::array{
        SEnumEntry<eWindowShadow>{WINDOW_SHADOW_ON, "on", "On"},
        SEnumEntry<eWindowShadow>{WINDOW_SHADOW_OFF, "off", "Off"},
        SEnumEntry<eWindowShadow>{WINDOW_SHADOW_FLOAT, "float", "Floating windows only"},
    }};

    inline constexpr CEnumTable FOCUS_FOLLOWS_MOUSE_MODES{std::array{
        SEnumEntry<eFocusFollowsMouse>{FOCUS_FOLLOWS_MOUSE_OFF, "off", "Off"},
        SEnumEntry<eFocusFollowsMouse>{FOCUS_FOLLOWS_MOUSE_AUTORAISE, "autoraise", "Auto-raise"},
        SEnumEntry<eFocusFollowsMouse>{FOCUS_FOLLOWS_MOUSE_AUTOFOCUS, "autofocus", "Auto-focus"},
    }};

    inline constexpr CEnumTable WINDOW_LAYERS{std::array{
        SEnumEntry<eWindowLayer>{WINDOW_LAYER_BELOW, "below", "Below", "Keep the window below normal windows"},
        SEnumEntry<eWindowLayer>{WINDOW_LAYER_NORMAL, "normal", "Normal", "Default stacking"},
        SEnumEntry<eWindowLayer>{WINDOW_LAYER_ABOVE, "above", "Above", "Keep the window above normal windows"},
    }};

    inline constexpr CEnumTable HOTKEY_MODIFIERS{std::array{
        SEnumEntry<eHotkeyModifier>{HOTKEY_MOD_ALT, "alt", "Option", "", "⌥"},
        SEnumEntry<eHotkeyModifier>{HOTKEY_MOD_LALT, "lalt", "Left Option", "", "⌥"},
        SEnumEntry<eHotkeyModifier>{HOTKEY_MOD_RALT, "ralt", "Right Option", "", "⌥"},
        SEnumEntry<eHotkeyModifier>{HOTKEY_MOD_SHIFT, "shift", "Shift", "", "⇧"},
        SEnumEntry<eHotkeyModifier>{HOTKEY_MOD_LSHIFT, "lshift", "Left Shift", "", "⇧"},
        SEnumEntry<eHotkeyModifier>{HOTKEY_MOD_RSHIFT, "rshift", "Right Shift", "", "⇧"},
        SEnumEntry<eHotkeyModifier>{HOTKEY_MOD_CMD, "cmd", "Command", "", "⌘"},
        SEnumEntry<eHotkeyModifier>{HOTKEY_MOD_LCMD, "lcmd", "Left Command", "", "⌘"},
        SEnumEntry<eHotkeyModifier>{HOTKEY_MOD_RCMD, "rcmd", "Right Command", "", "⌘"},
        SEnumEntry<eHotkeyModifier>{HOTKEY_MOD_CTRL, "ctrl", "Control", "", "⌃"},
        SEnumEntry<eHotkeyModifier>{HOTKEY_MOD_LCTRL, "lctrl", "Left Control", "", "⌃"},
        SEnumEntry<eHotkeyModifier>{HOTKEY_MOD_RCTRL, "rctrl", "Right Control", "", "⌃"},
        SEnumEntry<eHotkeyModifier>{HOTKEY_MOD_FN, "fn", "Function", "", "fn"},
        SEnumEntry<eHotkeyModifier>{HOTKEY_MOD_HYPER, "hyper", "Hyper", "cmd + shift + alt + ctrl", "⌃⌥⇧⌘"},
        SEnumEntry<eHotkeyModifier>{HOTKEY_MOD_MEH, "meh", "Meh", "shift + alt + ctrl", "Meh"},
    }};

    inline constexpr CEnumTable BINDING_CATEGORIES{std::array{
        SEnumEntry<eBindingCategory>{BINDING_CATEGORY_FOCUS, "focus", "Focus", "Window focus commands"},
        SEnumEntry<eBindingCategory>{BINDING_CATEGORY_MOVE, "move", "Move", "Window movement commands"},
        SEnumEntry<eBindingCategory>{BINDING_CATEGORY_RESIZE, "resize", "Resize", "Window resize commands"},
        SEnumEntry<eBindingCategory>{BINDING_CATEGORY_LAYOUT, "layout", "Layout", "Layout switching commands"},
        SEnumEntry<eBindingCategory>{BINDING_CATEGORY_SPACE, "space", "Space", "Space/desktop commands"},
        SEnumEntry<eBindingCategory>{BINDING_CATEGORY_DISPLAY, "display", "Display", "Display/monitor commands"},
        SEnumEntry<eBindingCategory>{BINDING_CATEGORY_CUSTOM, "custom", "Custom", "User-defined commands"},
    }};

    inline constexpr CEnumTable PRESET_CATEGORIES{std::array{
        SEnumEntry<ePresetCategory>{PRESET_CATEGORY_FOCUS, "focus", "Focus"},
        SEnumEntry<ePresetCategory>{PRESET_CATEGORY_MOVE, "move", "Move"},
        SEnumEntry<ePresetCategory>{PRESET_CATEGORY_RESIZE, "resize", "Resize"},
        SEnumEntry<ePresetCategory>{PRESET_CATEGORY_LAYOUT, "layout", "Layout"},
        SEnumEntry<ePresetCategory>{PRESET_CATEGORY_SPACES, "spaces", "Spaces"},
        SEnumEntry<ePresetCategory>{PRESET_CATEGORY_CUSTOM, "custom", "Custom"},
    }};

    inline constexpr CEnumTable PRESETS{std::array{
        SEnumEntry<ePreset>{PRESET_VIM, "vim", "Vim Style", "Vim-inspired navigation using hjkl keys with various modifiers"},
        SEnumEntry<ePreset>{PRESET_ARROWS, "arrows", "Arrow Keys", "Intuitive navigation using arrow keys, great for beginners"},
        SEnumEntry<ePreset>{PRESET_MINIMAL, "minimal", "Minimal", "Essential shortcuts only, less to remember"},
        SEnumEntry<ePreset>{PRESET_I3, "i3", "i3 Style", "Keyboard shortcuts inspired by the i3 window manager"},
        SEnumEntry<ePreset>{PRESET_STACK, "stack", "Stack Focused", "Shortcuts optimized for managing stacked/tabbed windows"},
    }};

    struct SSignalEventDescription {
        std::string_view event;
        std::string_view description;
    };

    inline constexpr std::array<SSignalEventDescription, 28> SIGNAL_EVENTS = {{
        {"application_launched", "When an application is launched"},
        {"application_terminated", "When an application is terminated"},
        {"application_front_switched", "When the frontmost application changes"},
        {"application_activated", "When an application is activated"},
        {"application_deactivated", "When an application is deactivated"},
        {"application_visible", "When an application becomes visible"},
        {"application_hidden", "When an application is hidden"},
        {"window_created", "When a window is created"},
        {"window_destroyed", "When a window is destroyed"},
        {"window_focused", "When a window gains focus"},
        {"window_moved", "When a window is moved"},
        {"window_resized", "When a window is resized"},
        {"window_minimized", "When a window is minimized"},
        {"window_deminimized", "When a window is restored from dock"},
        {"window_title_changed", "When a window title changes"},
        {"space_created", "When a space is created"},
        {"space_destroyed", "When a space is destroyed"},
        {"space_changed", "When the active space changes"},
        {"display_added", "When a display is added"},
        {"display_removed", "When a display is removed"},
        {"display_moved", "When a display is moved"},
        {"display_resized", "When a display is resized"},
        {"display_changed", "When the active display changes"},
        {"mission_control_enter", "When Mission Control is activated"},
        {"mission_control_exit", "When Mission Control is exited"},
        {"dock_did_restart", "When the Dock restarts"},
        {"menu_bar_hidden_changed", "When menu bar visibility changes"},
        {"system_woke", "When the system wakes from sleep"},
    }};

    bool isKnownSignalEvent(std::string_view event);
}
