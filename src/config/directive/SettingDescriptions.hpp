#pragma once

#include "ValueCoercer.hpp"
#include "../ConfigEnums.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace Config::Directive {

    // emission blocks of the canonical directive file, in file order
    enum eSettingSection : uint8_t {
        SETTING_SECTION_LAYOUT = 0,
        SETTING_SECTION_GAPS,
        SETTING_SECTION_EXTERNAL_BAR,
        SETTING_SECTION_MOUSE,
        SETTING_SECTION_APPEARANCE,
        SETTING_SECTION_BORDERS,
    };

    const char* settingSectionTitle(eSettingSection section);

    struct SSettingDescription {
        struct SRangeData {
            double min          = 0;
            double max          = 0;
            bool   minExclusive = false;
            bool   maxExclusive = false;
        };

        struct SChoiceData {
            std::vector<std::string> choices;
        };

        // 0xAARRGGBB
        struct SColorData {};

        std::string                                                               key;
        std::string                                                               description;
        eSettingType                                                              type    = SETTING_TYPE_STRING;
        eSettingSection                                                           section = SETTING_SECTION_LAYOUT;
        std::optional<SETTINGVALUE>                                               defaultValue;
        std::string                                                               toggle = ""; // only emitted while this bool setting is on
        std::variant<std::monostate, SRangeData, SChoiceData, SColorData>        data;
    };

    // table order is emission order
    inline static const std::vector<SSettingDescription> SETTING_DESCRIPTIONS = {

        /*
         * layout
         */

        SSettingDescription{
            .key          = "layout",
            .description  = "how windows are arranged: bsp tiles, float leaves windows alone, stack piles them",
            .type         = SETTING_TYPE_STRING,
            .section      = SETTING_SECTION_LAYOUT,
            .defaultValue = std::string{"bsp"},
            .data         = SSettingDescription::SChoiceData{LAYOUTS.strings()},
        },
        SSettingDescription{
            .key          = "window_placement",
            .description  = "which side of a split a new window is inserted on",
            .type         = SETTING_TYPE_STRING,
            .section      = SETTING_SECTION_LAYOUT,
            .defaultValue = std::string{"second_child"},
            .data         = SSettingDescription::SChoiceData{WINDOW_PLACEMENTS.strings()},
        },
        SSettingDescription{
            .key          = "auto_balance",
            .description  = "keep all windows the same size when a window is added or removed",
            .type         = SETTING_TYPE_BOOL,
            .section      = SETTING_SECTION_LAYOUT,
            .defaultValue = false,
        },
        SSettingDescription{
            .key          = "split_ratio",
            .description  = "default ratio of a new split",
            .type         = SETTING_TYPE_FLOAT,
            .section      = SETTING_SECTION_LAYOUT,
            .defaultValue = 0.5,
            .data         = SSettingDescription::SRangeData{.min = 0, .max = 1, .minExclusive = true, .maxExclusive = true},
        },
        SSettingDescription{
            .key          = "split_type",
            .description  = "orientation of new splits",
            .type         = SETTING_TYPE_STRING,
            .section      = SETTING_SECTION_LAYOUT,
            .defaultValue = std::string{"auto"},
            .data         = SSettingDescription::SChoiceData{SPLIT_TYPES.strings()},
        },

        /*
         * gaps and padding
         */

        SSettingDescription{
            .key          = "window_gap",
            .description  = "gap between tiled windows in pixels",
            .type         = SETTING_TYPE_INT,
            .section      = SETTING_SECTION_GAPS,
            .defaultValue = int64_t{6},
            .data         = SSettingDescription::SRangeData{.min = 0, .max = 1000},
        },
        SSettingDescription{
            .key          = "top_padding",
            .description  = "padding between the top screen edge and tiled windows",
            .type         = SETTING_TYPE_INT,
            .section      = SETTING_SECTION_GAPS,
            .defaultValue = int64_t{6},
            .data         = SSettingDescription::SRangeData{.min = 0, .max = 1000},
        },
        SSettingDescription{
            .key          = "bottom_padding",
            .description  = "padding between the bottom screen edge and tiled windows",
            .type         = SETTING_TYPE_INT,
            .section      = SETTING_SECTION_GAPS,
            .defaultValue = int64_t{6},
            .data         = SSettingDescription::SRangeData{.min = 0, .max = 1000},
        },
        SSettingDescription{
            .key          = "left_padding",
            .description  = "padding between the left screen edge and tiled windows",
            .type         = SETTING_TYPE_INT,
            .section      = SETTING_SECTION_GAPS,
            .defaultValue = int64_t{6},
            .data         = SSettingDescription::SRangeData{.min = 0, .max = 1000},
        },
        SSettingDescription{
            .key          = "right_padding",
            .description  = "padding between the right screen edge and tiled windows",
            .type         = SETTING_TYPE_INT,
            .section      = SETTING_SECTION_GAPS,
            .defaultValue = int64_t{6},
            .data         = SSettingDescription::SRangeData{.min = 0, .max = 1000},
        },

        /*
         * external bar
         */

        SSettingDescription{
            .key         = "external_bar",
            .description = "space reserved for a status bar, main:<top>:<bottom> or all:<top>:<bottom>. Unset by default",
            .type        = SETTING_TYPE_STRING,
            .section     = SETTING_SECTION_EXTERNAL_BAR,
        },

        /*
         * mouse
         */

        SSettingDescription{
            .key          = "mouse_follows_focus",
            .description  = "warp the cursor to the focused window",
            .type         = SETTING_TYPE_BOOL,
            .section      = SETTING_SECTION_MOUSE,
            .defaultValue = false,
        },
        SSettingDescription{
            .key          = "focus_follows_mouse",
            .description  = "focus the window under the cursor, optionally raising it",
            .type         = SETTING_TYPE_STRING,
            .section      = SETTING_SECTION_MOUSE,
            .defaultValue = std::string{"off"},
            .data         = SSettingDescription::SChoiceData{FOCUS_FOLLOWS_MOUSE_MODES.strings()},
        },
        SSettingDescription{
            .key          = "mouse_modifier",
            .description  = "modifier held for mouse window actions",
            .type         = SETTING_TYPE_STRING,
            .section      = SETTING_SECTION_MOUSE,
            .defaultValue = std::string{"alt"},
            .data         = SSettingDescription::SChoiceData{MOUSE_MODIFIERS.strings()},
        },
        SSettingDescription{
            .key          = "mouse_action1",
            .description  = "action bound to the left button while the modifier is held",
            .type         = SETTING_TYPE_STRING,
            .section      = SETTING_SECTION_MOUSE,
            .defaultValue = std::string{"move"},
            .data         = SSettingDescription::SChoiceData{MOUSE_ACTIONS.strings()},
        },
        SSettingDescription{
            .key          = "mouse_action2",
            .description  = "action bound to the right button while the modifier is held",
            .type         = SETTING_TYPE_STRING,
            .section      = SETTING_SECTION_MOUSE,
            .defaultValue = std::string{"resize"},
            .data         = SSettingDescription::SChoiceData{MOUSE_ACTIONS.strings()},
        },
        SSettingDescription{
            .key          = "mouse_drop_action",
            .description  = "what happens when a window is dropped onto another",
            .type         = SETTING_TYPE_STRING,
            .section      = SETTING_SECTION_MOUSE,
            .defaultValue = std::string{"swap"},
            .data         = SSettingDescription::SChoiceData{MOUSE_DROP_ACTIONS.strings()},
        },

        /*
         * window appearance
         */

        SSettingDescription{
            .key          = "window_opacity",
            .description  = "enable opacity for windows",
            .type         = SETTING_TYPE_BOOL,
            .section      = SETTING_SECTION_APPEARANCE,
            .defaultValue = false,
        },
        SSettingDescription{
            .key          = "active_window_opacity",
            .description  = "opacity of the focused window",
            .type         = SETTING_TYPE_FLOAT,
            .section      = SETTING_SECTION_APPEARANCE,
            .defaultValue = 1.0,
            .toggle       = "window_opacity",
            .data         = SSettingDescription::SRangeData{.min = 0, .max = 1},
        },
        SSettingDescription{
            .key          = "normal_window_opacity",
            .description  = "opacity of unfocused windows",
            .type         = SETTING_TYPE_FLOAT,
            .section      = SETTING_SECTION_APPEARANCE,
            .defaultValue = 0.9,
            .toggle       = "window_opacity",
            .data         = SSettingDescription::SRangeData{.min = 0, .max = 1},
        },
        SSettingDescription{
            .key          = "window_shadow",
            .description  = "draw shadows on all windows, none, or floating windows only",
            .type         = SETTING_TYPE_STRING,
            .section      = SETTING_SECTION_APPEARANCE,
            .defaultValue = std::string{"on"},
            .data         = SSettingDescription::SChoiceData{WINDOW_SHADOWS.strings()},
        },
        SSettingDescription{
            .key          = "window_animation_duration",
            .description  = "duration of window frame animations in seconds, 0 disables them",
            .type         = SETTING_TYPE_FLOAT,
            .section      = SETTING_SECTION_APPEARANCE,
            .defaultValue = 0.0,
            .data         = SSettingDescription::SRangeData{.min = 0, .max = 10},
        },

        /*
         * window borders
         */

        SSettingDescription{
            .key          = "window_border",
            .description  = "draw a border around windows",
            .type         = SETTING_TYPE_BOOL,
            .section      = SETTING_SECTION_BORDERS,
            .defaultValue = false,
        },
        SSettingDescription{
            .key          = "window_border_width",
            .description  = "border width in pixels",
            .type         = SETTING_TYPE_INT,
            .section      = SETTING_SECTION_BORDERS,
            .defaultValue = int64_t{4},
            .toggle       = "window_border",
            .data         = SSettingDescription::SRangeData{.min = 0, .max = 100},
        },
        SSettingDescription{
            .key          = "active_window_border_color",
            .description  = "border color of the focused window",
            .type         = SETTING_TYPE_STRING,
            .section      = SETTING_SECTION_BORDERS,
            .defaultValue = std::string{"0xff775759"},
            .toggle       = "window_border",
            .data         = SSettingDescription::SColorData{},
        },
        SSettingDescription{
            .key          = "normal_window_border_color",
            .description  = "border color of unfocused windows",
            .type         = SETTING_TYPE_STRING,
            .section      = SETTING_SECTION_BORDERS,
            .defaultValue = std::string{"0xff555555"},
            .toggle       = "window_border",
            .data         = SSettingDescription::SColorData{},
        },
        SSettingDescription{
            .key          = "insert_feedback_color",
            .description  = "color of the insertion point overlay",
            .type         = SETTING_TYPE_STRING,
            .section      = SETTING_SECTION_BORDERS,
            .defaultValue = std::string{"0xffd75f5f"},
            .toggle       = "window_border",
            .data         = SSettingDescription::SColorData{},
        },
    };

    const std::vector<SSettingDescription>& settingDescriptions();
    const SSettingDescription*              findSetting(std::string_view key);
}
