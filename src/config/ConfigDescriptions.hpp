#pragma once

#include <climits>
#include "ConfigManager.hpp"

inline static const std::vector<SConfigOptionDescription> CONFIG_OPTIONS = {

    /*
     * tabs:
     */

    SConfigOptionDescription{
        .value       = "tabs:swipe_enabled",
        .description = "enable switching between adjacent tabs by dragging from a screen edge",
        .type        = CONFIG_OPTION_BOOL,
        .data        = SConfigOptionDescription::SBoolData{true},
    },
    SConfigOptionDescription{
        .value       = "tabs:diagonal_swipe",
        .description = "keep tracking edge drags that start with a noticeable vertical component",
        .type        = CONFIG_OPTION_BOOL,
        .data        = SConfigOptionDescription::SBoolData{false},
    },
    SConfigOptionDescription{
        .value       = "tabs:edge_width",
        .description = "width in px of the band along the left and right edges where a drag may start",
        .type        = CONFIG_OPTION_INT,
        .data        = SConfigOptionDescription::SRangeData{20, 1, 200},
    },
    SConfigOptionDescription{
        .value       = "tabs:hide_bar_on_first_page",
        .description = "hide the tab bar while a transition to or from the first page runs",
        .type        = CONFIG_OPTION_BOOL,
        .data        = SConfigOptionDescription::SBoolData{true},
    },

    /*
     * animations:
     */

    SConfigOptionDescription{
        .value       = "animations:enabled",
        .description = "enable animations",
        .type        = CONFIG_OPTION_BOOL,
        .data        = SConfigOptionDescription::SBoolData{true},
    },

    /*
     * debug:
     */

    SConfigOptionDescription{
        .value       = "debug:disable_logs",
        .description = "disable logging",
        .type        = CONFIG_OPTION_BOOL,
        .data        = SConfigOptionDescription::SBoolData{false},
    },
    SConfigOptionDescription{
        .value       = "debug:disable_time",
        .description = "disables time logging",
        .type        = CONFIG_OPTION_BOOL,
        .data        = SConfigOptionDescription::SBoolData{true},
    },
    SConfigOptionDescription{
        .value       = "debug:enable_stdout_logs",
        .description = "enables logging to stdout",
        .type        = CONFIG_OPTION_BOOL,
        .data        = SConfigOptionDescription::SBoolData{true},
    },
    SConfigOptionDescription{
        .value       = "debug:colored_stdout_logs",
        .description = "enables colors in the stdout logs.",
        .type        = CONFIG_OPTION_BOOL,
        .data        = SConfigOptionDescription::SBoolData{true},
    },
};
