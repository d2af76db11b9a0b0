// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "xkalamine_export.h"
#include <QString>

namespace XKalamine {
namespace XkbPaths {

/**
 * @brief User-space XKB configuration: $XDG_CONFIG_HOME/xkb (~/.config/xkb)
 *
 * Only read by Wayland compositors; X11 sessions ignore it.
 */
XKALAMINE_EXPORT QString userRoot();

/**
 * @brief System XKB configuration: $XKB_CONFIG_ROOT, or /usr/share/X11/xkb
 */
XKALAMINE_EXPORT QString systemRoot();

XKALAMINE_EXPORT QString root(bool systemScope);

/**
 * @brief True if XDG_SESSION_TYPE names a Wayland session
 */
XKALAMINE_EXPORT bool isWaylandSession();

} // namespace XkbPaths
} // namespace XKalamine
