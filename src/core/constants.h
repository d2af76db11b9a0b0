// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QLatin1String>

namespace XKalamine {

/**
 * @brief Text markers delimiting installed layouts in XKB/symbols/[locale]
 *
 * Current format:
 *   // KALAMINE::[NAME]::BEGIN
 *   xkb_symbols "[name]" { ... }
 *   // KALAMINE::[NAME]::END
 *
 * The Lafayette project shipped an installer before XKalamine existed and
 * grouped its layouts under a single unnamed block:
 *   // LAFAYETTE::BEGIN
 *   xkb_symbols "lafayette"   { ... }
 *   xkb_symbols "lafayette42" { ... }
 *   // LAFAYETTE::END
 * Such a block is handled as one variant named "lafayette".
 */
namespace Markers {
inline constexpr QLatin1String CurrentPrefix{"// KALAMINE::"};
inline constexpr QLatin1String LegacyPrefix{"// LAFAYETTE::"};
inline constexpr QLatin1String BeginSuffix{"::BEGIN"};
inline constexpr QLatin1String EndSuffix{"::END"};
inline constexpr QLatin1String Begin{"BEGIN"};
inline constexpr QLatin1String End{"END"};
inline constexpr QLatin1String LegacyVariant{"lafayette"};

// Lines of a layout body starting with this are not copied into XKB/symbols
inline constexpr QLatin1String IgnoredLinePrefix{"//#"};

// First line of a symbols file created by XKalamine
inline constexpr QLatin1String GeneratedHeader{"// Generated by Kalamine"};
}

/**
 * @brief Layout of an XKB configuration root
 *
 * The rules registry is split in two shards sharing one schema. Each shard
 * is updated independently when it exists.
 */
namespace XkbDirs {
inline constexpr QLatin1String Rules{"rules"};
inline constexpr QLatin1String Symbols{"symbols"};
inline constexpr QLatin1String BaseRegistry{"base.xml"};
inline constexpr QLatin1String EvdevRegistry{"evdev.xml"};
inline constexpr QLatin1String EvdevRuleset{"evdev"};
inline constexpr QLatin1String CustomLayout{"custom"};

// Subdirectories expected in a user-space configuration ('geometry' is not needed)
inline constexpr QLatin1String UserSubdirs[] = {
    QLatin1String("compat"), QLatin1String("keycodes"), QLatin1String("rules"),
    QLatin1String("symbols"), QLatin1String("types"),
};

inline constexpr QLatin1String DefaultSystemRoot{"/usr/share/X11/xkb"};
inline constexpr QLatin1String UserRootName{"xkb"};
}

/**
 * @brief Element and attribute names of the xkbConfigRegistry schema
 */
namespace XmlKeys {
inline constexpr QLatin1String Registry{"xkbConfigRegistry"};
inline constexpr QLatin1String LayoutList{"layoutList"};
inline constexpr QLatin1String Layout{"layout"};
inline constexpr QLatin1String ConfigItem{"configItem"};
inline constexpr QLatin1String Name{"name"};
inline constexpr QLatin1String Description{"description"};
inline constexpr QLatin1String VariantList{"variantList"};
inline constexpr QLatin1String Variant{"variant"};
inline constexpr QLatin1String Type{"type"}; // Obsolete, set by older installers
}

/**
 * @brief Environment variables consulted when resolving XKB roots
 */
namespace EnvVars {
inline constexpr const char* XkbConfigRoot = "XKB_CONFIG_ROOT";
inline constexpr const char* XdgSessionType = "XDG_SESSION_TYPE";
}

} // namespace XKalamine
