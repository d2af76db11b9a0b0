// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "xkalamine_export.h"
#include <QLoggingCategory>

/**
 * @file logging.h
 * @brief Centralized logging categories for XKalamine
 *
 * Usage:
 *   #include "logging.h"
 *   qCDebug(lcSymbols) << "Debug message";
 *   qCWarning(lcRules) << "Warning message";
 *
 * Runtime filtering via environment variable:
 *   QT_LOGGING_RULES="xkalamine.*=true"                 # Enable all
 *   QT_LOGGING_RULES="xkalamine.*.debug=false"          # Disable debug only
 *   QT_LOGGING_RULES="xkalamine.core.symbols=true"      # Enable symbols files only
 *
 * Severity Guidelines:
 *   qCDebug    - Scan tracing (markers found, nodes matched)
 *   qCInfo     - Files rewritten, configuration bootstrapped
 *   qCWarning  - A file could not be read, parsed or written
 *   qCCritical - A commit left files in a partially updated state
 */

namespace XKalamine {

XKALAMINE_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcCore)
XKALAMINE_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcSymbols)
XKALAMINE_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcRules)
XKALAMINE_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcManager)

// Command line front end
XKALAMINE_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcCli)

} // namespace XKalamine
