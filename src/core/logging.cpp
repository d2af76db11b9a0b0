// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging.h"

namespace XKalamine {

// Core module categories
Q_LOGGING_CATEGORY(lcCore, "xkalamine.core", QtInfoMsg)
Q_LOGGING_CATEGORY(lcSymbols, "xkalamine.core.symbols", QtInfoMsg)
Q_LOGGING_CATEGORY(lcRules, "xkalamine.core.rules", QtInfoMsg)
Q_LOGGING_CATEGORY(lcManager, "xkalamine.core.manager", QtInfoMsg)

// CLI categories
Q_LOGGING_CATEGORY(lcCli, "xkalamine.cli", QtInfoMsg)

} // namespace XKalamine
