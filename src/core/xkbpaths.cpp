// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "xkbpaths.h"
#include "constants.h"
#include "logging.h"
#include <QDir>
#include <QStandardPaths>
#include <QtGlobal>

namespace XKalamine {
namespace XkbPaths {

QString userRoot()
{
    // GenericConfigLocation honours XDG_CONFIG_HOME
    return QDir(QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation)).filePath(XkbDirs::UserRootName);
}

QString systemRoot()
{
    const QString configured = qEnvironmentVariable(EnvVars::XkbConfigRoot);
    if (configured.isEmpty()) {
        return XkbDirs::DefaultSystemRoot;
    }
    qCDebug(lcCore) << "System XKB root overridden by" << EnvVars::XkbConfigRoot << ":" << configured;
    return QDir::cleanPath(configured);
}

QString root(bool systemScope)
{
    return systemScope ? systemRoot() : userRoot();
}

bool isWaylandSession()
{
    return qEnvironmentVariable(EnvVars::XdgSessionType).startsWith(QLatin1String("wayland"));
}

} // namespace XkbPaths
} // namespace XKalamine
